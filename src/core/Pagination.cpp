#include "txnlens/Pagination.hpp"

#include <algorithm>
#include <string>

namespace txnlens {

Result<PageRequest> PaginationService::validateParams(long long page, long long limit) {
    if (page < 1) {
        return makeError(ErrorCode::InvalidPagination, "page must be >= 1, got " + std::to_string(page));
    }
    if (limit < kMinLimit || limit > kMaxLimit) {
        return makeError(ErrorCode::InvalidPagination,
                         "limit must be between " + std::to_string(kMinLimit) + " and " +
                             std::to_string(kMaxLimit) + ", got " + std::to_string(limit));
    }
    return PageRequest{page, limit};
}

std::pair<std::size_t, std::size_t> PaginationService::pageBounds(const PageRequest& req, std::size_t total) {
    const auto limit = static_cast<std::size_t>(req.limit);
    const auto pageIndex = static_cast<std::size_t>(req.page - 1);
    if (limit == 0 || pageIndex > total / limit) return {total, total};
    std::size_t begin = std::min(pageIndex * limit, total);
    std::size_t end = std::min(begin + limit, total);
    return {begin, end};
}

PaginationMeta PaginationService::buildMeta(const PageRequest& req, std::size_t totalCount) {
    PaginationMeta meta;
    meta.page = req.page;
    meta.limit = req.limit;
    meta.totalCount = totalCount;
    const auto limit = static_cast<std::size_t>(req.limit);
    meta.totalPages = limit == 0 ? 0 : (totalCount + limit - 1) / limit;
    meta.hasNextPage = static_cast<std::size_t>(req.page) < meta.totalPages;
    return meta;
}

} // namespace txnlens
