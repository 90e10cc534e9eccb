#pragma once

#include <cstddef>
#include <utility>
#include <vector>
#include "txnlens/Error.hpp"

namespace txnlens {

struct PageRequest {
    long long page = 1;
    long long limit = 50;
};

struct PaginationMeta {
    long long page = 1;
    long long limit = 50;
    std::size_t totalCount = 0;
    std::size_t totalPages = 0;
    bool hasNextPage = false;
};

template <typename T>
struct Page {
    std::vector<T> data;
    PaginationMeta pagination;
};

class PaginationService {
public:
    static constexpr long long kDefaultPage = 1;
    static constexpr long long kDefaultLimit = 50;
    static constexpr long long kMinLimit = 1;
    static constexpr long long kMaxLimit = 1000;

    // InvalidPagination when page < 1 or limit is outside [kMinLimit, kMaxLimit].
    static Result<PageRequest> validateParams(long long page, long long limit);

    // Half-open [begin, end) slice of a result set of `total` items.
    static std::pair<std::size_t, std::size_t> pageBounds(const PageRequest& req, std::size_t total);

    static PaginationMeta buildMeta(const PageRequest& req, std::size_t totalCount);

    // Attaches metadata to an already-sliced page of items.
    template <typename T>
    static Page<T> buildEnvelope(std::vector<T> items, const PageRequest& req, std::size_t totalCount) {
        return Page<T>{std::move(items), buildMeta(req, totalCount)};
    }

    // Slices a full result set by the request and wraps it.
    template <typename T>
    static Page<T> paginate(const std::vector<T>& all, const PageRequest& req) {
        auto bounds = pageBounds(req, all.size());
        std::vector<T> slice(all.begin() + static_cast<std::ptrdiff_t>(bounds.first),
                             all.begin() + static_cast<std::ptrdiff_t>(bounds.second));
        return buildEnvelope(std::move(slice), req, all.size());
    }
};

} // namespace txnlens
