#include "txnlens/services/TransactionService.hpp"

#include <algorithm>
#include <iostream>

namespace txnlens {

namespace {

// Copies only the requested slice out of a sorted pointer list.
Page<Transaction> pageOf(const std::vector<const Transaction*>& sorted, const PageRequest& req) {
    auto bounds = PaginationService::pageBounds(req, sorted.size());
    std::vector<Transaction> slice;
    slice.reserve(bounds.second - bounds.first);
    for (std::size_t i = bounds.first; i < bounds.second; ++i) slice.push_back(*sorted[i]);
    return PaginationService::buildEnvelope(std::move(slice), req, sorted.size());
}

Error logged(Error err) {
    std::cerr << "TransactionService: " << errorCodeName(err.code) << ": " << err.message << "\n";
    return err;
}

} // namespace

TransactionService::TransactionService(TransactionStore& store) : store_(store) {
}

Result<Page<Transaction>> TransactionService::list(long long page, long long limit) const {
    auto req = PaginationService::validateParams(page, limit);
    if (!req) return logged(req.error());

    auto snap = store_.snapshot();
    std::vector<const Transaction*> all;
    all.reserve(snap->size());
    for (const auto& kv : snap->records()) all.push_back(&kv.second);
    algo::sortByDateDesc(all);
    return pageOf(all, req.value());
}

Result<Transaction> TransactionService::get(const std::string& id) const {
    auto txn = store_.get(id);
    if (!txn) {
        return logged(makeError(ErrorCode::NotFound, "Transaction with ID " + id + " not found"));
    }
    return *txn;
}

Status TransactionService::remove(const std::string& id) {
    if (!store_.remove(id)) {
        return logged(makeError(ErrorCode::NotFound, "Transaction with ID " + id + " not found"));
    }
    std::cerr << "TransactionService: deleted transaction " << id << "\n";
    return Done{};
}

Result<Page<Transaction>> TransactionService::search(const algo::SearchCriteria& criteria, long long page, long long limit) const {
    auto req = PaginationService::validateParams(page, limit);
    if (!req) return logged(req.error());

    const algo::SearchCriteria effective = criteria.normalized();
    auto valid = algo::validateCriteria(effective);
    if (!valid) return logged(valid.error());

    auto snap = store_.snapshot();
    return pageOf(algo::filterTransactions(*snap, effective), req.value());
}

std::vector<ChannelTypeCount> TransactionService::channelTypes() const {
    auto snap = store_.snapshot();
    std::vector<ChannelTypeCount> out;
    for (const auto& type : snap->attributeValues(Attribute::ChannelType)) {
        const IdIndex* ids = snap->attributeIndex(Attribute::ChannelType, type);
        out.push_back({type, ids ? ids->size() : 0});
    }
    std::stable_sort(out.begin(), out.end(), [](const ChannelTypeCount& a, const ChannelTypeCount& b) {
        return a.count > b.count;
    });
    return out;
}

Result<Page<Transaction>> TransactionService::recent(long long limit) const {
    return list(PaginationService::kDefaultPage, limit);
}

Result<Page<Transaction>> TransactionService::byCustomer(const std::string& customerId, long long page, long long limit) const {
    return byIndex(Attribute::Customer, customerId, page, limit);
}

Result<Page<Transaction>> TransactionService::byMerchant(const std::string& merchantId, long long page, long long limit) const {
    return byIndex(Attribute::Merchant, merchantId, page, limit);
}

Result<Page<Transaction>> TransactionService::byIndex(Attribute attribute, const std::string& value, long long page, long long limit) const {
    auto req = PaginationService::validateParams(page, limit);
    if (!req) return logged(req.error());

    auto snap = store_.snapshot();
    auto txns = snap->byAttribute(attribute, value);
    algo::sortByDateDesc(txns);
    return pageOf(txns, req.value());
}

} // namespace txnlens
