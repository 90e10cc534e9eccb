#include "txnlens/algorithms/SearchFilter.hpp"
#include "TransactionStore.hpp"

#include <algorithm>
#include <cmath>

namespace txnlens::algo {

namespace {

constexpr const char* kPlaceholder = "string";

std::optional<std::string> presentOrNone(const std::optional<std::string>& value) {
    if (!value || value->empty() || *value == kPlaceholder) return std::nullopt;
    return value;
}

bool eq(const std::optional<std::string>& expected, const std::string& actual) {
    return !expected || *expected == actual;
}

} // namespace

SearchCriteria SearchCriteria::normalized() const {
    SearchCriteria out;
    out.minAmount = minAmount;
    out.maxAmount = maxAmount;
    out.customerId = presentOrNone(customerId);
    out.transactionId = presentOrNone(transactionId);
    out.merchantCity = presentOrNone(merchantCity);
    out.channelType = presentOrNone(channelType);
    return out;
}

Status validateCriteria(const SearchCriteria& criteria) {
    auto badBound = [](const std::optional<double>& v) {
        return v && !std::isfinite(*v);
    };
    if (badBound(criteria.minAmount) || badBound(criteria.maxAmount)) {
        return makeError(ErrorCode::InvalidSearchFilters, "amount bounds must be finite numbers");
    }
    return Done{};
}

bool matches(const SearchCriteria& criteria, const Transaction& txn) {
    if (criteria.minAmount && txn.amount < *criteria.minAmount) return false;
    if (criteria.maxAmount && txn.amount > *criteria.maxAmount) return false;
    return eq(criteria.customerId, txn.clientId) &&
           eq(criteria.transactionId, txn.id) &&
           eq(criteria.merchantCity, txn.merchantCity) &&
           eq(criteria.channelType, txn.useChip);
}

void sortByDateDesc(std::vector<const Transaction*>& txns) {
    std::sort(txns.begin(), txns.end(), [](const Transaction* a, const Transaction* b) {
        if (a->date == b->date) return a->id < b->id;
        return a->date > b->date;
    });
}

std::vector<const Transaction*> filterTransactions(const Snapshot& snapshot, const SearchCriteria& criteria) {
    std::vector<const Transaction*> out;
    auto consider = [&](const Transaction* txn) {
        if (txn && matches(criteria, *txn)) out.push_back(txn);
    };

    if (criteria.transactionId) {
        consider(snapshot.find(*criteria.transactionId));
    } else if (criteria.customerId) {
        for (const Transaction* txn : snapshot.byAttribute(Attribute::Customer, *criteria.customerId)) consider(txn);
    } else if (criteria.channelType) {
        for (const Transaction* txn : snapshot.byAttribute(Attribute::ChannelType, *criteria.channelType)) consider(txn);
    } else {
        out.reserve(snapshot.size());
        for (const auto& kv : snapshot.records()) consider(&kv.second);
    }

    sortByDateDesc(out);
    return out;
}

} // namespace txnlens::algo
