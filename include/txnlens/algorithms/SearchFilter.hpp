#pragma once

#include <optional>
#include <string>
#include <vector>
#include "txnlens/Error.hpp"
#include "txnlens/Transaction.hpp"

namespace txnlens {
class Snapshot;
}

namespace txnlens::algo {

// Conjunctive search criteria. An empty optional imposes no constraint.
struct SearchCriteria {
    std::optional<double> minAmount;
    std::optional<double> maxAmount;
    std::optional<std::string> customerId;
    std::optional<std::string> transactionId;
    std::optional<std::string> merchantCity;
    std::optional<std::string> channelType;

    // Turns empty strings and the "string" placeholder into absent criteria.
    SearchCriteria normalized() const;
};

// InvalidSearchFilters only for NaN or infinite bounds. A range with
// min > max is valid and matches nothing.
Status validateCriteria(const SearchCriteria& criteria);

bool matches(const SearchCriteria& criteria, const Transaction& txn);

// Newest first; equal timestamps fall back to id order, so the order is total.
void sortByDateDesc(std::vector<const Transaction*>& txns);

// Single scan over the narrowest index the criteria allow, sorted newest first.
std::vector<const Transaction*> filterTransactions(const Snapshot& snapshot, const SearchCriteria& criteria);

} // namespace txnlens::algo
