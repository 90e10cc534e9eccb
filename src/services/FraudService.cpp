#include "txnlens/services/FraudService.hpp"

#include <algorithm>
#include <iostream>

namespace txnlens {

namespace {

constexpr double kErrorFlagWeight = 0.8;
constexpr double kVeryHighAmount = 5000.0;
constexpr double kVeryHighAmountWeight = 0.2;
constexpr double kHighAmount = 2000.0;
constexpr double kHighAmountWeight = 0.1;
constexpr double kMissingChannelWeight = 0.1;

} // namespace

FraudService::FraudService(const TransactionStore& store) : store_(store) {
}

FraudSummary FraudService::summary() const {
    auto snap = store_.snapshot();
    FraudSummary out;
    for (const Transaction* txn : snap->fraudulent()) {
        ++out.totalFraudCount;
        out.totalFraudAmount += txn->amount;
    }
    if (!snap->empty()) {
        out.fraudRate = static_cast<double>(out.totalFraudCount) / static_cast<double>(snap->size());
    }
    return out;
}

std::vector<FraudTypeStats> FraudService::byChannelType() const {
    auto snap = store_.snapshot();
    std::vector<FraudTypeStats> out;
    for (const auto& type : snap->attributeValues(Attribute::ChannelType)) {
        auto txns = snap->byAttribute(Attribute::ChannelType, type);
        if (txns.empty()) continue;
        FraudTypeStats s;
        s.type = type;
        s.totalCount = txns.size();
        s.fraudCount = static_cast<std::size_t>(std::count_if(txns.begin(), txns.end(),
            [](const Transaction* t) { return t->isFraud(); }));
        s.fraudRate = static_cast<double>(s.fraudCount) / static_cast<double>(s.totalCount);
        out.push_back(std::move(s));
    }
    std::stable_sort(out.begin(), out.end(), [](const FraudTypeStats& a, const FraudTypeStats& b) {
        return a.fraudRate > b.fraudRate;
    });
    return out;
}

FraudPrediction FraudService::predict(const Transaction& txn) const {
    double score = 0.0;
    std::vector<std::string> reasons;

    if (txn.isFraud()) {
        score += kErrorFlagWeight;
        reasons.emplace_back("Transaction has error flag");
    }
    if (txn.amount > kVeryHighAmount) {
        score += kVeryHighAmountWeight;
        reasons.emplace_back("Very high amount (> 5000)");
    } else if (txn.amount > kHighAmount) {
        score += kHighAmountWeight;
        reasons.emplace_back("High amount (> 2000)");
    }
    if (txn.useChip.empty()) {
        score += kMissingChannelWeight;
        reasons.emplace_back("Missing transaction type");
    }

    FraudPrediction out;
    out.transactionId = txn.id;
    out.fraudScore = std::min(1.0, std::max(0.0, score));
    if (reasons.empty()) {
        out.reasoning = "No fraud indicators detected";
    } else {
        for (std::size_t i = 0; i < reasons.size(); ++i) {
            if (i) out.reasoning += "; ";
            out.reasoning += reasons[i];
        }
    }
    return out;
}

Result<FraudPrediction> FraudService::predictById(const std::string& id) const {
    auto txn = store_.get(id);
    if (!txn) {
        std::cerr << "FraudService: prediction requested for unknown transaction " << id << "\n";
        return makeError(ErrorCode::NotFound, "Transaction with ID " + id + " not found");
    }
    return predict(*txn);
}

} // namespace txnlens
