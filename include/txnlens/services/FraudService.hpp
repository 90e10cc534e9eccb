#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "TransactionStore.hpp"
#include "txnlens/Error.hpp"

namespace txnlens {

struct FraudSummary {
    std::size_t totalFraudCount = 0;
    double fraudRate = 0.0;
    double totalFraudAmount = 0.0;
};

struct FraudTypeStats {
    std::string type;
    std::size_t fraudCount = 0;
    std::size_t totalCount = 0;
    double fraudRate = 0.0;
};

struct FraudPrediction {
    std::string transactionId;
    double fraudScore = 0.0;
    std::string reasoning;
};

class FraudService {
public:
    explicit FraudService(const TransactionStore& store);

    FraudSummary summary() const;

    // Per payment channel, highest fraud rate first.
    std::vector<FraudTypeStats> byChannelType() const;

    // Fixed rule-based score in [0, 1]:
    //   +0.8 error flag set
    //   +0.2 amount > 5000, otherwise +0.1 amount > 2000
    //   +0.1 payment channel missing
    FraudPrediction predict(const Transaction& txn) const;
    Result<FraudPrediction> predictById(const std::string& id) const;

private:
    const TransactionStore& store_;
};

} // namespace txnlens
