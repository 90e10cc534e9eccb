#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <vector>
#include "TransactionStore.hpp"

namespace txnlens {

struct OverviewStats {
    std::size_t totalCount = 0;
    double totalAmount = 0.0;
    double averageAmount = 0.0;
    Timestamp minDate{};
    Timestamp maxDate{};
};

struct AmountBucket {
    std::string range;
    std::size_t count = 0;
    double percentage = 0.0;
};

struct AmountDistribution {
    std::vector<AmountBucket> buckets;
};

struct TypeStats {
    std::string type;
    std::size_t count = 0;
    double totalAmount = 0.0;
    double averageAmount = 0.0;
};

struct DailyStats {
    std::string date;
    std::size_t count = 0;
    double totalAmount = 0.0;
    double averageAmount = 0.0;
};

struct AmountRange {
    double min;
    double max;
    const char* label;
};

// [min, max) ranges; a record lands in the first one containing its amount.
constexpr AmountRange kAmountBuckets[] = {
    {0.0, 100.0, "0-100"},
    {100.0, 500.0, "100-500"},
    {500.0, 1000.0, "500-1000"},
    {1000.0, std::numeric_limits<double>::infinity(), "1000+"},
};

class StatisticsService {
public:
    explicit StatisticsService(const TransactionStore& store);

    // Empty store reports zeros with both dates set to now.
    OverviewStats overview() const;
    AmountDistribution amountDistribution() const;

    // Per merchant category code, most frequent first.
    std::vector<TypeStats> byCategoryCode() const;

    // Per UTC calendar day, oldest first.
    std::vector<DailyStats> daily() const;

private:
    const TransactionStore& store_;
};

} // namespace txnlens
