#include "txnlens/services/StatisticsService.hpp"

#include <algorithm>
#include <map>

namespace txnlens {

StatisticsService::StatisticsService(const TransactionStore& store) : store_(store) {
}

OverviewStats StatisticsService::overview() const {
    auto snap = store_.snapshot();
    OverviewStats out;
    if (snap->empty()) {
        out.minDate = out.maxDate = Clock::now();
        return out;
    }

    bool first = true;
    for (const auto& kv : snap->records()) {
        const Transaction& txn = kv.second;
        out.totalAmount += txn.amount;
        if (first || txn.date < out.minDate) out.minDate = txn.date;
        if (first || txn.date > out.maxDate) out.maxDate = txn.date;
        first = false;
    }
    out.totalCount = snap->size();
    out.averageAmount = out.totalAmount / static_cast<double>(out.totalCount);
    return out;
}

AmountDistribution StatisticsService::amountDistribution() const {
    auto snap = store_.snapshot();
    constexpr std::size_t kBucketCount = sizeof(kAmountBuckets) / sizeof(kAmountBuckets[0]);
    std::size_t counts[kBucketCount] = {};

    for (const auto& kv : snap->records()) {
        const double amount = kv.second.amount;
        for (std::size_t b = 0; b < kBucketCount; ++b) {
            if (kAmountBuckets[b].min <= amount && amount < kAmountBuckets[b].max) {
                ++counts[b];
                break;
            }
        }
    }

    const std::size_t total = snap->size();
    AmountDistribution out;
    out.buckets.reserve(kBucketCount);
    for (std::size_t b = 0; b < kBucketCount; ++b) {
        double pct = total == 0 ? 0.0 : static_cast<double>(counts[b]) / static_cast<double>(total) * 100.0;
        out.buckets.push_back({kAmountBuckets[b].label, counts[b], pct});
    }
    return out;
}

std::vector<TypeStats> StatisticsService::byCategoryCode() const {
    auto snap = store_.snapshot();
    std::vector<TypeStats> out;
    for (const auto& mcc : snap->attributeValues(Attribute::CategoryCode)) {
        auto txns = snap->byAttribute(Attribute::CategoryCode, mcc);
        if (txns.empty()) continue;
        TypeStats s;
        s.type = mcc;
        s.count = txns.size();
        for (const Transaction* txn : txns) s.totalAmount += txn->amount;
        s.averageAmount = s.totalAmount / static_cast<double>(s.count);
        out.push_back(std::move(s));
    }
    std::stable_sort(out.begin(), out.end(), [](const TypeStats& a, const TypeStats& b) {
        return a.count > b.count;
    });
    return out;
}

std::vector<DailyStats> StatisticsService::daily() const {
    auto snap = store_.snapshot();
    std::map<Timestamp, DailyStats> byDay;
    for (const auto& kv : snap->records()) {
        const Transaction& txn = kv.second;
        auto& day = byDay[startOfDay(txn.date)];
        ++day.count;
        day.totalAmount += txn.amount;
    }

    std::vector<DailyStats> out;
    out.reserve(byDay.size());
    for (auto& kv : byDay) {
        DailyStats s = kv.second;
        s.date = formatDate(kv.first);
        s.averageAmount = s.totalAmount / static_cast<double>(s.count);
        out.push_back(std::move(s));
    }
    return out;
}

} // namespace txnlens
