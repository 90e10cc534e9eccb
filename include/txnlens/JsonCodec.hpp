#pragma once

#include <nlohmann/json.hpp>
#include "txnlens/Pagination.hpp"
#include "txnlens/Transaction.hpp"
#include "txnlens/algorithms/SearchFilter.hpp"
#include "txnlens/services/CustomerService.hpp"
#include "txnlens/services/FraudService.hpp"
#include "txnlens/services/HealthService.hpp"
#include "txnlens/services/StatisticsService.hpp"
#include "txnlens/services/TransactionService.hpp"

namespace txnlens {

// Wire field names follow the CSV columns; timestamps are "YYYY-MM-DDTHH:MM:SS".
void to_json(nlohmann::json& j, const Transaction& t);
void to_json(nlohmann::json& j, const PaginationMeta& m);
void to_json(nlohmann::json& j, const ChannelTypeCount& c);
void to_json(nlohmann::json& j, const OverviewStats& s);
void to_json(nlohmann::json& j, const AmountBucket& b);
void to_json(nlohmann::json& j, const AmountDistribution& d);
void to_json(nlohmann::json& j, const TypeStats& s);
void to_json(nlohmann::json& j, const DailyStats& s);
void to_json(nlohmann::json& j, const FraudSummary& s);
void to_json(nlohmann::json& j, const FraudTypeStats& s);
void to_json(nlohmann::json& j, const FraudPrediction& p);
void to_json(nlohmann::json& j, const CustomerSummary& c);
void to_json(nlohmann::json& j, const CustomerDetails& c);
void to_json(nlohmann::json& j, const TopCustomer& c);
void to_json(nlohmann::json& j, const HealthStatus& h);
void to_json(nlohmann::json& j, const SystemMetadata& m);

template <typename T>
void to_json(nlohmann::json& j, const Page<T>& page) {
    j = nlohmann::json{{"data", page.data}, {"pagination", page.pagination}};
}

// Accepts the same field names; `date` as "YYYY-MM-DD HH:MM:SS" or with 'T'.
// Throws std::invalid_argument on a bad date or a negative amount, and
// nlohmann::json::exception on wrong field types.
Transaction transactionFromJson(const nlohmann::json& j);

// Search body keys: min_amount, max_amount, client_id, transaction_id,
// merchant_city, use_chip. Null values count as absent.
algo::SearchCriteria criteriaFromJson(const nlohmann::json& j);

} // namespace txnlens
