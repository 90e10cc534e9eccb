#include "txnlens/JsonCodec.hpp"

#include <stdexcept>

using json = nlohmann::json;

namespace txnlens {

void to_json(json& j, const Transaction& t) {
    j = json{
        {"id", t.id},
        {"date", formatTimestamp(t.date)},
        {"client_id", t.clientId},
        {"card_id", t.cardId},
        {"amount", t.amount},
        {"use_chip", t.useChip},
        {"merchant_id", t.merchantId},
        {"merchant_city", t.merchantCity},
        {"merchant_state", t.merchantState},
        {"zip", t.zip},
        {"mcc", t.mcc},
        {"errors", t.errors.empty() ? json(nullptr) : json(t.errors)}
    };
}

void to_json(json& j, const PaginationMeta& m) {
    j = json{
        {"page", m.page},
        {"limit", m.limit},
        {"total_count", m.totalCount},
        {"total_pages", m.totalPages},
        {"has_next_page", m.hasNextPage}
    };
}

void to_json(json& j, const ChannelTypeCount& c) {
    j = json{{"type", c.type}, {"count", c.count}};
}

void to_json(json& j, const OverviewStats& s) {
    j = json{
        {"total_count", s.totalCount},
        {"total_amount", s.totalAmount},
        {"average_amount", s.averageAmount},
        {"min_date", formatTimestamp(s.minDate)},
        {"max_date", formatTimestamp(s.maxDate)}
    };
}

void to_json(json& j, const AmountBucket& b) {
    j = json{{"range", b.range}, {"count", b.count}, {"percentage", b.percentage}};
}

void to_json(json& j, const AmountDistribution& d) {
    j = json{{"buckets", d.buckets}};
}

void to_json(json& j, const TypeStats& s) {
    j = json{
        {"type", s.type},
        {"count", s.count},
        {"total_amount", s.totalAmount},
        {"average_amount", s.averageAmount}
    };
}

void to_json(json& j, const DailyStats& s) {
    j = json{
        {"date", s.date},
        {"count", s.count},
        {"total_amount", s.totalAmount},
        {"average_amount", s.averageAmount}
    };
}

void to_json(json& j, const FraudSummary& s) {
    j = json{
        {"total_fraud_count", s.totalFraudCount},
        {"fraud_rate", s.fraudRate},
        {"total_fraud_amount", s.totalFraudAmount}
    };
}

void to_json(json& j, const FraudTypeStats& s) {
    j = json{
        {"type", s.type},
        {"fraud_count", s.fraudCount},
        {"total_count", s.totalCount},
        {"fraud_rate", s.fraudRate}
    };
}

void to_json(json& j, const FraudPrediction& p) {
    j = json{
        {"transaction_id", p.transactionId},
        {"fraud_score", p.fraudScore},
        {"reasoning", p.reasoning}
    };
}

void to_json(json& j, const CustomerSummary& c) {
    j = json{{"customer_id", c.customerId}, {"transaction_count", c.transactionCount}};
}

void to_json(json& j, const CustomerDetails& c) {
    j = json{
        {"customer_id", c.customerId},
        {"transaction_count", c.transactionCount},
        {"total_amount", c.totalAmount},
        {"average_amount", c.averageAmount}
    };
}

void to_json(json& j, const TopCustomer& c) {
    j = json{
        {"customer_id", c.customerId},
        {"transaction_count", c.transactionCount},
        {"total_amount", c.totalAmount}
    };
}

void to_json(json& j, const HealthStatus& h) {
    j = json{{"status", h.status}, {"response_time_ms", h.responseTimeMs}};
}

void to_json(json& j, const SystemMetadata& m) {
    j = json{
        {"total_transaction_count", m.totalTransactionCount},
        {"data_load_date", formatTimestamp(m.dataLoadDate)},
        {"api_version", m.apiVersion},
        {"min_date", formatTimestamp(m.minDate)},
        {"max_date", formatTimestamp(m.maxDate)}
    };
}

Transaction transactionFromJson(const json& j) {
    auto str = [&](const char* key) -> std::string {
        if (!j.contains(key) || j[key].is_null()) return {};
        return j[key].get<std::string>();
    };

    Transaction t;
    t.id = str("id");
    const std::string dateText = str("date");
    if (!dateText.empty()) {
        auto date = parseTimestamp(dateText);
        if (!date) throw std::invalid_argument("bad date '" + dateText + "'");
        t.date = *date;
    }
    if (j.contains("amount") && !j["amount"].is_null()) t.amount = j["amount"].get<double>();
    if (t.amount < 0.0) throw std::invalid_argument("amount must be non-negative");
    t.clientId = str("client_id");
    t.cardId = str("card_id");
    t.useChip = str("use_chip");
    t.merchantId = str("merchant_id");
    t.merchantCity = str("merchant_city");
    t.merchantState = str("merchant_state");
    t.zip = str("zip");
    t.mcc = str("mcc");
    t.errors = str("errors");
    return t;
}

algo::SearchCriteria criteriaFromJson(const json& j) {
    algo::SearchCriteria c;
    auto number = [&](const char* key, std::optional<double>& out) {
        if (j.contains(key) && !j[key].is_null()) out = j[key].get<double>();
    };
    auto text = [&](const char* key, std::optional<std::string>& out) {
        if (j.contains(key) && !j[key].is_null()) out = j[key].get<std::string>();
    };
    number("min_amount", c.minAmount);
    number("max_amount", c.maxAmount);
    text("client_id", c.customerId);
    text("transaction_id", c.transactionId);
    text("merchant_city", c.merchantCity);
    text("use_chip", c.channelType);
    return c;
}

} // namespace txnlens
