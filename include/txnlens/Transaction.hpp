#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace txnlens {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// One card transaction. Stored records are never mutated in place.
struct Transaction {
    std::string id;
    Timestamp date{};
    std::string clientId;
    std::string cardId;
    double amount = 0.0;
    std::string useChip;       // payment channel, e.g. "Swipe Transaction"
    std::string merchantId;
    std::string merchantCity;
    std::string merchantState;
    std::string zip;
    std::string mcc;           // merchant category code
    std::string errors;        // non-empty marks the record as fraudulent

    bool isFraud() const { return !errors.empty(); }
};

bool operator==(const Transaction& a, const Transaction& b);
inline bool operator!=(const Transaction& a, const Transaction& b) { return !(a == b); }

// "YYYY-MM-DD HH:MM:SS" (UTC). Also accepts a 'T' separator.
std::optional<Timestamp> parseTimestamp(const std::string& text);

// "YYYY-MM-DDTHH:MM:SS"
std::string formatTimestamp(Timestamp ts);

// "YYYY-MM-DD"
std::string formatDate(Timestamp ts);

// Truncates to 00:00:00 UTC of the same day.
Timestamp startOfDay(Timestamp ts);

} // namespace txnlens
