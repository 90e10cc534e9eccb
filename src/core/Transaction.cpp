#include "txnlens/Transaction.hpp"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace txnlens {

namespace {

constexpr std::chrono::seconds kSecondsPerDay{86400};

std::tm toUtc(Timestamp ts) {
    std::time_t t = Clock::to_time_t(ts);
    std::tm out{};
    gmtime_r(&t, &out);
    return out;
}

} // namespace

bool operator==(const Transaction& a, const Transaction& b) {
    return a.id == b.id && a.date == b.date && a.clientId == b.clientId &&
           a.cardId == b.cardId && a.amount == b.amount && a.useChip == b.useChip &&
           a.merchantId == b.merchantId && a.merchantCity == b.merchantCity &&
           a.merchantState == b.merchantState && a.zip == b.zip && a.mcc == b.mcc &&
           a.errors == b.errors;
}

std::optional<Timestamp> parseTimestamp(const std::string& text) {
    if (text.size() != 19) return std::nullopt;
    if (text[10] != ' ' && text[10] != 'T') return std::nullopt;

    std::string normalized = text;
    normalized[10] = ' ';
    std::tm tm{};
    std::istringstream in(normalized);
    in >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (in.fail()) return std::nullopt;

    // get_time does not range-check the day against the month
    std::tm check = tm;
    std::time_t t = timegm(&check);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    if (check.tm_mday != tm.tm_mday || check.tm_mon != tm.tm_mon) return std::nullopt;
    return Clock::from_time_t(t);
}

std::string formatTimestamp(Timestamp ts) {
    std::tm tm = toUtc(ts);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}

std::string formatDate(Timestamp ts) {
    std::tm tm = toUtc(ts);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
    return buf;
}

Timestamp startOfDay(Timestamp ts) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch());
    auto days = secs / kSecondsPerDay;
    if (secs.count() < 0 && secs % kSecondsPerDay != std::chrono::seconds::zero()) --days;
    return Timestamp(std::chrono::duration_cast<Clock::duration>(days * kSecondsPerDay));
}

} // namespace txnlens
