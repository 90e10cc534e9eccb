#include "txnlens/services/HealthService.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <string>

namespace txnlens {

HealthService::HealthService(const TransactionStore& store) : store_(store) {
}

HealthStatus HealthService::checkHealth() const {
    const auto start = std::chrono::steady_clock::now();
    HealthStatus out;
    out.status = "healthy";
    try {
        auto snap = store_.snapshot();
        std::string reason;
        if (snap->fraudCount() > snap->size()) {
            reason = "fraud index larger than record map";
        } else if (!snap->empty()) {
            // read one record back through the lookup path
            const auto& first = *snap->records().begin();
            const Transaction* found = snap->find(first.first);
            if (found != &first.second) reason = "record lookup does not match record map";
        }
        if (!reason.empty()) {
            std::cerr << "HealthService: store check failed: " << reason << "\n";
            out.status = "unhealthy";
        }
    } catch (const std::exception& e) {
        std::cerr << "HealthService: store check failed: " << e.what() << "\n";
        out.status = "unhealthy";
    }
    const auto elapsed = std::chrono::steady_clock::now() - start;
    out.responseTimeMs = std::max(0.0, std::chrono::duration<double, std::milli>(elapsed).count());
    return out;
}

SystemMetadata HealthService::metadata() const {
    auto snap = store_.snapshot();
    const Timestamp now = Clock::now();
    SystemMetadata out;
    out.totalTransactionCount = snap->size();
    out.dataLoadDate = snap->loadedAt().value_or(now);
    out.apiVersion = kApiVersion;
    if (snap->empty()) {
        out.minDate = out.maxDate = now;
    } else {
        out.minDate = snap->minDate().value_or(now);
        out.maxDate = snap->maxDate().value_or(now);
    }
    return out;
}

} // namespace txnlens
