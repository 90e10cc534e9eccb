#pragma once

#include <cstddef>
#include <string>
#include "TransactionStore.hpp"

namespace txnlens {

constexpr const char* kApiVersion = "1.0.0";

struct HealthStatus {
    std::string status;     // "healthy" or "unhealthy"
    double responseTimeMs = 0.0;
};

struct SystemMetadata {
    std::size_t totalTransactionCount = 0;
    Timestamp dataLoadDate{};
    std::string apiVersion;
    Timestamp minDate{};
    Timestamp maxDate{};
};

class HealthService {
public:
    explicit HealthService(const TransactionStore& store);

    HealthStatus checkHealth() const;

    // Date bounds are the store's tracked bounds; both fall back to now
    // when the store is empty, as does the load date before any load.
    SystemMetadata metadata() const;

private:
    const TransactionStore& store_;
};

} // namespace txnlens
