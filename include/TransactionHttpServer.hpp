#pragma once

#include <string>
#include "httplib.h"
#include "TransactionStore.hpp"
#include "txnlens/Config.hpp"
#include "txnlens/services/CustomerService.hpp"
#include "txnlens/services/FraudService.hpp"
#include "txnlens/services/HealthService.hpp"
#include "txnlens/services/StatisticsService.hpp"
#include "txnlens/services/TransactionService.hpp"
#include <nlohmann/json.hpp>

class TransactionHttpServer {
public:
    TransactionHttpServer(const txnlens::Config& config, txnlens::TransactionStore& store);
    void run();
    void stop();

private:
    void setupRoutes();

    txnlens::Config config_;
    httplib::Server server_;
    txnlens::TransactionService transactions_;
    txnlens::StatisticsService statistics_;
    txnlens::FraudService fraud_;
    txnlens::CustomerService customers_;
    txnlens::HealthService health_;
};
