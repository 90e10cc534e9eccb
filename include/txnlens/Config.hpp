#pragma once

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace txnlens {

struct Config {
    std::string host = "0.0.0.0";
    int port = 8080;
    std::string csvPath = "data/transactions.csv";
    std::size_t threads = 8;
    std::size_t progressEvery = 10000;
    bool verbose = false;

    // Defaults, then the JSON file (if any), then TXNLENS_* environment
    // variables. An unreadable or malformed file throws std::runtime_error.
    static Config load(const std::string& path = "");

    void applyJson(const nlohmann::json& j);
    void applyEnvironment();

    nlohmann::json toJson() const;
};

} // namespace txnlens
