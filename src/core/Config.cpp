#include "txnlens/Config.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace txnlens {

namespace {

bool parseFlag(const std::string& v) {
    return !(v.empty() || v == "0" || v == "false" || v == "off");
}

constexpr int kMaxPort = 65535;

// Whole-string integer parse; values below minValue clamp up, values above
// maxValue are ignored.
template <typename T>
void envNumber(const char* name, T& target, T minValue, T maxValue = std::numeric_limits<T>::max()) {
    const char* raw = std::getenv(name);
    if (!raw) return;
    const std::string text = raw;
    try {
        std::size_t used = 0;
        long long v = std::stoll(text, &used);
        if (used != text.size()) {
            std::cerr << "Config: ignoring malformed " << name << "=" << text << "\n";
            return;
        }
        if (v > 0 && static_cast<unsigned long long>(v) > static_cast<unsigned long long>(maxValue)) {
            std::cerr << "Config: ignoring out-of-range " << name << "=" << text << "\n";
            return;
        }
        target = v < static_cast<long long>(minValue) ? minValue : static_cast<T>(v);
    } catch (const std::exception&) {
        std::cerr << "Config: ignoring malformed " << name << "=" << text << "\n";
    }
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::string file = path;
    if (file.empty()) {
        if (const char* envPath = std::getenv("TXNLENS_CONFIG")) file = envPath;
    }
    if (!file.empty()) {
        std::ifstream in(file);
        if (!in) throw std::runtime_error("cannot open config file " + file);
        json j = json::parse(in, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            throw std::runtime_error("config file " + file + " is not a JSON object");
        }
        cfg.applyJson(j);
    }
    cfg.applyEnvironment();
    return cfg;
}

void Config::applyJson(const json& j) {
    host = j.value("host", host);
    port = j.value("port", port);
    csvPath = j.value("csv_path", csvPath);
    threads = std::max<std::size_t>(1, j.value("threads", threads));
    progressEvery = std::max<std::size_t>(1, j.value("progress_every", progressEvery));
    verbose = j.value("verbose", verbose);
}

void Config::applyEnvironment() {
    if (const char* envHost = std::getenv("TXNLENS_HOST")) host = envHost;
    if (const char* envCsv = std::getenv("TXNLENS_CSV_PATH")) csvPath = envCsv;
    envNumber("TXNLENS_PORT", port, 1, kMaxPort);
    envNumber<std::size_t>("TXNLENS_THREADS", threads, 1);
    envNumber<std::size_t>("TXNLENS_PROGRESS_EVERY", progressEvery, 1);
    if (const char* envVerbose = std::getenv("TXNLENS_VERBOSE")) verbose = parseFlag(envVerbose);
}

json Config::toJson() const {
    return json{
        {"host", host},
        {"port", port},
        {"csv_path", csvPath},
        {"threads", threads},
        {"progress_every", progressEvery},
        {"verbose", verbose}
    };
}

} // namespace txnlens
