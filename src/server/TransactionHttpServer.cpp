#include "TransactionHttpServer.hpp"
#include "txnlens/JsonCodec.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>

using json = nlohmann::json;
using txnlens::ErrorCode;

namespace {

int statusFor(ErrorCode code) {
    switch (code) {
    case ErrorCode::NotFound: return 404;
    case ErrorCode::InvalidPagination:
    case ErrorCode::InvalidSearchFilters:
    case ErrorCode::InvalidRecordData: return 400;
    case ErrorCode::DataLoadError: return 500;
    }
    return 500;
}

// Absent parameter gives the default; a present but non-integer one gives nullopt.
std::optional<long long> intParam(const httplib::Request& req, const char* name, long long def) {
    if (!req.has_param(name)) return def;
    const std::string raw = req.get_param_value(name);
    try {
        std::size_t used = 0;
        long long v = std::stoll(raw, &used);
        if (used != raw.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

TransactionHttpServer::TransactionHttpServer(const txnlens::Config& config, txnlens::TransactionStore& store)
    : config_(config),
      transactions_(store),
      statistics_(store),
      fraud_(store),
      customers_(store),
      health_(store) {
    const std::size_t threads = config_.threads;
    server_.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    setupRoutes();
}

void TransactionHttpServer::run() {
    std::cout << "TransactionHttpServer listening on "
              << config_.host << ":" << config_.port
              << " with " << config_.threads << " workers" << std::endl;
    if (!server_.listen(config_.host.c_str(), config_.port)) {
        throw std::runtime_error("failed to listen on " + config_.host + ":" + std::to_string(config_.port));
    }
}

void TransactionHttpServer::stop() {
    server_.stop();
}

void TransactionHttpServer::setupRoutes() {

    // JSON helpers
    auto ok = [](const json& data) {
        return json{
            {"status", "ok"},
            {"data", data}
        };
    };

    auto err = [](int code, const std::string& message) {
        return json{
            {"status", "error"},
            {"error", {
                {"code", code},
                {"message", message}
            }}
        };
    };

    auto isJsonContent = [](const httplib::Request& req) {
        auto ct = req.get_header_value("Content-Type");
        return ct.find("application/json") != std::string::npos;
    };

    // CORS helper to add to ALL responses
    auto addCors = [](httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    };

    auto reply = [ok, addCors](httplib::Response& res, const json& data, int status = 200) {
        res.status = status;
        res.set_content(ok(data).dump(), "application/json");
        addCors(res);
    };

    auto fail = [err, addCors](httplib::Response& res, int status, const std::string& message) {
        res.status = status;
        res.set_content(err(status, message).dump(), "application/json");
        addCors(res);
    };

    auto failWith = [fail](httplib::Response& res, const txnlens::Error& e) {
        fail(res, statusFor(e.code), e.message);
    };

    // page/limit from the query string; false once a 400 has been written
    auto readPaging = [fail](const httplib::Request& req, httplib::Response& res, long long& page, long long& limit) {
        auto p = intParam(req, "page", txnlens::PaginationService::kDefaultPage);
        auto l = intParam(req, "limit", txnlens::PaginationService::kDefaultLimit);
        if (!p || !l) {
            fail(res, 400, "page and limit must be integers");
            return false;
        }
        page = *p;
        limit = *l;
        return true;
    };

    auto verbose = config_.verbose;
    server_.set_logger([verbose](const httplib::Request& req, const httplib::Response& res) {
        if (verbose) {
            std::cerr << "TransactionHttpServer: " << req.method << " " << req.path << " -> " << res.status << "\n";
        }
    });

    server_.set_exception_handler([fail](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string message = "internal error";
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            message = e.what();
        } catch (...) {
            message = "unknown exception";
        }
        std::cerr << "TransactionHttpServer: " << req.method << " " << req.path << " failed: " << message << "\n";
        fail(res, 500, message);
    });

    // Handle preflight OPTIONS requests for ANY route
    server_.Options(R"(.*)", [addCors](const httplib::Request&, httplib::Response& res) {
        addCors(res);
        res.status = 200;
        res.set_content("", "text/plain");
    });

    // --- TRANSACTIONS ---
    server_.Get("/api/transactions", [this, reply, failWith, readPaging](const httplib::Request& req, httplib::Response& res) {
        long long page = 0, limit = 0;
        if (!readPaging(req, res, page, limit)) return;
        auto result = transactions_.list(page, limit);
        if (!result) return failWith(res, result.error());
        reply(res, result.value());
    });

    server_.Get("/api/transactions/recent", [this, reply, fail, failWith](const httplib::Request& req, httplib::Response& res) {
        auto limit = intParam(req, "limit", txnlens::PaginationService::kDefaultLimit);
        if (!limit) return fail(res, 400, "limit must be an integer");
        auto result = transactions_.recent(*limit);
        if (!result) return failWith(res, result.error());
        reply(res, result.value());
    });

    server_.Get("/api/transactions/types", [this, reply](const httplib::Request&, httplib::Response& res) {
        reply(res, transactions_.channelTypes());
    });

    server_.Post("/api/transactions/search", [this, reply, fail, failWith, readPaging, isJsonContent](const httplib::Request& req, httplib::Response& res) {
        long long page = 0, limit = 0;
        if (!readPaging(req, res, page, limit)) return;
        txnlens::algo::SearchCriteria criteria;
        if (!req.body.empty()) {
            if (!isJsonContent(req)) return fail(res, 415, "Content-Type must be application/json");
            try {
                auto body = json::parse(req.body);
                if (!body.is_object()) return fail(res, 400, "search body must be a JSON object");
                criteria = txnlens::criteriaFromJson(body);
            } catch (const json::exception& e) {
                return fail(res, 400, std::string("Invalid JSON: ") + e.what());
            }
        }
        auto result = transactions_.search(criteria, page, limit);
        if (!result) return failWith(res, result.error());
        reply(res, result.value());
    });

    server_.Get(R"(/api/transactions/customer/([^/]+))", [this, reply, failWith, readPaging](const httplib::Request& req, httplib::Response& res) {
        long long page = 0, limit = 0;
        if (!readPaging(req, res, page, limit)) return;
        auto result = transactions_.byCustomer(req.matches[1], page, limit);
        if (!result) return failWith(res, result.error());
        reply(res, result.value());
    });

    server_.Get(R"(/api/transactions/merchant/([^/]+))", [this, reply, failWith, readPaging](const httplib::Request& req, httplib::Response& res) {
        long long page = 0, limit = 0;
        if (!readPaging(req, res, page, limit)) return;
        auto result = transactions_.byMerchant(req.matches[1], page, limit);
        if (!result) return failWith(res, result.error());
        reply(res, result.value());
    });

    server_.Get(R"(/api/transactions/([^/]+))", [this, reply, failWith](const httplib::Request& req, httplib::Response& res) {
        auto result = transactions_.get(req.matches[1]);
        if (!result) return failWith(res, result.error());
        reply(res, result.value());
    });

    server_.Delete(R"(/api/transactions/([^/]+))", [this, reply, failWith](const httplib::Request& req, httplib::Response& res) {
        std::string id = req.matches[1];
        auto status = transactions_.remove(id);
        if (!status) return failWith(res, status.error());
        reply(res, json{{"id", id}, {"deleted", true}});
    });

    // --- STATISTICS ---
    server_.Get("/api/stats/overview", [this, reply](const httplib::Request&, httplib::Response& res) {
        reply(res, statistics_.overview());
    });

    server_.Get("/api/stats/amount-distribution", [this, reply](const httplib::Request&, httplib::Response& res) {
        reply(res, statistics_.amountDistribution());
    });

    server_.Get("/api/stats/by-type", [this, reply](const httplib::Request&, httplib::Response& res) {
        reply(res, statistics_.byCategoryCode());
    });

    server_.Get("/api/stats/daily", [this, reply](const httplib::Request&, httplib::Response& res) {
        reply(res, statistics_.daily());
    });

    // --- FRAUD ---
    server_.Get("/api/fraud/summary", [this, reply](const httplib::Request&, httplib::Response& res) {
        reply(res, fraud_.summary());
    });

    server_.Get("/api/fraud/by-type", [this, reply](const httplib::Request&, httplib::Response& res) {
        reply(res, fraud_.byChannelType());
    });

    server_.Post("/api/fraud/predict", [this, reply, fail, isJsonContent](const httplib::Request& req, httplib::Response& res) {
        if (!isJsonContent(req)) return fail(res, 415, "Content-Type must be application/json");
        try {
            auto body = json::parse(req.body);
            if (!body.is_object()) return fail(res, 400, "transaction must be a JSON object");
            reply(res, fraud_.predict(txnlens::transactionFromJson(body)));
        } catch (const json::exception& e) {
            fail(res, 400, std::string("Invalid JSON: ") + e.what());
        } catch (const std::invalid_argument& e) {
            fail(res, 400, std::string("Invalid transaction: ") + e.what());
        }
    });

    server_.Get(R"(/api/fraud/predict/([^/]+))", [this, reply, failWith](const httplib::Request& req, httplib::Response& res) {
        auto result = fraud_.predictById(req.matches[1]);
        if (!result) return failWith(res, result.error());
        reply(res, result.value());
    });

    // --- CUSTOMERS ---
    server_.Get("/api/customers", [this, reply, failWith, readPaging](const httplib::Request& req, httplib::Response& res) {
        long long page = 0, limit = 0;
        if (!readPaging(req, res, page, limit)) return;
        auto result = customers_.listAll(page, limit);
        if (!result) return failWith(res, result.error());
        reply(res, result.value());
    });

    server_.Get("/api/customers/top", [this, reply, fail](const httplib::Request& req, httplib::Response& res) {
        auto n = intParam(req, "n", 10);
        if (!n) return fail(res, 400, "n must be an integer");
        if (*n < txnlens::PaginationService::kMinLimit || *n > txnlens::PaginationService::kMaxLimit) {
            return fail(res, 400, "n must be between 1 and 1000");
        }
        reply(res, customers_.top(static_cast<std::size_t>(*n)));
    });

    server_.Get(R"(/api/customers/([^/]+))", [this, reply](const httplib::Request& req, httplib::Response& res) {
        reply(res, customers_.details(req.matches[1]));
    });

    // --- SYSTEM ---
    server_.Get("/api/system/health", [this, reply](const httplib::Request&, httplib::Response& res) {
        auto health = health_.checkHealth();
        reply(res, health, health.status == "healthy" ? 200 : 503);
    });

    server_.Get("/api/system/metadata", [this, reply](const httplib::Request&, httplib::Response& res) {
        reply(res, health_.metadata());
    });
}
