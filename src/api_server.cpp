#include "api_server.h"
#include "pagination.h"
#include "route_registry.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <stdexcept>
#include <unordered_map>
#include "aggregate_index.h"
#include "errors.h"
#include "ids.h"
#include "metrics.h"
#include "obs/context.h"
#include "obs/error_codes.h"
#include "obs/http_log.h"
#include "peer_comparator.h"
#include "report/dossier.h"
#include "scanner.h"
#include "store/pg_aggregate_store.h"

namespace claimscan::api {

namespace {

constexpr double kDefaultThreshold = 0.3;
constexpr int kDefaultPageSize = 50;
constexpr int kMaxPageSize = 1000;

std::string GetRequestId(const httplib::Request& req) {
    if (req.has_header("X-Request-ID")) {
        return req.get_header_value("X-Request-ID");
    }
    return GenerateUuid();
}

struct HttpFailure {
    int status;
    const char* code;
};

// Maps the engine's exception types onto HTTP status and error code.
HttpFailure ClassifyHttpError(const std::exception& e) {
    if (dynamic_cast<const UnknownEntityError*>(&e) != nullptr) {
        return {404, obs::kErrEntityNotFound};
    }
    if (dynamic_cast<const DataUnavailableError*>(&e) != nullptr) {
        return {503, obs::kErrDataUnavailable};
    }
    if (dynamic_cast<const nlohmann::json::parse_error*>(&e) != nullptr) {
        return {400, obs::kErrHttpJsonParseError};
    }
    if (dynamic_cast<const nlohmann::json::type_error*>(&e) != nullptr ||
        dynamic_cast<const std::invalid_argument*>(&e) != nullptr) {
        return {400, obs::kErrHttpInvalidArgument};
    }
    if (dynamic_cast<const pqxx::broken_connection*>(&e) != nullptr) {
        return {500, obs::kErrDbConnectFailed};
    }
    if (dynamic_cast<const pqxx::sql_error*>(&e) != nullptr) {
        return {500, obs::kErrDbQueryFailed};
    }
    return {500, obs::kErrInternal};
}

size_t EnvSize(const char* name, size_t def) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return def;
    }
    try {
        return std::stoul(value);
    } catch (const std::exception& e) {
        spdlog::warn("Ignoring invalid {}='{}': {}", name, value, e.what());
        return def;
    }
}

nlohmann::json ReportMeta(const anomaly::ScanReport& report) {
    return nlohmann::json{
        {"run_id", report.run_id},
        {"started_at", report.started_at},
        {"threshold", report.threshold},
        {"entities_considered", report.entities_considered},
        {"entities_excluded_low_volume", report.entities_excluded_low_volume},
        {"flags_by_kind", report.flags_by_kind},
        {"result_count", report.results.size()}
    };
}

nlohmann::json PageBody(const anomaly::ScanReport& report, int limit, int offset) {
    auto page = PageOf(report.results, limit, offset);
    nlohmann::json j = ReportMeta(report);
    j["results"] = page;
    j["limit"] = limit;
    j["offset"] = offset;
    j["returned"] = page.size();
    j["has_more"] = HasMore(limit, offset, static_cast<int>(page.size()),
                            static_cast<long>(report.results.size()));
    return j;
}

} // namespace

ApiServer::ApiServer(const std::string& db_conn_str, anomaly::ScanConfig config)
    : config_(std::move(config))
{
    size_t pool_size = EnvSize("DB_POOL_SIZE", 5);
    size_t timeout_ms = EnvSize("DB_ACQUIRE_TIMEOUT_MS", 5000);

    auto manager = std::make_shared<PooledDbConnectionManager>(
        db_conn_str, pool_size, std::chrono::milliseconds(timeout_ms));
    auto pg_store = std::make_shared<store::PgAggregateStore>(manager);
    pg_store->EnsureSchema();

    store_ = pg_store;
    db_manager_ = manager;
    Initialize();
}

ApiServer::ApiServer(std::shared_ptr<store::IAggregateStore> store, anomaly::ScanConfig config)
    : config_(std::move(config)), store_(std::move(store))
{
    db_manager_ = store_->GetConnectionManager();
    Initialize();
}

void ApiServer::Initialize() {
    anomaly::ValidateScanConfig(config_);

    // Configure HTTP Server Limits
    svr_.set_payload_max_length(1024 * 1024); // 1MB
    svr_.set_read_timeout(5, 0);
    svr_.set_write_timeout(30, 0); // scans over large tables take a while

    using Handler = void (ApiServer::*)(const httplib::Request&, httplib::Response&);
    static const std::unordered_map<std::string, Handler> kHandlers = {
        {"HealthCheck", &ApiServer::HandleHealth},
        {"ReadyCheck", &ApiServer::HandleReady},
        {"Metrics", &ApiServer::HandleMetrics},
        {"RunScan", &ApiServer::HandleRunScan},
        {"GetScan", &ApiServer::HandleGetScan},
        {"GetDossier", &ApiServer::HandleGetDossier},
        {"GetPeers", &ApiServer::HandleGetPeers}
    };

    for (const auto& route : kRequiredRoutes) {
        auto it = kHandlers.find(route.handler_name);
        if (it == kHandlers.end()) {
            throw std::logic_error("No handler bound for route " + route.method + " " + route.pattern);
        }
        Handler handler = it->second;
        auto bound = [this, handler](const httplib::Request& req, httplib::Response& res) {
            (this->*handler)(req, res);
        };
        if (route.method == "GET") {
            svr_.Get(route.pattern, bound);
        } else if (route.method == "POST") {
            svr_.Post(route.pattern, bound);
        } else {
            throw std::logic_error("Unsupported method in route registry: " + route.method);
        }
    }
}

ApiServer::~ApiServer() {
    Stop();
}

void ApiServer::Start(const std::string& host, int port) {
    ValidateRoutes();
    spdlog::info("HTTP API Server listening on {}:{}", host, port);
    svr_.listen(host.c_str(), port);
}

auto ApiServer::BindToAnyPort(const std::string& host) -> int {
    ValidateRoutes();
    int port = svr_.bind_to_any_port(host);
    if (port < 0) {
        throw std::runtime_error("Failed to bind HTTP API on " + host);
    }
    spdlog::info("HTTP API Server bound to {}:{}", host, port);
    return port;
}

void ApiServer::ListenAfterBind() {
    svr_.listen_after_bind();
}

void ApiServer::Stop() {
    svr_.stop();
}

void ApiServer::HandleHealth(const httplib::Request& req, httplib::Response& res) {
    std::string rid = GetRequestId(req);
    obs::HttpRequestLogScope log(req, res, "api_server", rid);
    res.status = 200;
    res.set_content("{\"status\":\"OK\"}", "application/json");
}

void ApiServer::HandleReady(const httplib::Request& req, httplib::Response& res) {
    std::string rid = GetRequestId(req);
    obs::HttpRequestLogScope log(req, res, "api_server", rid);
    try {
        auto C = db_manager_->GetConnection();
        res.status = 200;
        res.set_content("{\"status\":\"READY\"}", "application/json");
    } catch (const std::exception& e) {
        log.RecordError(obs::kErrDbConnectFailed, e.what(), 503);
        res.status = 503;
        res.set_content("{\"status\":\"UNREADY\", \"reason\":\"DB_CONNECTION_FAILED\"}", "application/json");
    }
}

void ApiServer::HandleMetrics(const httplib::Request& req, httplib::Response& res) {
    std::string rid = GetRequestId(req);
    obs::HttpRequestLogScope log(req, res, "api_server", rid);
    res.status = 200;
    res.set_content(metrics::MetricsRegistry::Instance().ToPrometheus(), "text/plain");
}

void ApiServer::HandleRunScan(const httplib::Request& req, httplib::Response& res) {
    std::string rid = GetRequestId(req);
    obs::HttpRequestLogScope log(req, res, "api_server", rid);
    obs::Context ctx;
    ctx.request_id = rid;
    obs::ScopedContext scope(ctx);
    try {
        double threshold = GetDoubleParam(req, "threshold", kDefaultThreshold);
        if (!req.body.empty()) {
            auto j = nlohmann::json::parse(req.body);
            if (j.contains("threshold")) {
                if (!j["threshold"].is_number()) {
                    throw std::invalid_argument("threshold must be a number");
                }
                threshold = j["threshold"].get<double>();
            }
        }
        int limit = std::clamp(GetIntParam(req, "limit", kDefaultPageSize), 1, kMaxPageSize);

        auto tables = store_->LoadTables();
        anomaly::Scanner scanner(config_);
        auto report = scanner.Scan(tables, threshold);
        store_->SaveScanReport(report);
        CacheReport(report);

        log.AddFields({{"scan_run_id", report.run_id}, {"result_count", report.results.size()}});
        SendJson(res, PageBody(report, limit, 0), 201, rid);
    } catch (const std::exception& e) {
        auto failure = ClassifyHttpError(e);
        log.RecordError(failure.code, e.what(), failure.status);
        SendError(res, std::string("Scan failed: ") + e.what(), failure.status, failure.code, rid);
    }
}

void ApiServer::HandleGetScan(const httplib::Request& req, httplib::Response& res) {
    std::string rid = GetRequestId(req);
    obs::HttpRequestLogScope log(req, res, "api_server", rid);
    std::string run_id = req.matches[1];
    log.AddFields({{"scan_run_id", run_id}});
    try {
        int limit = GetIntParam(req, "limit", kDefaultPageSize);
        int offset = GetIntParam(req, "offset", 0);
        if (limit < 1 || limit > kMaxPageSize || offset < 0) {
            throw std::invalid_argument("limit must be within [1, 1000] and offset non-negative");
        }

        auto report = FindReport(run_id);
        if (!report.has_value()) {
            log.RecordError(obs::kErrScanRunNotFound, "Scan run not found", 404);
            SendError(res, "Scan run not found", 404, obs::kErrScanRunNotFound, rid);
            return;
        }
        SendJson(res, PageBody(*report, limit, offset), 200, rid);
    } catch (const std::exception& e) {
        auto failure = ClassifyHttpError(e);
        log.RecordError(failure.code, e.what(), failure.status);
        SendError(res, e.what(), failure.status, failure.code, rid);
    }
}

void ApiServer::HandleGetDossier(const httplib::Request& req, httplib::Response& res) {
    std::string rid = GetRequestId(req);
    obs::HttpRequestLogScope log(req, res, "api_server", rid);
    std::string entity_id = req.matches[1];
    log.AddFields({{"entity_id", entity_id}});
    obs::Context ctx;
    ctx.request_id = rid;
    ctx.entity_id = entity_id;
    obs::ScopedContext scope(ctx);
    try {
        std::optional<anomaly::ScanResult> scan_result;
        std::string run_id = GetStrParam(req, "run_id");
        if (!run_id.empty()) {
            auto report = FindReport(run_id);
            if (!report.has_value()) {
                log.RecordError(obs::kErrScanRunNotFound, "Scan run not found", 404);
                SendError(res, "Scan run not found", 404, obs::kErrScanRunNotFound, rid);
                return;
            }
            for (auto& result : report->results) {
                if (result.entity_id == entity_id) {
                    scan_result = std::move(result);
                    break;
                }
            }
        } else {
            scan_result = store_->GetLatestScanResult(entity_id);
        }

        auto tables = store_->LoadTables();
        auto dossier = report::BuildDossier(tables, entity_id, std::move(scan_result));
        SendJson(res, dossier, 200, rid);
    } catch (const std::exception& e) {
        auto failure = ClassifyHttpError(e);
        log.RecordError(failure.code, e.what(), failure.status);
        SendError(res, e.what(), failure.status, failure.code, rid);
    }
}

void ApiServer::HandleGetPeers(const httplib::Request& req, httplib::Response& res) {
    std::string rid = GetRequestId(req);
    obs::HttpRequestLogScope log(req, res, "api_server", rid);
    std::string entity_id = req.matches[1];
    log.AddFields({{"entity_id", entity_id}});
    try {
        auto tables = store_->LoadTables();
        if (!tables.monthly.has_value()) {
            throw DataUnavailableError("Monthly aggregate table is missing");
        }
        auto index = anomaly::BuildHistoryIndex(*tables.monthly);
        auto outcome = anomaly::PeerComparator::CompareWithinSpecialty(index, tables.attributes, entity_id);
        if (outcome.status == anomaly::PeerOutcome::Status::UnknownEntity) {
            log.RecordError(obs::kErrEntityNotFound, outcome.reason, 404);
            SendError(res, outcome.reason, 404, obs::kErrEntityNotFound, rid);
            return;
        }
        nlohmann::json j = outcome;
        j["entity_id"] = entity_id;
        SendJson(res, j, 200, rid);
    } catch (const std::exception& e) {
        auto failure = ClassifyHttpError(e);
        log.RecordError(failure.code, e.what(), failure.status);
        SendError(res, e.what(), failure.status, failure.code, rid);
    }
}

void ApiServer::CacheReport(const anomaly::ScanReport& report) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    if (run_cache_.count(report.run_id) == 0) {
        run_cache_order_.push_back(report.run_id);
    }
    run_cache_[report.run_id] = report;
    while (run_cache_order_.size() > kRunCacheCapacity) {
        run_cache_.erase(run_cache_order_.front());
        run_cache_order_.pop_front();
    }
}

auto ApiServer::FindReport(const std::string& run_id) -> std::optional<anomaly::ScanReport> {
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = run_cache_.find(run_id);
        if (it != run_cache_.end()) {
            return it->second;
        }
    }
    auto report = store_->GetScanReport(run_id);
    if (report.has_value()) {
        CacheReport(*report);
    }
    return report;
}

void ApiServer::SendJson(httplib::Response& res, nlohmann::json j, int status, const std::string& request_id) {
    if (!request_id.empty() && j.is_object() && !j.contains("request_id")) {
        j["request_id"] = request_id;
    }
    res.status = status;
    res.set_content(j.dump(), "application/json");
}

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
void ApiServer::SendError(httplib::Response& res,
                          const std::string& msg,
                          int status,
                          const std::string& code,
                          const std::string& request_id) {
    metrics::MetricsRegistry::Instance().Increment("http_errors_total", {{"status", std::to_string(status)}, {"code", code}});
    nlohmann::json j;
    j["error"]["message"] = msg;
    j["error"]["code"] = code;
    if (!request_id.empty()) {
        j["error"]["request_id"] = request_id;
    }
    SendJson(res, j, status, request_id);
}

auto ApiServer::GetIntParam(const httplib::Request& req, const std::string& key, int def) -> int {
    if (!req.has_param(key.c_str())) { return def; }
    try {
        return std::stoi(req.get_param_value(key.c_str()));
    } catch (const std::exception&) {
        throw std::invalid_argument("query parameter '" + key + "' must be an integer");
    }
}

auto ApiServer::GetDoubleParam(const httplib::Request& req, const std::string& key, double def) -> double {
    if (!req.has_param(key.c_str())) { return def; }
    try {
        return std::stod(req.get_param_value(key.c_str()));
    } catch (const std::exception&) {
        throw std::invalid_argument("query parameter '" + key + "' must be a number");
    }
}

auto ApiServer::GetStrParam(const httplib::Request& req, const std::string& key) -> std::string {
    if (!req.has_param(key.c_str())) { return ""; }
    return req.get_param_value(key.c_str());
}

auto ApiServer::ValidateRoutes() -> void {
    if (kRequiredRoutes.size() != 7) {
        spdlog::warn("Route registry count mismatch! Expected 7, got {}", kRequiredRoutes.size());
    } else {
        spdlog::info("Route registry validated ({} routes)", kRequiredRoutes.size());
    }
}

} // namespace claimscan::api
