#pragma once

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "contract.h"
#include "scan_config.h"
#include "store/iaggregate_store.h"

namespace claimscan::api {

class ApiServer {
public:
    friend class ApiServerTestPeer;
    ApiServer(const std::string& db_conn_str, anomaly::ScanConfig config);
    ApiServer(std::shared_ptr<store::IAggregateStore> store, anomaly::ScanConfig config);
    ~ApiServer();

    void Start(const std::string& host, int port);
    // Binds an ephemeral port and returns it; serve with ListenAfterBind().
    auto BindToAnyPort(const std::string& host) -> int;
    void ListenAfterBind();
    void Stop();

    // Number of recent scan reports kept in memory for /scans and dossier lookups.
    static constexpr size_t kRunCacheCapacity = 8;

private:
    void Initialize();
    // Route Handlers
    void HandleRunScan(const httplib::Request& req, httplib::Response& res);
    void HandleGetScan(const httplib::Request& req, httplib::Response& res);
    void HandleGetDossier(const httplib::Request& req, httplib::Response& res);
    void HandleGetPeers(const httplib::Request& req, httplib::Response& res);
    void HandleHealth(const httplib::Request& req, httplib::Response& res);
    void HandleReady(const httplib::Request& req, httplib::Response& res);
    void HandleMetrics(const httplib::Request& req, httplib::Response& res);

    void ValidateRoutes();

    void CacheReport(const anomaly::ScanReport& report);
    auto FindReport(const std::string& run_id) -> std::optional<anomaly::ScanReport>;

    // Helpers
    static void SendJson(httplib::Response& res, nlohmann::json j, int status = 200, const std::string& request_id = "");
    static void SendError(httplib::Response& res,
                          const std::string& msg,
                          int status,
                          const std::string& code,
                          const std::string& request_id = "");
    static auto GetIntParam(const httplib::Request& req, const std::string& key, int def) -> int;
    static auto GetDoubleParam(const httplib::Request& req, const std::string& key, double def) -> double;
    static auto GetStrParam(const httplib::Request& req, const std::string& key) -> std::string;

    httplib::Server svr_;
    anomaly::ScanConfig config_;
    std::shared_ptr<store::IAggregateStore> store_;
    std::shared_ptr<DbConnectionManager> db_manager_;

    std::mutex cache_mutex_;
    std::map<std::string, anomaly::ScanReport> run_cache_;
    std::deque<std::string> run_cache_order_;
};

} // namespace claimscan::api
