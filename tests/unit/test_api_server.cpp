#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "api_server.h"
#include "fixtures/claims_fixture.h"
#include "mocks/mock_aggregate_store.h"
#include "route_registry.h"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <regex>

namespace claimscan::api {

class ApiServerTestPeer {
public:
    static void RunScan(ApiServer& s, const httplib::Request& req, httplib::Response& res) { s.HandleRunScan(req, res); }
    static void GetScan(ApiServer& s, const httplib::Request& req, httplib::Response& res) { s.HandleGetScan(req, res); }
    static void GetDossier(ApiServer& s, const httplib::Request& req, httplib::Response& res) { s.HandleGetDossier(req, res); }
    static void GetPeers(ApiServer& s, const httplib::Request& req, httplib::Response& res) { s.HandleGetPeers(req, res); }
    static void Health(ApiServer& s, const httplib::Request& req, httplib::Response& res) { s.HandleHealth(req, res); }
};

namespace {

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SaveArg;

// Fills req.path and req.matches the way the router does for `pattern`.
void Route(httplib::Request& req, const std::string& handler_name, const std::string& path) {
    for (const auto& route : kRequiredRoutes) {
        if (route.handler_name == handler_name) {
            req.method = route.method;
            req.path = path;
            ASSERT_TRUE(std::regex_match(req.path, req.matches, std::regex(route.pattern))) << path;
            return;
        }
    }
    FAIL() << "no route for " << handler_name;
}

auto Body(const httplib::Response& res) -> nlohmann::json {
    return nlohmann::json::parse(res.body);
}

class ApiServerTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<MockAggregateStore>> store;
    std::unique_ptr<ApiServer> server;

    void SetUp() override {
        store = std::make_shared<NiceMock<MockAggregateStore>>();
        ON_CALL(*store, LoadTables()).WillByDefault(Return(fixtures::BuildTables()));
        server = std::make_unique<ApiServer>(store, anomaly::ScanConfig{});
    }

    auto RunScan(const std::string& body = "") -> httplib::Response {
        httplib::Request req;
        req.method = "POST";
        req.path = "/scans";
        req.body = body;
        httplib::Response res;
        ApiServerTestPeer::RunScan(*server, req, res);
        return res;
    }
};

TEST_F(ApiServerTest, HealthReportsOk) {
    httplib::Request req;
    req.set_header("X-Request-ID", "rid-1");
    httplib::Response res;
    ApiServerTestPeer::Health(*server, req, res);
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(Body(res)["status"], "OK");
}

TEST_F(ApiServerTest, RunScanPersistsAndReturnsRankedPage) {
    anomaly::ScanReport saved;
    EXPECT_CALL(*store, SaveScanReport(_)).WillOnce(SaveArg<0>(&saved));

    auto res = RunScan(R"({"threshold": 0.3})");
    ASSERT_EQ(res.status, 201) << res.body;
    auto j = Body(res);
    EXPECT_EQ(j["run_id"], saved.run_id);
    EXPECT_EQ(j["entities_considered"], 25);
    EXPECT_EQ(j["entities_excluded_low_volume"], 1);
    ASSERT_EQ(j["results"].size(), 4u);
    EXPECT_EQ(j["results"][0]["entity_id"], fixtures::kRevenue);
    EXPECT_EQ(j["results"][3]["entity_id"], fixtures::kSpike);
    EXPECT_FALSE(j["has_more"].get<bool>());
    EXPECT_EQ(saved.results.size(), 4u);
}

TEST_F(ApiServerTest, RunScanRejectsBadThreshold) {
    EXPECT_CALL(*store, SaveScanReport(_)).Times(0);
    EXPECT_EQ(RunScan(R"({"threshold": 1.5})").status, 400);
    EXPECT_EQ(RunScan(R"({"threshold": "high"})").status, 400);
    auto res = RunScan("{oops");
    EXPECT_EQ(res.status, 400);
    EXPECT_EQ(Body(res)["error"]["code"], "E_HTTP_JSON_PARSE_ERROR");
}

TEST_F(ApiServerTest, RunScanWithoutAggregatesIsUnavailable) {
    ON_CALL(*store, LoadTables()).WillByDefault(Return(AggregateTables{}));
    auto res = RunScan();
    EXPECT_EQ(res.status, 503);
    EXPECT_EQ(Body(res)["error"]["code"], "E_DATA_UNAVAILABLE");
}

TEST_F(ApiServerTest, RunScanOverEmptyAggregatesReturnsEmptyReport) {
    AggregateTables empty;
    empty.monthly = std::vector<MonthlyAggregate>{};
    ON_CALL(*store, LoadTables()).WillByDefault(Return(empty));
    auto res = RunScan();
    ASSERT_EQ(res.status, 201) << res.body;
    auto j = Body(res);
    EXPECT_TRUE(j["results"].empty());
    EXPECT_EQ(j["entities_considered"], 0);
}

TEST_F(ApiServerTest, GetScanPagesCachedRun) {
    auto run_id = Body(RunScan())["run_id"].get<std::string>();
    EXPECT_CALL(*store, GetScanReport(_)).Times(0);

    httplib::Request req;
    Route(req, "GetScan", "/scans/" + run_id);
    req.params.emplace("limit", "2");
    req.params.emplace("offset", "1");
    httplib::Response res;
    ApiServerTestPeer::GetScan(*server, req, res);

    ASSERT_EQ(res.status, 200) << res.body;
    auto j = Body(res);
    ASSERT_EQ(j["results"].size(), 2u);
    EXPECT_EQ(j["results"][0]["entity_id"], fixtures::kVolume);
    EXPECT_TRUE(j["has_more"].get<bool>());
}

TEST_F(ApiServerTest, GetScanFallsBackToStoreAndReportsMissingRun) {
    EXPECT_CALL(*store, GetScanReport("missing-run")).WillOnce(Return(std::nullopt));
    httplib::Request req;
    Route(req, "GetScan", "/scans/missing-run");
    httplib::Response res;
    ApiServerTestPeer::GetScan(*server, req, res);
    EXPECT_EQ(res.status, 404);
    EXPECT_EQ(Body(res)["error"]["code"], "E_SCAN_RUN_NOT_FOUND");
}

TEST_F(ApiServerTest, GetScanRejectsBadPaging) {
    httplib::Request req;
    Route(req, "GetScan", "/scans/any-run");
    req.params.emplace("limit", "0");
    httplib::Response res;
    ApiServerTestPeer::GetScan(*server, req, res);
    EXPECT_EQ(res.status, 400);
}

TEST_F(ApiServerTest, DossierUsesLatestPersistedResult) {
    anomaly::ScanResult latest;
    latest.entity_id = fixtures::kRevenue;
    latest.overall_score = 0.7;
    latest.flags.push_back({anomaly::FlagKind::RevenueOutlier, "pricey", 1.0, nlohmann::json::object()});
    EXPECT_CALL(*store, GetLatestScanResult(fixtures::kRevenue)).WillOnce(Return(latest));

    httplib::Request req;
    Route(req, "GetDossier", std::string("/entities/") + fixtures::kRevenue + "/dossier");
    httplib::Response res;
    ApiServerTestPeer::GetDossier(*server, req, res);

    ASSERT_EQ(res.status, 200) << res.body;
    auto j = Body(res);
    EXPECT_EQ(j["entity"]["entity_id"], fixtures::kRevenue);
    EXPECT_EQ(j["entity"]["specialty"], "Cardiology");
    EXPECT_DOUBLE_EQ(j["scan_result"]["overall_score"].get<double>(), 0.7);
    EXPECT_EQ(j["timeline"].size(), 12u);
    EXPECT_EQ(j["peer_comparison"]["status"], "available");
}

TEST_F(ApiServerTest, DossierForUnknownEntityIs404) {
    httplib::Request req;
    Route(req, "GetDossier", "/entities/NOPE/dossier");
    httplib::Response res;
    ApiServerTestPeer::GetDossier(*server, req, res);
    EXPECT_EQ(res.status, 404);
    EXPECT_EQ(Body(res)["error"]["code"], "E_ENTITY_NOT_FOUND");
}

TEST_F(ApiServerTest, DossierForUnknownRunIs404) {
    EXPECT_CALL(*store, GetScanReport("gone")).WillOnce(Return(std::nullopt));
    httplib::Request req;
    Route(req, "GetDossier", std::string("/entities/") + fixtures::kClean + "/dossier");
    req.params.emplace("run_id", "gone");
    httplib::Response res;
    ApiServerTestPeer::GetDossier(*server, req, res);
    EXPECT_EQ(res.status, 404);
    EXPECT_EQ(Body(res)["error"]["code"], "E_SCAN_RUN_NOT_FOUND");
}

TEST_F(ApiServerTest, PeersWithinSpecialty) {
    httplib::Request req;
    Route(req, "GetPeers", std::string("/entities/") + fixtures::kClean + "/peers");
    httplib::Response res;
    ApiServerTestPeer::GetPeers(*server, req, res);

    ASSERT_EQ(res.status, 200) << res.body;
    auto j = Body(res);
    EXPECT_EQ(j["entity_id"], fixtures::kClean);
    EXPECT_EQ(j["status"], "available");
    EXPECT_EQ(j["group_key"], "Dermatology");
}

TEST_F(ApiServerTest, PeersUnavailableWithoutSpecialty) {
    httplib::Request req;
    Route(req, "GetPeers", std::string("/entities/") + fixtures::kConsistency + "/peers");
    httplib::Response res;
    ApiServerTestPeer::GetPeers(*server, req, res);
    ASSERT_EQ(res.status, 200);
    EXPECT_EQ(Body(res)["status"], "unavailable");
}

TEST_F(ApiServerTest, PeersForUnknownEntityIs404) {
    httplib::Request req;
    Route(req, "GetPeers", "/entities/NOPE/peers");
    httplib::Response res;
    ApiServerTestPeer::GetPeers(*server, req, res);
    EXPECT_EQ(res.status, 404);
}

} // namespace
} // namespace claimscan::api
