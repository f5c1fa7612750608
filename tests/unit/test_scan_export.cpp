#include <gtest/gtest.h>
#include "scan_export.h"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace claimscan::anomaly {

namespace {

auto Result(const std::string& id, double score, std::vector<FlagKind> kinds) -> ScanResult {
    ScanResult r;
    r.entity_id = id;
    r.overall_score = score;
    for (auto k : kinds) {
        r.flags.push_back({k, "", 0.5, nlohmann::json::object()});
    }
    return r;
}

} // namespace

TEST(ScanExportTest, WritesRankedRows) {
    std::vector<ScanResult> results = {
        Result("B", 0.9, {FlagKind::BillingSpike, FlagKind::VolumeImpossibility, FlagKind::BillingSpike}),
        Result("A", 0.65454545, {FlagKind::SuspiciousConsistency})
    };
    std::ostringstream out;
    WriteScanResultsCsv(out, results);
    EXPECT_EQ(out.str(),
              "rank,entity_id,score,num_flags,flag_kinds\n"
              "1,B,0.900,3,volume_impossibility;billing_spike\n"
              "2,A,0.655,1,suspicious_consistency\n");
}

TEST(ScanExportTest, QuotesAwkwardEntityIds) {
    std::ostringstream out;
    WriteScanResultsCsv(out, {Result("Smith, \"Doc\"", 0.5, {FlagKind::RevenueOutlier})});
    EXPECT_NE(out.str().find("1,\"Smith, \"\"Doc\"\"\",0.500,1,revenue_outlier"), std::string::npos);
}

TEST(ScanExportTest, HeaderOnlyForEmptyScan) {
    std::ostringstream out;
    WriteScanResultsCsv(out, {});
    EXPECT_EQ(out.str(), "rank,entity_id,score,num_flags,flag_kinds\n");
}

TEST(ScanExportTest, CreatesParentDirectories) {
    auto dir = std::filesystem::temp_directory_path() / "claimscan_export_test";
    std::filesystem::remove_all(dir);
    auto path = dir / "nested" / "scan_results.csv";

    WriteScanResultsCsvFile(path.string(), {Result("A", 0.7, {FlagKind::RevenueOutlier})});

    std::ifstream in(path);
    ASSERT_TRUE(in.is_open());
    std::string header;
    std::getline(in, header);
    EXPECT_EQ(header, "rank,entity_id,score,num_flags,flag_kinds");
    std::filesystem::remove_all(dir);
}

TEST(ScanExportTest, JoinFlagKindsUsesSeparator) {
    auto r = Result("A", 0.9, {FlagKind::RevenueOutlier, FlagKind::VolumeImpossibility});
    EXPECT_EQ(JoinFlagKinds(r, ", "), "volume_impossibility, revenue_outlier");
}

} // namespace claimscan::anomaly
