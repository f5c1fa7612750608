#include <gtest/gtest.h>
#include "errors.h"
#include "fixtures/claims_fixture.h"
#include "report/dossier.h"
#include "scanner.h"

#include <algorithm>

namespace claimscan::report {

namespace fx = claimscan::fixtures;

class DossierTest : public ::testing::Test {
protected:
    AggregateTables tables = fx::BuildTables();
};

TEST_F(DossierTest, SummarizesMonthlyHistory) {
    auto dossier = BuildDossier(tables, fx::kVolume);
    const auto& s = dossier.claims_summary;
    EXPECT_EQ(s.total_claims, 6 * 1500 + 5000);
    EXPECT_DOUBLE_EQ(s.total_paid, 14000 * 85.0);
    EXPECT_EQ(s.total_beneficiaries, 6 * 700 + 900);
    ASSERT_TRUE(s.paid_per_claim.has_value());
    EXPECT_DOUBLE_EQ(*s.paid_per_claim, 85.0);
    EXPECT_EQ(s.first_period.ToString(), "2023-01");
    EXPECT_EQ(s.last_period.ToString(), "2023-07");
    EXPECT_EQ(s.active_months, 7u);
    EXPECT_DOUBLE_EQ(s.avg_claims_per_active_month, 2000.0);
    EXPECT_EQ(s.max_claims_in_a_month, 5000);
    EXPECT_DOUBLE_EQ(s.max_paid_in_a_month, 5000 * 85.0);

    ASSERT_EQ(dossier.timeline.size(), 7u);
    EXPECT_EQ(dossier.timeline.front().period.ToString(), "2023-01");
    EXPECT_EQ(dossier.timeline.back().claim_count, 5000);
}

TEST_F(DossierTest, PlaceholderResultWithoutScan) {
    auto dossier = BuildDossier(tables, fx::kClean);
    EXPECT_EQ(dossier.scan_result.entity_id, fx::kClean);
    EXPECT_DOUBLE_EQ(dossier.scan_result.overall_score, 0.0);
    EXPECT_TRUE(dossier.scan_result.flags.empty());
    EXPECT_DOUBLE_EQ(dossier.scan_result.total_paid, dossier.claims_summary.total_paid);
}

TEST_F(DossierTest, AttachesSuppliedScanResult) {
    anomaly::Scanner scanner{anomaly::ScanConfig{}};
    auto report = scanner.Scan(tables, 0.3);
    auto it = std::find_if(report.results.begin(), report.results.end(),
                           [](const anomaly::ScanResult& r) { return r.entity_id == fx::kRevenue; });
    ASSERT_NE(it, report.results.end());

    auto dossier = BuildDossier(tables, fx::kRevenue, *it);
    EXPECT_DOUBLE_EQ(dossier.scan_result.overall_score, it->overall_score);
    ASSERT_EQ(dossier.scan_result.flags.size(), 1u);
    EXPECT_EQ(dossier.scan_result.flags[0].kind, anomaly::FlagKind::RevenueOutlier);
    ASSERT_TRUE(dossier.attributes.has_value());
    EXPECT_EQ(dossier.attributes->specialty, "Cardiology");
    EXPECT_EQ(dossier.peer_comparison.status, anomaly::PeerOutcome::Status::Available);
}

TEST_F(DossierTest, UnknownEntityIsNotFound) {
    EXPECT_THROW(BuildDossier(tables, "NOPE"), UnknownEntityError);
    try {
        BuildDossier(tables, "NOPE");
    } catch (const UnknownEntityError& e) {
        EXPECT_EQ(e.entity_id(), "NOPE");
    }
}

TEST_F(DossierTest, MissingMonthlyTableIsUnavailable) {
    tables.monthly = std::nullopt;
    EXPECT_THROW(BuildDossier(tables, fx::kClean), DataUnavailableError);
}

TEST_F(DossierTest, PeerOutcomeReportsMissingSpecialty) {
    auto dossier = BuildDossier(tables, fx::kSpike);
    EXPECT_FALSE(dossier.attributes.has_value());
    EXPECT_EQ(dossier.peer_comparison.status, anomaly::PeerOutcome::Status::Unavailable);
}

TEST_F(DossierTest, SerializesToJson) {
    nlohmann::json j = BuildDossier(tables, fx::kVolume);
    EXPECT_EQ(j["entity"]["entity_id"], fx::kVolume);
    EXPECT_EQ(j["entity"]["specialty"], "Cardiology");
    EXPECT_EQ(j["claims_summary"]["date_range_start"], "2023-01");
    EXPECT_EQ(j["claims_summary"]["date_range_end"], "2023-07");
    EXPECT_EQ(j["peer_comparison"]["status"], "available");
    EXPECT_EQ(j["timeline"].size(), 7u);
    EXPECT_EQ(j["timeline"][6]["month"], "2023-07");
    EXPECT_EQ(j["scan_result"]["overall_score"], 0.0);
}

} // namespace claimscan::report
