#include <gtest/gtest.h>
#include "aggregate_index.h"
#include "detectors/spike_detector.h"
#include "fixtures/claims_fixture.h"

namespace claimscan::anomaly {

using fixtures::Month;
using fixtures::Row;

TEST(SpikeDetectorTest, FlagsMonthAboveMultipleOfOwnMean) {
    std::vector<MonthlyAggregate> rows;
    for (int m = 1; m <= 9; ++m) {
        rows.push_back(Row("A", Month(2023, m), 10, 1000.0));
    }
    rows.push_back(Row("A", Month(2023, 10), 10, 21000.0)); // mean 3000, ratio 7

    auto flags = DetectBillingSpikes(BuildHistoryIndex(rows), ScanConfig{});
    ASSERT_EQ(flags.size(), 1u);
    EXPECT_EQ(flags[0].flag.kind, FlagKind::BillingSpike);
    EXPECT_EQ(flags[0].flag.evidence["month"], "2023-10");
    EXPECT_DOUBLE_EQ(flags[0].flag.evidence["ratio"].get<double>(), 7.0);
    EXPECT_DOUBLE_EQ(flags[0].flag.severity, 0.7);
}

TEST(SpikeDetectorTest, SeveritySaturatesAtTenTimesMean) {
    std::vector<MonthlyAggregate> rows;
    for (int m = 1; m <= 12; ++m) {
        rows.push_back(Row("A", Month(2022, m), 1, 100.0));
    }
    for (int m = 1; m <= 7; ++m) {
        rows.push_back(Row("A", Month(2023, m), 1, 100.0));
    }
    rows.push_back(Row("A", Month(2023, 8), 1, 38100.0)); // mean 2000, ratio 19.05

    auto flags = DetectBillingSpikes(BuildHistoryIndex(rows), ScanConfig{});
    ASSERT_EQ(flags.size(), 1u);
    EXPECT_DOUBLE_EQ(flags[0].flag.severity, 1.0);
}

TEST(SpikeDetectorTest, NeverFlagsShortHistory) {
    auto flags = DetectBillingSpikes(BuildHistoryIndex({
        Row("A", Month(2023, 1), 1, 1.0),
        Row("A", Month(2023, 2), 1, 1000000.0)
    }), ScanConfig{});
    EXPECT_TRUE(flags.empty());
}

TEST(SpikeDetectorTest, DuplicateRowsDoNotCountAsExtraMonths) {
    auto flags = DetectBillingSpikes(BuildHistoryIndex({
        Row("A", Month(2023, 1), 1, 1.0),
        Row("A", Month(2023, 1), 1, 1.0),
        Row("A", Month(2023, 2), 1, 1.0),
        Row("A", Month(2023, 2), 1, 1000000.0)
    }), ScanConfig{});
    EXPECT_TRUE(flags.empty());
}

TEST(SpikeDetectorTest, SkipsNonPositiveMean) {
    auto flags = DetectBillingSpikes(BuildHistoryIndex({
        Row("A", Month(2023, 1), 1, -500.0),
        Row("A", Month(2023, 2), 1, -500.0),
        Row("A", Month(2023, 3), 1, 100.0)
    }), ScanConfig{});
    EXPECT_TRUE(flags.empty());
}

TEST(SpikeDetectorTest, MinimumMonthsIsConfigurable) {
    std::vector<MonthlyAggregate> rows = {
        Row("A", Month(2023, 1), 1, 10.0),
        Row("A", Month(2023, 2), 1, 10.0),
        Row("A", Month(2023, 3), 1, 10.0),
        Row("A", Month(2023, 4), 1, 10.0),
        Row("A", Month(2023, 5), 1, 10.0),
        Row("A", Month(2023, 6), 1, 10.0),
        Row("A", Month(2023, 7), 1, 1000.0)
    };
    ScanConfig config;
    EXPECT_EQ(DetectBillingSpikes(BuildHistoryIndex(rows), config).size(), 1u);
    config.spike_min_months = 12;
    EXPECT_TRUE(DetectBillingSpikes(BuildHistoryIndex(rows), config).empty());
}

} // namespace claimscan::anomaly
