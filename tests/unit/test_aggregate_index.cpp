#include <gtest/gtest.h>
#include "aggregate_index.h"
#include "fixtures/claims_fixture.h"

namespace claimscan::anomaly {

using fixtures::Amount;
using fixtures::Month;
using fixtures::Row;

TEST(AggregateIndexTest, SumsDuplicateEntityMonthRows) {
    auto index = BuildHistoryIndex({
        Row("A", Month(2023, 1), 10, 100.0, 4),
        Row("A", Month(2023, 1), 5, 50.0, 1),
        Row("A", Month(2023, 2), 1, 10.0)
    });
    ASSERT_EQ(index.size(), 1u);
    const auto& history = index.at("A");
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history.at(Month(2023, 1)).claim_count, 15);
    EXPECT_DOUBLE_EQ(history.at(Month(2023, 1)).paid_amount, 150.0);
    EXPECT_EQ(history.at(Month(2023, 1)).beneficiary_count, 5);

    auto totals = TotalsFor(history);
    EXPECT_EQ(totals.claim_count, 16);
    EXPECT_DOUBLE_EQ(totals.paid_amount, 160.0);
    EXPECT_EQ(totals.active_months, 2u);
}

TEST(AggregateIndexTest, ViabilitySplitUsesTotalPaid) {
    auto index = BuildHistoryIndex({
        Row("SMALL", Month(2023, 1), 500, 400.0),
        Row("SMALL", Month(2023, 2), 500, 599.0),
        Row("EDGE", Month(2023, 1), 1, 1000.0),
        Row("NEG", Month(2023, 1), 3, -5000.0)
    });
    auto split = SplitByViability(index, 1000.0);
    EXPECT_EQ(split.viable.count("EDGE"), 1u);
    EXPECT_EQ(split.excluded.count("SMALL"), 1u);
    EXPECT_EQ(split.excluded.count("NEG"), 1u);
    EXPECT_EQ(split.viable.size() + split.excluded.size(), index.size());
}

TEST(AggregateIndexTest, RestrictDropsUnknownEntities) {
    auto index = BuildHistoryIndex({Row("A", Month(2023, 1), 1, 10.0)});
    auto kept = RestrictToEntities({Amount("A", 5.0, 3), Amount("B", 5.0, 3)}, index);
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0].entity_id, "A");
}

} // namespace claimscan::anomaly
