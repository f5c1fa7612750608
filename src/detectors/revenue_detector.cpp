#include "revenue_detector.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "../obs/logging.h"
#include "../stats/robust_stats.h"

namespace claimscan::anomaly {

namespace {

struct RateSample {
    std::string entity_id;
    double paid_per_claim = 0.0;
    EntityTotals totals;
};

} // namespace

auto DetectRevenueOutliers(const HistoryIndex& index, const ScanConfig& config) -> FlagList {
    FlagList flags;

    std::vector<RateSample> samples;
    samples.reserve(index.size());
    for (const auto& [entity_id, history] : index) {
        auto totals = TotalsFor(history);
        if (totals.claim_count <= 0) {
            continue;
        }
        samples.push_back({entity_id,
                           totals.paid_amount / static_cast<double>(totals.claim_count),
                           totals});
    }

    std::vector<double> rates;
    rates.reserve(samples.size());
    for (const auto& s : samples) {
        rates.push_back(s.paid_per_claim);
    }

    auto stats = ComputeRobustStats(rates);
    if (!stats.has_value()) {
        obs::LogEvent(obs::LogLevel::Warn, "revenue_outlier_skipped", "detector",
                      {{"reason", "undefined_mad"}, {"population", samples.size()}});
        return flags;
    }

    for (const auto& s : samples) {
        double z = ModifiedZScore(s.paid_per_claim, *stats);
        if (!(z > config.revenue_z_threshold)) {
            continue;
        }
        RedFlag flag;
        flag.kind = FlagKind::RevenueOutlier;
        flag.severity = std::min(1.0, z / 10.0);
        flag.description = fmt::format(
            "Paid per claim ${:.2f} is {:.1f} robust std devs above the peer median ${:.2f} "
            "(total paid ${:.2f} over {} claims)",
            s.paid_per_claim, z, stats->median, s.totals.paid_amount, s.totals.claim_count);
        flag.evidence = {
            {"paid_per_claim", s.paid_per_claim},
            {"total_paid", s.totals.paid_amount},
            {"total_claims", s.totals.claim_count},
            {"modified_zscore", z},
            {"population_median", stats->median},
            {"scaled_mad", stats->scaled_mad}
        };
        flags.push_back({s.entity_id, std::move(flag)});
    }
    return flags;
}

} // namespace claimscan::anomaly
