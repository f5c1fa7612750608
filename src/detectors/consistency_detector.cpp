#include "consistency_detector.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace claimscan::anomaly {

namespace {

struct AmountProfile {
    std::map<double, long long> counts; // paid amount -> line items
    long long total_rows = 0;
};

} // namespace

auto DetectSuspiciousConsistency(const std::vector<ProcedureAmountAggregate>& rows,
                                 const ScanConfig& config) -> FlagList {
    FlagList flags;

    std::map<std::string, AmountProfile> profiles;
    for (const auto& row : rows) {
        if (row.paid_amount == 0.0 || !std::isfinite(row.paid_amount) || row.row_count <= 0) {
            continue;
        }
        auto& profile = profiles[row.entity_id];
        profile.counts[row.paid_amount] += row.row_count;
        profile.total_rows += row.row_count;
    }

    for (const auto& [entity_id, profile] : profiles) {
        if (profile.total_rows < config.consistency_min_rows) {
            continue;
        }

        // Ascending amount order with strict '>' keeps the lowest amount on ties.
        double top_amount = 0.0;
        long long top_count = 0;
        for (const auto& [amount, count] : profile.counts) {
            if (count > top_count) {
                top_amount = amount;
                top_count = count;
            }
        }

        double ratio = static_cast<double>(top_count) / static_cast<double>(profile.total_rows);
        if (!(ratio > config.consistency_ratio)) {
            continue;
        }

        RedFlag flag;
        flag.kind = FlagKind::SuspiciousConsistency;
        flag.severity = std::min(1.0, ratio);
        flag.description = fmt::format(
            "{:.0f}% of {} line items paid identical amount ${:.2f}, a pattern of templated "
            "billing rather than natural price variation",
            ratio * 100.0, profile.total_rows, top_amount);
        flag.evidence = {
            {"consistency_ratio", ratio},
            {"top_amount", top_amount},
            {"top_amount_count", top_count},
            {"total_rows", profile.total_rows},
            {"distinct_amounts", profile.counts.size()}
        };
        flags.push_back({entity_id, std::move(flag)});
    }
    return flags;
}

} // namespace claimscan::anomaly
