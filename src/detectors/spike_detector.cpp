#include "spike_detector.h"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

#include "../obs/logging.h"

namespace claimscan::anomaly {

auto DetectBillingSpikes(const HistoryIndex& index, const ScanConfig& config) -> FlagList {
    FlagList flags;
    size_t short_history = 0;

    for (const auto& [entity_id, history] : index) {
        if (history.size() < static_cast<size_t>(config.spike_min_months)) {
            short_history++;
            continue;
        }

        auto totals = TotalsFor(history);
        double mean = totals.paid_amount / static_cast<double>(history.size());
        if (!(mean > 0.0)) {
            continue;
        }

        for (const auto& [period, month] : history) {
            double ratio = month.paid_amount / mean;
            if (!(ratio > config.spike_multiplier)) {
                continue;
            }
            RedFlag flag;
            flag.kind = FlagKind::BillingSpike;
            flag.severity = std::min(1.0, ratio / 10.0);
            flag.description = fmt::format("Monthly paid ${:.2f} in {} is {:.1f}x their average ${:.2f}",
                                           month.paid_amount, period.ToString(), ratio, mean);
            flag.evidence = {
                {"month", period.ToString()},
                {"amount", month.paid_amount},
                {"entity_mean", mean},
                {"ratio", ratio},
                {"months_of_history", history.size()}
            };
            flags.push_back({entity_id, std::move(flag)});
        }
    }

    if (short_history > 0) {
        obs::LogEvent(obs::LogLevel::Info, "billing_spike_short_history", "detector",
                      {{"entities_skipped", short_history}, {"min_months", config.spike_min_months}});
    }
    return flags;
}

} // namespace claimscan::anomaly
