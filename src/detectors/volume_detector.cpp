#include "volume_detector.h"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

namespace claimscan::anomaly {

auto DetectVolumeImpossibility(const HistoryIndex& index, const ScanConfig& config) -> FlagList {
    FlagList flags;
    const long long ceiling = config.volume_ceiling;
    if (ceiling <= 0) {
        return flags;
    }
    const double saturation = 3.0 * static_cast<double>(ceiling);

    for (const auto& [entity_id, history] : index) {
        for (const auto& [period, month] : history) {
            if (month.claim_count <= ceiling) {
                continue;
            }
            RedFlag flag;
            flag.kind = FlagKind::VolumeImpossibility;
            flag.severity = std::min(1.0, static_cast<double>(month.claim_count) / saturation);
            flag.description = fmt::format("{} claims in {} (max plausible: {})",
                                           month.claim_count, period.ToString(), ceiling);
            flag.evidence = {
                {"month", period.ToString()},
                {"claims", month.claim_count},
                {"ceiling", ceiling}
            };
            flags.push_back({entity_id, std::move(flag)});
        }
    }
    return flags;
}

} // namespace claimscan::anomaly
