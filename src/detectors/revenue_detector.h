#pragma once

#include "../aggregate_index.h"
#include "../contract.h"
#include "../scan_config.h"

namespace claimscan::anomaly {

// Cross-entity pricing outliers: paid-per-claim tested against the population
// median with a MAD-scaled modified z-score. Entities with no claims are left
// out of the population. No flags when the MAD is zero.
auto DetectRevenueOutliers(const HistoryIndex& index, const ScanConfig& config) -> FlagList;

} // namespace claimscan::anomaly
