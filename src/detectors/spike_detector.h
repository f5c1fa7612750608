#pragma once

#include "../aggregate_index.h"
#include "../contract.h"
#include "../scan_config.h"

namespace claimscan::anomaly {

// Self-relative comparator: each month's paid amount against the entity's own
// mean monthly paid. Entities with fewer than spike_min_months distinct months,
// or a non-positive mean, are skipped.
auto DetectBillingSpikes(const HistoryIndex& index, const ScanConfig& config) -> FlagList;

} // namespace claimscan::anomaly
