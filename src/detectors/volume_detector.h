#pragma once

#include "../aggregate_index.h"
#include "../contract.h"
#include "../scan_config.h"

namespace claimscan::anomaly {

// One flag per (entity, month) whose claim count exceeds the volume ceiling.
// Severity ramps linearly and saturates at three times the ceiling.
auto DetectVolumeImpossibility(const HistoryIndex& index, const ScanConfig& config) -> FlagList;

} // namespace claimscan::anomaly
