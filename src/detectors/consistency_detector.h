#pragma once

#include <vector>

#include "../contract.h"
#include "../scan_config.h"
#include "../types.h"

namespace claimscan::anomaly {

// Flags entities where one paid amount covers more than consistency_ratio of
// their line items. Zero-amount rows are dropped before counting; entities with
// fewer than consistency_min_rows remaining rows are not evaluated.
// Ties for the most frequent amount resolve to the lowest amount.
auto DetectSuspiciousConsistency(const std::vector<ProcedureAmountAggregate>& rows,
                                 const ScanConfig& config) -> FlagList;

} // namespace claimscan::anomaly
