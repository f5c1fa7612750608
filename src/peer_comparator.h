#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "aggregate_index.h"
#include "contract.h"
#include "types.h"

namespace claimscan::anomaly {

// Ranks one entity's total against a peer population. Uses mean/std rather
// than median/MAD: the figure is for presentation, not for detection.
class PeerComparator {
public:
    // percentile_rank = share of peers with total <= entity_total, times 100.
    // z_score is set only when the sample standard deviation is nonzero.
    // nullopt for an empty population.
    static auto Compare(double entity_total, const std::vector<double>& population) -> std::optional<PeerComparison>;

    // Peer group = every entity sharing the subject's specialty, the subject
    // included; metric = total paid across all months.
    static auto CompareWithinSpecialty(const HistoryIndex& index,
                                       const std::map<std::string, EntityAttributes>& attributes,
                                       const std::string& entity_id) -> PeerOutcome;
};

} // namespace claimscan::anomaly
