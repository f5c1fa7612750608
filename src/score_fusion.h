#pragma once

#include <string>
#include <vector>

#include "contract.h"

namespace claimscan::anomaly {

class ScoreFusion {
public:
    static constexpr double kSeverityWeight = 0.5;
    static constexpr double kCorroborationWeight = 0.2;

    // min(1, 0.5 * max severity + 0.2 * distinct kinds). Zero for no flags.
    // TODO(calibration): weights are carried over unchanged from the first
    // release and have never been fitted against confirmed cases.
    static auto Score(const std::vector<RedFlag>& flags) -> double;

    // Merges detector outputs per entity, scores every entity with at least one
    // flag, drops scores below `threshold` and orders by score descending, then
    // entity_id ascending. The result does not depend on the order of
    // `detector_outputs`. Throws std::invalid_argument if threshold is outside [0, 1].
    static auto Fuse(const std::vector<FlagList>& detector_outputs, double threshold) -> std::vector<ScanResult>;
};

} // namespace claimscan::anomaly
