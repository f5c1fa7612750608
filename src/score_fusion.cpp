#include "score_fusion.h"

#include <algorithm>
#include <iterator>
#include <map>
#include <stdexcept>
#include <utility>

namespace claimscan::anomaly {

auto ScoreFusion::Score(const std::vector<RedFlag>& flags) -> double {
    if (flags.empty()) {
        return 0.0;
    }

    double max_severity = 0.0;
    bool seen[kAllFlagKinds.size()] = {};
    for (const auto& flag : flags) {
        max_severity = std::max(max_severity, flag.severity);
        seen[static_cast<size_t>(flag.kind)] = true;
    }
    int distinct_kinds = static_cast<int>(std::count(std::begin(seen), std::end(seen), true));

    double score = max_severity * kSeverityWeight + distinct_kinds * kCorroborationWeight;
    return std::clamp(score, 0.0, 1.0);
}

auto ScoreFusion::Fuse(const std::vector<FlagList>& detector_outputs, double threshold) -> std::vector<ScanResult> {
    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        throw std::invalid_argument("threshold must be within [0, 1]");
    }

    std::map<std::string, std::vector<RedFlag>> by_entity;
    for (const auto& output : detector_outputs) {
        for (const auto& hit : output) {
            by_entity[hit.entity_id].push_back(hit.flag);
        }
    }

    std::vector<ScanResult> results;
    for (auto& [entity_id, flags] : by_entity) {
        // Each detector emits one kind, so grouping by kind makes the flag
        // order independent of the merge order.
        std::stable_sort(flags.begin(), flags.end(), [](const RedFlag& a, const RedFlag& b) {
            return static_cast<int>(a.kind) < static_cast<int>(b.kind);
        });

        double score = Score(flags);
        if (score < threshold) {
            continue;
        }

        ScanResult result;
        result.entity_id = entity_id;
        result.overall_score = score;
        result.flags = std::move(flags);
        results.push_back(std::move(result));
    }

    std::sort(results.begin(), results.end(), [](const ScanResult& a, const ScanResult& b) {
        if (a.overall_score != b.overall_score) {
            return a.overall_score > b.overall_score;
        }
        return a.entity_id < b.entity_id;
    });
    return results;
}

} // namespace claimscan::anomaly
