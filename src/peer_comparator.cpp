#include "peer_comparator.h"

#include <cmath>
#include <utility>

#include "stats/robust_stats.h"

namespace claimscan::anomaly {

auto PeerComparator::Compare(double entity_total, const std::vector<double>& population) -> std::optional<PeerComparison> {
    auto moments = ComputeMoments(population);
    auto median = Median(population);
    if (!moments.has_value() || !median.has_value()) {
        return std::nullopt;
    }

    size_t at_or_below = 0;
    for (double total : population) {
        if (total <= entity_total) {
            at_or_below++;
        }
    }

    PeerComparison c;
    c.peer_count = population.size();
    c.entity_total = entity_total;
    c.peer_mean = moments->mean;
    c.peer_median = *median;
    c.percentile_rank = static_cast<double>(at_or_below) / static_cast<double>(population.size()) * 100.0;
    if (moments->stddev.has_value() && *moments->stddev > 0.0 && std::isfinite(*moments->stddev)) {
        c.z_score = (entity_total - moments->mean) / *moments->stddev;
    }
    return c;
}

auto PeerComparator::CompareWithinSpecialty(const HistoryIndex& index,
                                            const std::map<std::string, EntityAttributes>& attributes,
                                            const std::string& entity_id) -> PeerOutcome {
    auto subject = index.find(entity_id);
    if (subject == index.end()) {
        return PeerOutcome::NotFound(entity_id);
    }

    auto attr = attributes.find(entity_id);
    if (attr == attributes.end() || attr->second.specialty.empty()) {
        return PeerOutcome::Unavailable("no specialty data available for peer comparison");
    }
    const std::string& specialty = attr->second.specialty;

    std::vector<double> population;
    for (const auto& [peer_id, peer_attr] : attributes) {
        if (peer_attr.specialty != specialty) {
            continue;
        }
        auto history = index.find(peer_id);
        if (history == index.end()) {
            continue;
        }
        population.push_back(TotalsFor(history->second).paid_amount);
    }

    auto comparison = Compare(TotalsFor(subject->second).paid_amount, population);
    if (!comparison.has_value()) {
        return PeerOutcome::Unavailable("no peers found in same specialty");
    }
    comparison->group_key = specialty;
    return PeerOutcome::Available(std::move(*comparison));
}

} // namespace claimscan::anomaly
