#include "stats/robust_stats.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace claimscan::anomaly {

auto Median(std::vector<double> values) -> std::optional<double> {
    if (values.empty()) {
        return std::nullopt;
    }

    size_t n = values.size();
    size_t mid = n / 2;
    std::nth_element(values.begin(), values.begin() + mid, values.end());
    double upper = values[mid];
    if (n % 2 == 1) {
        return upper;
    }
    // Lower middle is the max of the left partition.
    double lower = *std::max_element(values.begin(), values.begin() + mid);
    return (lower + upper) / 2.0;
}

auto ComputeRobustStats(const std::vector<double>& values) -> std::optional<RobustStats> {
    auto median = Median(values);
    if (!median.has_value()) {
        return std::nullopt;
    }

    std::vector<double> abs_diffs;
    abs_diffs.reserve(values.size());
    for (double val : values) {
        abs_diffs.push_back(std::abs(val - *median));
    }
    auto mad = Median(std::move(abs_diffs));
    if (!mad.has_value() || !(*mad > 0.0) || !std::isfinite(*mad)) {
        return std::nullopt;
    }

    RobustStats stats;
    stats.median = *median;
    stats.scaled_mad = kMadScale * *mad;
    return stats;
}

auto ModifiedZScore(double value, const RobustStats& stats) -> double {
    return (value - stats.median) / stats.scaled_mad;
}

auto ComputeMoments(const std::vector<double>& values) -> std::optional<MomentStats> {
    if (values.empty()) {
        return std::nullopt;
    }

    MomentStats m;
    m.count = values.size();
    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    m.mean = sum / static_cast<double>(m.count);

    if (m.count >= 2) {
        // Two-pass sample variance.
        double ss = 0.0;
        for (double v : values) {
            ss += (v - m.mean) * (v - m.mean);
        }
        m.stddev = std::sqrt(ss / static_cast<double>(m.count - 1));
    }
    return m;
}

} // namespace claimscan::anomaly
