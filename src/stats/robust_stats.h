#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace claimscan::anomaly {

// Makes the MAD comparable to a normal standard deviation.
inline constexpr double kMadScale = 1.4826;

struct RobustStats {
    double median = 0.0;
    double scaled_mad = 0.0; // kMadScale * MAD, always > 0
};

struct MomentStats {
    size_t count = 0;
    double mean = 0.0;
    std::optional<double> stddev; // sample (n-1); absent for n < 2
};

// Even-sized samples average the two middle values. nullopt when empty.
auto Median(std::vector<double> values) -> std::optional<double>;

// nullopt when the sample is empty or has no dispersion (MAD == 0).
// Callers skip outlier testing for that population.
auto ComputeRobustStats(const std::vector<double>& values) -> std::optional<RobustStats>;

auto ModifiedZScore(double value, const RobustStats& stats) -> double;

// nullopt when empty.
auto ComputeMoments(const std::vector<double>& values) -> std::optional<MomentStats>;

} // namespace claimscan::anomaly
