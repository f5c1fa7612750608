#pragma once

#include <string>

namespace claimscan {
namespace anomaly {

// Detector thresholds. Passed by value into the Scanner; never global.
struct ScanConfig {
    // Volume impossibility: claims per entity per month above this are implausible.
    long long volume_ceiling = 1500;

    // Revenue outlier: modified z-score of paid-per-claim.
    double revenue_z_threshold = 3.0;

    // Billing spike: month paid vs the entity's own mean monthly paid.
    double spike_multiplier = 5.0;
    int spike_min_months = 3; // never below 3

    // Suspicious consistency: share of line items at one identical amount.
    double consistency_ratio = 0.9;
    long long consistency_min_rows = 30;

    // Entities below this total paid are not scanned at all.
    double min_total_paid = 1000.0;

    bool parallel_detectors = false;
};

// Reads a JSON object whose keys are the field names above. Missing keys keep
// their defaults; a key with the wrong JSON type throws std::invalid_argument.
auto LoadScanConfig(const std::string& path) -> ScanConfig;
auto ParseScanConfig(const std::string& json_text) -> ScanConfig;

// CLAIMSCAN_VOLUME_CEILING, CLAIMSCAN_REVENUE_Z_THRESHOLD, CLAIMSCAN_SPIKE_MULTIPLIER, CLAIMSCAN_SPIKE_MIN_MONTHS,
// CLAIMSCAN_CONSISTENCY_RATIO, CLAIMSCAN_CONSISTENCY_MIN_ROWS, CLAIMSCAN_MIN_TOTAL_PAID
auto ApplyEnvOverrides(ScanConfig& config) -> void;

// Throws std::invalid_argument describing the first bad field.
auto ValidateScanConfig(const ScanConfig& config) -> void;

} // namespace anomaly
} // namespace claimscan
