#pragma once

#include "contract.h"
#include "scan_config.h"
#include "types.h"

namespace claimscan::anomaly {

class Scanner {
public:
    explicit Scanner(ScanConfig config);

    // Runs every detector over `tables` and fuses the flags into a ranked report.
    // Throws DataUnavailableError when the monthly table is missing (an empty
    // one yields a report with no results), std::invalid_argument when
    // threshold is outside [0, 1].
    auto Scan(const AggregateTables& tables, double threshold) const -> ScanReport;

    [[nodiscard]] auto config() const -> const ScanConfig& { return config_; }

private:
    ScanConfig config_;
};

} // namespace claimscan::anomaly
