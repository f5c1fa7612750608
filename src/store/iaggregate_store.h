#pragma once

#include <memory>
#include <optional>
#include <string>

#include "../contract.h"
#include "../db_connection_manager.h"
#include "../types.h"

namespace claimscan::store {

// Persistence boundary of the engine: reads the two aggregate tables and the
// attribute side table, writes scan reports.
class IAggregateStore {
public:
    virtual ~IAggregateStore() = default;

    virtual auto GetConnectionManager() -> std::shared_ptr<DbConnectionManager> = 0;

    struct BuildSummary {
        long long monthly_rows = 0;
        long long paid_amount_rows = 0;
    };

    // Rebuilds entity_monthly and entity_paid_amounts from the raw claims table.
    virtual auto BuildAggregates() -> BuildSummary = 0;

    // A relation that does not exist comes back as std::nullopt (or an empty
    // attribute map); it is up to the scanner to decide whether that is fatal.
    virtual auto LoadTables() -> AggregateTables = 0;

    virtual auto SaveScanReport(const anomaly::ScanReport& report) -> void = 0;

    virtual auto GetScanReport(const std::string& run_id) -> std::optional<anomaly::ScanReport> = 0;

    // The entity's result in the most recent run; nullopt when that run did
    // not flag it, even if an older run did.
    virtual auto GetLatestScanResult(const std::string& entity_id) -> std::optional<anomaly::ScanResult> = 0;
};

} // namespace claimscan::store
