#pragma once

#include <memory>
#include <optional>
#include <string>

#include <pqxx/pqxx>

#include "iaggregate_store.h"

namespace claimscan::store {

// PostgreSQL implementation. Expects the schema-mapped raw table
//   claims(entity_id, service_month, claim_count, paid_amount, beneficiary_count)
// and optionally entity_attributes(entity_id, name, specialty, state).
class PgAggregateStore : public IAggregateStore {
public:
    explicit PgAggregateStore(const std::string& connection_string);
    explicit PgAggregateStore(std::shared_ptr<DbConnectionManager> manager);
    PgAggregateStore(const PgAggregateStore&) = delete;
    auto operator=(const PgAggregateStore&) -> PgAggregateStore& = delete;
    ~PgAggregateStore() override = default;

    auto GetConnectionManager() -> std::shared_ptr<DbConnectionManager> override {
        return manager_;
    }

    // Creates scan_runs / scan_results if they do not exist.
    auto EnsureSchema() -> void;

    auto BuildAggregates() -> BuildSummary override;
    auto LoadTables() -> AggregateTables override;
    auto SaveScanReport(const anomaly::ScanReport& report) -> void override;
    auto GetScanReport(const std::string& run_id) -> std::optional<anomaly::ScanReport> override;
    auto GetLatestScanResult(const std::string& entity_id) -> std::optional<anomaly::ScanResult> override;

private:
    static auto RelationExists(pqxx::transaction_base& txn, const std::string& name) -> bool;

    std::shared_ptr<DbConnectionManager> manager_;
};

} // namespace claimscan::store
