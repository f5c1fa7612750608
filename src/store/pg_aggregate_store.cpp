#include "pg_aggregate_store.h"

#include <spdlog/spdlog.h>
#include <utility>

#include "../errors.h"
#include "../obs/error_codes.h"
#include "../obs/logging.h"
#include "../scan_export.h"

namespace claimscan::store {

namespace {

constexpr const char* kSchemaSql = R"SQL(
CREATE TABLE IF NOT EXISTS scan_runs (
    run_id TEXT PRIMARY KEY,
    started_at TIMESTAMPTZ NOT NULL,
    threshold DOUBLE PRECISION NOT NULL,
    entities_considered BIGINT NOT NULL,
    entities_excluded_low_volume BIGINT NOT NULL,
    flags_by_kind JSONB NOT NULL DEFAULT '{}'::jsonb
);
CREATE TABLE IF NOT EXISTS scan_results (
    run_id TEXT NOT NULL REFERENCES scan_runs(run_id) ON DELETE CASCADE,
    rank INTEGER NOT NULL,
    entity_id TEXT NOT NULL,
    score DOUBLE PRECISION NOT NULL,
    num_flags INTEGER NOT NULL,
    flag_kinds TEXT NOT NULL,
    result JSONB NOT NULL,
    PRIMARY KEY (run_id, rank)
);
CREATE INDEX IF NOT EXISTS idx_scan_results_entity ON scan_results(entity_id);
)SQL";

constexpr const char* kBuildMonthlySql = R"SQL(
CREATE TABLE entity_monthly AS
SELECT entity_id,
       date_trunc('month', service_month)::date AS period,
       SUM(claim_count)::bigint AS claim_count,
       SUM(paid_amount)::double precision AS paid_amount,
       SUM(COALESCE(beneficiary_count, 0))::bigint AS beneficiary_count
FROM claims
GROUP BY entity_id, date_trunc('month', service_month)
)SQL";

constexpr const char* kBuildPaidAmountsSql = R"SQL(
CREATE TABLE entity_paid_amounts AS
SELECT entity_id,
       paid_amount::double precision AS paid_amount,
       COUNT(*)::bigint AS row_count
FROM claims
WHERE paid_amount IS NOT NULL
GROUP BY entity_id, paid_amount
)SQL";

auto ToScanResult(const pqxx::row& row) -> anomaly::ScanResult {
    auto j = nlohmann::json::parse(row["result"].as<std::string>());
    return j.get<anomaly::ScanResult>();
}

} // namespace

PgAggregateStore::PgAggregateStore(const std::string& connection_string)
    : manager_(std::make_shared<SimpleDbConnectionManager>(connection_string)) {}

PgAggregateStore::PgAggregateStore(std::shared_ptr<DbConnectionManager> manager)
    : manager_(std::move(manager)) {}

auto PgAggregateStore::RelationExists(pqxx::transaction_base& txn, const std::string& name) -> bool {
    auto res = txn.exec_params("SELECT to_regclass($1) IS NOT NULL", name);
    return !res.empty() && res[0][0].as<bool>();
}

auto PgAggregateStore::EnsureSchema() -> void {
    try {
        auto conn = manager_->GetConnection();
        pqxx::work W(*conn);
        W.exec(kSchemaSql);
        W.commit();
    } catch (const std::exception& e) {
        obs::LogEvent(obs::LogLevel::Error, "schema_setup_failed", "store",
                      {{"error_code", obs::kErrDbQueryFailed}, {"error", e.what()}});
        throw;
    }
}

auto PgAggregateStore::BuildAggregates() -> BuildSummary {
    obs::ScopedTimer timer("aggregates_built", "store");
    try {
        auto conn = manager_->GetConnection();
        pqxx::work W(*conn);
        if (!RelationExists(W, "claims")) {
            throw DataUnavailableError("Raw claims table is missing");
        }
        W.exec("DROP TABLE IF EXISTS entity_monthly");
        W.exec("DROP TABLE IF EXISTS entity_paid_amounts");
        W.exec(kBuildMonthlySql);
        W.exec(kBuildPaidAmountsSql);
        W.exec("CREATE INDEX ON entity_monthly(entity_id, period)");
        W.exec("CREATE INDEX ON entity_paid_amounts(entity_id)");

        BuildSummary summary;
        summary.monthly_rows = W.exec("SELECT COUNT(*) FROM entity_monthly")[0][0].as<long long>();
        summary.paid_amount_rows = W.exec("SELECT COUNT(*) FROM entity_paid_amounts")[0][0].as<long long>();
        W.commit();

        timer.Stop(obs::LogLevel::Info, {
            {"monthly_rows", summary.monthly_rows},
            {"paid_amount_rows", summary.paid_amount_rows}
        });
        return summary;
    } catch (const DataUnavailableError& e) {
        timer.Stop(obs::LogLevel::Error, {{"error_code", obs::kErrDataUnavailable}, {"error", e.what()}});
        throw;
    } catch (const std::exception& e) {
        timer.Stop(obs::LogLevel::Error, {{"error_code", obs::kErrDbQueryFailed}, {"error", e.what()}});
        throw;
    }
}

auto PgAggregateStore::LoadTables() -> AggregateTables {
    obs::ScopedTimer timer("aggregates_loaded", "store");
    AggregateTables tables;
    try {
        auto conn = manager_->GetConnection();
        pqxx::nontransaction N(*conn);

        if (RelationExists(N, "entity_monthly")) {
            std::vector<MonthlyAggregate> rows;
            auto res = N.exec(
                "SELECT entity_id, to_char(period, 'YYYY-MM') AS period, claim_count, paid_amount, "
                "COALESCE(beneficiary_count, 0) AS beneficiary_count "
                "FROM entity_monthly ORDER BY entity_id, period");
            rows.reserve(res.size());
            for (const auto& row : res) {
                MonthlyAggregate m;
                m.entity_id = row["entity_id"].as<std::string>();
                m.period = Period::Parse(row["period"].as<std::string>());
                m.claim_count = row["claim_count"].is_null() ? 0 : row["claim_count"].as<long long>();
                m.paid_amount = row["paid_amount"].is_null() ? 0.0 : row["paid_amount"].as<double>();
                m.beneficiary_count = row["beneficiary_count"].as<long long>();
                rows.push_back(std::move(m));
            }
            tables.monthly = std::move(rows);
        }

        if (RelationExists(N, "entity_paid_amounts")) {
            std::vector<ProcedureAmountAggregate> rows;
            auto res = N.exec(
                "SELECT entity_id, paid_amount, row_count FROM entity_paid_amounts "
                "WHERE paid_amount IS NOT NULL ORDER BY entity_id, paid_amount");
            rows.reserve(res.size());
            for (const auto& row : res) {
                ProcedureAmountAggregate p;
                p.entity_id = row["entity_id"].as<std::string>();
                p.paid_amount = row["paid_amount"].as<double>();
                p.row_count = row["row_count"].as<long long>();
                rows.push_back(std::move(p));
            }
            tables.procedure_amounts = std::move(rows);
        }

        if (RelationExists(N, "entity_attributes")) {
            auto res = N.exec(
                "SELECT entity_id, COALESCE(name, '') AS name, COALESCE(specialty, '') AS specialty, "
                "COALESCE(state, '') AS state FROM entity_attributes");
            for (const auto& row : res) {
                EntityAttributes a;
                a.entity_id = row["entity_id"].as<std::string>();
                a.name = row["name"].as<std::string>();
                a.specialty = row["specialty"].as<std::string>();
                a.state = row["state"].as<std::string>();
                tables.attributes[a.entity_id] = std::move(a);
            }
        }
    } catch (const std::exception& e) {
        timer.Stop(obs::LogLevel::Error, {{"error_code", obs::kErrDbQueryFailed}, {"error", e.what()}});
        throw;
    }

    timer.Stop(obs::LogLevel::Info, {
        {"monthly_rows", tables.monthly ? static_cast<long long>(tables.monthly->size()) : -1},
        {"paid_amount_rows", tables.procedure_amounts ? static_cast<long long>(tables.procedure_amounts->size()) : -1},
        {"attribute_rows", tables.attributes.size()}
    });
    return tables;
}

auto PgAggregateStore::SaveScanReport(const anomaly::ScanReport& report) -> void {
    try {
        auto conn = manager_->GetConnection();
        pqxx::work W(*conn);
        nlohmann::json flags_by_kind = report.flags_by_kind;
        W.exec_params(
            "INSERT INTO scan_runs (run_id, started_at, threshold, entities_considered, "
            "entities_excluded_low_volume, flags_by_kind) VALUES ($1, $2::timestamptz, $3, $4, $5, $6::jsonb)",
            report.run_id, report.started_at, report.threshold,
            static_cast<long long>(report.entities_considered),
            static_cast<long long>(report.entities_excluded_low_volume),
            flags_by_kind.dump());

        int rank = 1;
        for (const auto& result : report.results) {
            nlohmann::json j = result;
            W.exec_params(
                "INSERT INTO scan_results (run_id, rank, entity_id, score, num_flags, flag_kinds, result) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7::jsonb)",
                report.run_id, rank, result.entity_id, result.overall_score,
                static_cast<int>(result.flags.size()), JoinFlagKinds(result, ";"), j.dump());
            ++rank;
        }
        W.commit();
        spdlog::info("Persisted scan run {} with {} results", report.run_id, report.results.size());
    } catch (const std::exception& e) {
        obs::LogEvent(obs::LogLevel::Error, "scan_persist_failed", "store",
                      {{"error_code", obs::kErrDbInsertFailed}, {"run_id", report.run_id}, {"error", e.what()}});
        throw;
    }
}

auto PgAggregateStore::GetScanReport(const std::string& run_id) -> std::optional<anomaly::ScanReport> {
    try {
        auto conn = manager_->GetConnection();
        pqxx::nontransaction N(*conn);
        auto run = N.exec_params(
            "SELECT run_id, to_char(started_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS.MS\"Z\"') AS started_at, "
            "threshold, entities_considered, entities_excluded_low_volume, flags_by_kind::text AS flags_by_kind "
            "FROM scan_runs WHERE run_id = $1",
            run_id);
        if (run.empty()) {
            return std::nullopt;
        }

        anomaly::ScanReport report;
        report.run_id = run[0]["run_id"].as<std::string>();
        report.started_at = run[0]["started_at"].as<std::string>();
        report.threshold = run[0]["threshold"].as<double>();
        report.entities_considered = run[0]["entities_considered"].as<size_t>();
        report.entities_excluded_low_volume = run[0]["entities_excluded_low_volume"].as<size_t>();
        auto kinds = nlohmann::json::parse(run[0]["flags_by_kind"].as<std::string>());
        for (auto it = kinds.begin(); it != kinds.end(); ++it) {
            report.flags_by_kind[it.key()] = it.value().get<long>();
        }

        auto res = N.exec_params(
            "SELECT result::text AS result FROM scan_results WHERE run_id = $1 ORDER BY rank",
            run_id);
        report.results.reserve(res.size());
        for (const auto& row : res) {
            report.results.push_back(ToScanResult(row));
        }
        return report;
    } catch (const std::exception& e) {
        obs::LogEvent(obs::LogLevel::Error, "scan_fetch_failed", "store",
                      {{"error_code", obs::kErrDbQueryFailed}, {"run_id", run_id}, {"error", e.what()}});
        throw;
    }
}

auto PgAggregateStore::GetLatestScanResult(const std::string& entity_id) -> std::optional<anomaly::ScanResult> {
    try {
        auto conn = manager_->GetConnection();
        pqxx::nontransaction N(*conn);
        if (!RelationExists(N, "scan_results")) {
            return std::nullopt;
        }
        auto res = N.exec_params(
            "SELECT r.result::text AS result FROM scan_results r "
            "WHERE r.entity_id = $1 AND r.run_id = "
            "(SELECT run_id FROM scan_runs ORDER BY started_at DESC, run_id DESC LIMIT 1)",
            entity_id);
        if (res.empty()) {
            return std::nullopt;
        }
        return ToScanResult(res[0]);
    } catch (const std::exception& e) {
        obs::LogEvent(obs::LogLevel::Error, "scan_result_fetch_failed", "store",
                      {{"error_code", obs::kErrDbQueryFailed}, {"entity_id", entity_id}, {"error", e.what()}});
        throw;
    }
}

} // namespace claimscan::store
