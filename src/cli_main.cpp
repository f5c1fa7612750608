#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "errors.h"
#include "report/dossier.h"
#include "scan_config.h"
#include "scan_export.h"
#include "scanner.h"
#include "store/pg_aggregate_store.h"

using claimscan::anomaly::ScanConfig;

static std::string get_env(const char* key) {
    const char* val = std::getenv(key);
    return val ? std::string(val) : std::string();
}

static void PrintUsage() {
    std::cerr << "Usage: claimscan_cli <command> [options]\n"
              << "  preprocess\n"
              << "  scan [--threshold X] [--top N] [--config PATH] [--output PATH]\n"
              << "  profile <entity_id>\n"
              << "Environment: DB_CONNECTION_STRING, CLAIMSCAN_CONFIG, CLAIMSCAN_* overrides" << std::endl;
}

static ScanConfig ResolveConfig(const std::string& config_path) {
    ScanConfig config;
    std::string path = config_path.empty() ? get_env("CLAIMSCAN_CONFIG") : config_path;
    if (!path.empty()) {
        config = claimscan::anomaly::LoadScanConfig(path);
    }
    claimscan::anomaly::ApplyEnvOverrides(config);
    claimscan::anomaly::ValidateScanConfig(config);
    return config;
}

static int RunPreprocess(claimscan::store::IAggregateStore& store) {
    auto summary = store.BuildAggregates();
    std::cout << "entity_monthly rows:      " << summary.monthly_rows << "\n"
              << "entity_paid_amounts rows: " << summary.paid_amount_rows << std::endl;
    return 0;
}

static int RunScan(claimscan::store::PgAggregateStore& store,
                   const ScanConfig& config,
                   double threshold,
                   int top,
                   const std::string& output_path) {
    auto tables = store.LoadTables();
    claimscan::anomaly::Scanner scanner(config);
    auto report = scanner.Scan(tables, threshold);

    store.EnsureSchema();
    store.SaveScanReport(report);
    claimscan::anomaly::WriteScanResultsCsvFile(output_path, report.results);

    std::cout << "Scan " << report.run_id << ": "
              << report.entities_considered << " entities scanned, "
              << report.entities_excluded_low_volume << " below minimum volume, "
              << report.results.size() << " flagged at threshold " << threshold << "\n";
    for (const auto& [kind, count] : report.flags_by_kind) {
        std::cout << "  " << std::left << std::setw(24) << kind << count << "\n";
    }

    int shown = 0;
    for (const auto& result : report.results) {
        if (shown >= top) {
            break;
        }
        ++shown;
        std::cout << fmt::format("{:>4}. {} | {:.0f}% | {} flags ({})",
                                 shown, result.entity_id, result.overall_score * 100.0,
                                 result.flags.size(), claimscan::anomaly::JoinFlagKinds(result, ", "))
                  << "\n";
    }
    std::cout << "Results written to " << output_path << std::endl;
    return 0;
}

// Attaches the entity's result from the latest persisted scan, if it was flagged there.
static int RunProfile(claimscan::store::IAggregateStore& store, const std::string& entity_id) {
    auto tables = store.LoadTables();
    auto dossier = claimscan::report::BuildDossier(tables, entity_id, store.GetLatestScanResult(entity_id));

    nlohmann::json j = dossier;
    std::cout << j.dump(2) << "\n";

    const auto& summary = dossier.claims_summary;
    std::cout << fmt::format("{}: {} claims, ${:.2f} paid over {} months ({} to {}), score {:.0f}%",
                             entity_id, summary.total_claims, summary.total_paid, summary.active_months,
                             summary.first_period.ToString(), summary.last_period.ToString(),
                             dossier.scan_result.overall_score * 100.0)
              << std::endl;
    return 0;
}

int main(int argc, char** argv) {
    auto console = spdlog::stderr_color_mt("console");
    spdlog::set_default_logger(console);

    if (argc < 2) {
        PrintUsage();
        return 2;
    }

    std::string command = argv[1];
    std::string entity_id;
    std::string config_path;
    std::string output_path = "output/scan_results.csv";
    std::string db_conn_str = get_env("DB_CONNECTION_STRING");
    double threshold = 0.3;
    int top = 20;

    try {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--threshold" && i + 1 < argc) {
                threshold = std::stod(argv[++i]);
            } else if (arg == "--top" && i + 1 < argc) {
                top = std::stoi(argv[++i]);
            } else if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                output_path = argv[++i];
            } else if (arg == "--db_conn" && i + 1 < argc) {
                db_conn_str = argv[++i];
            } else if (command == "profile" && entity_id.empty() && arg.rfind("--", 0) != 0) {
                entity_id = arg;
            } else {
                std::cerr << "Unknown argument: " << arg << std::endl;
                PrintUsage();
                return 2;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid option value: " << e.what() << std::endl;
        return 2;
    }

    if (db_conn_str.empty()) {
        std::cerr << "Missing DB connection string (use --db_conn or DB_CONNECTION_STRING)." << std::endl;
        return 1;
    }

    try {
        claimscan::store::PgAggregateStore store(db_conn_str);
        if (command == "preprocess") {
            return RunPreprocess(store);
        }
        if (command == "scan") {
            return RunScan(store, ResolveConfig(config_path), threshold, top, output_path);
        }
        if (command == "profile") {
            if (entity_id.empty()) {
                std::cerr << "Missing <entity_id> for profile." << std::endl;
                return 2;
            }
            return RunProfile(store, entity_id);
        }
        std::cerr << "Unknown command: " << command << std::endl;
        PrintUsage();
        return 2;
    } catch (const claimscan::UnknownEntityError& e) {
        std::cerr << e.what() << std::endl;
        return 3;
    } catch (const claimscan::DataUnavailableError& e) {
        std::cerr << "Data unavailable: " << e.what() << ". Run 'claimscan_cli preprocess' first." << std::endl;
        return 4;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
