#include "scanner.h"

#include <functional>
#include <future>
#include <stdexcept>
#include <utility>
#include <vector>

#include "aggregate_index.h"
#include "detectors/consistency_detector.h"
#include "detectors/revenue_detector.h"
#include "detectors/spike_detector.h"
#include "detectors/volume_detector.h"
#include "errors.h"
#include "ids.h"
#include "obs/context.h"
#include "obs/logging.h"
#include "obs/metrics.h"
#include "score_fusion.h"

namespace claimscan::anomaly {

namespace {

using DetectorFn = std::function<FlagList()>;

auto RunDetectors(const std::vector<DetectorFn>& detectors, bool parallel) -> std::vector<FlagList> {
    std::vector<FlagList> outputs;
    outputs.reserve(detectors.size());

    if (!parallel) {
        for (const auto& detect : detectors) {
            outputs.push_back(detect());
        }
        return outputs;
    }

    // Workers inherit the caller's log context; results are collected in
    // submission order so fusion sees the same input either way.
    const obs::Context ctx = obs::GetContext();
    std::vector<std::future<FlagList>> pending;
    pending.reserve(detectors.size());
    for (const auto& detect : detectors) {
        pending.push_back(std::async(std::launch::async, [&detect, ctx]() {
            obs::ScopedContext scope(ctx);
            return detect();
        }));
    }
    for (auto& f : pending) {
        outputs.push_back(f.get());
    }
    return outputs;
}

} // namespace

Scanner::Scanner(ScanConfig config) : config_(std::move(config)) {
    ValidateScanConfig(config_);
}

auto Scanner::Scan(const AggregateTables& tables, double threshold) const -> ScanReport {
    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        throw std::invalid_argument("threshold must be within [0, 1]");
    }
    if (!tables.monthly.has_value()) {
        throw DataUnavailableError("Monthly aggregate table is missing");
    }
    ScanReport report;
    report.run_id = GenerateUuid();
    report.started_at = obs::NowIso8601();
    report.threshold = threshold;

    obs::Context ctx = obs::GetContext();
    ctx.scan_run_id = report.run_id;
    obs::ScopedContext scope(ctx);
    obs::ScopedTimer timer("scan_complete", "scanner",
                           {{"threshold", threshold}, {"monthly_rows", tables.monthly->size()}});

    auto split = SplitByViability(BuildHistoryIndex(*tables.monthly), config_.min_total_paid);
    const HistoryIndex& viable = split.viable;
    if (tables.monthly->empty()) {
        obs::LogEvent(obs::LogLevel::Warn, "monthly_table_empty", "scanner", {{"entities_considered", 0}});
    }
    report.entities_considered = viable.size();
    report.entities_excluded_low_volume = split.excluded.size();

    std::vector<ProcedureAmountAggregate> procedure_rows;
    if (!tables.procedure_amounts.has_value() || tables.procedure_amounts->empty()) {
        obs::LogEvent(obs::LogLevel::Warn, "consistency_detector_disabled", "scanner",
                      {{"reason", tables.procedure_amounts.has_value() ? "empty_table" : "missing_table"}});
    } else {
        procedure_rows = RestrictToEntities(*tables.procedure_amounts, viable);
    }

    const ScanConfig& config = config_;
    std::vector<DetectorFn> detectors = {
        [&]() { return DetectVolumeImpossibility(viable, config); },
        [&]() { return DetectRevenueOutliers(viable, config); },
        [&]() { return DetectBillingSpikes(viable, config); },
        [&]() { return DetectSuspiciousConsistency(procedure_rows, config); }
    };
    auto outputs = RunDetectors(detectors, config_.parallel_detectors);

    for (auto kind : kAllFlagKinds) {
        report.flags_by_kind[FlagKindName(kind)] = 0;
    }
    for (const auto& output : outputs) {
        for (const auto& hit : output) {
            report.flags_by_kind[FlagKindName(hit.flag.kind)]++;
        }
    }

    report.results = ScoreFusion::Fuse(outputs, threshold);
    for (auto& result : report.results) {
        auto it = viable.find(result.entity_id);
        if (it != viable.end()) {
            auto totals = TotalsFor(it->second);
            result.total_paid = totals.paid_amount;
            result.claim_count = totals.claim_count;
        }
    }

    obs::EmitCounter("scan_runs_total", 1, "runs", "scanner");
    for (const auto& [kind, count] : report.flags_by_kind) {
        obs::EmitCounter("scan_flags_total", count, "flags", "scanner", {{"kind", kind}});
    }
    obs::EmitCounter("scan_results_total", static_cast<long>(report.results.size()), "entities", "scanner");
    obs::EmitHistogram("scan_duration_ms", timer.ElapsedMs(), "ms", "scanner");

    timer.Stop(obs::LogLevel::Info, {
        {"entities_considered", report.entities_considered},
        {"entities_excluded_low_volume", report.entities_excluded_low_volume},
        {"flags_by_kind", report.flags_by_kind},
        {"results", report.results.size()}
    });
    return report;
}

} // namespace claimscan::anomaly
