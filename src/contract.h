#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace claimscan::anomaly {

// Declaration order is the canonical order used when listing kinds.
enum class FlagKind {
    VolumeImpossibility,
    RevenueOutlier,
    BillingSpike,
    SuspiciousConsistency
};

inline constexpr std::array<FlagKind, 4> kAllFlagKinds = {
    FlagKind::VolumeImpossibility,
    FlagKind::RevenueOutlier,
    FlagKind::BillingSpike,
    FlagKind::SuspiciousConsistency
};

inline auto FlagKindName(FlagKind kind) -> const char* {
    switch (kind) {
        case FlagKind::VolumeImpossibility:
            return "volume_impossibility";
        case FlagKind::RevenueOutlier:
            return "revenue_outlier";
        case FlagKind::BillingSpike:
            return "billing_spike";
        case FlagKind::SuspiciousConsistency:
            return "suspicious_consistency";
    }
    return "unknown";
}

// Throws std::invalid_argument for names FlagKindName never produces.
auto ParseFlagKind(const std::string& name) -> FlagKind;

struct RedFlag {
    FlagKind kind = FlagKind::VolumeImpossibility;
    std::string description;
    double severity = 0.0; // [0, 1]
    nlohmann::json evidence = nlohmann::json::object();
};

// One detector hit, tagged with the entity it belongs to.
struct EntityFlag {
    std::string entity_id;
    RedFlag flag;
};

using FlagList = std::vector<EntityFlag>;

struct ScanResult {
    std::string entity_id;
    double overall_score = 0.0; // [0, 1], higher is more suspicious
    std::vector<RedFlag> flags;
    double total_paid = 0.0;
    long long claim_count = 0;

    // Distinct kinds present, in canonical order.
    [[nodiscard]] auto DistinctKinds() const -> std::vector<FlagKind>;
};

struct ScanReport {
    std::string run_id;
    std::string started_at;
    double threshold = 0.0;
    size_t entities_considered = 0;
    size_t entities_excluded_low_volume = 0;
    std::map<std::string, long> flags_by_kind;
    std::vector<ScanResult> results;
};

struct PeerComparison {
    std::string group_key;
    size_t peer_count = 0;
    double entity_total = 0.0;
    double peer_mean = 0.0;
    double peer_median = 0.0;
    std::optional<double> z_score;
    double percentile_rank = 0.0;
};

struct PeerOutcome {
    enum class Status {
        Available,
        Unavailable,
        UnknownEntity
    };

    Status status = Status::Unavailable;
    std::optional<PeerComparison> comparison;
    std::string reason;

    static auto Available(PeerComparison comparison) -> PeerOutcome {
        PeerOutcome out;
        out.status = Status::Available;
        out.comparison = std::move(comparison);
        return out;
    }
    static auto Unavailable(std::string reason) -> PeerOutcome {
        PeerOutcome out;
        out.status = Status::Unavailable;
        out.reason = std::move(reason);
        return out;
    }
    static auto NotFound(const std::string& entity_id) -> PeerOutcome {
        PeerOutcome out;
        out.status = Status::UnknownEntity;
        out.reason = "unknown entity " + entity_id;
        return out;
    }
};

// JSON mapping used by the HTTP API, the CLI and the scan_results table.
void to_json(nlohmann::json& j, const RedFlag& flag);
void from_json(const nlohmann::json& j, RedFlag& flag);
void to_json(nlohmann::json& j, const ScanResult& result);
void from_json(const nlohmann::json& j, ScanResult& result);
void to_json(nlohmann::json& j, const ScanReport& report);
void to_json(nlohmann::json& j, const PeerOutcome& outcome);

} // namespace claimscan::anomaly
