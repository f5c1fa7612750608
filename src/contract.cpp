#include "contract.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace claimscan::anomaly {

namespace {

auto RoundTo(double value, int digits) -> double {
    double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

} // namespace

auto ParseFlagKind(const std::string& name) -> FlagKind {
    for (auto kind : kAllFlagKinds) {
        if (name == FlagKindName(kind)) {
            return kind;
        }
    }
    throw std::invalid_argument("Unknown flag kind: " + name);
}

auto ScanResult::DistinctKinds() const -> std::vector<FlagKind> {
    std::vector<FlagKind> kinds;
    for (auto kind : kAllFlagKinds) {
        bool present = std::any_of(flags.begin(), flags.end(),
                                   [kind](const RedFlag& f) { return f.kind == kind; });
        if (present) {
            kinds.push_back(kind);
        }
    }
    return kinds;
}

void to_json(nlohmann::json& j, const RedFlag& flag) {
    j = nlohmann::json{
        {"kind", FlagKindName(flag.kind)},
        {"description", flag.description},
        {"severity", flag.severity},
        {"evidence", flag.evidence}
    };
}

void from_json(const nlohmann::json& j, RedFlag& flag) {
    flag.kind = ParseFlagKind(j.at("kind").get<std::string>());
    flag.description = j.value("description", "");
    flag.severity = j.at("severity").get<double>();
    flag.evidence = j.value("evidence", nlohmann::json::object());
}

void to_json(nlohmann::json& j, const ScanResult& result) {
    nlohmann::json kinds = nlohmann::json::array();
    for (auto kind : result.DistinctKinds()) {
        kinds.push_back(FlagKindName(kind));
    }
    j = nlohmann::json{
        {"entity_id", result.entity_id},
        {"overall_score", result.overall_score},
        {"flag_kinds", kinds},
        {"flags", result.flags},
        {"total_paid", result.total_paid},
        {"claim_count", result.claim_count}
    };
}

void from_json(const nlohmann::json& j, ScanResult& result) {
    result.entity_id = j.at("entity_id").get<std::string>();
    result.overall_score = j.at("overall_score").get<double>();
    result.flags = j.value("flags", std::vector<RedFlag>{});
    result.total_paid = j.value("total_paid", 0.0);
    result.claim_count = j.value("claim_count", 0LL);
}

void to_json(nlohmann::json& j, const ScanReport& report) {
    j = nlohmann::json{
        {"run_id", report.run_id},
        {"started_at", report.started_at},
        {"threshold", report.threshold},
        {"entities_considered", report.entities_considered},
        {"entities_excluded_low_volume", report.entities_excluded_low_volume},
        {"flags_by_kind", report.flags_by_kind},
        {"result_count", report.results.size()},
        {"results", report.results}
    };
}

// Rounding happens here only; the comparator keeps full precision.
void to_json(nlohmann::json& j, const PeerOutcome& outcome) {
    switch (outcome.status) {
        case PeerOutcome::Status::Available: {
            const auto& c = *outcome.comparison;
            j = nlohmann::json{
                {"status", "available"},
                {"group_key", c.group_key},
                {"peer_count", c.peer_count},
                {"entity_total", RoundTo(c.entity_total, 2)},
                {"peer_mean", RoundTo(c.peer_mean, 2)},
                {"peer_median", RoundTo(c.peer_median, 2)},
                {"percentile_rank", RoundTo(c.percentile_rank, 1)}
            };
            if (c.z_score.has_value()) {
                j["zscore"] = RoundTo(*c.z_score, 2);
            }
            return;
        }
        case PeerOutcome::Status::Unavailable:
            j = nlohmann::json{{"status", "unavailable"}, {"note", outcome.reason}};
            return;
        case PeerOutcome::Status::UnknownEntity:
            j = nlohmann::json{{"status", "unknown_entity"}, {"note", outcome.reason}};
            return;
    }
}

} // namespace claimscan::anomaly
