#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../contract.h"
#include "../types.h"

namespace claimscan::report {

struct ClaimsSummary {
    long long total_claims = 0;
    double total_paid = 0.0;
    long long total_beneficiaries = 0;
    std::optional<double> paid_per_claim; // absent when total_claims == 0
    Period first_period;
    Period last_period;
    size_t active_months = 0;
    double avg_claims_per_active_month = 0.0;
    long long max_claims_in_a_month = 0;
    double max_paid_in_a_month = 0.0;
};

struct TimelinePoint {
    Period period;
    long long claim_count = 0;
    double paid_amount = 0.0;
    long long beneficiary_count = 0;
};

struct Dossier {
    std::string entity_id;
    std::optional<EntityAttributes> attributes;
    anomaly::ScanResult scan_result;
    ClaimsSummary claims_summary;
    anomaly::PeerOutcome peer_comparison;
    std::vector<TimelinePoint> timeline;
};

// Evidence bundle for one entity. Without a scan result a zero-score result
// with no flags is attached.
// Throws DataUnavailableError if the monthly table is missing, and
// UnknownEntityError if the entity has no monthly rows.
auto BuildDossier(const AggregateTables& tables,
                  const std::string& entity_id,
                  std::optional<anomaly::ScanResult> scan_result = std::nullopt) -> Dossier;

void to_json(nlohmann::json& j, const ClaimsSummary& summary);
void to_json(nlohmann::json& j, const TimelinePoint& point);
void to_json(nlohmann::json& j, const Dossier& dossier);

} // namespace claimscan::report
