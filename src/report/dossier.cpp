#include "dossier.h"

#include <algorithm>
#include <utility>

#include "../aggregate_index.h"
#include "../errors.h"
#include "../obs/context.h"
#include "../obs/logging.h"
#include "../peer_comparator.h"

namespace claimscan::report {

namespace {

auto Summarize(const anomaly::EntityHistory& history) -> ClaimsSummary {
    ClaimsSummary s;
    auto totals = anomaly::TotalsFor(history);
    s.total_claims = totals.claim_count;
    s.total_paid = totals.paid_amount;
    s.total_beneficiaries = totals.beneficiary_count;
    s.active_months = totals.active_months;
    if (totals.claim_count > 0) {
        s.paid_per_claim = totals.paid_amount / static_cast<double>(totals.claim_count);
    }
    if (!history.empty()) {
        s.first_period = history.begin()->first;
        s.last_period = history.rbegin()->first;
        s.avg_claims_per_active_month =
            static_cast<double>(totals.claim_count) / static_cast<double>(history.size());
        s.max_paid_in_a_month = history.begin()->second.paid_amount;
    }
    for (const auto& [period, month] : history) {
        s.max_claims_in_a_month = std::max(s.max_claims_in_a_month, month.claim_count);
        s.max_paid_in_a_month = std::max(s.max_paid_in_a_month, month.paid_amount);
    }
    return s;
}

auto Timeline(const anomaly::EntityHistory& history) -> std::vector<TimelinePoint> {
    std::vector<TimelinePoint> points;
    points.reserve(history.size());
    for (const auto& [period, month] : history) {
        points.push_back({period, month.claim_count, month.paid_amount, month.beneficiary_count});
    }
    return points;
}

} // namespace

auto BuildDossier(const AggregateTables& tables,
                  const std::string& entity_id,
                  std::optional<anomaly::ScanResult> scan_result) -> Dossier {
    if (!tables.monthly.has_value()) {
        throw DataUnavailableError("Monthly aggregate table is missing");
    }

    obs::Context ctx = obs::GetContext();
    ctx.entity_id = entity_id;
    obs::ScopedContext scope(ctx);
    obs::ScopedTimer timer("dossier_built", "dossier");

    auto index = anomaly::BuildHistoryIndex(*tables.monthly);
    auto subject = index.find(entity_id);
    if (subject == index.end()) {
        timer.Stop(obs::LogLevel::Warn, {{"outcome", "unknown_entity"}});
        throw UnknownEntityError(entity_id);
    }

    Dossier dossier;
    dossier.entity_id = entity_id;
    auto attr = tables.attributes.find(entity_id);
    if (attr != tables.attributes.end()) {
        dossier.attributes = attr->second;
    }

    if (scan_result.has_value()) {
        dossier.scan_result = std::move(*scan_result);
    } else {
        dossier.scan_result.entity_id = entity_id;
        dossier.scan_result.overall_score = 0.0;
    }

    dossier.claims_summary = Summarize(subject->second);
    dossier.timeline = Timeline(subject->second);
    dossier.peer_comparison = anomaly::PeerComparator::CompareWithinSpecialty(index, tables.attributes, entity_id);

    if (dossier.scan_result.total_paid == 0.0 && dossier.scan_result.claim_count == 0) {
        dossier.scan_result.total_paid = dossier.claims_summary.total_paid;
        dossier.scan_result.claim_count = dossier.claims_summary.total_claims;
    }
    return dossier;
}

void to_json(nlohmann::json& j, const ClaimsSummary& s) {
    j = nlohmann::json{
        {"total_claims", s.total_claims},
        {"total_paid", s.total_paid},
        {"total_beneficiaries", s.total_beneficiaries},
        {"date_range_start", s.first_period.ToString()},
        {"date_range_end", s.last_period.ToString()},
        {"active_months", s.active_months},
        {"avg_claims_per_active_month", s.avg_claims_per_active_month},
        {"max_claims_in_a_month", s.max_claims_in_a_month},
        {"max_paid_in_a_month", s.max_paid_in_a_month}
    };
    if (s.paid_per_claim.has_value()) {
        j["paid_per_claim"] = *s.paid_per_claim;
    }
}

void to_json(nlohmann::json& j, const TimelinePoint& p) {
    j = nlohmann::json{
        {"month", p.period.ToString()},
        {"claim_count", p.claim_count},
        {"total_paid", p.paid_amount},
        {"beneficiaries", p.beneficiary_count}
    };
}

void to_json(nlohmann::json& j, const Dossier& d) {
    nlohmann::json entity = {{"entity_id", d.entity_id}};
    if (d.attributes.has_value()) {
        entity["name"] = d.attributes->name;
        entity["specialty"] = d.attributes->specialty;
        entity["state"] = d.attributes->state;
    }
    j = nlohmann::json{
        {"entity", entity},
        {"scan_result", d.scan_result},
        {"claims_summary", d.claims_summary},
        {"peer_comparison", d.peer_comparison},
        {"timeline", d.timeline}
    };
}

} // namespace claimscan::report
