#include "aggregate_index.h"

namespace claimscan::anomaly {

auto BuildHistoryIndex(const std::vector<MonthlyAggregate>& rows) -> HistoryIndex {
    HistoryIndex index;
    for (const auto& row : rows) {
        auto& month = index[row.entity_id][row.period];
        month.claim_count += row.claim_count;
        month.paid_amount += row.paid_amount;
        month.beneficiary_count += row.beneficiary_count;
    }
    return index;
}

auto TotalsFor(const EntityHistory& history) -> EntityTotals {
    EntityTotals totals;
    for (const auto& [period, month] : history) {
        totals.claim_count += month.claim_count;
        totals.paid_amount += month.paid_amount;
        totals.beneficiary_count += month.beneficiary_count;
    }
    totals.active_months = history.size();
    return totals;
}

auto SplitByViability(const HistoryIndex& index, double min_total_paid) -> ViabilitySplit {
    ViabilitySplit split;
    for (const auto& [entity_id, history] : index) {
        if (TotalsFor(history).paid_amount < min_total_paid) {
            split.excluded.insert(entity_id);
        } else {
            split.viable.emplace(entity_id, history);
        }
    }
    return split;
}

auto RestrictToEntities(const std::vector<ProcedureAmountAggregate>& rows,
                        const HistoryIndex& index) -> std::vector<ProcedureAmountAggregate> {
    std::vector<ProcedureAmountAggregate> kept;
    kept.reserve(rows.size());
    for (const auto& row : rows) {
        if (index.count(row.entity_id) > 0) {
            kept.push_back(row);
        }
    }
    return kept;
}

} // namespace claimscan::anomaly
