#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "types.h"

namespace claimscan::anomaly {

struct MonthTotals {
    long long claim_count = 0;
    double paid_amount = 0.0;
    long long beneficiary_count = 0;
};

using EntityHistory = std::map<Period, MonthTotals>;

// entity_id -> period -> totals. Ordered so every pass over it is deterministic.
using HistoryIndex = std::map<std::string, EntityHistory>;

struct EntityTotals {
    long long claim_count = 0;
    double paid_amount = 0.0;
    long long beneficiary_count = 0;
    size_t active_months = 0;
};

// Rows repeating an (entity, period) pair are summed.
auto BuildHistoryIndex(const std::vector<MonthlyAggregate>& rows) -> HistoryIndex;

auto TotalsFor(const EntityHistory& history) -> EntityTotals;

struct ViabilitySplit {
    HistoryIndex viable;
    std::set<std::string> excluded;
};

// Entities whose total paid across all months is below min_total_paid go to `excluded`.
auto SplitByViability(const HistoryIndex& index, double min_total_paid) -> ViabilitySplit;

// Keeps only rows whose entity is in `index`.
auto RestrictToEntities(const std::vector<ProcedureAmountAggregate>& rows,
                        const HistoryIndex& index) -> std::vector<ProcedureAmountAggregate>;

} // namespace claimscan::anomaly
