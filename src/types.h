#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace claimscan {

// Calendar month of a billing period.
struct Period {
    int year = 0;
    int month = 0;

    // Accepts "YYYY-MM" or "YYYY-MM-DD" (the day is ignored).
    // Throws std::invalid_argument on anything else.
    static auto Parse(const std::string& text) -> Period;

    [[nodiscard]] auto ToString() const -> std::string;

    auto operator<(const Period& other) const -> bool {
        return year != other.year ? year < other.year : month < other.month;
    }
    auto operator==(const Period& other) const -> bool {
        return year == other.year && month == other.month;
    }
    auto operator!=(const Period& other) const -> bool { return !(*this == other); }
};

// One row per (entity_id, period), claim and paid totals already summed upstream.
struct MonthlyAggregate {
    std::string entity_id;
    Period period;
    long long claim_count = 0;
    double paid_amount = 0.0;
    long long beneficiary_count = 0;
};

// One row per (entity_id, paid_amount): how many line items shared that exact amount.
struct ProcedureAmountAggregate {
    std::string entity_id;
    double paid_amount = 0.0;
    long long row_count = 0;
};

// Registry metadata resolved outside the engine; only used for peer grouping and display.
struct EntityAttributes {
    std::string entity_id;
    std::string name;
    std::string specialty;
    std::string state;
};

// Snapshot of the inputs of one scan. A nullopt table was never produced,
// which is different from a produced table with no rows.
struct AggregateTables {
    std::optional<std::vector<MonthlyAggregate>> monthly;
    std::optional<std::vector<ProcedureAmountAggregate>> procedure_amounts;
    std::map<std::string, EntityAttributes> attributes;
};

} // namespace claimscan
