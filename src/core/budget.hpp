#pragma once

#include "core/types.hpp"
#include "core/result.hpp"
#include <string>
#include <cstdint>

namespace tally {

/**
 * category_id value that marks the overall (all categories) budget of a month.
 */
inline constexpr const char* OVERALL_BUDGET = "";

/**
 * Budget - Spending limit for one month, either overall or per category.
 *
 * Keyed by (month, category_id); at most one row per key.
 */
struct Budget {
    YearMonth month;
    std::string category_id;
    int64_t budget_cents = 0;

    [[nodiscard]] bool is_overall() const noexcept { return category_id.empty(); }

    bool operator==(const Budget&) const = default;
};

[[nodiscard]] inline Budget create_budget(YearMonth month, int64_t budget_cents,
                                          std::string category_id = OVERALL_BUDGET) {
    return Budget{
        .month = month,
        .category_id = std::move(category_id),
        .budget_cents = budget_cents
    };
}

/**
 * Stable textual key, unique per (month, category_id).
 */
[[nodiscard]] inline std::string budget_key(const Budget& budget) {
    return budget.month.to_string() + "/" + budget.category_id;
}

[[nodiscard]] inline Result<void, Error> validate(const Budget& budget) {
    if (!budget.month.is_valid()) {
        return Result<void, Error>::err(Error{ErrorKind::Validation, "budget has no valid month"});
    }
    if (budget.budget_cents < 0) {
        return Result<void, Error>::err(
            Error{ErrorKind::Validation,
                  "budget " + budget_key(budget) + " is negative"});
    }
    return Result<void, Error>::ok();
}

} // namespace tally
