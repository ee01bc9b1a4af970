#pragma once

#include "storage/storage_engine.hpp"
#include "core/budget.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tally::storage {

/**
 * BudgetRepository - Data access layer for monthly budgets.
 *
 * Rows are keyed by (month, category_id); an empty category_id is the
 * overall budget of the month.
 */
class BudgetRepository {
public:
    explicit BudgetRepository(StorageEngine& engine) : engine_(engine) {}

    /**
     * Insert or replace the budget for its key.
     */
    [[nodiscard]] Result<Budget, Error> upsert(const Budget& budget);

    /**
     * Same as upsert; named for symmetry with the other repositories.
     */
    [[nodiscard]] Result<Budget, Error> create(const Budget& budget) { return upsert(budget); }

    /**
     * Insert-or-replace a batch atomically. Duplicate keys inside the batch
     * apply in order and count once.
     */
    [[nodiscard]] Result<int, Error> bulk_upsert(const std::vector<Budget>& budgets);

    [[nodiscard]] Result<std::optional<Budget>, Error> get(const YearMonth& month,
                                                           const std::string& category_id);

    [[nodiscard]] Result<std::vector<Budget>, Error> list_for_month(const YearMonth& month);

    [[nodiscard]] Result<std::vector<Budget>, Error> list();

    [[nodiscard]] Result<void, Error> remove(const YearMonth& month, const std::string& category_id);

    [[nodiscard]] Result<int64_t, Error> count();

private:
    StorageEngine& engine_;

    [[nodiscard]] static Budget row_to_budget(Statement& stmt);
    [[nodiscard]] static Result<void, Error> write_row(Database& db, const Budget& budget);
};

} // namespace tally::storage
