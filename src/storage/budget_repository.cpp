#include "storage/budget_repository.hpp"

#include <unordered_set>

namespace tally::storage {

Budget BudgetRepository::row_to_budget(Statement& stmt) {
    return Budget{
        .month = YearMonth::parse(stmt.column_text(0)).value_or(YearMonth{}),
        .category_id = stmt.column_text(1),
        .budget_cents = stmt.column_int64(2)
    };
}

Result<void, Error> BudgetRepository::write_row(Database& db, const Budget& budget) {
    if (!budget.is_overall()) {
        auto check = db.prepare("SELECT 1 FROM categories WHERE id = ?;");
        if (check.is_err()) {
            return Result<void, Error>::err(check.unwrap_err());
        }
        auto check_stmt = std::move(check).unwrap();
        auto bind_result = check_stmt.bind_all(budget.category_id);
        if (bind_result.is_err()) {
            return bind_result;
        }
        auto step_result = check_stmt.step();
        if (step_result.is_err()) {
            return Result<void, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) {
            return Result<void, Error>::err(Error{ErrorKind::Validation,
                "budget " + budget_key(budget) + " references missing category '" +
                budget.category_id + "'"});
        }
    }

    auto stmt_result = db.prepare(R"SQL(
        INSERT INTO budgets (month, category_id, budget_cents)
        VALUES (?, ?, ?)
        ON CONFLICT(month, category_id) DO UPDATE SET
            budget_cents = excluded.budget_cents;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(budget.month.to_string(), budget.category_id, budget.budget_cents);
    if (bind_result.is_err()) {
        return bind_result;
    }
    return stmt.run();
}

Result<Budget, Error> BudgetRepository::upsert(const Budget& budget) {
    auto valid = validate(budget);
    if (valid.is_err()) {
        return Result<Budget, Error>::err(valid.unwrap_err());
    }

    return engine_.transaction([&](Database& db) -> Result<Budget, Error> {
        auto write_result = write_row(db, budget);
        if (write_result.is_err()) {
            return Result<Budget, Error>::err(write_result.unwrap_err());
        }
        return Result<Budget, Error>::ok(budget);
    });
}

Result<int, Error> BudgetRepository::bulk_upsert(const std::vector<Budget>& budgets) {
    for (const auto& budget : budgets) {
        auto valid = validate(budget);
        if (valid.is_err()) {
            return Result<int, Error>::err(valid.unwrap_err());
        }
    }

    return engine_.transaction([&](Database& db) -> Result<int, Error> {
        std::unordered_set<std::string> keys;
        for (const auto& budget : budgets) {
            auto write_result = write_row(db, budget);
            if (write_result.is_err()) {
                return Result<int, Error>::err(write_result.unwrap_err());
            }
            keys.insert(budget_key(budget));
        }
        return Result<int, Error>::ok(static_cast<int>(keys.size()));
    });
}

Result<std::optional<Budget>, Error> BudgetRepository::get(const YearMonth& month,
                                                           const std::string& category_id) {
    return engine_.read([&](Database& db) -> Result<std::optional<Budget>, Error> {
        auto stmt_result = db.prepare(
            "SELECT month, category_id, budget_cents FROM budgets "
            "WHERE month = ? AND category_id = ?;");
        if (stmt_result.is_err()) {
            return Result<std::optional<Budget>, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        auto bind_result = stmt.bind_all(month.to_string(), category_id);
        if (bind_result.is_err()) {
            return Result<std::optional<Budget>, Error>::err(bind_result.unwrap_err());
        }

        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::optional<Budget>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) {
            return Result<std::optional<Budget>, Error>::ok(std::nullopt);
        }
        return Result<std::optional<Budget>, Error>::ok(row_to_budget(stmt));
    });
}

Result<std::vector<Budget>, Error> BudgetRepository::list_for_month(const YearMonth& month) {
    return engine_.read([&](Database& db) -> Result<std::vector<Budget>, Error> {
        auto stmt_result = db.prepare(
            "SELECT month, category_id, budget_cents FROM budgets "
            "WHERE month = ? ORDER BY category_id;");
        if (stmt_result.is_err()) {
            return Result<std::vector<Budget>, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        auto bind_result = stmt.bind_all(month.to_string());
        if (bind_result.is_err()) {
            return Result<std::vector<Budget>, Error>::err(bind_result.unwrap_err());
        }
        return collect_rows(stmt, row_to_budget);
    });
}

Result<std::vector<Budget>, Error> BudgetRepository::list() {
    return engine_.read([](Database& db) -> Result<std::vector<Budget>, Error> {
        auto stmt_result = db.prepare(
            "SELECT month, category_id, budget_cents FROM budgets ORDER BY month, category_id;");
        if (stmt_result.is_err()) {
            return Result<std::vector<Budget>, Error>::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();
        return collect_rows(stmt, row_to_budget);
    });
}

Result<void, Error> BudgetRepository::remove(const YearMonth& month, const std::string& category_id) {
    return engine_.transaction([&](Database& db) -> Result<void, Error> {
        auto stmt_result = db.prepare("DELETE FROM budgets WHERE month = ? AND category_id = ?;");
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        auto bind_result = stmt.bind_all(month.to_string(), category_id);
        if (bind_result.is_err()) {
            return bind_result;
        }
        auto run_result = stmt.run();
        if (run_result.is_err()) {
            return run_result;
        }
        if (db.changes() == 0) {
            return Result<void, Error>::err(Error{ErrorKind::NotFound,
                "budget " + month.to_string() + "/" + category_id + " not found"});
        }
        return Result<void, Error>::ok();
    });
}

Result<int64_t, Error> BudgetRepository::count() {
    return engine_.read([](Database& db) {
        return db.query_int64("SELECT COUNT(*) FROM budgets;");
    });
}

} // namespace tally::storage
