#pragma once

#include "import/import_source.hpp"
#include "storage/budget_repository.hpp"
#include "storage/category_repository.hpp"
#include "storage/transaction_repository.hpp"
#include <string>
#include <vector>

namespace tally::importer {

struct ImportResult {
    int categories_imported = 0;
    int transactions_imported = 0;
    int budgets_imported = 0;
    std::vector<std::string> errors;

    [[nodiscard]] bool ok() const noexcept { return errors.empty(); }

    [[nodiscard]] int total() const noexcept {
        return categories_imported + transactions_imported + budgets_imported;
    }
};

/**
 * BulkImporter - Merges an import source into the store.
 *
 * Groups run in dependency order (categories, transactions, budgets). Each
 * group is one bulk upsert, so a group either lands whole or not at all.
 * Failures are collected per group and never abort the other groups.
 * Ids are preserved, so importing the same source twice is a no-op.
 */
class BulkImporter {
public:
    BulkImporter(storage::CategoryRepository& categories,
                 storage::TransactionRepository& transactions,
                 storage::BudgetRepository& budgets)
        : categories_(categories), transactions_(transactions), budgets_(budgets) {}

    [[nodiscard]] ImportResult import_from(ImportSource& source);

private:
    void import_categories(ImportSource& source, ImportResult& result);
    void import_transactions(ImportSource& source, ImportResult& result);
    void import_budgets(ImportSource& source, ImportResult& result);

    storage::CategoryRepository& categories_;
    storage::TransactionRepository& transactions_;
    storage::BudgetRepository& budgets_;
};

} // namespace tally::importer
