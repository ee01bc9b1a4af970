#pragma once

#include "core/budget.hpp"
#include "core/category.hpp"
#include "core/transaction.hpp"
#include "import/bulk_importer.hpp"
#include "import/cashew_import.hpp"
#include "sync/sync_adapter.hpp"
#include <QString>
#include <QStringList>
#include <optional>
#include <string>
#include <vector>

namespace tally::app {

struct StoreSummary {
    QString db_path;
    int schema_version = 0;
    int64_t categories = 0;
    int64_t transactions = 0;
    int64_t budgets = 0;
    bool pending_changes = false;
    std::optional<std::string> last_revision;
    QString sync_state;
    QStringList warnings;
};

/**
 * "-12.34" style rendering of a cent amount.
 */
[[nodiscard]] QString format_cents(int64_t cents);

// Text output: one record per line, children indented under their parent.
[[nodiscard]] QString format_categories(const std::vector<Category>& categories);
[[nodiscard]] QString format_transactions(const std::vector<Transaction>& transactions);
[[nodiscard]] QString format_budgets(const std::vector<Budget>& budgets);
[[nodiscard]] QString format_import_result(const importer::ImportResult& result);
[[nodiscard]] QString format_cashew_result(const importer::CashewImportResult& result);
[[nodiscard]] QString format_status(const StoreSummary& summary);
[[nodiscard]] QString format_sync_report(const sync::SyncReport& report);

// JSON output: arrays of row objects using the snapshot field names.
[[nodiscard]] QString format_categories_json(const std::vector<Category>& categories);
[[nodiscard]] QString format_transactions_json(const std::vector<Transaction>& transactions);
[[nodiscard]] QString format_budgets_json(const std::vector<Budget>& budgets);
[[nodiscard]] QString format_import_result_json(const importer::ImportResult& result);
[[nodiscard]] QString format_cashew_result_json(const importer::CashewImportResult& result);
[[nodiscard]] QString format_status_json(const StoreSummary& summary);

} // namespace tally::app
