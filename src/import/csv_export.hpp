#pragma once

#include "import/import_source.hpp"
#include "core/budget.hpp"
#include "core/category.hpp"
#include "core/result.hpp"
#include "core/transaction.hpp"
#include <QByteArray>
#include <QString>
#include <string>
#include <string_view>
#include <vector>

namespace tally::importer {

/**
 * Quote a cell when it holds a comma, a quote or a line break. Quotes
 * inside are doubled.
 */
[[nodiscard]] std::string csv_escape(std::string_view cell);

/**
 * Column order written for a group; the same names the row mapping reads.
 */
[[nodiscard]] std::vector<std::string> export_columns(RecordGroup group);

/**
 * Header line plus one line per row, LF separated. Missing keys and empty
 * values become empty cells.
 */
[[nodiscard]] QByteArray encode_csv(const std::vector<std::string>& columns, const Rows& rows);

struct CsvExportResult {
    QString directory;
    size_t categories = 0;
    size_t transactions = 0;
    size_t budgets = 0;

    [[nodiscard]] size_t row_count() const noexcept { return categories + transactions + budgets; }
};

/**
 * Write categories.csv, transactions.csv and budgets.csv into directory,
 * creating it when missing. Tombstones are written too, so
 * CsvDirectorySource reads the export back to the same rows.
 *
 * Categories are sorted by name, transactions newest first, budgets by month.
 */
[[nodiscard]] Result<CsvExportResult, Error> export_csv_directory(const QString& directory,
                                                                  std::vector<Category> categories,
                                                                  std::vector<Transaction> transactions,
                                                                  std::vector<Budget> budgets);

} // namespace tally::importer
