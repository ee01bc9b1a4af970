#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "storage/category_repository.hpp"
#include "storage/storage_engine.hpp"
#include "storage/transaction_repository.hpp"
#include <QString>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tally::importer {

struct CashewOptions {
    bool commit = true;             // false: dry run, nothing is written
    bool skip_duplicates = false;   // drop rows matching a live transaction
};

struct CashewRowError {
    size_t row = 0;                 // CSV record number, the header is row 1
    std::string message;
};

struct CashewImportResult {
    QString filename;
    CashewOptions options;
    size_t total_rows = 0;
    size_t parsed_rows = 0;
    size_t invalid_rows = 0;
    size_t categories_created = 0;
    size_t transactions_created = 0;
    size_t transactions_skipped = 0;
    std::map<std::string, std::string> column_mapping;  // field -> header as written
    std::vector<std::string> warnings;
    std::vector<CashewRowError> errors;
};

inline constexpr size_t CASHEW_MAX_ROW_ERRORS = 50;

// Cell parsers for Cashew exports. Errors carry the message only.

/**
 * Header name reduced to lower-case letters and digits ("Category Name" -> "categoryname").
 */
[[nodiscard]] std::string normalize_cashew_header(std::string_view header);

/**
 * Resolve the Cashew fields (amount, date, title, note, category_name, ...)
 * to the headers present. Unmatched fields are absent from the map.
 */
[[nodiscard]] std::map<std::string, std::string> resolve_cashew_columns(const std::vector<std::string>& headers);

/**
 * true, 1, yes, y, t (case-insensitive). Anything else is false.
 */
[[nodiscard]] bool parse_cashew_bool(std::string_view text);

/**
 * YYYY-MM-DD, YYYY-MM-DD HH:MM[...], YYYY/MM/DD, or any ISO 8601 /
 * RFC 2822 date-time. Only the calendar date is kept.
 */
[[nodiscard]] Result<CalendarDate, Error> parse_cashew_date(std::string_view text);

/**
 * Amount in cents. "(12.00)" and "-12" are negative, "+12" positive.
 * Without a sign, income_flag picks the sign (false: expense, negative);
 * no flag means positive. "1,234.56", "1,234" and "12,34" are understood.
 */
[[nodiscard]] Result<int64_t, Error> parse_cashew_amount(std::string_view text,
                                                         std::optional<bool> income_flag);

/**
 * CashewImporter - Imports a Cashew CSV export into the store.
 *
 * Each row becomes a new transaction. Categories are found or created by
 * name path (category, subcategory) and kind, where the kind follows the
 * sign of the amount. A path used by both kinds gets a second parent,
 * suffixed " (Income)" or " (Expense)", for the minority kind.
 *
 * Bad rows are skipped and reported; a file without amount and date
 * columns fails as a whole. The commit writes categories and transactions
 * in one transaction.
 */
class CashewImporter {
public:
    CashewImporter(storage::StorageEngine& engine,
                   storage::CategoryRepository& categories,
                   storage::TransactionRepository& transactions)
        : engine_(engine), categories_(categories), transactions_(transactions) {}

    [[nodiscard]] Result<CashewImportResult, Error> import_text(std::string_view text,
                                                                const QString& filename,
                                                                const CashewOptions& options = {});

    [[nodiscard]] Result<CashewImportResult, Error> import_file(const QString& path,
                                                                const CashewOptions& options = {});

private:
    storage::StorageEngine& engine_;
    storage::CategoryRepository& categories_;
    storage::TransactionRepository& transactions_;
};

} // namespace tally::importer
