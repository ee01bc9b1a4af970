#pragma once

#include "import/import_source.hpp"
#include "core/budget.hpp"
#include "core/category.hpp"
#include "core/transaction.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace tally::importer {

/**
 * FieldReader - Typed access to one loosely typed row.
 *
 * Errors name the group, the 1-based row number and the field, e.g.
 * "Transactions row 3: 'date' is not a valid date ('2024-02-30')".
 */
class FieldReader {
public:
    FieldReader(const Row& row, RecordGroup group, size_t row_number)
        : row_(row), group_(group), row_number_(row_number) {}

    /**
     * Text of a present, non-blank cell.
     */
    [[nodiscard]] std::optional<std::string> text(std::string_view key) const;

    /**
     * Like text(), but keeps surrounding whitespace. For names, merchants
     * and notes, which round-trip through snapshots unchanged.
     */
    [[nodiscard]] std::optional<std::string> verbatim_text(std::string_view key) const;

    [[nodiscard]] Result<std::string, Error> required_text(std::string_view key) const;

    [[nodiscard]] Result<std::optional<int64_t>, Error> integer(std::string_view key) const;

    [[nodiscard]] Result<int64_t, Error> required_integer(std::string_view key) const;

    /**
     * true/false, yes/no, 1/0 (case-insensitive). Blank cells give fallback.
     */
    [[nodiscard]] Result<bool, Error> boolean(std::string_view key, bool fallback) const;

    /**
     * "YYYY-MM-DD", an ISO date-time (date part used) or a spreadsheet serial day.
     */
    [[nodiscard]] Result<CalendarDate, Error> required_date(std::string_view key) const;

    /**
     * "YYYY-MM", or a full date whose month is used.
     */
    [[nodiscard]] Result<YearMonth, Error> required_month(std::string_view key) const;

    [[nodiscard]] Error error(std::string_view key, const std::string& problem) const;

private:
    [[nodiscard]] const FieldValue* find(std::string_view key) const;

    const Row& row_;
    RecordGroup group_;
    size_t row_number_;
};

/**
 * Map a row into an entity. Missing ids are generated; missing timestamps
 * are left at the epoch for the repository to stamp.
 */
[[nodiscard]] Result<Category, Error> category_from_row(const Row& row, size_t row_number);
[[nodiscard]] Result<Transaction, Error> transaction_from_row(const Row& row, size_t row_number);
[[nodiscard]] Result<Budget, Error> budget_from_row(const Row& row, size_t row_number);

/**
 * Inverse mapping, used for exports and snapshots. Row keys match what the
 * *_from_row functions read.
 */
[[nodiscard]] Row to_row(const Category& category);
[[nodiscard]] Row to_row(const Transaction& tx);
[[nodiscard]] Row to_row(const Budget& budget);

} // namespace tally::importer
