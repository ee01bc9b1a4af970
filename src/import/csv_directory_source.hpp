#pragma once

#include "import/import_source.hpp"
#include <QString>
#include <string>
#include <string_view>
#include <vector>

namespace tally::importer {

using CsvRecord = std::vector<std::string>;

/**
 * Parse CSV text: comma separated, double-quoted fields with "" as an
 * escaped quote, quoted fields may span lines, LF or CRLF line endings.
 * A UTF-8 byte order mark is skipped and blank lines are ignored.
 */
[[nodiscard]] Result<std::vector<CsvRecord>, Error> parse_csv(std::string_view text);

/**
 * Turn parsed records into rows keyed by the (trimmed, lower-cased) header.
 * Empty cells become empty values so optional fields read as absent.
 */
[[nodiscard]] Result<Rows, Error> rows_from_csv(const std::vector<CsvRecord>& records);

/**
 * CsvDirectorySource - categories.csv, transactions.csv and budgets.csv
 * in one folder. A missing file is a missing group.
 */
class CsvDirectorySource : public ImportSource {
public:
    explicit CsvDirectorySource(QString directory) : directory_(std::move(directory)) {}

    [[nodiscard]] Result<std::optional<Rows>, Error> group(RecordGroup group) override;

    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] QString file_path(RecordGroup group) const;

private:
    QString directory_;
};

} // namespace tally::importer
