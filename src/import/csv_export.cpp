#include "import/csv_export.hpp"
#include "import/csv_directory_source.hpp"
#include "import/row_mapping.hpp"
#include "core/log.hpp"

#include <QDir>
#include <QSaveFile>
#include <algorithm>

namespace tally::importer {

namespace {

template<typename Entity>
Rows rows_of(const std::vector<Entity>& entities) {
    Rows rows;
    rows.reserve(entities.size());
    for (const auto& entity : entities) {
        rows.push_back(to_row(entity));
    }
    return rows;
}

Result<void, Error> write_file(const QString& path, const QByteArray& bytes) {
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly) || file.write(bytes) != bytes.size() || !file.commit()) {
        return Result<void, Error>::err(Error{ErrorKind::Storage,
            "cannot write " + path.toStdString() + ": " + file.errorString().toStdString()});
    }
    return Result<void, Error>::ok();
}

} // namespace

std::string csv_escape(std::string_view cell) {
    if (cell.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(cell);
    }
    std::string quoted;
    quoted.reserve(cell.size() + 2);
    quoted += '"';
    for (const char c : cell) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::vector<std::string> export_columns(RecordGroup group) {
    switch (group) {
        case RecordGroup::Categories:
            return {"id", "name", "kind", "parent_id", "active", "created_at", "updated_at"};
        case RecordGroup::Transactions:
            return {"id", "date", "amount_cents", "category_id", "merchant", "notes",
                    "created_at", "updated_at", "deleted"};
        case RecordGroup::Budgets:
            return {"month", "category_id", "budget_cents"};
    }
    return {};
}

QByteArray encode_csv(const std::vector<std::string>& columns, const Rows& rows) {
    std::string out;
    auto append_line = [&out](const std::vector<std::string>& cells) {
        for (size_t i = 0; i < cells.size(); ++i) {
            if (i > 0) out += ',';
            out += csv_escape(cells[i]);
        }
        out += '\n';
    };

    append_line(columns);
    for (const auto& row : rows) {
        std::vector<std::string> cells;
        cells.reserve(columns.size());
        for (const auto& column : columns) {
            auto it = row.find(column);
            cells.push_back(it == row.end() ? std::string() : to_display(it->second));
        }
        append_line(cells);
    }
    return QByteArray(out.data(), static_cast<qsizetype>(out.size()));
}

Result<CsvExportResult, Error> export_csv_directory(const QString& directory,
                                                    std::vector<Category> categories,
                                                    std::vector<Transaction> transactions,
                                                    std::vector<Budget> budgets) {
    QDir dir(directory);
    if (!dir.mkpath(QStringLiteral("."))) {
        return Result<CsvExportResult, Error>::err(Error{ErrorKind::Storage,
            "cannot create " + directory.toStdString()});
    }

    std::stable_sort(categories.begin(), categories.end(),
                     [](const Category& a, const Category& b) { return a.name < b.name; });
    std::stable_sort(transactions.begin(), transactions.end(),
                     [](const Transaction& a, const Transaction& b) { return a.date > b.date; });
    std::stable_sort(budgets.begin(), budgets.end(),
                     [](const Budget& a, const Budget& b) { return a.month < b.month; });

    const CsvDirectorySource layout(directory);
    const std::pair<RecordGroup, Rows> groups[] = {
        {RecordGroup::Categories, rows_of(categories)},
        {RecordGroup::Transactions, rows_of(transactions)},
        {RecordGroup::Budgets, rows_of(budgets)},
    };
    for (const auto& [group, rows] : groups) {
        auto written = write_file(layout.file_path(group), encode_csv(export_columns(group), rows));
        if (written.is_err()) {
            return Result<CsvExportResult, Error>::err(written.unwrap_err());
        }
    }

    CsvExportResult result{
        .directory = dir.absolutePath(),
        .categories = categories.size(),
        .transactions = transactions.size(),
        .budgets = budgets.size(),
    };
    qCInfo(tallyImportLog) << "Exported" << result.row_count() << "rows to" << result.directory;
    return Result<CsvExportResult, Error>::ok(std::move(result));
}

} // namespace tally::importer
