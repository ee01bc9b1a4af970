#include "import/bulk_importer.hpp"
#include "import/row_mapping.hpp"
#include "core/log.hpp"

#include <type_traits>

namespace tally::importer {

namespace {

std::string group_error(RecordGroup group, const std::string& message) {
    return std::string(group_name(group)) + ": " + message;
}

/**
 * Fetch, map and upsert one group. Returns the rows written, or 0 with an
 * entry appended to result.errors.
 */
template<typename MapRow, typename Upsert>
int run_group(ImportSource& source, RecordGroup group, ImportResult& result,
              MapRow map_row, Upsert upsert) {
    auto fetched = source.group(group);
    if (fetched.is_err()) {
        result.errors.push_back(group_error(group, fetched.unwrap_err().message));
        return 0;
    }
    if (!fetched.unwrap()) {
        result.errors.push_back("Missing '" + std::string(group_name(group)) + "' group.");
        return 0;
    }

    const auto& rows = *fetched.unwrap();
    using Entity = typename std::invoke_result_t<MapRow, const Row&, size_t>::value_type;
    std::vector<Entity> entities;
    entities.reserve(rows.size());

    for (size_t i = 0; i < rows.size(); ++i) {
        auto mapped = map_row(rows[i], i + 1);
        if (mapped.is_err()) {
            result.errors.push_back(group_error(group, mapped.unwrap_err().message));
            return 0;
        }
        entities.push_back(std::move(mapped).unwrap());
    }

    if (entities.empty()) {
        return 0;
    }

    auto written = upsert(entities);
    if (written.is_err()) {
        result.errors.push_back(group_error(group, written.unwrap_err().message));
        return 0;
    }
    return written.unwrap();
}

} // namespace

void BulkImporter::import_categories(ImportSource& source, ImportResult& result) {
    result.categories_imported = run_group(
        source, RecordGroup::Categories, result, category_from_row,
        [this](const std::vector<Category>& rows) { return categories_.bulk_upsert(rows); });
}

void BulkImporter::import_transactions(ImportSource& source, ImportResult& result) {
    result.transactions_imported = run_group(
        source, RecordGroup::Transactions, result, transaction_from_row,
        [this](const std::vector<Transaction>& rows) { return transactions_.bulk_upsert(rows); });
}

void BulkImporter::import_budgets(ImportSource& source, ImportResult& result) {
    result.budgets_imported = run_group(
        source, RecordGroup::Budgets, result, budget_from_row,
        [this](const std::vector<Budget>& rows) { return budgets_.bulk_upsert(rows); });
}

ImportResult BulkImporter::import_from(ImportSource& source) {
    qCInfo(tallyImportLog) << "Importing from" << QString::fromStdString(source.describe());

    ImportResult result;
    import_categories(source, result);
    import_transactions(source, result);
    import_budgets(source, result);

    for (const auto& error : result.errors) {
        qCWarning(tallyImportLog) << "Import:" << QString::fromStdString(error);
    }
    qCInfo(tallyImportLog) << "Imported" << result.categories_imported << "categories,"
                           << result.transactions_imported << "transactions,"
                           << result.budgets_imported << "budgets with"
                           << result.errors.size() << "errors";
    return result;
}

} // namespace tally::importer
