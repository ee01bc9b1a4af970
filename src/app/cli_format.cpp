#include "app/cli_format.hpp"
#include "import/row_mapping.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

namespace tally::app {

namespace {

[[nodiscard]] QString qstr(const std::string& text) {
    return QString::fromStdString(text);
}

[[nodiscard]] QJsonValue to_json(const importer::FieldValue& value) {
    if (const auto* b = std::get_if<bool>(&value)) return QJsonValue(*b);
    if (const auto* i = std::get_if<int64_t>(&value)) return QJsonValue(static_cast<qint64>(*i));
    if (const auto* d = std::get_if<double>(&value)) return QJsonValue(*d);
    if (const auto* s = std::get_if<std::string>(&value)) return QJsonValue(qstr(*s));
    return QJsonValue(QJsonValue::Null);
}

template<typename Entity>
[[nodiscard]] QString rows_json(const std::vector<Entity>& entities) {
    QJsonArray array;
    for (const auto& entity : entities) {
        QJsonObject object;
        for (const auto& [key, value] : importer::to_row(entity)) {
            object.insert(qstr(key), to_json(value));
        }
        array.append(object);
    }
    return QString::fromUtf8(QJsonDocument(array).toJson(QJsonDocument::Indented));
}

[[nodiscard]] QString join_lines(const QStringList& lines) {
    return lines.isEmpty() ? QString{} : lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

} // namespace

QString format_cents(int64_t cents) {
    const auto sign = cents < 0 ? QStringLiteral("-") : QString{};
    const auto magnitude = cents < 0 ? 0ULL - static_cast<unsigned long long>(cents)
                                     : static_cast<unsigned long long>(cents);
    return sign + QStringLiteral("%1.%2")
                      .arg(magnitude / 100)
                      .arg(magnitude % 100, 2, 10, QLatin1Char('0'));
}

QString format_categories(const std::vector<Category>& categories) {
    QStringList lines;
    for (const auto& category : tree_order(categories)) {
        auto line = QString(category.parent_id ? 2 : 0, QLatin1Char(' ')) +
                    QStringLiteral("- ") + qstr(category.name) +
                    QStringLiteral(" [%1]").arg(QLatin1String(to_string(category.kind).data()));
        if (!category.active) {
            line += QStringLiteral(" (inactive)");
        }
        lines << line;
    }
    return join_lines(lines);
}

QString format_transactions(const std::vector<Transaction>& transactions) {
    QStringList lines;
    for (const auto& tx : transactions) {
        auto line = QStringLiteral("%1  %2  %3")
                        .arg(qstr(tx.date.to_string()))
                        .arg(format_cents(tx.amount_cents), 12)
                        .arg(qstr(tx.merchant.value_or(tx.notes.value_or(""))));
        if (tx.deleted) {
            line += QStringLiteral(" (deleted)");
        }
        lines << line;
    }
    lines << QStringLiteral("Total: %1").arg(format_cents(total_cents(transactions)));
    return join_lines(lines);
}

QString format_budgets(const std::vector<Budget>& budgets) {
    QStringList lines;
    for (const auto& budget : budgets) {
        lines << QStringLiteral("%1  %2  %3")
                     .arg(qstr(budget.month.to_string()))
                     .arg(budget.is_overall() ? QStringLiteral("(overall)") : qstr(budget.category_id))
                     .arg(format_cents(budget.budget_cents));
    }
    return join_lines(lines);
}

QString format_import_result(const importer::ImportResult& result) {
    QStringList lines;
    lines << QStringLiteral("Imported %1 categories, %2 transactions, %3 budgets")
                 .arg(result.categories_imported)
                 .arg(result.transactions_imported)
                 .arg(result.budgets_imported);
    for (const auto& error : result.errors) {
        lines << QStringLiteral("  error: ") + qstr(error);
    }
    return join_lines(lines);
}

QString format_cashew_result(const importer::CashewImportResult& result) {
    QStringList lines;
    lines << QStringLiteral("%1: %2 rows, %3 parsed, %4 invalid")
                 .arg(result.filename)
                 .arg(static_cast<qulonglong>(result.total_rows))
                 .arg(static_cast<qulonglong>(result.parsed_rows))
                 .arg(static_cast<qulonglong>(result.invalid_rows));
    lines << QStringLiteral("%1 %2 categories, %3 transactions")
                 .arg(result.options.commit ? QStringLiteral("Created") : QStringLiteral("Would create"))
                 .arg(static_cast<qulonglong>(result.categories_created))
                 .arg(static_cast<qulonglong>(result.transactions_created));
    for (const auto& warning : result.warnings) {
        lines << QStringLiteral("  warning: ") + qstr(warning);
    }
    for (const auto& error : result.errors) {
        lines << QStringLiteral("  row %1: %2").arg(static_cast<qulonglong>(error.row)).arg(qstr(error.message));
    }
    return join_lines(lines);
}

QString format_status(const StoreSummary& summary) {
    QStringList lines;
    lines << QStringLiteral("Database: %1").arg(summary.db_path);
    lines << QStringLiteral("Schema version: %1").arg(summary.schema_version);
    lines << QStringLiteral("Categories: %1").arg(summary.categories);
    lines << QStringLiteral("Transactions: %1").arg(summary.transactions);
    lines << QStringLiteral("Budgets: %1").arg(summary.budgets);
    lines << QStringLiteral("Sync: %1").arg(summary.sync_state);
    if (summary.last_revision) {
        lines << QStringLiteral("Last revision: %1").arg(qstr(*summary.last_revision));
    }
    lines << QStringLiteral("Pending changes: %1")
                 .arg(summary.pending_changes ? QStringLiteral("yes") : QStringLiteral("no"));
    for (const auto& warning : summary.warnings) {
        lines << QStringLiteral("Warning: %1").arg(warning);
    }
    return join_lines(lines);
}

QString format_sync_report(const sync::SyncReport& report) {
    QStringList parts;
    parts << (report.merged ? QStringLiteral("merged %1 rows").arg(static_cast<qulonglong>(report.rows_merged))
                            : QStringLiteral("nothing to merge"));
    parts << (report.pushed ? QStringLiteral("pushed") : QStringLiteral("nothing to push"));
    if (report.revision) {
        parts << QStringLiteral("revision %1").arg(qstr(*report.revision));
    }
    return parts.join(QStringLiteral(", ")) + QLatin1Char('\n');
}

QString format_categories_json(const std::vector<Category>& categories) {
    return rows_json(tree_order(categories));
}

QString format_transactions_json(const std::vector<Transaction>& transactions) {
    return rows_json(transactions);
}

QString format_budgets_json(const std::vector<Budget>& budgets) {
    return rows_json(budgets);
}

QString format_import_result_json(const importer::ImportResult& result) {
    QJsonArray errors;
    for (const auto& error : result.errors) {
        errors.append(qstr(error));
    }
    QJsonObject root{
        {QStringLiteral("categories_imported"), result.categories_imported},
        {QStringLiteral("transactions_imported"), result.transactions_imported},
        {QStringLiteral("budgets_imported"), result.budgets_imported},
        {QStringLiteral("errors"), errors},
    };
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

QString format_cashew_result_json(const importer::CashewImportResult& result) {
    QJsonObject columns;
    for (const auto& [field, header] : result.column_mapping) {
        columns.insert(qstr(field), qstr(header));
    }
    QJsonArray warnings;
    for (const auto& warning : result.warnings) {
        warnings.append(qstr(warning));
    }
    QJsonArray errors;
    for (const auto& error : result.errors) {
        errors.append(QJsonObject{
            {QStringLiteral("row"), static_cast<qint64>(error.row)},
            {QStringLiteral("message"), qstr(error.message)},
        });
    }
    QJsonObject root{
        {QStringLiteral("filename"), result.filename},
        {QStringLiteral("commit"), result.options.commit},
        {QStringLiteral("skip_duplicates"), result.options.skip_duplicates},
        {QStringLiteral("total_rows"), static_cast<qint64>(result.total_rows)},
        {QStringLiteral("parsed_rows"), static_cast<qint64>(result.parsed_rows)},
        {QStringLiteral("invalid_rows"), static_cast<qint64>(result.invalid_rows)},
        {QStringLiteral("categories_created"), static_cast<qint64>(result.categories_created)},
        {QStringLiteral("transactions_created"), static_cast<qint64>(result.transactions_created)},
        {QStringLiteral("transactions_skipped"), static_cast<qint64>(result.transactions_skipped)},
        {QStringLiteral("column_mapping"), columns},
        {QStringLiteral("warnings"), warnings},
        {QStringLiteral("errors"), errors},
    };
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

QString format_status_json(const StoreSummary& summary) {
    QJsonObject root{
        {QStringLiteral("db_path"), summary.db_path},
        {QStringLiteral("schema_version"), summary.schema_version},
        {QStringLiteral("categories"), static_cast<qint64>(summary.categories)},
        {QStringLiteral("transactions"), static_cast<qint64>(summary.transactions)},
        {QStringLiteral("budgets"), static_cast<qint64>(summary.budgets)},
        {QStringLiteral("pending_changes"), summary.pending_changes},
        {QStringLiteral("sync"), summary.sync_state},
        {QStringLiteral("warnings"), QJsonArray::fromStringList(summary.warnings)},
    };
    if (summary.last_revision) {
        root.insert(QStringLiteral("last_revision"), qstr(*summary.last_revision));
    }
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

} // namespace tally::app
