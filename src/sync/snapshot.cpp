#include "sync/snapshot.hpp"
#include "import/json_backup_source.hpp"
#include "import/row_mapping.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

namespace tally::sync {

namespace {

QJsonValue to_json(const importer::FieldValue& value) {
    struct Visitor {
        QJsonValue operator()(std::monostate) const { return QJsonValue(QJsonValue::Null); }
        QJsonValue operator()(bool b) const { return QJsonValue(b); }
        QJsonValue operator()(int64_t i) const { return QJsonValue(static_cast<qint64>(i)); }
        QJsonValue operator()(double d) const { return QJsonValue(d); }
        QJsonValue operator()(const std::string& s) const {
            return QJsonValue(QString::fromStdString(s));
        }
    };
    return std::visit(Visitor{}, value);
}

template<typename Entity>
QJsonArray to_json_array(const std::vector<Entity>& entities) {
    QJsonArray array;
    for (const auto& entity : entities) {
        QJsonObject object;
        for (const auto& [key, value] : importer::to_row(entity)) {
            object.insert(QString::fromStdString(key), to_json(value));
        }
        array.append(object);
    }
    return array;
}

template<typename Entity, typename MapRow>
Result<std::vector<Entity>, Error> decode_group(const QJsonObject& root, importer::RecordGroup group,
                                                MapRow map_row) {
    const auto key = QString::fromUtf8(importer::group_key(group).data(),
                                       static_cast<qsizetype>(importer::group_key(group).size()));
    const auto value = root.value(key);
    if (!value.isArray()) {
        return Result<std::vector<Entity>, Error>::err(Error{ErrorKind::Validation,
            "snapshot is missing the '" + key.toStdString() + "' array"});
    }

    auto rows = importer::rows_from_json_array(value.toArray(), group);
    if (rows.is_err()) {
        return Result<std::vector<Entity>, Error>::err(rows.unwrap_err());
    }

    std::vector<Entity> entities;
    entities.reserve(rows.unwrap().size());
    for (size_t i = 0; i < rows.unwrap().size(); ++i) {
        auto mapped = map_row(rows.unwrap()[i], i + 1);
        if (mapped.is_err()) {
            return Result<std::vector<Entity>, Error>::err(mapped.unwrap_err());
        }
        entities.push_back(std::move(mapped).unwrap());
    }
    return Result<std::vector<Entity>, Error>::ok(std::move(entities));
}

} // namespace

Result<Snapshot, Error> collect_snapshot(storage::StorageEngine& engine,
                                         storage::CategoryRepository& categories,
                                         storage::TransactionRepository& transactions,
                                         storage::BudgetRepository& budgets) {
    return engine.read([&](storage::Database&) -> Result<Snapshot, Error> {
        Snapshot snapshot;
        snapshot.exported_at = Timestamp::now();

        auto version = engine.schema_version();
        if (version.is_err()) return Result<Snapshot, Error>::err(version.unwrap_err());
        snapshot.schema_version = version.unwrap();

        auto category_rows = categories.list();
        if (category_rows.is_err()) return Result<Snapshot, Error>::err(category_rows.unwrap_err());
        snapshot.categories = std::move(category_rows).unwrap();

        auto transaction_rows = transactions.list(TransactionFilter{.include_deleted = true});
        if (transaction_rows.is_err()) return Result<Snapshot, Error>::err(transaction_rows.unwrap_err());
        snapshot.transactions = std::move(transaction_rows).unwrap();

        auto budget_rows = budgets.list();
        if (budget_rows.is_err()) return Result<Snapshot, Error>::err(budget_rows.unwrap_err());
        snapshot.budgets = std::move(budget_rows).unwrap();

        return Result<Snapshot, Error>::ok(std::move(snapshot));
    });
}

QByteArray encode_snapshot(const Snapshot& snapshot) {
    QJsonObject root;
    root.insert(QStringLiteral("format"), QLatin1String(SNAPSHOT_FORMAT));
    root.insert(QStringLiteral("version"), SNAPSHOT_VERSION);
    root.insert(QStringLiteral("schema_version"), snapshot.schema_version);
    root.insert(QStringLiteral("exported_at"),
                QString::fromStdString(snapshot.exported_at.to_iso_string()));
    root.insert(QStringLiteral("categories"), to_json_array(snapshot.categories));
    root.insert(QStringLiteral("transactions"), to_json_array(snapshot.transactions));
    root.insert(QStringLiteral("budgets"), to_json_array(snapshot.budgets));
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

Result<Snapshot, Error> decode_snapshot(const QByteArray& bytes) {
    QJsonParseError parse_error;
    const auto doc = QJsonDocument::fromJson(bytes, &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        return Result<Snapshot, Error>::err(Error{ErrorKind::Validation,
            "snapshot is not a JSON object: " + parse_error.errorString().toStdString()});
    }

    const auto root = doc.object();
    if (root.value(QStringLiteral("format")).toString() != QLatin1String(SNAPSHOT_FORMAT)) {
        return Result<Snapshot, Error>::err(
            Error{ErrorKind::Validation, "not a tally snapshot"});
    }
    const int version = root.value(QStringLiteral("version")).toInt(0);
    if (version < 1 || version > SNAPSHOT_VERSION) {
        return Result<Snapshot, Error>::err(Error{ErrorKind::Validation,
            "unsupported snapshot version " + std::to_string(version)});
    }

    Snapshot snapshot;
    snapshot.schema_version = root.value(QStringLiteral("schema_version")).toInt(0);

    auto categories = decode_group<Category>(root, importer::RecordGroup::Categories,
                                             importer::category_from_row);
    if (categories.is_err()) return Result<Snapshot, Error>::err(categories.unwrap_err());
    snapshot.categories = std::move(categories).unwrap();

    auto transactions = decode_group<Transaction>(root, importer::RecordGroup::Transactions,
                                                  importer::transaction_from_row);
    if (transactions.is_err()) return Result<Snapshot, Error>::err(transactions.unwrap_err());
    snapshot.transactions = std::move(transactions).unwrap();

    auto budgets = decode_group<Budget>(root, importer::RecordGroup::Budgets,
                                        importer::budget_from_row);
    if (budgets.is_err()) return Result<Snapshot, Error>::err(budgets.unwrap_err());
    snapshot.budgets = std::move(budgets).unwrap();

    return Result<Snapshot, Error>::ok(std::move(snapshot));
}

} // namespace tally::sync
