#pragma once

#include "import/import_source.hpp"
#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

namespace tally::importer {

/**
 * Convert a JSON scalar to a cell. Whole numbers become integers.
 */
[[nodiscard]] FieldValue field_from_json(const QJsonValue& value);

/**
 * Convert an array of flat objects to rows. Nested values are rejected.
 */
[[nodiscard]] Result<Rows, Error> rows_from_json_array(const QJsonArray& array, RecordGroup group);

/**
 * JsonBackupSource - A backup document: a JSON object holding "categories",
 * "transactions" and "budgets" arrays. Snapshots written by export and by
 * sync have this shape; a "format" other than tally-snapshot is refused.
 */
class JsonBackupSource : public ImportSource {
public:
    [[nodiscard]] static Result<JsonBackupSource, Error> from_bytes(const QByteArray& bytes);

    [[nodiscard]] static Result<JsonBackupSource, Error> from_file(const QString& path);

    [[nodiscard]] Result<std::optional<Rows>, Error> group(RecordGroup group) override;

    [[nodiscard]] std::string describe() const override { return description_; }

private:
    JsonBackupSource(QJsonObject root, std::string description)
        : root_(std::move(root)), description_(std::move(description)) {}

    QJsonObject root_;
    std::string description_;
};

} // namespace tally::importer
