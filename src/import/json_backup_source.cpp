#include "import/json_backup_source.hpp"

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <cmath>

namespace tally::importer {

namespace {

constexpr auto kSnapshotFormat = "tally-snapshot";

} // namespace

FieldValue field_from_json(const QJsonValue& value) {
    switch (value.type()) {
        case QJsonValue::Bool:
            return value.toBool();
        case QJsonValue::Double: {
            const double d = value.toDouble();
            if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 9.0e15) {
                return static_cast<int64_t>(d);
            }
            return d;
        }
        case QJsonValue::String:
            return value.toString().toStdString();
        default:
            return std::monostate{};
    }
}

Result<Rows, Error> rows_from_json_array(const QJsonArray& array, RecordGroup group) {
    Rows rows;
    rows.reserve(static_cast<size_t>(array.size()));

    for (qsizetype i = 0; i < array.size(); ++i) {
        const auto element = array.at(i);
        if (!element.isObject()) {
            return Result<Rows, Error>::err(Error{ErrorKind::Validation,
                std::string(group_name(group)) + " row " + std::to_string(i + 1) +
                ": expected an object"});
        }

        Row row;
        const auto object = element.toObject();
        for (auto it = object.begin(); it != object.end(); ++it) {
            if (it.value().isArray() || it.value().isObject()) {
                return Result<Rows, Error>::err(Error{ErrorKind::Validation,
                    std::string(group_name(group)) + " row " + std::to_string(i + 1) +
                    ": '" + it.key().toStdString() + "' is not a scalar"});
            }
            row[it.key().toStdString()] = field_from_json(it.value());
        }
        rows.push_back(std::move(row));
    }
    return Result<Rows, Error>::ok(std::move(rows));
}

Result<JsonBackupSource, Error> JsonBackupSource::from_bytes(const QByteArray& bytes) {
    QJsonParseError parse_error;
    const auto doc = QJsonDocument::fromJson(bytes, &parse_error);
    if (parse_error.error != QJsonParseError::NoError) {
        return Result<JsonBackupSource, Error>::err(Error{ErrorKind::Validation,
            "backup is not valid JSON: " + parse_error.errorString().toStdString() +
            " at offset " + std::to_string(parse_error.offset)});
    }
    if (!doc.isObject()) {
        return Result<JsonBackupSource, Error>::err(
            Error{ErrorKind::Validation, "backup root must be a JSON object"});
    }

    auto root = doc.object();
    const auto format = root.value(QStringLiteral("format"));
    if (!format.isUndefined() && format.toString() != QLatin1String(kSnapshotFormat)) {
        return Result<JsonBackupSource, Error>::err(Error{ErrorKind::Validation,
            "unsupported backup format '" + format.toString().toStdString() + "'"});
    }
    return Result<JsonBackupSource, Error>::ok(JsonBackupSource(std::move(root), "json"));
}

Result<JsonBackupSource, Error> JsonBackupSource::from_file(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<JsonBackupSource, Error>::err(Error{ErrorKind::Storage,
            "cannot read " + path.toStdString() + ": " + file.errorString().toStdString()});
    }

    auto source = from_bytes(file.readAll());
    if (source.is_err()) {
        return source;
    }
    auto loaded = std::move(source).unwrap();
    loaded.description_ = "json:" + path.toStdString();
    return Result<JsonBackupSource, Error>::ok(std::move(loaded));
}

Result<std::optional<Rows>, Error> JsonBackupSource::group(RecordGroup group) {
    const auto key = QString::fromUtf8(group_key(group).data(),
                                       static_cast<qsizetype>(group_key(group).size()));
    const auto value = root_.value(key);
    if (value.isUndefined() || value.isNull()) {
        return Result<std::optional<Rows>, Error>::ok(std::nullopt);
    }
    if (!value.isArray()) {
        return Result<std::optional<Rows>, Error>::err(Error{ErrorKind::Validation,
            "'" + key.toStdString() + "' must be an array"});
    }

    auto rows = rows_from_json_array(value.toArray(), group);
    if (rows.is_err()) {
        return Result<std::optional<Rows>, Error>::err(rows.unwrap_err());
    }
    return Result<std::optional<Rows>, Error>::ok(std::move(rows).unwrap());
}

} // namespace tally::importer
