#include "import/csv_directory_source.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <algorithm>
#include <cctype>

namespace tally::importer {

namespace {

std::string normalize_header(const std::string& raw) {
    const auto first = raw.find_first_not_of(" \t");
    if (first == std::string::npos) return {};
    const auto last = raw.find_last_not_of(" \t");
    std::string header = raw.substr(first, last - first + 1);
    std::transform(header.begin(), header.end(), header.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return header;
}

bool is_blank(const CsvRecord& record) {
    return record.size() == 1 && record.front().empty();
}

} // namespace

Result<std::vector<CsvRecord>, Error> parse_csv(std::string_view text) {
    if (text.substr(0, 3) == "\xEF\xBB\xBF") {
        text.remove_prefix(3);
    }

    std::vector<CsvRecord> records;
    CsvRecord record;
    std::string field;
    bool in_quotes = false;
    bool field_was_quoted = false;
    size_t line = 1;

    auto end_record = [&]() {
        record.push_back(std::move(field));
        field.clear();
        field_was_quoted = false;
        if (!is_blank(record)) {
            records.push_back(std::move(record));
        }
        record.clear();
    };

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') ++line;
                field += c;
            }
            continue;
        }

        switch (c) {
            case '"':
                if (!field.empty() || field_was_quoted) {
                    return Result<std::vector<CsvRecord>, Error>::err(Error{ErrorKind::Validation,
                        "unexpected quote on line " + std::to_string(line)});
                }
                in_quotes = true;
                field_was_quoted = true;
                break;
            case ',':
                record.push_back(std::move(field));
                field.clear();
                field_was_quoted = false;
                break;
            case '\r':
                if (i + 1 < text.size() && text[i + 1] == '\n') {
                    ++i;
                }
                end_record();
                ++line;
                break;
            case '\n':
                end_record();
                ++line;
                break;
            default:
                field += c;
                break;
        }
    }

    if (in_quotes) {
        return Result<std::vector<CsvRecord>, Error>::err(Error{ErrorKind::Validation,
            "unterminated quoted field starting before line " + std::to_string(line)});
    }
    if (!field.empty() || field_was_quoted || !record.empty()) {
        end_record();
    }
    return Result<std::vector<CsvRecord>, Error>::ok(std::move(records));
}

Result<Rows, Error> rows_from_csv(const std::vector<CsvRecord>& records) {
    Rows rows;
    if (records.empty()) {
        return Result<Rows, Error>::ok(std::move(rows));
    }

    std::vector<std::string> headers;
    headers.reserve(records.front().size());
    for (const auto& raw : records.front()) {
        headers.push_back(normalize_header(raw));
    }

    for (size_t r = 1; r < records.size(); ++r) {
        const auto& record = records[r];
        if (record.size() > headers.size()) {
            return Result<Rows, Error>::err(Error{ErrorKind::Validation,
                "row " + std::to_string(r) + " has " + std::to_string(record.size()) +
                " fields but the header has " + std::to_string(headers.size())});
        }

        Row row;
        for (size_t c = 0; c < headers.size(); ++c) {
            if (headers[c].empty()) continue;
            if (c < record.size() && !record[c].empty()) {
                row[headers[c]] = record[c];
            } else {
                row[headers[c]] = std::monostate{};
            }
        }
        rows.push_back(std::move(row));
    }
    return Result<Rows, Error>::ok(std::move(rows));
}

QString CsvDirectorySource::file_path(RecordGroup group) const {
    return QDir(directory_).filePath(QString::fromUtf8(group_key(group).data(),
                                                       static_cast<qsizetype>(group_key(group).size())) +
                                     QStringLiteral(".csv"));
}

std::string CsvDirectorySource::describe() const {
    return "csv:" + QDir(directory_).absolutePath().toStdString();
}

Result<std::optional<Rows>, Error> CsvDirectorySource::group(RecordGroup group) {
    const auto path = file_path(group);
    if (!QFileInfo::exists(path)) {
        return Result<std::optional<Rows>, Error>::ok(std::nullopt);
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<std::optional<Rows>, Error>::err(Error{ErrorKind::Storage,
            "cannot read " + path.toStdString() + ": " + file.errorString().toStdString()});
    }
    const QByteArray bytes = file.readAll();

    auto records = parse_csv(std::string_view(bytes.constData(), static_cast<size_t>(bytes.size())));
    if (records.is_err()) {
        return Result<std::optional<Rows>, Error>::err(Error{ErrorKind::Validation,
            QFileInfo(path).fileName().toStdString() + ": " + records.unwrap_err().message});
    }

    auto rows = rows_from_csv(records.unwrap());
    if (rows.is_err()) {
        return Result<std::optional<Rows>, Error>::err(Error{ErrorKind::Validation,
            QFileInfo(path).fileName().toStdString() + ": " + rows.unwrap_err().message});
    }
    return Result<std::optional<Rows>, Error>::ok(std::move(rows).unwrap());
}

} // namespace tally::importer
