#include "import/cashew_import.hpp"
#include "import/csv_directory_source.hpp"
#include "core/category.hpp"
#include "core/log.hpp"
#include "core/transaction.hpp"

#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <iterator>
#include <unordered_map>
#include <unordered_set>

namespace tally::importer {

namespace {

constexpr const char* UNCATEGORIZED = "Uncategorized";
constexpr qsizetype MAX_NAME_LENGTH = 200;

// Resolution order matters: the first listed alias present wins.
const std::vector<std::pair<std::string, std::vector<std::string>>>& cashew_fields() {
    static const std::vector<std::pair<std::string, std::vector<std::string>>> fields{
        {"account", {"account"}},
        {"amount", {"amount"}},
        {"currency", {"currency"}},
        {"title", {"title"}},
        {"note", {"note", "notes"}},
        {"date", {"date", "notedate"}},
        {"income", {"income"}},
        {"type", {"type"}},
        {"category_name", {"categoryname", "category"}},
        {"subcategory_name", {"subcategoryname", "subcategory"}},
        {"color", {"color"}},
        {"icon", {"icon"}},
        {"emoji", {"emoji"}},
        {"budget", {"budget"}},
        {"objective", {"objective"}},
    };
    return fields;
}

std::string trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

std::string normalize_name(const std::string& name) {
    return QString::fromStdString(name).simplified().toLower().toStdString();
}

std::string capped(const std::string& name) {
    return QString::fromStdString(name).left(MAX_NAME_LENGTH).toStdString();
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

Error row_error(std::string message) {
    return Error{ErrorKind::Validation, std::move(message)};
}

struct ParsedRow {
    CalendarDate date;
    int64_t amount_cents = 0;
    CategoryKind kind = CategoryKind::Expense;
    std::string merchant;
    std::string notes;
    std::string path;
};

struct PathStats {
    std::string category;
    std::string subcategory;
    int income_count = 0;
    int expense_count = 0;
    int64_t income_total = 0;
    int64_t expense_total = 0;
};

std::string kind_key(CategoryKind kind, const std::string& rest) {
    return std::string(to_string(kind)) + ":" + rest;
}

std::string duplicate_key(const CalendarDate& date, int64_t cents, const std::string& category_id,
                          const std::string& merchant, const std::string& notes) {
    return date.to_string() + "|" + std::to_string(cents) + "|" + category_id + "|" +
           merchant + "|" + notes;
}

CashewImportResult empty_result(const QString& filename, const CashewOptions& options) {
    CashewImportResult result;
    result.filename = filename;
    result.options = options;
    return result;
}

} // namespace

std::string normalize_cashew_header(std::string_view header) {
    std::string normalized;
    for (const char c : header) {
        const auto lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if ((lower >= 'a' && lower <= 'z') || (lower >= '0' && lower <= '9')) {
            normalized += lower;
        }
    }
    return normalized;
}

std::map<std::string, std::string> resolve_cashew_columns(const std::vector<std::string>& headers) {
    std::unordered_map<std::string, std::string> by_normalized;
    for (const auto& header : headers) {
        const auto normalized = normalize_cashew_header(header);
        if (!normalized.empty()) {
            by_normalized.emplace(normalized, header);
        }
    }

    std::map<std::string, std::string> columns;
    for (const auto& [field, aliases] : cashew_fields()) {
        for (const auto& alias : aliases) {
            auto it = by_normalized.find(alias);
            if (it != by_normalized.end()) {
                columns.emplace(field, it->second);
                break;
            }
        }
    }
    return columns;
}

bool parse_cashew_bool(std::string_view text) {
    auto value = trim(text);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value == "true" || value == "1" || value == "yes" || value == "y" || value == "t";
}

Result<CalendarDate, Error> parse_cashew_date(std::string_view text) {
    const auto s = QString::fromStdString(trim(text));
    if (s.isEmpty()) {
        return Result<CalendarDate, Error>::err(row_error("date is empty"));
    }

    static const QRegularExpression patterns[] = {
        QRegularExpression(QStringLiteral("^(\\d{4})-(\\d{2})-(\\d{2})$")),
        QRegularExpression(QStringLiteral("^(\\d{4})-(\\d{2})-(\\d{2})[T ](\\d{2}):(\\d{2})")),
        QRegularExpression(QStringLiteral("^(\\d{4})/(\\d{2})/(\\d{2})$")),
    };
    for (const auto& pattern : patterns) {
        const auto match = pattern.match(s);
        if (!match.hasMatch()) continue;
        auto date = CalendarDate::from_ymd(match.captured(1).toInt(), match.captured(2).toInt(),
                                           match.captured(3).toInt());
        if (!date) {
            return Result<CalendarDate, Error>::err(row_error("Invalid date: " + s.toStdString()));
        }
        return Result<CalendarDate, Error>::ok(*date);
    }

    QDate parsed = QDateTime::fromString(s, Qt::ISODateWithMs).date();
    if (!parsed.isValid()) parsed = QDateTime::fromString(s, Qt::RFC2822Date).date();
    if (!parsed.isValid()) parsed = QDate::fromString(s, Qt::ISODate);
    if (parsed.isValid()) {
        if (auto date = CalendarDate::from_ymd(parsed.year(), parsed.month(), parsed.day())) {
            return Result<CalendarDate, Error>::ok(*date);
        }
    }
    return Result<CalendarDate, Error>::err(row_error("Unrecognized date format: " + s.toStdString()));
}

Result<int64_t, Error> parse_cashew_amount(std::string_view text, std::optional<bool> income_flag) {
    auto s = trim(text);
    if (s.empty()) {
        return Result<int64_t, Error>::err(row_error("amount is empty"));
    }

    bool negative = false;
    bool positive = false;
    if (s.size() >= 2 && s.front() == '(' && s.back() == ')') {
        negative = true;
        s = trim(std::string_view(s).substr(1, s.size() - 2));
    }
    if (!s.empty() && s.front() == '-') {
        negative = true;
        s = trim(std::string_view(s).substr(1));
    } else if (!s.empty() && s.front() == '+') {
        positive = true;
        s = trim(std::string_view(s).substr(1));
    }

    std::string cleaned;
    std::copy_if(s.begin(), s.end(), std::back_inserter(cleaned), [](char c) {
        return (c >= '0' && c <= '9') || c == '.' || c == ',';
    });
    const auto not_numeric = [&text] {
        return Result<int64_t, Error>::err(row_error("amount is not numeric: " + std::string(text)));
    };
    if (cleaned.empty()) {
        return not_numeric();
    }

    const bool has_dot = cleaned.find('.') != std::string::npos;
    const auto comma = cleaned.find(',');
    std::string number;
    if (comma != std::string::npos && !has_dot &&
        cleaned.find(',', comma + 1) == std::string::npos && cleaned.size() - comma - 1 == 2) {
        // "123,45": a single comma with two digits after it is the decimal mark
        number = cleaned.substr(0, comma) + "." + cleaned.substr(comma + 1);
    } else {
        std::copy_if(cleaned.begin(), cleaned.end(), std::back_inserter(number),
                     [](char c) { return c != ','; });
    }

    double value = 0;
    auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), value);
    if (ec != std::errc{} || ptr == number.data()) {
        return not_numeric();
    }
    if (!std::isfinite(value) || value * 100 > 9.0e15) {
        return Result<int64_t, Error>::err(row_error("amount is out of range: " + std::string(text)));
    }

    const auto cents = static_cast<int64_t>(std::llround(value * 100));
    if (negative) return Result<int64_t, Error>::ok(-cents);
    if (positive) return Result<int64_t, Error>::ok(cents);
    if (income_flag && !*income_flag) return Result<int64_t, Error>::ok(-cents);
    return Result<int64_t, Error>::ok(cents);
}

Result<CashewImportResult, Error> CashewImporter::import_file(const QString& path,
                                                              const CashewOptions& options) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<CashewImportResult, Error>::err(Error{ErrorKind::Storage,
            "cannot read " + path.toStdString() + ": " + file.errorString().toStdString()});
    }
    const QByteArray bytes = file.readAll();
    return import_text(std::string_view(bytes.constData(), static_cast<size_t>(bytes.size())),
                       QFileInfo(path).fileName(), options);
}

Result<CashewImportResult, Error> CashewImporter::import_text(std::string_view text,
                                                              const QString& filename,
                                                              const CashewOptions& options) {
    auto records_result = parse_csv(text);
    if (records_result.is_err()) {
        return Result<CashewImportResult, Error>::err(Error{ErrorKind::Validation,
            filename.toStdString() + ": " + records_result.unwrap_err().message});
    }
    const auto& records = records_result.unwrap();

    auto result = empty_result(filename, options);
    if (records.size() < 2) {
        result.warnings.push_back("CSV contained only headers (no rows).");
        return Result<CashewImportResult, Error>::ok(std::move(result));
    }

    std::vector<std::string> headers;
    for (const auto& raw : records.front()) {
        headers.push_back(trim(raw));
    }
    result.column_mapping = resolve_cashew_columns(headers);
    if (!result.column_mapping.count("amount") || !result.column_mapping.count("date")) {
        std::string found;
        for (const auto& header : headers) {
            if (!found.empty()) found += ", ";
            found += header;
        }
        return Result<CashewImportResult, Error>::err(Error{ErrorKind::Validation,
            "Missing required columns: amount and date. Found: " + found});
    }

    std::map<std::string, size_t> column_index;
    for (const auto& [field, header] : result.column_mapping) {
        column_index[field] = static_cast<size_t>(
            std::find(headers.begin(), headers.end(), header) - headers.begin());
    }
    const auto has = [&](const std::string& field) { return column_index.count(field) > 0; };

    std::vector<ParsedRow> parsed;
    std::vector<std::string> path_order;
    std::unordered_map<std::string, PathStats> stats;

    result.total_rows = records.size() - 1;
    for (size_t r = 1; r < records.size(); ++r) {
        const auto& record = records[r];
        const auto cell = [&](const std::string& field) -> std::string {
            auto it = column_index.find(field);
            if (it == column_index.end() || it->second >= record.size()) return {};
            return trim(record[it->second]);
        };
        const auto fail = [&](const Error& error) {
            if (result.errors.size() < CASHEW_MAX_ROW_ERRORS) {
                result.errors.push_back(CashewRowError{r + 1, error.message});
            }
        };

        const auto amount_raw = cell("amount");
        const auto date_raw = cell("date");
        if (amount_raw.empty()) { fail(row_error("amount is empty")); continue; }
        if (date_raw.empty()) { fail(row_error("date is empty")); continue; }

        const std::optional<bool> income_flag =
            has("income") ? std::optional<bool>(parse_cashew_bool(cell("income"))) : std::nullopt;

        auto cents = parse_cashew_amount(amount_raw, income_flag);
        if (cents.is_err()) { fail(cents.unwrap_err()); continue; }
        auto date = parse_cashew_date(date_raw);
        if (date.is_err()) { fail(date.unwrap_err()); continue; }

        auto category = cell("category_name");
        auto subcategory = cell("subcategory_name");
        if (category.empty() && !subcategory.empty()) {
            category = std::move(subcategory);
            subcategory.clear();
        }
        if (category.empty()) category = UNCATEGORIZED;

        const auto amount = cents.unwrap();
        CategoryKind kind = CategoryKind::Expense;
        if (amount > 0 || (amount == 0 && income_flag.value_or(false))) {
            kind = CategoryKind::Income;
        }

        auto path = normalize_name(category) + "|||" + normalize_name(subcategory);
        auto [it, inserted] = stats.try_emplace(path);
        if (inserted) {
            it->second.category = category;
            it->second.subcategory = subcategory;
            path_order.push_back(path);
        }
        if (kind == CategoryKind::Income) {
            ++it->second.income_count;
            it->second.income_total += std::max<int64_t>(amount, 0);
        } else {
            ++it->second.expense_count;
            it->second.expense_total += std::max<int64_t>(-amount, 0);
        }

        parsed.push_back(ParsedRow{
            .date = date.unwrap(),
            .amount_cents = amount,
            .kind = kind,
            .merchant = cell("title"),
            .notes = cell("note"),
            .path = std::move(path),
        });
    }

    result.parsed_rows = parsed.size();
    result.invalid_rows = result.total_rows - parsed.size();
    if (result.invalid_rows > 0) {
        result.warnings.push_back("Skipped " + std::to_string(result.invalid_rows) + " invalid row(s).");
    }
    if (parsed.empty()) {
        return Result<CashewImportResult, Error>::ok(std::move(result));
    }

    auto existing_categories = categories_.list();
    if (existing_categories.is_err()) {
        return Result<CashewImportResult, Error>::err(existing_categories.unwrap_err());
    }
    auto existing_transactions = transactions_.list();
    if (existing_transactions.is_err()) {
        return Result<CashewImportResult, Error>::err(existing_transactions.unwrap_err());
    }

    // kind:name for roots, kind:parent_id:name for children
    std::unordered_map<std::string, std::string> roots;
    std::unordered_map<std::string, std::string> children;
    for (const auto& category : existing_categories.unwrap()) {
        const auto name = normalize_name(category.name);
        if (category.parent_id) {
            children.emplace(kind_key(category.kind, *category.parent_id + ":" + name), category.id);
        } else {
            roots.emplace(kind_key(category.kind, name), category.id);
        }
    }

    std::unordered_set<std::string> seen;
    if (options.skip_duplicates) {
        for (const auto& tx : existing_transactions.unwrap()) {
            seen.insert(duplicate_key(tx.date, tx.amount_cents, tx.category_id,
                                      tx.merchant.value_or(""), tx.notes.value_or("")));
        }
    }

    std::vector<Category> created_categories;
    std::unordered_map<std::string, std::string> leaf_ids;  // path:kind -> category id
    for (const auto& path : path_order) {
        const auto& st = stats.at(path);
        const bool mixed = st.income_count > 0 && st.expense_count > 0;
        CategoryKind majority = CategoryKind::Expense;
        if (st.income_count != st.expense_count) {
            majority = st.income_count > st.expense_count ? CategoryKind::Income : CategoryKind::Expense;
        } else if (st.income_total != st.expense_total) {
            majority = st.income_total > st.expense_total ? CategoryKind::Income : CategoryKind::Expense;
        }

        for (const auto kind : {CategoryKind::Expense, CategoryKind::Income}) {
            const int count = kind == CategoryKind::Income ? st.income_count : st.expense_count;
            if (count == 0) continue;

            auto parent_name = st.category;
            if (mixed && kind != majority) {
                const std::string suffix = kind == CategoryKind::Income ? " (Income)" : " (Expense)";
                if (!ends_with(parent_name, suffix)) parent_name += suffix;
            }

            const auto parent_key = kind_key(kind, normalize_name(parent_name));
            auto parent = roots.find(parent_key);
            if (parent == roots.end()) {
                auto category = create_category(capped(parent_name), kind);
                parent = roots.emplace(parent_key, category.id).first;
                created_categories.push_back(std::move(category));
            }

            std::string leaf_id = parent->second;
            if (!st.subcategory.empty()) {
                const auto child_key = kind_key(kind, parent->second + ":" + normalize_name(st.subcategory));
                auto child = children.find(child_key);
                if (child == children.end()) {
                    auto category = create_category(capped(st.subcategory), kind, parent->second);
                    child = children.emplace(child_key, category.id).first;
                    created_categories.push_back(std::move(category));
                }
                leaf_id = child->second;
            }
            leaf_ids.emplace(path + ":" + std::string(to_string(kind)), leaf_id);
        }
    }

    std::vector<Transaction> new_transactions;
    for (const auto& row : parsed) {
        const auto& leaf_id = leaf_ids.at(row.path + ":" + std::string(to_string(row.kind)));
        if (options.skip_duplicates &&
            !seen.insert(duplicate_key(row.date, row.amount_cents, leaf_id, row.merchant, row.notes)).second) {
            ++result.transactions_skipped;
            continue;
        }
        new_transactions.push_back(create_transaction(
            row.date, row.amount_cents, leaf_id,
            row.merchant.empty() ? std::nullopt : std::optional<std::string>(row.merchant),
            row.notes.empty() ? std::nullopt : std::optional<std::string>(row.notes)));
    }
    if (result.transactions_skipped > 0) {
        result.warnings.push_back("Skipped " + std::to_string(result.transactions_skipped) +
                                  " duplicate transaction(s).");
    }

    result.categories_created = created_categories.size();
    result.transactions_created = new_transactions.size();

    if (options.commit && (!created_categories.empty() || !new_transactions.empty())) {
        auto written = engine_.transaction([&](storage::Database&) -> Result<void, Error> {
            if (!created_categories.empty()) {
                auto categories = categories_.bulk_upsert(created_categories);
                if (categories.is_err()) return Result<void, Error>::err(categories.unwrap_err());
            }
            if (!new_transactions.empty()) {
                auto transactions = transactions_.bulk_upsert(new_transactions);
                if (transactions.is_err()) return Result<void, Error>::err(transactions.unwrap_err());
            }
            return Result<void, Error>::ok();
        });
        if (written.is_err()) {
            qCWarning(tallyImportLog) << "Cashew import of" << filename << "failed:"
                                      << QString::fromStdString(written.unwrap_err().message);
            return Result<CashewImportResult, Error>::err(written.unwrap_err());
        }
    }

    qCInfo(tallyImportLog) << (options.commit ? "Cashew import of" : "Cashew dry run of") << filename
                           << ":" << result.transactions_created << "transactions,"
                           << result.categories_created << "new categories,"
                           << result.invalid_rows << "invalid rows";
    return Result<CashewImportResult, Error>::ok(std::move(result));
}

} // namespace tally::importer
