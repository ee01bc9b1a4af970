#include "import/row_mapping.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>

namespace tally::importer {

namespace {

std::string trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool equals_ignore_case(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::optional<int64_t> parse_integer(std::string_view text) {
    if (!text.empty() && text.front() == '+') text.remove_prefix(1);
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec == std::errc{} && ptr == text.data() + text.size()) {
        return value;
    }
    // "1200.0" from spreadsheets that store every number as a double
    double real = 0;
    auto [rptr, rec] = std::from_chars(text.data(), text.data() + text.size(), real);
    if (rec == std::errc{} && rptr == text.data() + text.size() &&
        std::isfinite(real) && std::floor(real) == real && std::fabs(real) < 9.0e15) {
        return static_cast<int64_t>(real);
    }
    return std::nullopt;
}

std::optional<int64_t> millis_or_epoch(const FieldReader& reader, std::string_view key) {
    auto value = reader.integer(key);
    if (value.is_err()) return std::nullopt;
    return value.unwrap();
}

} // namespace

// ============================================================================
// FieldReader
// ============================================================================

const FieldValue* FieldReader::find(std::string_view key) const {
    auto it = row_.find(std::string(key));
    if (it != row_.end()) {
        return &it->second;
    }
    for (const auto& [name, value] : row_) {
        if (equals_ignore_case(trim(name), key)) {
            return &value;
        }
    }
    return nullptr;
}

Error FieldReader::error(std::string_view key, const std::string& problem) const {
    return Error{ErrorKind::Validation,
                 std::string(group_name(group_)) + " row " + std::to_string(row_number_) +
                 ": '" + std::string(key) + "' " + problem};
}

std::optional<std::string> FieldReader::text(std::string_view key) const {
    const auto* value = find(key);
    if (!value) return std::nullopt;
    auto rendered = trim(to_display(*value));
    if (rendered.empty()) return std::nullopt;
    return rendered;
}

std::optional<std::string> FieldReader::verbatim_text(std::string_view key) const {
    const auto* value = find(key);
    if (!value) return std::nullopt;
    auto rendered = to_display(*value);
    if (trim(rendered).empty()) return std::nullopt;
    return rendered;
}

Result<std::string, Error> FieldReader::required_text(std::string_view key) const {
    auto value = text(key);
    if (!value) {
        return Result<std::string, Error>::err(error(key, "is required"));
    }
    return Result<std::string, Error>::ok(std::move(*value));
}

Result<std::optional<int64_t>, Error> FieldReader::integer(std::string_view key) const {
    const auto* value = find(key);
    if (!value || std::holds_alternative<std::monostate>(*value)) {
        return Result<std::optional<int64_t>, Error>::ok(std::nullopt);
    }
    if (const auto* i = std::get_if<int64_t>(value)) {
        return Result<std::optional<int64_t>, Error>::ok(*i);
    }
    if (std::holds_alternative<bool>(*value)) {
        return Result<std::optional<int64_t>, Error>::err(error(key, "is not a number"));
    }

    auto rendered = trim(to_display(*value));
    if (rendered.empty()) {
        return Result<std::optional<int64_t>, Error>::ok(std::nullopt);
    }
    auto parsed = parse_integer(rendered);
    if (!parsed) {
        return Result<std::optional<int64_t>, Error>::err(
            error(key, "is not a whole number ('" + rendered + "')"));
    }
    return Result<std::optional<int64_t>, Error>::ok(*parsed);
}

Result<int64_t, Error> FieldReader::required_integer(std::string_view key) const {
    auto value = integer(key);
    if (value.is_err()) {
        return Result<int64_t, Error>::err(value.unwrap_err());
    }
    if (!value.unwrap()) {
        return Result<int64_t, Error>::err(error(key, "is required"));
    }
    return Result<int64_t, Error>::ok(*value.unwrap());
}

Result<bool, Error> FieldReader::boolean(std::string_view key, bool fallback) const {
    const auto* value = find(key);
    if (!value || std::holds_alternative<std::monostate>(*value)) {
        return Result<bool, Error>::ok(fallback);
    }
    if (const auto* b = std::get_if<bool>(value)) {
        return Result<bool, Error>::ok(*b);
    }

    auto rendered = lower(trim(to_display(*value)));
    if (rendered.empty()) return Result<bool, Error>::ok(fallback);
    if (rendered == "true" || rendered == "yes" || rendered == "1") return Result<bool, Error>::ok(true);
    if (rendered == "false" || rendered == "no" || rendered == "0") return Result<bool, Error>::ok(false);
    return Result<bool, Error>::err(error(key, "is not a boolean ('" + rendered + "')"));
}

Result<CalendarDate, Error> FieldReader::required_date(std::string_view key) const {
    const auto* value = find(key);
    if (!value || std::holds_alternative<std::monostate>(*value)) {
        return Result<CalendarDate, Error>::err(error(key, "is required"));
    }

    if (std::holds_alternative<int64_t>(*value) || std::holds_alternative<double>(*value)) {
        const auto serial = std::holds_alternative<int64_t>(*value)
            ? std::get<int64_t>(*value)
            : static_cast<int64_t>(std::floor(std::get<double>(*value)));
        if (auto date = CalendarDate::from_serial(serial)) {
            return Result<CalendarDate, Error>::ok(*date);
        }
        return Result<CalendarDate, Error>::err(
            error(key, "is not a valid date serial (" + std::to_string(serial) + ")"));
    }

    auto rendered = trim(to_display(*value));
    std::string_view date_part = rendered;
    if (date_part.size() > 10 && (date_part[10] == 'T' || date_part[10] == ' ')) {
        date_part = date_part.substr(0, 10);
    }
    if (auto date = CalendarDate::parse(date_part)) {
        return Result<CalendarDate, Error>::ok(*date);
    }
    return Result<CalendarDate, Error>::err(error(key, "is not a valid date ('" + rendered + "')"));
}

Result<YearMonth, Error> FieldReader::required_month(std::string_view key) const {
    auto rendered = text(key);
    if (!rendered) {
        return Result<YearMonth, Error>::err(error(key, "is required"));
    }
    if (auto month = YearMonth::parse(*rendered)) {
        return Result<YearMonth, Error>::ok(*month);
    }
    if (auto date = CalendarDate::parse(*rendered)) {
        return Result<YearMonth, Error>::ok(
            YearMonth::parse(rendered->substr(0, 7)).value_or(YearMonth{}));
    }
    return Result<YearMonth, Error>::err(error(key, "is not a valid month ('" + *rendered + "')"));
}

// ============================================================================
// Row -> entity
// ============================================================================

Result<Category, Error> category_from_row(const Row& row, size_t row_number) {
    FieldReader reader(row, RecordGroup::Categories, row_number);

    auto name = reader.verbatim_text("name");
    if (!name) return Result<Category, Error>::err(reader.error("name", "is required"));

    auto kind_text = reader.required_text("kind");
    if (kind_text.is_err()) return Result<Category, Error>::err(kind_text.unwrap_err());
    auto kind = parse_category_kind(kind_text.unwrap());
    if (!kind) {
        return Result<Category, Error>::err(
            reader.error("kind", "must be 'income' or 'expense' ('" + kind_text.unwrap() + "')"));
    }

    auto active = reader.boolean("active", true);
    if (active.is_err()) return Result<Category, Error>::err(active.unwrap_err());

    auto id = reader.text("id");
    if (!id) id = generate_id();

    return Result<Category, Error>::ok(Category{
        .id = std::move(*id),
        .name = std::move(*name),
        .kind = *kind,
        .parent_id = reader.text("parent_id"),
        .active = active.unwrap(),
        .created_at = Timestamp(millis_or_epoch(reader, "created_at").value_or(0)),
        .updated_at = Timestamp(millis_or_epoch(reader, "updated_at").value_or(0))
    });
}

Result<Transaction, Error> transaction_from_row(const Row& row, size_t row_number) {
    FieldReader reader(row, RecordGroup::Transactions, row_number);

    auto date = reader.required_date("date");
    if (date.is_err()) return Result<Transaction, Error>::err(date.unwrap_err());

    auto amount = reader.required_integer("amount_cents");
    if (amount.is_err()) return Result<Transaction, Error>::err(amount.unwrap_err());

    auto category_id = reader.required_text("category_id");
    if (category_id.is_err()) return Result<Transaction, Error>::err(category_id.unwrap_err());

    auto deleted = reader.boolean("deleted", false);
    if (deleted.is_err()) return Result<Transaction, Error>::err(deleted.unwrap_err());

    auto id = reader.text("id");
    if (!id) id = generate_id();

    return Result<Transaction, Error>::ok(Transaction{
        .id = std::move(*id),
        .date = date.unwrap(),
        .amount_cents = amount.unwrap(),
        .category_id = std::move(category_id).unwrap(),
        .merchant = reader.verbatim_text("merchant"),
        .notes = reader.verbatim_text("notes"),
        .created_at = Timestamp(millis_or_epoch(reader, "created_at").value_or(0)),
        .updated_at = Timestamp(millis_or_epoch(reader, "updated_at").value_or(0)),
        .deleted = deleted.unwrap()
    });
}

Result<Budget, Error> budget_from_row(const Row& row, size_t row_number) {
    FieldReader reader(row, RecordGroup::Budgets, row_number);

    auto month = reader.required_month("month");
    if (month.is_err()) return Result<Budget, Error>::err(month.unwrap_err());

    auto cents = reader.required_integer("budget_cents");
    if (cents.is_err()) return Result<Budget, Error>::err(cents.unwrap_err());

    return Result<Budget, Error>::ok(Budget{
        .month = month.unwrap(),
        .category_id = reader.text("category_id").value_or(OVERALL_BUDGET),
        .budget_cents = cents.unwrap()
    });
}

// ============================================================================
// Entity -> row
// ============================================================================

Row to_row(const Category& category) {
    Row row{
        {"id", category.id},
        {"name", category.name},
        {"kind", std::string(to_string(category.kind))},
        {"parent_id", std::monostate{}},
        {"active", category.active},
        {"created_at", category.created_at.millis()},
        {"updated_at", category.updated_at.millis()},
    };
    if (category.parent_id) {
        row["parent_id"] = *category.parent_id;
    }
    return row;
}

Row to_row(const Transaction& tx) {
    return Row{
        {"id", tx.id},
        {"date", tx.date.to_string()},
        {"amount_cents", tx.amount_cents},
        {"category_id", tx.category_id},
        {"merchant", tx.merchant ? FieldValue(*tx.merchant) : FieldValue(std::monostate{})},
        {"notes", tx.notes ? FieldValue(*tx.notes) : FieldValue(std::monostate{})},
        {"created_at", tx.created_at.millis()},
        {"updated_at", tx.updated_at.millis()},
        {"deleted", tx.deleted},
    };
}

Row to_row(const Budget& budget) {
    return Row{
        {"month", budget.month.to_string()},
        {"category_id", budget.category_id},
        {"budget_cents", budget.budget_cents},
    };
}

} // namespace tally::importer
