#pragma once

#include "core/result.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tally::importer {

/**
 * A loosely typed cell as it arrives from a spreadsheet, CSV file or JSON
 * document. monostate is an empty cell.
 */
using FieldValue = std::variant<std::monostate, bool, int64_t, double, std::string>;
using Row = std::map<std::string, FieldValue>;
using Rows = std::vector<Row>;

enum class RecordGroup {
    Categories,
    Transactions,
    Budgets
};

/**
 * Display name, as used in error messages ("Categories").
 */
[[nodiscard]] constexpr std::string_view group_name(RecordGroup group) noexcept {
    switch (group) {
        case RecordGroup::Categories: return "Categories";
        case RecordGroup::Transactions: return "Transactions";
        case RecordGroup::Budgets: return "Budgets";
    }
    return "Unknown";
}

/**
 * Lower-case key used by file formats ("categories").
 */
[[nodiscard]] constexpr std::string_view group_key(RecordGroup group) noexcept {
    switch (group) {
        case RecordGroup::Categories: return "categories";
        case RecordGroup::Transactions: return "transactions";
        case RecordGroup::Budgets: return "budgets";
    }
    return "unknown";
}

/**
 * ImportSource - Named groups of rows.
 *
 * group() returns nullopt when the source has no such group, and an error
 * when the group exists but cannot be read.
 */
class ImportSource {
public:
    virtual ~ImportSource() = default;

    [[nodiscard]] virtual Result<std::optional<Rows>, Error> group(RecordGroup group) = 0;

    [[nodiscard]] virtual std::string describe() const = 0;
};

/**
 * MemorySource - Rows assembled in code.
 */
class MemorySource : public ImportSource {
public:
    MemorySource() = default;

    MemorySource& set_group(RecordGroup group, Rows rows);

    [[nodiscard]] Result<std::optional<Rows>, Error> group(RecordGroup group) override;

    [[nodiscard]] std::string describe() const override { return "memory"; }

private:
    std::map<RecordGroup, Rows> groups_;
};

/**
 * Render a cell for messages and text coercion.
 */
[[nodiscard]] std::string to_display(const FieldValue& value);

} // namespace tally::importer
