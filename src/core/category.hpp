#pragma once

#include "core/types.hpp"
#include "core/result.hpp"
#include <string>
#include <string_view>
#include <optional>
#include <vector>
#include <algorithm>
#include <cctype>

namespace tally {

enum class CategoryKind {
    Expense,
    Income
};

[[nodiscard]] constexpr std::string_view to_string(CategoryKind kind) noexcept {
    return kind == CategoryKind::Income ? "income" : "expense";
}

/**
 * Parse "income" / "expense" (case-insensitive, surrounding blanks ignored).
 */
[[nodiscard]] inline std::optional<CategoryKind> parse_category_kind(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);

    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "income") return CategoryKind::Income;
    if (lower == "expense") return CategoryKind::Expense;
    return std::nullopt;
}

/**
 * Category - A bucket transactions and budgets are filed under.
 *
 * Categories nest one level deep: a parent has no parent of its own and
 * shares the kind of its children.
 */
struct Category {
    std::string id;
    std::string name;
    CategoryKind kind = CategoryKind::Expense;
    std::optional<std::string> parent_id;
    bool active = true;
    Timestamp created_at;
    Timestamp updated_at;

    bool operator==(const Category&) const = default;
};

// ============================================================================
// Pure transformation functions
// ============================================================================

[[nodiscard]] inline Category create_category(
    std::string name,
    CategoryKind kind,
    std::optional<std::string> parent_id = std::nullopt,
    std::string id = {}
) {
    auto now = Timestamp::now();
    return Category{
        .id = id.empty() ? generate_id() : std::move(id),
        .name = std::move(name),
        .kind = kind,
        .parent_id = std::move(parent_id),
        .active = true,
        .created_at = now,
        .updated_at = now
    };
}

[[nodiscard]] inline Category with_name(Category category, std::string name) {
    category.name = std::move(name);
    category.updated_at = Timestamp::now();
    return category;
}

[[nodiscard]] inline Category with_parent(Category category, std::optional<std::string> parent_id) {
    category.parent_id = std::move(parent_id);
    category.updated_at = Timestamp::now();
    return category;
}

[[nodiscard]] inline Category with_active(Category category, bool active) {
    category.active = active;
    category.updated_at = Timestamp::now();
    return category;
}

/**
 * Field-level checks. Relational rules (parent exists, same kind, one level
 * of nesting) need the store and live in the repository.
 */
[[nodiscard]] inline Result<void, Error> validate(const Category& category) {
    if (category.id.empty()) {
        return Result<void, Error>::err(Error{ErrorKind::Validation, "category id is empty"});
    }
    if (category.name.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Result<void, Error>::err(
            Error{ErrorKind::Validation, "category '" + category.id + "' has an empty name"});
    }
    if (category.parent_id && category.parent_id->empty()) {
        return Result<void, Error>::err(
            Error{ErrorKind::Validation, "category '" + category.id + "' has an empty parent id"});
    }
    return Result<void, Error>::ok();
}

/**
 * Top-level categories in name order, each followed by its children.
 */
[[nodiscard]] inline std::vector<Category> tree_order(std::vector<Category> categories) {
    std::sort(categories.begin(), categories.end(),
        [](const Category& a, const Category& b) { return a.name < b.name; });

    std::vector<Category> ordered;
    ordered.reserve(categories.size());
    for (const auto& root : categories) {
        if (root.parent_id) continue;
        ordered.push_back(root);
        for (const auto& child : categories) {
            if (child.parent_id == root.id) {
                ordered.push_back(child);
            }
        }
    }
    // Orphans (parent filtered out of the input) keep their sorted position at the end.
    for (const auto& category : categories) {
        if (category.parent_id &&
            std::none_of(ordered.begin(), ordered.end(),
                         [&](const Category& c) { return c.id == category.id; })) {
            ordered.push_back(category);
        }
    }
    return ordered;
}

} // namespace tally
