#pragma once

#include "storage/storage_engine.hpp"
#include "core/category.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tally::storage {

struct CategoryFilter {
    std::optional<CategoryKind> kind;
    bool active_only = false;
};

/**
 * CategoryRepository - Data access layer for categories.
 *
 * Relational rules are checked inside the write transaction after the rows
 * are written, so a batch may list a child before its parent.
 */
class CategoryRepository {
public:
    explicit CategoryRepository(StorageEngine& engine) : engine_(engine) {}

    /**
     * Insert a new category. An empty id is replaced by a generated one.
     */
    [[nodiscard]] Result<Category, Error> create(Category category);

    /**
     * Overwrite an existing category. NotFound if the id is unknown.
     */
    [[nodiscard]] Result<Category, Error> update(Category category);

    /**
     * Insert-or-overwrite a batch atomically. Returns the number of distinct
     * rows written.
     */
    [[nodiscard]] Result<int, Error> bulk_upsert(const std::vector<Category>& categories);

    [[nodiscard]] Result<std::optional<Category>, Error> get(const std::string& id);

    [[nodiscard]] Result<std::vector<Category>, Error> list(const CategoryFilter& filter = {});

    [[nodiscard]] Result<std::vector<Category>, Error> children(const std::string& parent_id);

    /**
     * Delete a category nothing references. Tombstoned transactions filed
     * under it are purged with it, which is refused while the store has
     * synced before and still has changes the remote has not seen.
     */
    [[nodiscard]] Result<void, Error> remove(const std::string& id);

    /**
     * Move transactions and budgets to target, detach children, then delete.
     * Budgets that collide on month add their amounts.
     */
    [[nodiscard]] Result<void, Error> reassign_and_remove(const std::string& id,
                                                          const std::string& target_id);

    [[nodiscard]] Result<int64_t, Error> count();

private:
    StorageEngine& engine_;

    [[nodiscard]] static Category row_to_category(Statement& stmt);
    [[nodiscard]] static Result<void, Error> write_row(Database& db, const Category& category);
    [[nodiscard]] static Result<std::optional<Category>, Error> find(Database& db, const std::string& id);
    [[nodiscard]] static Result<void, Error> check_relations(Database& db, const std::string& id);
};

} // namespace tally::storage
