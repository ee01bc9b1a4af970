#include "storage/category_repository.hpp"

#include <unordered_set>

namespace tally::storage {

namespace {

constexpr const char* SELECT_COLUMNS = R"SQL(
    SELECT id, name, kind, parent_id, active, created_at, updated_at
    FROM categories
)SQL";

Error validation_error(std::string message) {
    return Error{ErrorKind::Validation, std::move(message)};
}

Result<int64_t, Error> count_where(Database& db, const std::string& sql, const std::string& id) {
    auto stmt_result = db.prepare(sql);
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(id);
    if (bind_result.is_err()) {
        return Result<int64_t, Error>::err(bind_result.unwrap_err());
    }
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t, Error>::err(step_result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(step_result.unwrap() ? stmt.column_int64(0) : 0);
}

template<typename... Args>
Result<void, Error> exec_bound(Database& db, const std::string& sql, const Args&... args) {
    auto stmt_result = db.prepare(sql);
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(args...);
    if (bind_result.is_err()) {
        return bind_result;
    }
    return stmt.run();
}

} // namespace

Category CategoryRepository::row_to_category(Statement& stmt) {
    return Category{
        .id = stmt.column_text(0),
        .name = stmt.column_text(1),
        .kind = parse_category_kind(stmt.column_text(2)).value_or(CategoryKind::Expense),
        .parent_id = stmt.column_optional_text(3),
        .active = stmt.column_int(4) != 0,
        .created_at = Timestamp(stmt.column_int64(5)),
        .updated_at = Timestamp(stmt.column_int64(6))
    };
}

Result<std::optional<Category>, Error> CategoryRepository::find(Database& db, const std::string& id) {
    auto stmt_result = db.prepare(std::string(SELECT_COLUMNS) + " WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<Category>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(id);
    if (bind_result.is_err()) {
        return Result<std::optional<Category>, Error>::err(bind_result.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<Category>, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<Category>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<Category>, Error>::ok(row_to_category(stmt));
}

Result<void, Error> CategoryRepository::write_row(Database& db, const Category& category) {
    auto stmt_result = db.prepare(R"SQL(
        INSERT INTO categories (id, name, kind, parent_id, active, created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            name = excluded.name,
            kind = excluded.kind,
            parent_id = excluded.parent_id,
            active = excluded.active,
            created_at = excluded.created_at,
            updated_at = excluded.updated_at;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(
        category.id,
        category.name,
        to_string(category.kind),
        category.parent_id,
        category.active,
        category.created_at.millis(),
        category.updated_at.millis());
    if (bind_result.is_err()) {
        return bind_result;
    }
    return stmt.run();
}

Result<void, Error> CategoryRepository::check_relations(Database& db, const std::string& id) {
    auto self_result = find(db, id);
    if (self_result.is_err()) {
        return Result<void, Error>::err(self_result.unwrap_err());
    }
    const auto& self = self_result.unwrap();
    if (!self) {
        return Result<void, Error>::ok();
    }

    if (self->parent_id) {
        if (*self->parent_id == id) {
            return Result<void, Error>::err(validation_error(
                "category '" + id + "' cannot be its own parent"));
        }

        auto parent_result = find(db, *self->parent_id);
        if (parent_result.is_err()) {
            return Result<void, Error>::err(parent_result.unwrap_err());
        }
        const auto& parent = parent_result.unwrap();
        if (!parent) {
            return Result<void, Error>::err(validation_error(
                "category '" + id + "' references missing parent '" + *self->parent_id + "'"));
        }
        if (parent->kind != self->kind) {
            return Result<void, Error>::err(validation_error(
                "category '" + id + "' is " + std::string(to_string(self->kind)) +
                " but its parent '" + parent->id + "' is " + std::string(to_string(parent->kind))));
        }
        if (parent->parent_id) {
            return Result<void, Error>::err(validation_error(
                "category '" + id + "' would nest under '" + parent->id +
                "', which already has a parent"));
        }
    }

    auto children_result = count_where(db,
        "SELECT COUNT(*) FROM categories WHERE parent_id = ?1 AND id <> ?1;", id);
    if (children_result.is_err()) {
        return Result<void, Error>::err(children_result.unwrap_err());
    }
    if (children_result.unwrap() == 0) {
        return Result<void, Error>::ok();
    }
    if (self->parent_id) {
        return Result<void, Error>::err(validation_error(
            "category '" + id + "' has children and cannot have a parent"));
    }

    auto stmt_result = db.prepare(
        "SELECT COUNT(*) FROM categories WHERE parent_id = ? AND kind <> ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(id, to_string(self->kind));
    if (bind_result.is_err()) {
        return bind_result;
    }
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    if (step_result.unwrap() && stmt.column_int64(0) > 0) {
        return Result<void, Error>::err(validation_error(
            "category '" + id + "' has children of a different kind"));
    }
    return Result<void, Error>::ok();
}

Result<Category, Error> CategoryRepository::create(Category category) {
    if (category.id.empty()) {
        category.id = generate_id();
    }
    if (category.created_at.is_epoch()) {
        category.created_at = Timestamp::now();
    }
    if (category.updated_at.is_epoch()) {
        category.updated_at = category.created_at;
    }

    auto valid = validate(category);
    if (valid.is_err()) {
        return Result<Category, Error>::err(valid.unwrap_err());
    }

    return engine_.transaction([&](Database& db) -> Result<Category, Error> {
        auto existing = find(db, category.id);
        if (existing.is_err()) {
            return Result<Category, Error>::err(existing.unwrap_err());
        }
        if (existing.unwrap()) {
            return Result<Category, Error>::err(validation_error(
                "category '" + category.id + "' already exists"));
        }

        auto write_result = write_row(db, category);
        if (write_result.is_err()) {
            return Result<Category, Error>::err(write_result.unwrap_err());
        }
        auto check_result = check_relations(db, category.id);
        if (check_result.is_err()) {
            return Result<Category, Error>::err(check_result.unwrap_err());
        }
        return Result<Category, Error>::ok(category);
    });
}

Result<Category, Error> CategoryRepository::update(Category category) {
    auto valid = validate(category);
    if (valid.is_err()) {
        return Result<Category, Error>::err(valid.unwrap_err());
    }

    return engine_.transaction([&](Database& db) -> Result<Category, Error> {
        auto existing = find(db, category.id);
        if (existing.is_err()) {
            return Result<Category, Error>::err(existing.unwrap_err());
        }
        if (!existing.unwrap()) {
            return Result<Category, Error>::err(
                Error{ErrorKind::NotFound, "category '" + category.id + "' not found"});
        }

        category.created_at = existing.unwrap()->created_at;
        category.updated_at = Timestamp::now();

        auto write_result = write_row(db, category);
        if (write_result.is_err()) {
            return Result<Category, Error>::err(write_result.unwrap_err());
        }
        auto check_result = check_relations(db, category.id);
        if (check_result.is_err()) {
            return Result<Category, Error>::err(check_result.unwrap_err());
        }
        return Result<Category, Error>::ok(category);
    });
}

Result<int, Error> CategoryRepository::bulk_upsert(const std::vector<Category>& categories) {
    for (const auto& category : categories) {
        auto valid = validate(category);
        if (valid.is_err()) {
            return Result<int, Error>::err(valid.unwrap_err());
        }
    }

    return engine_.transaction([&](Database& db) -> Result<int, Error> {
        const auto now = Timestamp::now();
        std::vector<std::string> written;
        std::unordered_set<std::string> seen;

        for (auto category : categories) {
            if (category.created_at.is_epoch()) category.created_at = now;
            if (category.updated_at.is_epoch()) category.updated_at = now;

            auto write_result = write_row(db, category);
            if (write_result.is_err()) {
                return Result<int, Error>::err(write_result.unwrap_err());
            }
            if (seen.insert(category.id).second) {
                written.push_back(category.id);
            }
        }

        // The whole batch is in place; judge each row against the result.
        for (const auto& id : written) {
            auto check_result = check_relations(db, id);
            if (check_result.is_err()) {
                return Result<int, Error>::err(check_result.unwrap_err());
            }
        }
        return Result<int, Error>::ok(static_cast<int>(written.size()));
    });
}

Result<std::optional<Category>, Error> CategoryRepository::get(const std::string& id) {
    return engine_.read([&](Database& db) { return find(db, id); });
}

Result<std::vector<Category>, Error> CategoryRepository::list(const CategoryFilter& filter) {
    return engine_.read([&](Database& db) -> Result<std::vector<Category>, Error> {
        std::string sql = std::string(SELECT_COLUMNS) + " WHERE 1 = 1";
        if (filter.kind) {
            sql += " AND kind = ?";
        }
        if (filter.active_only) {
            sql += " AND active = 1";
        }
        sql += " ORDER BY name, id;";

        auto stmt_result = db.prepare(sql);
        if (stmt_result.is_err()) {
            return Result<std::vector<Category>, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        if (filter.kind) {
            auto bind_result = stmt.bind_all(to_string(*filter.kind));
            if (bind_result.is_err()) {
                return Result<std::vector<Category>, Error>::err(bind_result.unwrap_err());
            }
        }
        return collect_rows(stmt, row_to_category);
    });
}

Result<std::vector<Category>, Error> CategoryRepository::children(const std::string& parent_id) {
    return engine_.read([&](Database& db) -> Result<std::vector<Category>, Error> {
        auto stmt_result = db.prepare(std::string(SELECT_COLUMNS) +
                                      " WHERE parent_id = ? ORDER BY name, id;");
        if (stmt_result.is_err()) {
            return Result<std::vector<Category>, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        auto bind_result = stmt.bind_all(parent_id);
        if (bind_result.is_err()) {
            return Result<std::vector<Category>, Error>::err(bind_result.unwrap_err());
        }
        return collect_rows(stmt, row_to_category);
    });
}

Result<void, Error> CategoryRepository::remove(const std::string& id) {
    return engine_.transaction([&](Database& db) -> Result<void, Error> {
        auto existing = find(db, id);
        if (existing.is_err()) {
            return Result<void, Error>::err(existing.unwrap_err());
        }
        if (!existing.unwrap()) {
            return Result<void, Error>::err(
                Error{ErrorKind::NotFound, "category '" + id + "' not found"});
        }

        struct Reference {
            const char* sql;
            const char* what;
        };
        const Reference references[] = {
            {"SELECT COUNT(*) FROM transactions WHERE category_id = ? AND deleted = 0;", "transaction(s)"},
            {"SELECT COUNT(*) FROM budgets WHERE category_id = ?;", "budget(s)"},
            {"SELECT COUNT(*) FROM categories WHERE parent_id = ?;", "child category(ies)"},
        };
        for (const auto& reference : references) {
            auto count_result = count_where(db, reference.sql, id);
            if (count_result.is_err()) {
                return Result<void, Error>::err(count_result.unwrap_err());
            }
            if (count_result.unwrap() > 0) {
                return Result<void, Error>::err(validation_error(
                    "category '" + id + "' is referenced by " +
                    std::to_string(count_result.unwrap()) + " " + reference.what));
            }
        }

        // Tombstones the remote has not seen yet must survive until pushed.
        auto tombstones = count_where(db,
            "SELECT COUNT(*) FROM transactions WHERE category_id = ? AND deleted = 1;", id);
        if (tombstones.is_err()) {
            return Result<void, Error>::err(tombstones.unwrap_err());
        }
        if (tombstones.unwrap() > 0) {
            auto unpushed = db.query_int64(R"SQL(
                SELECT COUNT(*) FROM sync_state
                WHERE id = 1 AND synced_seq < (SELECT seq FROM change_counter WHERE id = 1);
            )SQL");
            if (unpushed.is_err()) {
                return Result<void, Error>::err(unpushed.unwrap_err());
            }
            if (unpushed.unwrap() > 0) {
                return Result<void, Error>::err(validation_error(
                    "category '" + id + "' has " + std::to_string(tombstones.unwrap()) +
                    " deleted transaction(s) not yet synced"));
            }
        }

        auto purged = exec_bound(db,
            "DELETE FROM transactions WHERE category_id = ? AND deleted = 1;", id);
        if (purged.is_err()) {
            return purged;
        }
        return exec_bound(db, "DELETE FROM categories WHERE id = ?;", id);
    });
}

Result<void, Error> CategoryRepository::reassign_and_remove(const std::string& id,
                                                            const std::string& target_id) {
    if (id == target_id) {
        return Result<void, Error>::err(validation_error(
            "category '" + id + "' cannot be reassigned to itself"));
    }

    return engine_.transaction([&](Database& db) -> Result<void, Error> {
        for (const auto& check_id : {id, target_id}) {
            auto existing = find(db, check_id);
            if (existing.is_err()) {
                return Result<void, Error>::err(existing.unwrap_err());
            }
            if (!existing.unwrap()) {
                return Result<void, Error>::err(
                    Error{ErrorKind::NotFound, "category '" + check_id + "' not found"});
            }
        }

        const auto now = Timestamp::now().millis();

        auto moved = exec_bound(db,
            "UPDATE transactions SET category_id = ?2, updated_at = ?3 WHERE category_id = ?1;",
            id, target_id, now);
        if (moved.is_err()) {
            return moved;
        }

        // Month collisions fold the amount into the target's budget.
        auto merged = exec_bound(db, R"SQL(
            UPDATE budgets SET budget_cents = budget_cents + (
                SELECT src.budget_cents FROM budgets AS src
                WHERE src.category_id = ?1 AND src.month = budgets.month)
            WHERE category_id = ?2 AND month IN (
                SELECT month FROM budgets WHERE category_id = ?1);
        )SQL", id, target_id);
        if (merged.is_err()) {
            return merged;
        }
        auto dropped = exec_bound(db, R"SQL(
            DELETE FROM budgets WHERE category_id = ?1 AND month IN (
                SELECT month FROM budgets WHERE category_id = ?2);
        )SQL", id, target_id);
        if (dropped.is_err()) {
            return dropped;
        }
        auto rekeyed = exec_bound(db,
            "UPDATE budgets SET category_id = ?2 WHERE category_id = ?1;", id, target_id);
        if (rekeyed.is_err()) {
            return rekeyed;
        }

        auto detached = exec_bound(db,
            "UPDATE categories SET parent_id = NULL, updated_at = ?2 WHERE parent_id = ?1;",
            id, now);
        if (detached.is_err()) {
            return detached;
        }
        return exec_bound(db, "DELETE FROM categories WHERE id = ?;", id);
    });
}

Result<int64_t, Error> CategoryRepository::count() {
    return engine_.read([](Database& db) {
        return db.query_int64("SELECT COUNT(*) FROM categories;");
    });
}

} // namespace tally::storage
