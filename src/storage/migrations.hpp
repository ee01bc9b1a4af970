#pragma once

#include "storage/storage_engine.hpp"
#include "storage/database.hpp"
#include "core/result.hpp"
#include <functional>
#include <span>
#include <string>
#include <vector>

namespace tally::storage {

/**
 * Migration - One forward-only schema step.
 */
struct Migration {
    int version = 0;
    std::string name;
    std::function<Result<void, Error>(Database&)> apply;
};

/**
 * Build a migration that executes a block of SQL.
 */
[[nodiscard]] Migration sql_migration(int version, std::string name, std::string sql);

/**
 * SchemaRegistry - The ordered set of migrations an application ships.
 */
class SchemaRegistry {
public:
    SchemaRegistry() = default;

    /**
     * Register a migration. Versions start at 1 and must be unique.
     */
    [[nodiscard]] Result<void, Error> add(Migration migration);

    /**
     * Migrations with version > current_version, ascending. The view aliases
     * the registry; it stays valid until the next add().
     */
    [[nodiscard]] std::span<const Migration> pending_migrations(int current_version) const;

    [[nodiscard]] int latest_version() const {
        return migrations_.empty() ? 0 : migrations_.back().version;
    }

    [[nodiscard]] size_t size() const { return migrations_.size(); }

private:
    std::vector<Migration> migrations_;  // sorted by version
};

/**
 * The schema of the finance store.
 */
[[nodiscard]] const SchemaRegistry& default_registry();

/**
 * MigrationRunner - Applies pending migrations, one transaction each.
 *
 * A migration and the schema version advance commit together; a failure
 * leaves the store at the previous version and stops the sequence.
 */
class MigrationRunner {
public:
    MigrationRunner(StorageEngine& engine, const SchemaRegistry& registry)
        : engine_(engine), registry_(registry) {}

    /**
     * Apply all pending migrations. Returns the number applied.
     */
    [[nodiscard]] Result<int, Error> migrate();

    [[nodiscard]] Result<int, Error> current_version() { return current_version(engine_); }

    [[nodiscard]] static Result<int, Error> current_version(StorageEngine& engine);

    [[nodiscard]] int latest_version() const { return registry_.latest_version(); }

private:
    [[nodiscard]] Result<void, Error> run_migration(const Migration& m);

    StorageEngine& engine_;
    const SchemaRegistry& registry_;
};

} // namespace tally::storage
