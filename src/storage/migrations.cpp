#include "storage/migrations.hpp"
#include "core/log.hpp"
#include "core/types.hpp"

#include <algorithm>

namespace tally::storage {

namespace {

Result<void, Error> ensure_version_table(Database& db) {
    return db.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS schema_version (
            id INTEGER PRIMARY KEY CHECK (id = 1),
            version INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );
    )SQL");
}

Result<void, Error> set_version(Database& db, int version) {
    auto stmt_result = db.prepare(R"SQL(
        INSERT INTO schema_version (id, version, updated_at) VALUES (1, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            version = excluded.version,
            updated_at = excluded.updated_at
        WHERE excluded.version > schema_version.version;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(version, Timestamp::now().millis());
    if (bind_result.is_err()) {
        return bind_result;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    if (db.changes() != 1) {
        return Result<void, Error>::err(Error{
            "schema version would not advance to " + std::to_string(version)});
    }
    return Result<void, Error>::ok();
}

} // namespace

Migration sql_migration(int version, std::string name, std::string sql) {
    return Migration{
        .version = version,
        .name = std::move(name),
        .apply = [sql = std::move(sql)](Database& db) { return db.execute(sql); }
    };
}

// ============================================================================
// SchemaRegistry
// ============================================================================

Result<void, Error> SchemaRegistry::add(Migration migration) {
    if (migration.version < 1) {
        return Result<void, Error>::err(Error{ErrorKind::Validation,
            "migration '" + migration.name + "' has version " +
            std::to_string(migration.version) + "; versions start at 1"});
    }
    if (!migration.apply) {
        return Result<void, Error>::err(Error{ErrorKind::Validation,
            "migration " + std::to_string(migration.version) + " has no apply step"});
    }

    auto it = std::lower_bound(migrations_.begin(), migrations_.end(), migration.version,
        [](const Migration& m, int version) { return m.version < version; });
    if (it != migrations_.end() && it->version == migration.version) {
        return Result<void, Error>::err(Error{ErrorKind::Validation,
            "duplicate migration version " + std::to_string(migration.version) +
            " ('" + it->name + "' and '" + migration.name + "')"});
    }

    migrations_.insert(it, std::move(migration));
    return Result<void, Error>::ok();
}

std::span<const Migration> SchemaRegistry::pending_migrations(int current_version) const {
    auto it = std::upper_bound(migrations_.begin(), migrations_.end(), current_version,
        [](int version, const Migration& m) { return version < m.version; });
    return std::span<const Migration>(migrations_).subspan(
        static_cast<size_t>(std::distance(migrations_.begin(), it)));
}

// ============================================================================
// MigrationRunner
// ============================================================================

Result<int, Error> MigrationRunner::current_version(StorageEngine& engine) {
    return engine.read([](Database& db) -> Result<int, Error> {
        auto exists_result = db.query_int64(
            "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name = 'schema_version';");
        if (exists_result.is_err()) {
            return Result<int, Error>::err(exists_result.unwrap_err());
        }
        if (exists_result.unwrap() == 0) {
            return Result<int, Error>::ok(0);
        }

        auto version_result = db.query_int64(
            "SELECT COALESCE(MAX(version), 0) FROM schema_version;");
        if (version_result.is_err()) {
            return Result<int, Error>::err(version_result.unwrap_err());
        }
        return Result<int, Error>::ok(static_cast<int>(version_result.unwrap()));
    });
}

Result<void, Error> MigrationRunner::run_migration(const Migration& m) {
    return engine_.transaction([&](Database& db) -> Result<void, Error> {
        auto ensure_result = ensure_version_table(db);
        if (ensure_result.is_err()) {
            return ensure_result;
        }
        auto apply_result = m.apply(db);
        if (apply_result.is_err()) {
            return apply_result;
        }
        return set_version(db, m.version);
    });
}

Result<int, Error> MigrationRunner::migrate() {
    auto current_result = current_version();
    if (current_result.is_err()) {
        const auto& error = current_result.unwrap_err();
        return Result<int, Error>::err(Error{ErrorKind::MigrationFailed,
            "Cannot read schema version: " + error.message, error.code});
    }

    const int current = current_result.unwrap();
    if (current > registry_.latest_version()) {
        return Result<int, Error>::err(Error{ErrorKind::MigrationFailed,
            "Store is at schema version " + std::to_string(current) +
            ", newer than this build supports (" +
            std::to_string(registry_.latest_version()) + ")"});
    }

    int applied = 0;
    for (const auto& m : registry_.pending_migrations(current)) {
        auto result = run_migration(m);
        if (result.is_err()) {
            const auto& error = result.unwrap_err();
            qCCritical(tallyStorageLog) << "migration" << m.version << m.name.c_str()
                                        << "failed:" << error.message.c_str();
            return Result<int, Error>::err(Error{ErrorKind::MigrationFailed,
                "Migration " + std::to_string(m.version) + " (" + m.name + ") failed: " +
                error.message, error.code});
        }
        qCInfo(tallyStorageLog) << "applied migration" << m.version << m.name.c_str();
        ++applied;
    }

    return Result<int, Error>::ok(applied);
}

// ============================================================================
// Application schema
// ============================================================================

namespace {

constexpr const char* INITIAL_SCHEMA = R"SQL(
    CREATE TABLE categories (
        id TEXT PRIMARY KEY,
        name TEXT NOT NULL,
        kind TEXT NOT NULL CHECK (kind IN ('income', 'expense')),
        parent_id TEXT,
        active INTEGER NOT NULL DEFAULT 1,
        created_at INTEGER NOT NULL,
        updated_at INTEGER NOT NULL
    );
    CREATE INDEX idx_categories_parent ON categories(parent_id);

    CREATE TABLE transactions (
        id TEXT PRIMARY KEY,
        date TEXT NOT NULL,
        amount_cents INTEGER NOT NULL,
        category_id TEXT NOT NULL REFERENCES categories(id),
        merchant TEXT,
        notes TEXT,
        created_at INTEGER NOT NULL,
        updated_at INTEGER NOT NULL,
        deleted INTEGER NOT NULL DEFAULT 0
    );
    CREATE INDEX idx_transactions_date ON transactions(date);
    CREATE INDEX idx_transactions_category ON transactions(category_id);

    CREATE TABLE budgets (
        month TEXT NOT NULL,
        category_id TEXT NOT NULL DEFAULT '',
        budget_cents INTEGER NOT NULL CHECK (budget_cents >= 0),
        PRIMARY KEY (month, category_id)
    );
)SQL";

// Every entity-table write bumps the counter; sync compares it with the
// value captured at the last push. Existing rows count as unsynced.
constexpr const char* CHANGE_TRACKING = R"SQL(
    CREATE TABLE change_counter (
        id INTEGER PRIMARY KEY CHECK (id = 1),
        seq INTEGER NOT NULL
    );
    INSERT INTO change_counter (id, seq)
    SELECT 1, (SELECT COUNT(*) FROM categories)
            + (SELECT COUNT(*) FROM transactions)
            + (SELECT COUNT(*) FROM budgets);

    CREATE TRIGGER categories_change_ai AFTER INSERT ON categories BEGIN
        UPDATE change_counter SET seq = seq + 1 WHERE id = 1;
    END;
    CREATE TRIGGER categories_change_au AFTER UPDATE ON categories BEGIN
        UPDATE change_counter SET seq = seq + 1 WHERE id = 1;
    END;
    CREATE TRIGGER categories_change_ad AFTER DELETE ON categories BEGIN
        UPDATE change_counter SET seq = seq + 1 WHERE id = 1;
    END;

    CREATE TRIGGER transactions_change_ai AFTER INSERT ON transactions BEGIN
        UPDATE change_counter SET seq = seq + 1 WHERE id = 1;
    END;
    CREATE TRIGGER transactions_change_au AFTER UPDATE ON transactions BEGIN
        UPDATE change_counter SET seq = seq + 1 WHERE id = 1;
    END;
    CREATE TRIGGER transactions_change_ad AFTER DELETE ON transactions BEGIN
        UPDATE change_counter SET seq = seq + 1 WHERE id = 1;
    END;

    CREATE TRIGGER budgets_change_ai AFTER INSERT ON budgets BEGIN
        UPDATE change_counter SET seq = seq + 1 WHERE id = 1;
    END;
    CREATE TRIGGER budgets_change_au AFTER UPDATE ON budgets BEGIN
        UPDATE change_counter SET seq = seq + 1 WHERE id = 1;
    END;
    CREATE TRIGGER budgets_change_ad AFTER DELETE ON budgets BEGIN
        UPDATE change_counter SET seq = seq + 1 WHERE id = 1;
    END;
)SQL";

constexpr const char* SYNC_STATE = R"SQL(
    CREATE TABLE sync_state (
        id INTEGER PRIMARY KEY CHECK (id = 1),
        last_revision TEXT,
        last_synced_at INTEGER NOT NULL,
        synced_seq INTEGER NOT NULL DEFAULT 0
    );
)SQL";

SchemaRegistry build_default_registry() {
    SchemaRegistry registry;
    for (auto migration : {
             sql_migration(1, "initial_schema", INITIAL_SCHEMA),
             sql_migration(2, "change_tracking", CHANGE_TRACKING),
             sql_migration(3, "sync_state", SYNC_STATE)}) {
        registry.add(std::move(migration)).unwrap();
    }
    return registry;
}

} // namespace

const SchemaRegistry& default_registry() {
    static const SchemaRegistry registry = build_default_registry();
    return registry;
}

} // namespace tally::storage
