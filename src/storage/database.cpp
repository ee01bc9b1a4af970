#include "storage/database.hpp"

namespace tally::storage {

namespace {

Error sqlite_error(std::string message, int rc) {
    return Error{ErrorKind::Storage, std::move(message), rc};
}

} // namespace

// ============================================================================
// Statement implementation
// ============================================================================

Result<void, Error> Statement::bind_text(int index, std::string_view text) {
    int rc = sqlite3_bind_text(stmt_.get(), index, text.data(),
                               static_cast<int>(text.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error("Failed to bind text", rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind_int(int index, int value) {
    int rc = sqlite3_bind_int(stmt_.get(), index, value);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error("Failed to bind int", rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind_int64(int index, int64_t value) {
    int rc = sqlite3_bind_int64(stmt_.get(), index, value);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error("Failed to bind int64", rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind_double(int index, double value) {
    int rc = sqlite3_bind_double(stmt_.get(), index, value);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error("Failed to bind double", rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind_null(int index) {
    int rc = sqlite3_bind_null(stmt_.get(), index);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error("Failed to bind null", rc));
    }
    return Result<void, Error>::ok();
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), index)));
}

std::optional<std::string> Statement::column_optional_text(int index) const {
    if (column_is_null(index)) return std::nullopt;
    return column_text(index);
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

double Statement::column_double(int index) const {
    return sqlite3_column_double(stmt_.get(), index);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

Result<bool, Error> Statement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    sqlite3* db = sqlite3_db_handle(stmt_.get());
    return Result<bool, Error>::err(
        sqlite_error(db ? sqlite3_errmsg(db) : "Step failed", rc));
}

Result<void, Error> Statement::run() {
    auto step_result = step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::reset() {
    int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error("Reset failed", rc));
    }
    return Result<void, Error>::ok();
}

// ============================================================================
// Database implementation
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_), depth_(other.depth_) {
    other.db_ = nullptr;
    other.depth_ = 0;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        depth_ = other.depth_;
        other.db_ = nullptr;
        other.depth_ = 0;
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path) {
    sqlite3* handle = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &handle, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = handle ? sqlite3_errmsg(handle) : "Unknown error";
        if (handle) sqlite3_close(handle);
        return Result<Database, Error>::err(
            Error{ErrorKind::StorageUnavailable, "Cannot open '" + path + "': " + error, rc});
    }

    Database db(handle);

    auto pragma_result = db.execute("PRAGMA foreign_keys = ON;");
    if (pragma_result.is_ok()) {
        pragma_result = db.execute("PRAGMA busy_timeout = 5000;");
    }
    if (pragma_result.is_ok() && path != ":memory:") {
        // WAL lets readers proceed while a writer holds the lock
        pragma_result = db.execute("PRAGMA journal_mode = WAL;");
    }
    if (pragma_result.is_ok()) {
        // Touch the schema so a corrupt or non-database file fails here
        pragma_result = db.execute("SELECT count(*) FROM sqlite_master;");
    }
    if (pragma_result.is_err()) {
        const auto& error = pragma_result.unwrap_err();
        return Result<Database, Error>::err(
            Error{ErrorKind::StorageUnavailable,
                  "Cannot initialize '" + path + "': " + error.message, error.code});
    }

    return Result<Database, Error>::ok(std::move(db));
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
        depth_ = 0;
    }
}

Result<Statement, Error> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Result<Statement, Error>::err(
            Error{ErrorKind::StorageUnavailable, "Database not open"});
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(sqlite_error(last_error(), rc));
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    if (!db_) {
        return Result<void, Error>::err(
            Error{ErrorKind::StorageUnavailable, "Database not open"});
    }
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<void, Error>::err(sqlite_error(error, rc));
    }
    return Result<void, Error>::ok();
}

Result<int64_t, Error> Database::query_int64(const std::string& sql) {
    auto stmt_result = prepare(sql);
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<int64_t, Error>::err(sqlite_error("Query returned no row", SQLITE_DONE));
    }
    return Result<int64_t, Error>::ok(stmt.column_int64(0));
}

Result<void, Error> Database::begin_scope(int depth) {
    if (depth == 0) {
        return execute("BEGIN IMMEDIATE;");
    }
    return execute("SAVEPOINT sp_" + std::to_string(depth) + ";");
}

Result<void, Error> Database::commit_scope(int depth) {
    if (depth == 0) {
        return execute("COMMIT;");
    }
    return execute("RELEASE SAVEPOINT sp_" + std::to_string(depth) + ";");
}

Result<void, Error> Database::rollback_scope(int depth) {
    if (depth == 0) {
        // SQLite may already have rolled back on its own (SQLITE_FULL, SQLITE_IOERR)
        if (sqlite3_get_autocommit(db_)) {
            return Result<void, Error>::ok();
        }
        return execute("ROLLBACK;");
    }
    const auto name = "sp_" + std::to_string(depth);
    auto result = execute("ROLLBACK TO SAVEPOINT " + name + ";");
    if (result.is_err()) {
        return result;
    }
    return execute("RELEASE SAVEPOINT " + name + ";");
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

} // namespace tally::storage
