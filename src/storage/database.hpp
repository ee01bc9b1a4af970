#pragma once

#include "core/result.hpp"
#include <sqlite3.h>
#include <string>
#include <string_view>
#include <memory>
#include <optional>
#include <vector>
#include <exception>
#include <stdexcept>
#include <cstdint>
#include <type_traits>

namespace tally::storage {

/**
 * SQLite statement wrapper with RAII.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    // Bind helpers
    [[nodiscard]] Result<void, Error> bind_text(int index, std::string_view text);
    [[nodiscard]] Result<void, Error> bind_int(int index, int value);
    [[nodiscard]] Result<void, Error> bind_int64(int index, int64_t value);
    [[nodiscard]] Result<void, Error> bind_double(int index, double value);
    [[nodiscard]] Result<void, Error> bind_null(int index);

    [[nodiscard]] Result<void, Error> bind_value(int index, std::string_view text) { return bind_text(index, text); }
    [[nodiscard]] Result<void, Error> bind_value(int index, const std::string& text) { return bind_text(index, text); }
    [[nodiscard]] Result<void, Error> bind_value(int index, const char* text) { return bind_text(index, text); }
    [[nodiscard]] Result<void, Error> bind_value(int index, int value) { return bind_int(index, value); }
    [[nodiscard]] Result<void, Error> bind_value(int index, int64_t value) { return bind_int64(index, value); }
    [[nodiscard]] Result<void, Error> bind_value(int index, bool value) { return bind_int(index, value ? 1 : 0); }
    [[nodiscard]] Result<void, Error> bind_value(int index, std::nullopt_t) { return bind_null(index); }
    [[nodiscard]] Result<void, Error> bind_value(int index, const std::optional<std::string>& text) {
        return text ? bind_text(index, *text) : bind_null(index);
    }

    /**
     * Bind parameters 1..N in order, stopping at the first failure.
     */
    template<typename... Args>
    [[nodiscard]] Result<void, Error> bind_all(const Args&... args) {
        int index = 0;
        auto status = Result<void, Error>::ok();
        auto bind_one = [&](const auto& value) {
            ++index;
            if (status.is_ok()) {
                status = bind_value(index, value);
            }
        };
        (bind_one(args), ...);
        return status;
    }

    // Column getters
    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] std::optional<std::string> column_optional_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] double column_double(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

    // Execute
    [[nodiscard]] Result<bool, Error> step();  // Returns true if there's a row
    [[nodiscard]] Result<void, Error> run();   // Step once, discarding any row
    [[nodiscard]] Result<void, Error> reset();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Step a bound statement to completion, mapping each row with row_fn.
 */
template<typename RowFn>
[[nodiscard]] auto collect_rows(Statement& stmt, RowFn&& row_fn)
    -> Result<std::vector<std::invoke_result_t<RowFn, Statement&>>, Error> {
    using Row = std::invoke_result_t<RowFn, Statement&>;
    std::vector<Row> rows;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<Row>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;
        rows.push_back(row_fn(stmt));
    }
    return Result<std::vector<Row>, Error>::ok(std::move(rows));
}

/**
 * Database - SQLite connection wrapper.
 *
 * Provides:
 * - RAII connection management
 * - Transactions that nest through SAVEPOINTs
 * - Error handling via Result type
 *
 * A Database is not synchronized on its own; StorageEngine serializes
 * writers in front of it.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    /**
     * Open a database connection. Failures are StorageUnavailable.
     */
    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    /**
     * Open an in-memory database (for testing).
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }

    void close();

    /**
     * Get the raw SQLite handle (use with caution).
     */
    [[nodiscard]] sqlite3* handle() const { return db_; }

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);

    /**
     * Execute one or more SQL statements without results.
     */
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    /**
     * Execute a SQL statement and process results with a callback.
     */
    template<typename F>
    [[nodiscard]] Result<void, Error> query(const std::string& sql, F&& callback) {
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        while (true) {
            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return Result<void, Error>::err(step_result.unwrap_err());
            }
            if (!step_result.unwrap()) break;
            callback(stmt);
        }

        return Result<void, Error>::ok();
    }

    /**
     * Run a single-value query such as SELECT COUNT(*).
     */
    [[nodiscard]] Result<int64_t, Error> query_int64(const std::string& sql);

    /**
     * Execute a function within a transaction.
     *
     * The outermost scope is BEGIN IMMEDIATE ... COMMIT; inner scopes are
     * savepoints, so a failed inner scope unwinds only itself. Commits when f
     * returns Ok, rolls back when it returns Err or throws (the exception is
     * rethrown after the rollback).
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        const int depth = depth_;
        auto begin_result = begin_scope(depth);
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }
        ++depth_;

        try {
            auto result = f();
            depth_ = depth;

            if (result.is_err()) {
                auto rollback_result = rollback_scope(depth);
                if (rollback_result.is_err()) {
                    auto error = result.unwrap_err();
                    error.message += " (rollback failed: " + rollback_result.unwrap_err().message + ")";
                    return ResultType::err(std::move(error));
                }
                return result;
            }

            auto commit_result = commit_scope(depth);
            if (commit_result.is_err()) {
                auto error = commit_result.unwrap_err();
                auto rollback_result = rollback_scope(depth);
                if (rollback_result.is_err()) {
                    error.message += " (rollback failed: " + rollback_result.unwrap_err().message + ")";
                }
                return ResultType::err(std::move(error));
            }
            return result;
        } catch (...) {
            depth_ = depth;
            auto rollback_result = rollback_scope(depth);
            if (rollback_result.is_err()) {
                std::throw_with_nested(std::runtime_error(
                    "rollback after exception failed: " + rollback_result.unwrap_err().message));
            }
            throw;
        }
    }

    /**
     * Nesting depth of the transaction currently open on this connection.
     */
    [[nodiscard]] int transaction_depth() const noexcept { return depth_; }

    /**
     * Number of rows changed by the last statement.
     */
    [[nodiscard]] int changes() const;

    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    [[nodiscard]] Result<void, Error> begin_scope(int depth);
    [[nodiscard]] Result<void, Error> commit_scope(int depth);
    [[nodiscard]] Result<void, Error> rollback_scope(int depth);

    sqlite3* db_ = nullptr;
    int depth_ = 0;
};

} // namespace tally::storage
