#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <QAtomicInt>
#include <QAtomicPointer>
#include <QReadWriteLock>
#include <QThread>
#include <optional>
#include <string>
#include <type_traits>

namespace tally::storage {

class SchemaRegistry;

/**
 * StorageEngine - Owns the single SQLite connection of a device.
 *
 * All reads and writes go through transaction() or read():
 * - one writer at a time; a transaction() issued from inside another on the
 *   same thread nests as a savepoint
 * - read() scopes run concurrently with each other and never observe a
 *   write transaction in flight on another thread
 * - starting a transaction() from inside a read() scope is an error
 */
class StorageEngine {
public:
    explicit StorageEngine(std::string path);
    ~StorageEngine();

    StorageEngine(const StorageEngine&) = delete;
    StorageEngine& operator=(const StorageEngine&) = delete;

    /**
     * Acquire the database handle. Idempotent: a second call returns the
     * handle opened by the first. Failure is StorageUnavailable.
     */
    [[nodiscard]] Result<Database*, Error> open();

    /**
     * Open a private in-memory database instead of the configured path.
     */
    [[nodiscard]] Result<Database*, Error> open_memory();

    /**
     * Apply every migration of the registry newer than the stored schema
     * version. Returns the number applied and marks the engine ready.
     */
    [[nodiscard]] Result<int, Error> migrate(const SchemaRegistry& registry);

    [[nodiscard]] Result<int, Error> schema_version();

    void close();

    [[nodiscard]] bool is_open() const { return open_.loadAcquire() != 0; }
    [[nodiscard]] bool is_ready() const { return ready_.loadAcquire() != 0; }
    [[nodiscard]] const std::string& path() const { return path_; }

    /**
     * Run work(Database&) inside a transaction. Commits on Ok, rolls back on
     * Err. An exception thrown by work rolls back and propagates.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& work) -> std::invoke_result_t<F, Database&> {
        using ResultType = std::invoke_result_t<F, Database&>;

        if (is_writer_thread()) {
            return db_->transaction([&] { return work(*db_); });
        }
        if (holds_read_scope()) {
            return ResultType::err(Error{ErrorKind::Storage,
                                         "Cannot start a write transaction inside a read scope"});
        }

        QWriteLocker lock(&lock_);
        if (!db_) {
            return ResultType::err(not_open_error());
        }
        WriterScope writer(writer_);
        return db_->transaction([&] { return work(*db_); });
    }

    /**
     * Run work(Database&) under the shared lock. Nested read() and read()
     * inside a transaction on the same thread run directly.
     */
    template<typename F>
    [[nodiscard]] auto read(F&& work) -> std::invoke_result_t<F, Database&> {
        using ResultType = std::invoke_result_t<F, Database&>;

        if (is_writer_thread() || holds_read_scope()) {
            return work(*db_);
        }

        QReadLocker lock(&lock_);
        if (!db_) {
            return ResultType::err(not_open_error());
        }
        ReadScope scope(*this);
        return work(*db_);
    }

private:
    struct WriterScope {
        explicit WriterScope(QAtomicPointer<QThread>& writer) : writer_(writer) {
            writer_.storeRelease(QThread::currentThread());
        }
        ~WriterScope() { writer_.storeRelease(nullptr); }
        QAtomicPointer<QThread>& writer_;
    };

    struct ReadScope {
        explicit ReadScope(const StorageEngine& engine) : engine_(engine) { engine_.enter_read_scope(); }
        ~ReadScope() { engine_.leave_read_scope(); }
        const StorageEngine& engine_;
    };

    [[nodiscard]] bool is_writer_thread() const {
        return writer_.loadAcquire() == QThread::currentThread();
    }
    [[nodiscard]] bool holds_read_scope() const;
    void enter_read_scope() const;
    void leave_read_scope() const;

    [[nodiscard]] Result<Database*, Error> open_at(const std::string& path);
    [[nodiscard]] static Error not_open_error();

    std::string path_;
    std::optional<Database> db_;
    mutable QReadWriteLock lock_;
    QAtomicPointer<QThread> writer_{nullptr};
    QAtomicInt open_{0};
    QAtomicInt ready_{0};
};

} // namespace tally::storage
