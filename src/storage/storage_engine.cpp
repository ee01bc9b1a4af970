#include "storage/storage_engine.hpp"
#include "storage/migrations.hpp"
#include "core/log.hpp"

#include <algorithm>
#include <vector>

namespace tally::storage {

namespace {

// Engines whose shared lock the current thread holds.
thread_local std::vector<const StorageEngine*> t_read_scopes;

} // namespace

StorageEngine::StorageEngine(std::string path) : path_(std::move(path)) {}

StorageEngine::~StorageEngine() {
    close();
}

Result<Database*, Error> StorageEngine::open() {
    return open_at(path_);
}

Result<Database*, Error> StorageEngine::open_memory() {
    return open_at(":memory:");
}

Result<Database*, Error> StorageEngine::open_at(const std::string& path) {
    QWriteLocker lock(&lock_);
    if (db_) {
        return Result<Database*, Error>::ok(&*db_);
    }

    auto db_result = Database::open(path);
    if (db_result.is_err()) {
        qCCritical(tallyStorageLog) << "open failed:" << db_result.unwrap_err().message.c_str();
        return Result<Database*, Error>::err(db_result.unwrap_err());
    }

    db_.emplace(std::move(db_result).unwrap());
    open_.storeRelease(1);
    path_ = path;
    qCInfo(tallyStorageLog) << "opened" << path_.c_str();
    return Result<Database*, Error>::ok(&*db_);
}

Result<int, Error> StorageEngine::migrate(const SchemaRegistry& registry) {
    if (!is_open()) {
        return Result<int, Error>::err(not_open_error());
    }

    MigrationRunner runner(*this, registry);
    auto result = runner.migrate();
    if (result.is_err()) {
        ready_.storeRelease(0);
        return result;
    }
    ready_.storeRelease(1);
    return result;
}

Result<int, Error> StorageEngine::schema_version() {
    if (!is_open()) {
        return Result<int, Error>::err(not_open_error());
    }
    return MigrationRunner::current_version(*this);
}

void StorageEngine::close() {
    QWriteLocker lock(&lock_);
    if (db_) {
        db_.reset();
        open_.storeRelease(0);
        qCInfo(tallyStorageLog) << "closed" << path_.c_str();
    }
    ready_.storeRelease(0);
}

bool StorageEngine::holds_read_scope() const {
    return std::find(t_read_scopes.begin(), t_read_scopes.end(), this) != t_read_scopes.end();
}

void StorageEngine::enter_read_scope() const {
    t_read_scopes.push_back(this);
}

void StorageEngine::leave_read_scope() const {
    auto it = std::find(t_read_scopes.rbegin(), t_read_scopes.rend(), this);
    if (it != t_read_scopes.rend()) {
        t_read_scopes.erase(std::next(it).base());
    }
}

Error StorageEngine::not_open_error() {
    return Error{ErrorKind::StorageUnavailable, "Storage engine is not open"};
}

} // namespace tally::storage
