#include "sync/blob_store.hpp"

namespace tally::sync {

Error conflict_error(const std::optional<std::string>& expected,
                     const std::optional<std::string>& actual) {
    return Error{ErrorKind::SyncConflict,
                 "remote moved: expected revision " + expected.value_or("<none>") +
                 ", found " + actual.value_or("<none>")};
}

Result<std::optional<RemoteBlob>, Error> MemoryBlobStore::get() {
    QMutexLocker lock(&mutex_);
    if (offline_) {
        return Result<std::optional<RemoteBlob>, Error>::err(
            Error{ErrorKind::SyncUnavailable, "memory store is offline"});
    }
    return Result<std::optional<RemoteBlob>, Error>::ok(blob_);
}

Result<std::string, Error> MemoryBlobStore::put(const QByteArray& bytes,
                                                const std::optional<std::string>& expected_revision) {
    QMutexLocker lock(&mutex_);
    if (offline_) {
        return Result<std::string, Error>::err(
            Error{ErrorKind::SyncUnavailable, "memory store is offline"});
    }

    const std::optional<std::string> current =
        blob_ ? std::optional<std::string>(blob_->revision) : std::nullopt;
    if (current != expected_revision) {
        return Result<std::string, Error>::err(conflict_error(expected_revision, current));
    }

    auto revision = "r" + std::to_string(next_revision_++);
    blob_ = RemoteBlob{.bytes = bytes, .revision = revision};
    ++puts_;
    return Result<std::string, Error>::ok(std::move(revision));
}

void MemoryBlobStore::set_offline(bool offline) {
    QMutexLocker lock(&mutex_);
    offline_ = offline;
}

int MemoryBlobStore::put_count() const {
    QMutexLocker lock(&mutex_);
    return puts_;
}

} // namespace tally::sync
