#pragma once

#include "core/result.hpp"
#include <QByteArray>
#include <QMutex>
#include <cstdint>
#include <optional>
#include <string>

namespace tally::sync {

struct RemoteBlob {
    QByteArray bytes;
    std::string revision;
};

/**
 * BlobStore - One opaque, revisioned blob owned by the user.
 *
 * get() returns nullopt when nothing has been stored yet. put() is
 * conditional: it succeeds only if the current revision equals
 * expected_revision (nullopt meaning "nothing stored yet"), otherwise it
 * fails with SyncConflict and leaves the blob untouched.
 */
class BlobStore {
public:
    virtual ~BlobStore() = default;

    [[nodiscard]] virtual Result<std::optional<RemoteBlob>, Error> get() = 0;

    [[nodiscard]] virtual Result<std::string, Error> put(
        const QByteArray& bytes,
        const std::optional<std::string>& expected_revision) = 0;

    [[nodiscard]] virtual std::string describe() const = 0;
};

/**
 * MemoryBlobStore - In-process blob. Several adapters may share one
 * instance to simulate devices syncing through the same remote.
 */
class MemoryBlobStore : public BlobStore {
public:
    MemoryBlobStore() = default;

    [[nodiscard]] Result<std::optional<RemoteBlob>, Error> get() override;

    [[nodiscard]] Result<std::string, Error> put(
        const QByteArray& bytes,
        const std::optional<std::string>& expected_revision) override;

    [[nodiscard]] std::string describe() const override { return "memory"; }

    /**
     * Make the next get() or put() fail with SyncUnavailable.
     */
    void set_offline(bool offline);

    [[nodiscard]] int put_count() const;

private:
    mutable QMutex mutex_;
    std::optional<RemoteBlob> blob_;
    uint64_t next_revision_ = 1;
    int puts_ = 0;
    bool offline_ = false;
};

[[nodiscard]] Error conflict_error(const std::optional<std::string>& expected,
                                   const std::optional<std::string>& actual);

} // namespace tally::sync
