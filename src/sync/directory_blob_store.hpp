#pragma once

#include "sync/blob_store.hpp"
#include <QString>

namespace tally::sync {

/**
 * Hex BLAKE2b-256 digest of the bytes.
 */
[[nodiscard]] std::string content_revision(const QByteArray& bytes);

/**
 * DirectoryBlobStore - The blob is a file in a directory, typically one a
 * desktop cloud client mirrors.
 *
 * The revision is the content hash, so any writer (including the cloud
 * client replacing the file) moves it. put() compares and writes under a
 * lock file next to the blob and replaces the file atomically.
 */
class DirectoryBlobStore : public BlobStore {
public:
    explicit DirectoryBlobStore(QString directory,
                                QString file_name = QStringLiteral("tally-snapshot.json"));

    [[nodiscard]] Result<std::optional<RemoteBlob>, Error> get() override;

    [[nodiscard]] Result<std::string, Error> put(
        const QByteArray& bytes,
        const std::optional<std::string>& expected_revision) override;

    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] QString blob_path() const;

    void set_lock_timeout_ms(int timeout_ms) { lock_timeout_ms_ = timeout_ms; }

private:
    [[nodiscard]] Result<std::optional<RemoteBlob>, Error> read_blob() const;

    QString directory_;
    QString file_name_;
    int lock_timeout_ms_ = 5000;
};

} // namespace tally::sync
