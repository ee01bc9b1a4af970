#include "sync/directory_blob_store.hpp"
#include "core/log.hpp"
#include "core/types.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLockFile>
#include <QSaveFile>
#include <sodium.h>
#include <array>

namespace tally::sync {

std::string content_revision(const QByteArray& bytes) {
    std::array<unsigned char, crypto_generichash_BYTES> digest{};
    crypto_generichash(digest.data(), digest.size(),
                       reinterpret_cast<const unsigned char*>(bytes.constData()),
                       static_cast<unsigned long long>(bytes.size()),
                       nullptr, 0);

    std::array<char, crypto_generichash_BYTES * 2 + 1> hex{};
    sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
    return std::string(hex.data());
}

DirectoryBlobStore::DirectoryBlobStore(QString directory, QString file_name)
    : directory_(std::move(directory)), file_name_(std::move(file_name)) {}

QString DirectoryBlobStore::blob_path() const {
    return QDir(directory_).filePath(file_name_);
}

std::string DirectoryBlobStore::describe() const {
    return "directory:" + blob_path().toStdString();
}

Result<std::optional<RemoteBlob>, Error> DirectoryBlobStore::read_blob() const {
    const auto path = blob_path();
    if (!QFileInfo::exists(path)) {
        return Result<std::optional<RemoteBlob>, Error>::ok(std::nullopt);
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<std::optional<RemoteBlob>, Error>::err(Error{ErrorKind::SyncUnavailable,
            "cannot read " + path.toStdString() + ": " + file.errorString().toStdString()});
    }

    RemoteBlob blob;
    blob.bytes = file.readAll();
    blob.revision = content_revision(blob.bytes);
    return Result<std::optional<RemoteBlob>, Error>::ok(std::move(blob));
}

Result<std::optional<RemoteBlob>, Error> DirectoryBlobStore::get() {
    if (!ensure_sodium()) {
        return Result<std::optional<RemoteBlob>, Error>::err(
            Error{ErrorKind::SyncUnavailable, "libsodium initialization failed"});
    }
    if (!QDir(directory_).exists()) {
        return Result<std::optional<RemoteBlob>, Error>::err(Error{ErrorKind::SyncUnavailable,
            "sync directory " + directory_.toStdString() + " does not exist"});
    }
    return read_blob();
}

Result<std::string, Error> DirectoryBlobStore::put(const QByteArray& bytes,
                                                   const std::optional<std::string>& expected_revision) {
    if (!ensure_sodium()) {
        return Result<std::string, Error>::err(
            Error{ErrorKind::SyncUnavailable, "libsodium initialization failed"});
    }
    if (!QDir(directory_).exists()) {
        return Result<std::string, Error>::err(Error{ErrorKind::SyncUnavailable,
            "sync directory " + directory_.toStdString() + " does not exist"});
    }

    QLockFile lock(blob_path() + QStringLiteral(".lock"));
    lock.setStaleLockTime(30000);
    if (!lock.tryLock(lock_timeout_ms_)) {
        return Result<std::string, Error>::err(Error{ErrorKind::SyncUnavailable,
            "sync directory is locked by another writer", static_cast<int>(lock.error())});
    }

    auto current = read_blob();
    if (current.is_err()) {
        return Result<std::string, Error>::err(current.unwrap_err());
    }
    const std::optional<std::string> current_revision =
        current.unwrap() ? std::optional<std::string>(current.unwrap()->revision) : std::nullopt;
    if (current_revision != expected_revision) {
        return Result<std::string, Error>::err(conflict_error(expected_revision, current_revision));
    }

    QSaveFile file(blob_path());
    if (!file.open(QIODevice::WriteOnly)) {
        return Result<std::string, Error>::err(Error{ErrorKind::SyncUnavailable,
            "cannot write " + blob_path().toStdString() + ": " + file.errorString().toStdString()});
    }
    if (file.write(bytes) != bytes.size() || !file.commit()) {
        return Result<std::string, Error>::err(Error{ErrorKind::SyncUnavailable,
            "cannot write " + blob_path().toStdString() + ": " + file.errorString().toStdString()});
    }

    auto revision = content_revision(bytes);
    qCDebug(tallySyncLog) << "wrote" << blob_path() << "revision" << revision.c_str();
    return Result<std::string, Error>::ok(std::move(revision));
}

} // namespace tally::sync
