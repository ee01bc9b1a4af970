#pragma once

#include "sync/authenticator.hpp"
#include "sync/blob_store.hpp"
#include <QUrl>

namespace tally::sync {

/**
 * HttpBlobStore - The blob is one HTTP resource.
 *
 * GET returns the body and its ETag (404 means nothing stored). PUT carries
 * If-Match with the expected ETag, or If-None-Match: * for a first write;
 * 412 is a conflict. 401/403 are AuthFailed, other failures SyncUnavailable.
 *
 * Calls block on a private event loop, so the store can be used from the
 * sync worker thread.
 */
class HttpBlobStore : public BlobStore {
public:
    HttpBlobStore(QUrl url, Credentials credentials);

    [[nodiscard]] Result<std::optional<RemoteBlob>, Error> get() override;

    [[nodiscard]] Result<std::string, Error> put(
        const QByteArray& bytes,
        const std::optional<std::string>& expected_revision) override;

    [[nodiscard]] std::string describe() const override;

    void set_timeout_ms(int timeout_ms) { timeout_ms_ = timeout_ms; }

private:
    QUrl url_;
    Credentials credentials_;
    int timeout_ms_ = 30000;
};

} // namespace tally::sync
