#include "sync/http_blob_store.hpp"
#include "core/log.hpp"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <memory>

namespace tally::sync {

namespace {

struct HttpResponse {
    int status = 0;
    QByteArray body;
    QByteArray etag;
    QNetworkReply::NetworkError network_error = QNetworkReply::NoError;
    QString error_string;
};

// The reply is finished (or aborted by the transfer timeout) when this returns.
HttpResponse wait_for(QNetworkReply* reply) {
    std::unique_ptr<QNetworkReply, void (*)(QNetworkReply*)> owned(
        reply, [](QNetworkReply* r) { r->deleteLater(); });

    if (!reply->isFinished()) {
        QEventLoop loop;
        QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
        loop.exec();
    }

    HttpResponse response;
    response.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    response.body = reply->readAll();
    response.etag = reply->rawHeader("ETag");
    response.network_error = reply->error();
    response.error_string = reply->errorString();
    return response;
}

Error http_error(const std::string& action, const HttpResponse& response) {
    if (response.status == 401 || response.status == 403) {
        return Error{ErrorKind::AuthFailed,
                     action + " rejected credentials (HTTP " + std::to_string(response.status) + ")",
                     response.status};
    }
    if (response.status == 0) {
        return Error{ErrorKind::SyncUnavailable,
                     action + " failed: " + response.error_string.toStdString()};
    }
    return Error{ErrorKind::SyncUnavailable,
                 action + " failed with HTTP " + std::to_string(response.status),
                 response.status};
}

} // namespace

HttpBlobStore::HttpBlobStore(QUrl url, Credentials credentials)
    : url_(std::move(url)), credentials_(std::move(credentials)) {}

std::string HttpBlobStore::describe() const {
    return "http:" + url_.toString(QUrl::RemoveUserInfo | QUrl::RemoveQuery).toStdString();
}

Result<std::optional<RemoteBlob>, Error> HttpBlobStore::get() {
    QNetworkAccessManager manager;
    QNetworkRequest request(url_);
    request.setTransferTimeout(timeout_ms_);
    request.setRawHeader("Authorization",
                         QByteArray("Bearer ") + QByteArray::fromStdString(credentials_.access_token));
    request.setRawHeader("Accept", "application/json");

    const auto response = wait_for(manager.get(request));
    qCDebug(tallySyncLog) << "GET" << url_ << "->" << response.status;

    if (response.status == 404) {
        return Result<std::optional<RemoteBlob>, Error>::ok(std::nullopt);
    }
    if (response.status != 200) {
        return Result<std::optional<RemoteBlob>, Error>::err(http_error("download", response));
    }
    if (response.etag.isEmpty()) {
        return Result<std::optional<RemoteBlob>, Error>::err(Error{ErrorKind::SyncUnavailable,
            "server did not return an ETag for the snapshot"});
    }

    return Result<std::optional<RemoteBlob>, Error>::ok(RemoteBlob{
        .bytes = response.body,
        .revision = response.etag.toStdString()
    });
}

Result<std::string, Error> HttpBlobStore::put(const QByteArray& bytes,
                                              const std::optional<std::string>& expected_revision) {
    QNetworkAccessManager manager;
    QNetworkRequest request(url_);
    request.setTransferTimeout(timeout_ms_);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    request.setRawHeader("Authorization",
                         QByteArray("Bearer ") + QByteArray::fromStdString(credentials_.access_token));
    if (expected_revision) {
        request.setRawHeader("If-Match", QByteArray::fromStdString(*expected_revision));
    } else {
        request.setRawHeader("If-None-Match", "*");
    }

    const auto response = wait_for(manager.put(request, bytes));
    qCDebug(tallySyncLog) << "PUT" << url_ << "->" << response.status;

    if (response.status == 412) {
        return Result<std::string, Error>::err(Error{ErrorKind::SyncConflict,
            "remote moved since revision " + expected_revision.value_or("<none>"), 412});
    }
    if (response.status < 200 || response.status >= 300) {
        return Result<std::string, Error>::err(http_error("upload", response));
    }
    if (response.etag.isEmpty()) {
        return Result<std::string, Error>::err(Error{ErrorKind::SyncUnavailable,
            "server did not return an ETag for the upload"});
    }
    return Result<std::string, Error>::ok(response.etag.toStdString());
}

} // namespace tally::sync
