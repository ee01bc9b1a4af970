#include "app/app_context.hpp"
#include "storage/migrations.hpp"
#include "sync/directory_blob_store.hpp"
#include "sync/http_blob_store.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSysInfo>
#include <QUrl>

namespace tally::app {

namespace {

std::string resolve_client_id(const AppConfig& config) {
    if (!config.client_id.isEmpty()) {
        return config.client_id.toStdString();
    }
    return QSysInfo::machineHostName().toStdString();
}

std::string prepare_database_path(const QString& path) {
    if (path == QStringLiteral(":memory:")) {
        return path.toStdString();
    }
    QFileInfo info(path);
    QDir dir(info.absolutePath());
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }
    return info.absoluteFilePath().toStdString();
}

} // namespace

AppContext::AppContext(AppConfig config)
    : config_(std::move(config))
    , engine_(prepare_database_path(config_.db_path))
    , categories_(engine_)
    , transactions_(engine_)
    , budgets_(engine_)
    , sync_state_(engine_)
    , importer_(categories_, transactions_, budgets_)
    , adapter_(engine_, categories_, transactions_, budgets_, sync_state_)
    , controller_(engine_, storage::default_registry()) {
    if (!config_.sync_directory.isEmpty()) {
        authenticator_ = std::make_unique<sync::LocalAuthenticator>();
    } else if (!config_.sync_url.isEmpty()) {
        authenticator_ = std::make_unique<sync::TokenAuthenticator>(config_.sync_token.toStdString());
    }
    if (authenticator_) {
        controller_.set_sync(adapter_, *authenticator_, resolve_client_id(config_), make_store_factory());
    }
}

AppContext::~AppContext() {
    adapter_.shutdown();
    engine_.close();
}

InitStatus AppContext::initialize() {
    return controller_.initialize();
}

sync::BlobStoreFactory AppContext::make_store_factory() const {
    if (!config_.sync_directory.isEmpty()) {
        const auto directory = config_.sync_directory;
        return [directory](const sync::Credentials&)
                   -> Result<std::shared_ptr<sync::BlobStore>, Error> {
            if (!QDir(directory).exists()) {
                return Result<std::shared_ptr<sync::BlobStore>, Error>::err(Error{
                    ErrorKind::SyncUnavailable,
                    "sync directory " + directory.toStdString() + " does not exist"});
            }
            return Result<std::shared_ptr<sync::BlobStore>, Error>::ok(
                std::make_shared<sync::DirectoryBlobStore>(directory));
        };
    }

    const auto url = QUrl(config_.sync_url);
    return [url](const sync::Credentials& credentials)
               -> Result<std::shared_ptr<sync::BlobStore>, Error> {
        if (!url.isValid() || url.scheme().isEmpty()) {
            return Result<std::shared_ptr<sync::BlobStore>, Error>::err(Error{
                ErrorKind::SyncUnavailable, "sync url is not valid: " + url.toString().toStdString()});
        }
        return Result<std::shared_ptr<sync::BlobStore>, Error>::ok(
            std::make_shared<sync::HttpBlobStore>(url, credentials));
    };
}

} // namespace tally::app
