#include "app/init_controller.hpp"
#include "core/log.hpp"

namespace tally::app {

InitController::InitController(storage::StorageEngine& engine,
                               const storage::SchemaRegistry& registry,
                               QObject* parent)
    : QObject(parent)
    , engine_(engine)
    , registry_(registry) {}

void InitController::set_sync(sync::SyncAdapter& adapter,
                              sync::Authenticator& authenticator,
                              std::string client_id,
                              sync::BlobStoreFactory factory) {
    adapter_ = &adapter;
    authenticator_ = &authenticator;
    client_id_ = std::move(client_id);
    factory_ = std::move(factory);
}

InitStatus InitController::status() const {
    return InitStatus{.is_ready = stage_ == InitStage::Ready, .error = error_};
}

void InitController::advance(InitStage stage) {
    qCDebug(tallyInitLog) << "stage" << to_string(stage_).data() << "->" << to_string(stage).data();
    stage_ = stage;
    emit stageChanged();
    if (stage == InitStage::Ready) {
        emit readyChanged();
    }
}

InitStatus InitController::fail(Error error) {
    qCCritical(tallyInitLog) << "Startup failed at" << to_string(stage_).data() << ":"
                             << error.message.c_str();
    error_ = error;
    advance(InitStage::Error);
    emit errorOccurred(QString::fromStdString(error.message));
    return status();
}

InitStatus InitController::initialize() {
    if (stage_ != InitStage::Idle) {
        return status();
    }

    advance(InitStage::Opening);
    auto opened = engine_.open();
    if (opened.is_err()) {
        auto error = opened.unwrap_err();
        error.kind = ErrorKind::StorageUnavailable;
        return fail(std::move(error));
    }

    advance(InitStage::Migrating);
    auto migrated = engine_.migrate(registry_);
    if (migrated.is_err()) {
        auto error = migrated.unwrap_err();
        if (!is_fatal(error.kind)) {
            error.kind = ErrorKind::MigrationFailed;
        }
        return fail(std::move(error));
    }
    migrations_applied_ = migrated.unwrap();

    if (adapter_ && authenticator_ && factory_) {
        attach_sync();
    }

    advance(InitStage::Ready);
    qCInfo(tallyInitLog) << "Ready:" << engine_.path().c_str()
                         << "migrations applied:" << migrations_applied_
                         << "sync:" << (sync_attached_ ? "attached" : "off");
    return status();
}

void InitController::attach_sync() {
    advance(InitStage::Authenticating);
    auto attached = adapter_->attach(*authenticator_, client_id_,
        [this](const sync::Credentials& credentials) {
            advance(InitStage::Attaching);
            return factory_(credentials);
        });
    if (attached.is_err()) {
        const auto message = QString::fromStdString(attached.unwrap_err().message);
        qCWarning(tallyInitLog) << "Sync unavailable, continuing offline:" << message;
        warnings_ << QStringLiteral("Sync not attached: %1").arg(message);
        return;
    }
    sync_attached_ = true;
}

} // namespace tally::app
