#pragma once

#include "core/result.hpp"
#include "storage/migrations.hpp"
#include "storage/storage_engine.hpp"
#include "sync/authenticator.hpp"
#include "sync/sync_adapter.hpp"
#include <QObject>
#include <QString>
#include <QStringList>
#include <optional>
#include <string>

namespace tally::app {

enum class InitStage {
    Idle,
    Opening,
    Migrating,
    Authenticating,
    Attaching,
    Ready,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(InitStage stage) noexcept {
    switch (stage) {
        case InitStage::Idle: return "idle";
        case InitStage::Opening: return "opening";
        case InitStage::Migrating: return "migrating";
        case InitStage::Authenticating: return "authenticating";
        case InitStage::Attaching: return "attaching";
        case InitStage::Ready: return "ready";
        case InitStage::Error: return "error";
    }
    return "unknown";
}

struct InitStatus {
    bool is_ready = false;
    std::optional<Error> error;
};

/**
 * InitController - Brings the store up: open, migrate, then optionally
 * attach sync.
 *
 * Only opening and migrating can fail startup. Sign-in or attach failures
 * are kept as warnings and the controller still reaches Ready, with the
 * store working offline. The stages only move forward; a second
 * initialize() returns the first outcome.
 */
class InitController : public QObject {
    Q_OBJECT

    Q_PROPERTY(bool ready READ isReady NOTIFY readyChanged)

public:
    InitController(storage::StorageEngine& engine,
                   const storage::SchemaRegistry& registry,
                   QObject* parent = nullptr);

    /**
     * Enable the sync stages. Without this, initialize() stops after
     * migrating.
     */
    void set_sync(sync::SyncAdapter& adapter,
                  sync::Authenticator& authenticator,
                  std::string client_id,
                  sync::BlobStoreFactory factory);

    InitStatus initialize();

    [[nodiscard]] InitStatus status() const;
    [[nodiscard]] InitStage stage() const { return stage_; }
    [[nodiscard]] const QStringList& warnings() const { return warnings_; }
    [[nodiscard]] bool sync_attached() const { return sync_attached_; }
    [[nodiscard]] int migrations_applied() const { return migrations_applied_; }
    [[nodiscard]] bool isReady() const { return stage_ == InitStage::Ready; }

signals:
    void stageChanged();
    void readyChanged();
    void errorOccurred(const QString& message);

private:
    void advance(InitStage stage);
    InitStatus fail(Error error);
    void attach_sync();

    storage::StorageEngine& engine_;
    const storage::SchemaRegistry& registry_;

    sync::SyncAdapter* adapter_ = nullptr;
    sync::Authenticator* authenticator_ = nullptr;
    std::string client_id_;
    sync::BlobStoreFactory factory_;

    InitStage stage_ = InitStage::Idle;
    std::optional<Error> error_;
    QStringList warnings_;
    bool sync_attached_ = false;
    int migrations_applied_ = 0;
};

} // namespace tally::app
