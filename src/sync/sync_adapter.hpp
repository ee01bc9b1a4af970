#pragma once

#include "sync/authenticator.hpp"
#include "sync/blob_store.hpp"
#include "sync/snapshot.hpp"
#include "storage/budget_repository.hpp"
#include "storage/category_repository.hpp"
#include "storage/storage_engine.hpp"
#include "storage/sync_state_repository.hpp"
#include "storage/transaction_repository.hpp"
#include <QAtomicInt>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QThread>
#include <memory>
#include <optional>
#include <string>

namespace tally::sync {

enum class AdapterState {
    Detached,
    Authenticating,
    Attached,
    Syncing,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(AdapterState state) noexcept {
    switch (state) {
        case AdapterState::Detached: return "detached";
        case AdapterState::Authenticating: return "authenticating";
        case AdapterState::Attached: return "attached";
        case AdapterState::Syncing: return "syncing";
        case AdapterState::Error: return "error";
    }
    return "unknown";
}

/**
 * What one pull, push or full cycle did.
 */
struct SyncReport {
    bool pulled = false;
    bool merged = false;
    bool pushed = false;
    size_t rows_merged = 0;
    std::optional<std::string> revision;
};

/**
 * SyncAdapter - Mirrors the local store into a remote blob.
 *
 * pull() merges a remote snapshot the device has not seen yet through the
 * repositories' bulk upserts, remote rows winning on id collision. push()
 * uploads the full local entity set conditioned on the revision seen at the
 * last pull, so a remote the device has not seen is never overwritten.
 *
 * Sync failures are kept in last_error() and reported through warning();
 * they never reach the callers of the repositories. Cycles run one at a
 * time; request_sync() runs a cycle on a worker thread and ignores requests
 * while one is in flight.
 */
class SyncAdapter : public QObject {
    Q_OBJECT

    Q_PROPERTY(bool syncing READ isSyncing NOTIFY stateChanged)

public:
    SyncAdapter(storage::StorageEngine& engine,
                storage::CategoryRepository& categories,
                storage::TransactionRepository& transactions,
                storage::BudgetRepository& budgets,
                storage::SyncStateRepository& sync_state,
                QObject* parent = nullptr);
    ~SyncAdapter() override;

    /**
     * Sign in, then build and attach the store. On failure the adapter is
     * Detached and the error is kept in last_error().
     */
    [[nodiscard]] Result<void, Error> attach(Authenticator& authenticator,
                                             const std::string& client_id,
                                             const BlobStoreFactory& factory);

    /**
     * Attach an already constructed store.
     */
    void attach_store(std::shared_ptr<BlobStore> store);

    void detach();

    [[nodiscard]] Result<SyncReport, Error> pull();
    [[nodiscard]] Result<SyncReport, Error> push();

    /**
     * One cycle: pull, then push if there are local changes the remote has
     * not seen (or the remote is empty while local data exists).
     */
    [[nodiscard]] Result<SyncReport, Error> sync();

    /**
     * Start a cycle on the worker thread. Returns false when detached or
     * when a cycle is already in flight.
     */
    bool request_sync();

    /**
     * Block until the worker thread (if any) has finished its cycle.
     */
    void wait_idle();

    /**
     * Abandon an in-flight cycle at its next network step and join the
     * worker. A write transaction in progress still commits or rolls back.
     */
    void shutdown();

    [[nodiscard]] AdapterState state() const;
    [[nodiscard]] bool is_attached() const;
    [[nodiscard]] std::optional<Error> last_error() const;
    [[nodiscard]] bool isSyncing() const { return state() == AdapterState::Syncing; }

signals:
    void stateChanged();
    void syncFinished(bool ok, const QString& message);
    void warning(const QString& message);

private:
    enum class Operation { Pull, Push, Cycle };

    [[nodiscard]] Result<SyncReport, Error> run(Operation operation);
    [[nodiscard]] Result<SyncReport, Error> pull_step(BlobStore& store, SyncReport report);
    [[nodiscard]] Result<SyncReport, Error> push_step(BlobStore& store, SyncReport report);
    [[nodiscard]] Result<bool, Error> needs_push();
    [[nodiscard]] Result<void, Error> merge(const Snapshot& snapshot,
                                            const std::string& revision,
                                            const storage::SyncState& previous);
    [[nodiscard]] std::optional<Error> abandoned() const;

    void set_state(AdapterState state);
    void record_failure(const Error& error);
    [[nodiscard]] std::shared_ptr<BlobStore> current_store() const;

    storage::StorageEngine& engine_;
    storage::CategoryRepository& categories_;
    storage::TransactionRepository& transactions_;
    storage::BudgetRepository& budgets_;
    storage::SyncStateRepository& sync_state_;

    mutable QMutex mutex_;
    std::shared_ptr<BlobStore> store_;
    std::optional<Error> last_error_;
    AdapterState state_ = AdapterState::Detached;

    QMutex cycle_mutex_;
    QMutex worker_mutex_;
    std::unique_ptr<QThread> worker_;
    QAtomicInt in_flight_{0};
    QAtomicInt abandon_{0};
};

} // namespace tally::sync
