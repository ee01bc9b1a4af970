#include "sync/sync_adapter.hpp"
#include "core/log.hpp"

#include <QStringList>
#include <unordered_map>
#include <vector>

namespace tally::sync {

namespace {

// Local categories the snapshot does not carry may sit under a parent the
// remote has since re-kinded or nested; those are detached to top level.
std::vector<Category> orphaned_children(const std::vector<Category>& local,
                                        const std::vector<Category>& remote) {
    std::unordered_map<std::string, const Category*> remote_by_id;
    for (const auto& category : remote) {
        remote_by_id[category.id] = &category;
    }

    std::vector<Category> detached;
    for (const auto& category : local) {
        if (!category.parent_id || remote_by_id.count(category.id) > 0) {
            continue;
        }
        auto parent = remote_by_id.find(*category.parent_id);
        if (parent == remote_by_id.end()) {
            continue;
        }
        if (parent->second->kind != category.kind || parent->second->parent_id) {
            qCWarning(tallySyncLog) << "Detaching category" << category.id.c_str()
                                    << "from" << category.parent_id->c_str()
                                    << "changed on the remote";
            auto moved = category;
            moved.parent_id.reset();
            moved.updated_at = Timestamp::now();
            detached.push_back(std::move(moved));
        }
    }
    return detached;
}

QString describe_report(const SyncReport& report) {
    QStringList parts;
    if (report.merged) {
        parts << QStringLiteral("merged %1 rows").arg(static_cast<qulonglong>(report.rows_merged));
    } else if (report.pulled) {
        parts << QStringLiteral("remote unchanged");
    }
    if (report.pushed) {
        parts << QStringLiteral("pushed");
    }
    if (report.revision) {
        parts << QStringLiteral("revision %1").arg(QString::fromStdString(*report.revision));
    }
    return parts.join(QStringLiteral(", "));
}

} // namespace

SyncAdapter::SyncAdapter(storage::StorageEngine& engine,
                         storage::CategoryRepository& categories,
                         storage::TransactionRepository& transactions,
                         storage::BudgetRepository& budgets,
                         storage::SyncStateRepository& sync_state,
                         QObject* parent)
    : QObject(parent)
    , engine_(engine)
    , categories_(categories)
    , transactions_(transactions)
    , budgets_(budgets)
    , sync_state_(sync_state) {}

SyncAdapter::~SyncAdapter() {
    shutdown();
}

// ============================================================================
// Attachment
// ============================================================================

Result<void, Error> SyncAdapter::attach(Authenticator& authenticator,
                                        const std::string& client_id,
                                        const BlobStoreFactory& factory) {
    abandon_.storeRelease(0);
    set_state(AdapterState::Authenticating);

    auto fail = [this](Error error) {
        {
            QMutexLocker lock(&mutex_);
            store_.reset();
            last_error_ = error;
        }
        set_state(AdapterState::Detached);
        qCWarning(tallySyncLog) << "Sync not attached:" << error.message.c_str();
        emit warning(QString::fromStdString(error.message));
        return Result<void, Error>::err(std::move(error));
    };

    auto credentials = authenticator.sign_in(client_id);
    if (credentials.is_err()) {
        return fail(credentials.unwrap_err());
    }

    auto store = factory(credentials.unwrap());
    if (store.is_err()) {
        return fail(store.unwrap_err());
    }
    if (!store.unwrap()) {
        return fail(Error{ErrorKind::SyncUnavailable, "no blob store configured"});
    }

    attach_store(std::move(store).unwrap());
    return Result<void, Error>::ok();
}

void SyncAdapter::attach_store(std::shared_ptr<BlobStore> store) {
    abandon_.storeRelease(0);
    qCInfo(tallySyncLog) << "Attached to" << store->describe().c_str();
    {
        QMutexLocker lock(&mutex_);
        store_ = std::move(store);
        last_error_.reset();
    }
    set_state(AdapterState::Attached);
}

void SyncAdapter::detach() {
    {
        QMutexLocker lock(&mutex_);
        store_.reset();
    }
    set_state(AdapterState::Detached);
}

bool SyncAdapter::is_attached() const {
    QMutexLocker lock(&mutex_);
    return store_ != nullptr;
}

std::optional<Error> SyncAdapter::last_error() const {
    QMutexLocker lock(&mutex_);
    return last_error_;
}

std::shared_ptr<BlobStore> SyncAdapter::current_store() const {
    QMutexLocker lock(&mutex_);
    return store_;
}

AdapterState SyncAdapter::state() const {
    QMutexLocker lock(&mutex_);
    return state_;
}

void SyncAdapter::set_state(AdapterState state) {
    {
        QMutexLocker lock(&mutex_);
        if (state_ == state) {
            return;
        }
        state_ = state;
    }
    qCDebug(tallySyncLog) << "state" << to_string(state).data();
    emit stateChanged();
}

void SyncAdapter::record_failure(const Error& error) {
    {
        QMutexLocker lock(&mutex_);
        last_error_ = error;
    }
    set_state(AdapterState::Error);
    qCWarning(tallySyncLog) << "Sync failed:" << to_string(error.kind).data()
                            << error.message.c_str();
    emit warning(QString::fromStdString(error.message));
    emit syncFinished(false, QString::fromStdString(error.message));
}

std::optional<Error> SyncAdapter::abandoned() const {
    if (abandon_.loadAcquire() != 0) {
        return Error{ErrorKind::SyncUnavailable, "sync abandoned during shutdown"};
    }
    return std::nullopt;
}

// ============================================================================
// Cycles
// ============================================================================

Result<SyncReport, Error> SyncAdapter::pull() {
    return run(Operation::Pull);
}

Result<SyncReport, Error> SyncAdapter::push() {
    return run(Operation::Push);
}

Result<SyncReport, Error> SyncAdapter::sync() {
    return run(Operation::Cycle);
}

Result<SyncReport, Error> SyncAdapter::run(Operation operation) {
    QMutexLocker cycle(&cycle_mutex_);

    auto store = current_store();
    if (!store) {
        return Result<SyncReport, Error>::err(
            Error{ErrorKind::SyncUnavailable, "sync is not attached"});
    }

    set_state(AdapterState::Syncing);

    Result<SyncReport, Error> result = Result<SyncReport, Error>::ok(SyncReport{});
    switch (operation) {
        case Operation::Pull:
            result = pull_step(*store, SyncReport{});
            break;
        case Operation::Push:
            result = push_step(*store, SyncReport{});
            break;
        case Operation::Cycle:
            result = pull_step(*store, SyncReport{}).and_then(
                [&](SyncReport report) -> Result<SyncReport, Error> {
                    auto push_needed = needs_push();
                    if (push_needed.is_err()) {
                        return Result<SyncReport, Error>::err(push_needed.unwrap_err());
                    }
                    if (!push_needed.unwrap()) {
                        return Result<SyncReport, Error>::ok(std::move(report));
                    }
                    return push_step(*store, std::move(report));
                });
            break;
    }

    if (result.is_err()) {
        record_failure(result.unwrap_err());
        return result;
    }

    {
        QMutexLocker lock(&mutex_);
        last_error_.reset();
    }
    set_state(AdapterState::Attached);
    const auto summary = describe_report(result.unwrap());
    qCInfo(tallySyncLog) << "Sync finished:" << summary;
    emit syncFinished(true, summary);
    return result;
}

Result<SyncReport, Error> SyncAdapter::pull_step(BlobStore& store, SyncReport report) {
    if (auto error = abandoned()) {
        return Result<SyncReport, Error>::err(*error);
    }

    auto remote = store.get();
    if (remote.is_err()) {
        return Result<SyncReport, Error>::err(remote.unwrap_err());
    }
    if (auto error = abandoned()) {
        return Result<SyncReport, Error>::err(*error);
    }

    auto loaded = sync_state_.load();
    if (loaded.is_err()) {
        return Result<SyncReport, Error>::err(loaded.unwrap_err());
    }
    const auto previous = loaded.unwrap().value_or(storage::SyncState{});
    report.pulled = true;

    if (!remote.unwrap()) {
        qCDebug(tallySyncLog) << "remote is empty";
        report.revision.reset();
        auto saved = sync_state_.save(storage::SyncState{
            .last_revision = std::nullopt,
            .last_synced_at = Timestamp::now(),
            .synced_seq = previous.synced_seq
        });
        if (saved.is_err()) {
            return Result<SyncReport, Error>::err(saved.unwrap_err());
        }
        return Result<SyncReport, Error>::ok(std::move(report));
    }

    const auto& blob = *remote.unwrap();
    report.revision = blob.revision;

    if (loaded.unwrap() && previous.last_revision == blob.revision) {
        qCDebug(tallySyncLog) << "remote unchanged at" << blob.revision.c_str();
        auto saved = sync_state_.save(storage::SyncState{
            .last_revision = blob.revision,
            .last_synced_at = Timestamp::now(),
            .synced_seq = previous.synced_seq
        });
        if (saved.is_err()) {
            return Result<SyncReport, Error>::err(saved.unwrap_err());
        }
        return Result<SyncReport, Error>::ok(std::move(report));
    }

    auto snapshot = decode_snapshot(blob.bytes);
    if (snapshot.is_err()) {
        return Result<SyncReport, Error>::err(Error{ErrorKind::SyncUnavailable,
            "remote snapshot is unreadable: " + snapshot.unwrap_err().message});
    }

    auto local_version = engine_.schema_version();
    if (local_version.is_err()) {
        return Result<SyncReport, Error>::err(local_version.unwrap_err());
    }
    if (snapshot.unwrap().schema_version > local_version.unwrap()) {
        return Result<SyncReport, Error>::err(Error{ErrorKind::SyncUnavailable,
            "remote snapshot uses schema version " +
            std::to_string(snapshot.unwrap().schema_version) +
            ", this device is at " + std::to_string(local_version.unwrap())});
    }

    auto merged = merge(snapshot.unwrap(), blob.revision, previous);
    if (merged.is_err()) {
        return Result<SyncReport, Error>::err(merged.unwrap_err());
    }

    report.merged = true;
    report.rows_merged = snapshot.unwrap().row_count();
    qCInfo(tallySyncLog) << "Merged" << report.rows_merged << "rows from" << blob.revision.c_str();
    return Result<SyncReport, Error>::ok(std::move(report));
}

Result<void, Error> SyncAdapter::merge(const Snapshot& snapshot,
                                       const std::string& revision,
                                       const storage::SyncState& previous) {
    return engine_.transaction([&](storage::Database&) -> Result<void, Error> {
        auto pending = sync_state_.has_pending_changes();
        if (pending.is_err()) {
            return Result<void, Error>::err(pending.unwrap_err());
        }

        auto local = categories_.list();
        if (local.is_err()) {
            return Result<void, Error>::err(local.unwrap_err());
        }
        auto batch = orphaned_children(local.unwrap(), snapshot.categories);
        const bool detached_any = !batch.empty();
        batch.insert(batch.begin(), snapshot.categories.begin(), snapshot.categories.end());

        if (!batch.empty()) {
            auto written = categories_.bulk_upsert(batch);
            if (written.is_err()) return Result<void, Error>::err(written.unwrap_err());
        }
        if (!snapshot.transactions.empty()) {
            auto written = transactions_.bulk_upsert(snapshot.transactions);
            if (written.is_err()) return Result<void, Error>::err(written.unwrap_err());
        }
        if (!snapshot.budgets.empty()) {
            auto written = budgets_.bulk_upsert(snapshot.budgets);
            if (written.is_err()) return Result<void, Error>::err(written.unwrap_err());
        }

        // Rows written by the merge are already on the remote.
        auto counter = sync_state_.change_counter();
        if (counter.is_err()) {
            return Result<void, Error>::err(counter.unwrap_err());
        }
        return sync_state_.save(storage::SyncState{
            .last_revision = revision,
            .last_synced_at = Timestamp::now(),
            .synced_seq = pending.unwrap() || detached_any ? previous.synced_seq : counter.unwrap()
        });
    });
}

Result<bool, Error> SyncAdapter::needs_push() {
    auto pending = sync_state_.has_pending_changes();
    if (pending.is_err() || pending.unwrap()) {
        return pending;
    }

    auto state = sync_state_.load();
    if (state.is_err()) {
        return Result<bool, Error>::err(state.unwrap_err());
    }
    if (state.unwrap() && state.unwrap()->last_revision) {
        return Result<bool, Error>::ok(false);
    }

    // Remote is empty: publish whatever exists locally.
    auto categories = categories_.count();
    if (categories.is_err()) return Result<bool, Error>::err(categories.unwrap_err());
    auto transactions = transactions_.count(true);
    if (transactions.is_err()) return Result<bool, Error>::err(transactions.unwrap_err());
    auto budgets = budgets_.count();
    if (budgets.is_err()) return Result<bool, Error>::err(budgets.unwrap_err());

    return Result<bool, Error>::ok(
        categories.unwrap() + transactions.unwrap() + budgets.unwrap() > 0);
}

Result<SyncReport, Error> SyncAdapter::push_step(BlobStore& store, SyncReport report) {
    if (auto error = abandoned()) {
        return Result<SyncReport, Error>::err(*error);
    }

    auto state = sync_state_.load();
    if (state.is_err()) {
        return Result<SyncReport, Error>::err(state.unwrap_err());
    }
    if (!state.unwrap()) {
        return Result<SyncReport, Error>::err(
            Error{ErrorKind::SyncUnavailable, "pull before push: remote revision is unknown"});
    }
    const auto expected = state.unwrap()->last_revision;

    struct Captured {
        Snapshot snapshot;
        int64_t change_seq = 0;
    };
    auto captured = engine_.read([&](storage::Database&) -> Result<Captured, Error> {
        auto snapshot = collect_snapshot(engine_, categories_, transactions_, budgets_);
        if (snapshot.is_err()) return Result<Captured, Error>::err(snapshot.unwrap_err());
        auto counter = sync_state_.change_counter();
        if (counter.is_err()) return Result<Captured, Error>::err(counter.unwrap_err());
        return Result<Captured, Error>::ok(Captured{
            .snapshot = std::move(snapshot).unwrap(),
            .change_seq = counter.unwrap()
        });
    });
    if (captured.is_err()) {
        return Result<SyncReport, Error>::err(captured.unwrap_err());
    }

    const auto bytes = encode_snapshot(captured.unwrap().snapshot);
    if (auto error = abandoned()) {
        return Result<SyncReport, Error>::err(*error);
    }

    auto revision = store.put(bytes, expected);
    if (revision.is_err()) {
        return Result<SyncReport, Error>::err(revision.unwrap_err());
    }

    // Changes made after the capture stay pending for the next cycle.
    auto saved = sync_state_.save(storage::SyncState{
        .last_revision = revision.unwrap(),
        .last_synced_at = Timestamp::now(),
        .synced_seq = captured.unwrap().change_seq
    });
    if (saved.is_err()) {
        return Result<SyncReport, Error>::err(saved.unwrap_err());
    }

    qCInfo(tallySyncLog) << "Pushed" << captured.unwrap().snapshot.row_count() << "rows as"
                         << revision.unwrap().c_str();
    report.pushed = true;
    report.revision = revision.unwrap();
    return Result<SyncReport, Error>::ok(std::move(report));
}

// ============================================================================
// Background cycles
// ============================================================================

bool SyncAdapter::request_sync() {
    if (!is_attached()) {
        return false;
    }
    if (!in_flight_.testAndSetOrdered(0, 1)) {
        qCDebug(tallySyncLog) << "sync already in flight, request coalesced";
        return false;
    }

    QMutexLocker lock(&worker_mutex_);
    if (worker_) {
        worker_->wait();
    }
    worker_.reset(QThread::create([this] {
        // Failures are recorded in last_error() by run().
        [[maybe_unused]] auto result = run(Operation::Cycle);
        in_flight_.storeRelease(0);
    }));
    worker_->setObjectName(QStringLiteral("tally-sync"));
    worker_->start();
    return true;
}

void SyncAdapter::wait_idle() {
    QMutexLocker lock(&worker_mutex_);
    if (worker_) {
        worker_->wait();
    }
}

void SyncAdapter::shutdown() {
    abandon_.storeRelease(1);
    wait_idle();
    detach();
}

} // namespace tally::sync
