#pragma once

#include "storage/storage_engine.hpp"
#include "core/types.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>

namespace tally::storage {

/**
 * SyncState - What this device last saw of the remote snapshot.
 */
struct SyncState {
    std::optional<std::string> last_revision;  // absent when the remote was empty
    Timestamp last_synced_at;
    int64_t synced_seq = 0;                    // change counter at the last push

    bool operator==(const SyncState&) const = default;
};

/**
 * SyncStateRepository - The single sync bookkeeping row and the change counter.
 */
class SyncStateRepository {
public:
    explicit SyncStateRepository(StorageEngine& engine) : engine_(engine) {}

    /**
     * nullopt until the first successful pull.
     */
    [[nodiscard]] Result<std::optional<SyncState>, Error> load();

    [[nodiscard]] Result<void, Error> save(const SyncState& state);

    /**
     * Monotonic count of entity-table writes.
     */
    [[nodiscard]] Result<int64_t, Error> change_counter();

    /**
     * True when entity tables changed since the last push (or were never pushed).
     */
    [[nodiscard]] Result<bool, Error> has_pending_changes();

private:
    StorageEngine& engine_;
};

} // namespace tally::storage
