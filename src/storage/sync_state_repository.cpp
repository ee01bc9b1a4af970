#include "storage/sync_state_repository.hpp"

namespace tally::storage {

Result<std::optional<SyncState>, Error> SyncStateRepository::load() {
    return engine_.read([](Database& db) -> Result<std::optional<SyncState>, Error> {
        auto stmt_result = db.prepare(
            "SELECT last_revision, last_synced_at, synced_seq FROM sync_state WHERE id = 1;");
        if (stmt_result.is_err()) {
            return Result<std::optional<SyncState>, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::optional<SyncState>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) {
            return Result<std::optional<SyncState>, Error>::ok(std::nullopt);
        }

        return Result<std::optional<SyncState>, Error>::ok(SyncState{
            .last_revision = stmt.column_optional_text(0),
            .last_synced_at = Timestamp(stmt.column_int64(1)),
            .synced_seq = stmt.column_int64(2)
        });
    });
}

Result<void, Error> SyncStateRepository::save(const SyncState& state) {
    return engine_.transaction([&](Database& db) -> Result<void, Error> {
        auto stmt_result = db.prepare(R"SQL(
            INSERT INTO sync_state (id, last_revision, last_synced_at, synced_seq)
            VALUES (1, ?, ?, ?)
            ON CONFLICT(id) DO UPDATE SET
                last_revision = excluded.last_revision,
                last_synced_at = excluded.last_synced_at,
                synced_seq = excluded.synced_seq;
        )SQL");
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        auto bind_result = stmt.bind_all(state.last_revision,
                                         state.last_synced_at.millis(),
                                         state.synced_seq);
        if (bind_result.is_err()) {
            return bind_result;
        }
        return stmt.run();
    });
}

Result<int64_t, Error> SyncStateRepository::change_counter() {
    return engine_.read([](Database& db) {
        return db.query_int64("SELECT seq FROM change_counter WHERE id = 1;");
    });
}

Result<bool, Error> SyncStateRepository::has_pending_changes() {
    return engine_.read([this](Database&) -> Result<bool, Error> {
        auto counter_result = change_counter();
        if (counter_result.is_err()) {
            return Result<bool, Error>::err(counter_result.unwrap_err());
        }
        auto state_result = load();
        if (state_result.is_err()) {
            return Result<bool, Error>::err(state_result.unwrap_err());
        }

        const auto synced = state_result.unwrap() ? state_result.unwrap()->synced_seq : 0;
        return Result<bool, Error>::ok(counter_result.unwrap() > synced);
    });
}

} // namespace tally::storage
