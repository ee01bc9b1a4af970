#pragma once

#include "storage/storage_engine.hpp"
#include "core/transaction.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tally::storage {

/**
 * TransactionRepository - Data access layer for transactions.
 */
class TransactionRepository {
public:
    explicit TransactionRepository(StorageEngine& engine) : engine_(engine) {}

    /**
     * Insert a new transaction. An empty id is replaced by a generated one.
     */
    [[nodiscard]] Result<Transaction, Error> create(Transaction tx);

    /**
     * Overwrite an existing transaction. NotFound if the id is unknown.
     */
    [[nodiscard]] Result<Transaction, Error> update(Transaction tx);

    /**
     * Insert-or-overwrite a batch atomically. Every category_id must exist.
     * Returns the number of distinct rows written.
     */
    [[nodiscard]] Result<int, Error> bulk_upsert(const std::vector<Transaction>& transactions);

    /**
     * Get by id, including tombstones.
     */
    [[nodiscard]] Result<std::optional<Transaction>, Error> get(const std::string& id);

    /**
     * List newest first.
     */
    [[nodiscard]] Result<std::vector<Transaction>, Error> list(const TransactionFilter& filter = {});

    /**
     * Soft delete: the row stays as a tombstone so sync can carry the removal.
     */
    [[nodiscard]] Result<void, Error> remove(const std::string& id);

    /**
     * Hard delete.
     */
    [[nodiscard]] Result<void, Error> purge(const std::string& id);

    [[nodiscard]] Result<int64_t, Error> count(bool include_deleted = false);

private:
    StorageEngine& engine_;

    [[nodiscard]] static Transaction row_to_transaction(Statement& stmt);
    [[nodiscard]] static Result<void, Error> write_row(Database& db, const Transaction& tx);
    [[nodiscard]] static Result<std::optional<Transaction>, Error> find(Database& db, const std::string& id);
    [[nodiscard]] static Result<void, Error> check_category(Database& db, const Transaction& tx);
};

} // namespace tally::storage
