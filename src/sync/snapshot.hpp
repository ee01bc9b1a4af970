#pragma once

#include "core/budget.hpp"
#include "core/category.hpp"
#include "core/result.hpp"
#include "core/transaction.hpp"
#include "storage/budget_repository.hpp"
#include "storage/category_repository.hpp"
#include "storage/transaction_repository.hpp"
#include <QByteArray>
#include <vector>

namespace tally::sync {

inline constexpr auto SNAPSHOT_FORMAT = "tally-snapshot";
inline constexpr int SNAPSHOT_VERSION = 1;

/**
 * Snapshot - The full entity set of one device, tombstones included.
 *
 * The same document serves as the sync payload and as an export/backup
 * file that JsonBackupSource reads back.
 */
struct Snapshot {
    int schema_version = 0;
    Timestamp exported_at;
    std::vector<Category> categories;
    std::vector<Transaction> transactions;
    std::vector<Budget> budgets;

    [[nodiscard]] size_t row_count() const noexcept {
        return categories.size() + transactions.size() + budgets.size();
    }

    [[nodiscard]] bool empty() const noexcept { return row_count() == 0; }
};

/**
 * Read every entity under one read scope, so the result is consistent.
 */
[[nodiscard]] Result<Snapshot, Error> collect_snapshot(storage::StorageEngine& engine,
                                                       storage::CategoryRepository& categories,
                                                       storage::TransactionRepository& transactions,
                                                       storage::BudgetRepository& budgets);

[[nodiscard]] QByteArray encode_snapshot(const Snapshot& snapshot);

/**
 * Parse a snapshot document. Rows are mapped with the import coercions;
 * the first bad row fails the whole decode.
 */
[[nodiscard]] Result<Snapshot, Error> decode_snapshot(const QByteArray& bytes);

} // namespace tally::sync
