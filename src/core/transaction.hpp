#pragma once

#include "core/types.hpp"
#include "core/result.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace tally {

/**
 * Transaction - A dated, signed money movement filed under a category.
 *
 * Negative amounts are expenses. Deletion is a tombstone (deleted = true)
 * so that the removal reaches other devices through sync.
 */
struct Transaction {
    std::string id;
    CalendarDate date;
    int64_t amount_cents = 0;
    std::string category_id;
    std::optional<std::string> merchant;
    std::optional<std::string> notes;
    Timestamp created_at;
    Timestamp updated_at;
    bool deleted = false;

    bool operator==(const Transaction&) const = default;
};

/**
 * Filter for listing transactions. Empty fields do not constrain.
 */
struct TransactionFilter {
    std::optional<CalendarDate> from;
    std::optional<CalendarDate> to;
    std::optional<std::string> query;        // substring of merchant or notes
    std::vector<std::string> category_ids;
    std::optional<int64_t> min_amount_cents;
    std::optional<int64_t> max_amount_cents;
    bool include_deleted = false;
    std::optional<int> limit;
};

// ============================================================================
// Pure transformation functions
// ============================================================================

[[nodiscard]] inline Transaction create_transaction(
    CalendarDate date,
    int64_t amount_cents,
    std::string category_id,
    std::optional<std::string> merchant = std::nullopt,
    std::optional<std::string> notes = std::nullopt,
    std::string id = {}
) {
    auto now = Timestamp::now();
    return Transaction{
        .id = id.empty() ? generate_id() : std::move(id),
        .date = date,
        .amount_cents = amount_cents,
        .category_id = std::move(category_id),
        .merchant = std::move(merchant),
        .notes = std::move(notes),
        .created_at = now,
        .updated_at = now,
        .deleted = false
    };
}

[[nodiscard]] inline Transaction with_amount(Transaction tx, int64_t amount_cents) {
    tx.amount_cents = amount_cents;
    tx.updated_at = Timestamp::now();
    return tx;
}

[[nodiscard]] inline Transaction with_category(Transaction tx, std::string category_id) {
    tx.category_id = std::move(category_id);
    tx.updated_at = Timestamp::now();
    return tx;
}

[[nodiscard]] inline Transaction as_deleted(Transaction tx) {
    tx.deleted = true;
    tx.updated_at = Timestamp::now();
    return tx;
}

[[nodiscard]] inline Result<void, Error> validate(const Transaction& tx) {
    if (tx.id.empty()) {
        return Result<void, Error>::err(Error{ErrorKind::Validation, "transaction id is empty"});
    }
    if (!tx.date.is_valid()) {
        return Result<void, Error>::err(
            Error{ErrorKind::Validation, "transaction '" + tx.id + "' has no valid date"});
    }
    if (tx.category_id.empty()) {
        return Result<void, Error>::err(
            Error{ErrorKind::Validation, "transaction '" + tx.id + "' has no category"});
    }
    return Result<void, Error>::ok();
}

/**
 * Sum of amounts over live (non-deleted) transactions.
 */
[[nodiscard]] inline int64_t total_cents(const std::vector<Transaction>& transactions) {
    int64_t total = 0;
    for (const auto& tx : transactions) {
        if (!tx.deleted) total += tx.amount_cents;
    }
    return total;
}

} // namespace tally
