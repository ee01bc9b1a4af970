#include "storage/transaction_repository.hpp"

#include <unordered_set>
#include <variant>

namespace tally::storage {

namespace {

constexpr const char* SELECT_COLUMNS = R"SQL(
    SELECT id, date, amount_cents, category_id, merchant, notes,
           created_at, updated_at, deleted
    FROM transactions
)SQL";

using Param = std::variant<std::string, int64_t>;

Result<void, Error> bind_params(Statement& stmt, const std::vector<Param>& params) {
    int index = 0;
    for (const auto& param : params) {
        ++index;
        auto result = std::visit(
            [&](const auto& value) { return stmt.bind_value(index, value); }, param);
        if (result.is_err()) {
            return result;
        }
    }
    return Result<void, Error>::ok();
}

// LIKE pattern matching the text anywhere, with wildcards in it taken literally.
std::string contains_pattern(const std::string& text) {
    std::string pattern = "%";
    for (char c : text) {
        if (c == '%' || c == '_' || c == '\\') {
            pattern += '\\';
        }
        pattern += c;
    }
    pattern += '%';
    return pattern;
}

} // namespace

Transaction TransactionRepository::row_to_transaction(Statement& stmt) {
    return Transaction{
        .id = stmt.column_text(0),
        .date = CalendarDate::parse(stmt.column_text(1)).value_or(CalendarDate{}),
        .amount_cents = stmt.column_int64(2),
        .category_id = stmt.column_text(3),
        .merchant = stmt.column_optional_text(4),
        .notes = stmt.column_optional_text(5),
        .created_at = Timestamp(stmt.column_int64(6)),
        .updated_at = Timestamp(stmt.column_int64(7)),
        .deleted = stmt.column_int(8) != 0
    };
}

Result<std::optional<Transaction>, Error> TransactionRepository::find(Database& db,
                                                                      const std::string& id) {
    auto stmt_result = db.prepare(std::string(SELECT_COLUMNS) + " WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<Transaction>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(id);
    if (bind_result.is_err()) {
        return Result<std::optional<Transaction>, Error>::err(bind_result.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<Transaction>, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<Transaction>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<Transaction>, Error>::ok(row_to_transaction(stmt));
}

Result<void, Error> TransactionRepository::check_category(Database& db, const Transaction& tx) {
    auto stmt_result = db.prepare("SELECT 1 FROM categories WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(tx.category_id);
    if (bind_result.is_err()) {
        return bind_result;
    }
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<void, Error>::err(Error{ErrorKind::Validation,
            "transaction '" + tx.id + "' references missing category '" + tx.category_id + "'"});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> TransactionRepository::write_row(Database& db, const Transaction& tx) {
    auto check_result = check_category(db, tx);
    if (check_result.is_err()) {
        return check_result;
    }

    auto stmt_result = db.prepare(R"SQL(
        INSERT INTO transactions (id, date, amount_cents, category_id, merchant, notes,
                                  created_at, updated_at, deleted)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            date = excluded.date,
            amount_cents = excluded.amount_cents,
            category_id = excluded.category_id,
            merchant = excluded.merchant,
            notes = excluded.notes,
            created_at = excluded.created_at,
            updated_at = excluded.updated_at,
            deleted = excluded.deleted;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(
        tx.id,
        tx.date.to_string(),
        tx.amount_cents,
        tx.category_id,
        tx.merchant,
        tx.notes,
        tx.created_at.millis(),
        tx.updated_at.millis(),
        tx.deleted);
    if (bind_result.is_err()) {
        return bind_result;
    }
    return stmt.run();
}

Result<Transaction, Error> TransactionRepository::create(Transaction tx) {
    if (tx.id.empty()) {
        tx.id = generate_id();
    }
    if (tx.created_at.is_epoch()) {
        tx.created_at = Timestamp::now();
    }
    if (tx.updated_at.is_epoch()) {
        tx.updated_at = tx.created_at;
    }

    auto valid = validate(tx);
    if (valid.is_err()) {
        return Result<Transaction, Error>::err(valid.unwrap_err());
    }

    return engine_.transaction([&](Database& db) -> Result<Transaction, Error> {
        auto existing = find(db, tx.id);
        if (existing.is_err()) {
            return Result<Transaction, Error>::err(existing.unwrap_err());
        }
        if (existing.unwrap()) {
            return Result<Transaction, Error>::err(Error{ErrorKind::Validation,
                "transaction '" + tx.id + "' already exists"});
        }

        auto write_result = write_row(db, tx);
        if (write_result.is_err()) {
            return Result<Transaction, Error>::err(write_result.unwrap_err());
        }
        return Result<Transaction, Error>::ok(tx);
    });
}

Result<Transaction, Error> TransactionRepository::update(Transaction tx) {
    auto valid = validate(tx);
    if (valid.is_err()) {
        return Result<Transaction, Error>::err(valid.unwrap_err());
    }

    return engine_.transaction([&](Database& db) -> Result<Transaction, Error> {
        auto existing = find(db, tx.id);
        if (existing.is_err()) {
            return Result<Transaction, Error>::err(existing.unwrap_err());
        }
        if (!existing.unwrap()) {
            return Result<Transaction, Error>::err(
                Error{ErrorKind::NotFound, "transaction '" + tx.id + "' not found"});
        }

        tx.created_at = existing.unwrap()->created_at;
        tx.updated_at = Timestamp::now();

        auto write_result = write_row(db, tx);
        if (write_result.is_err()) {
            return Result<Transaction, Error>::err(write_result.unwrap_err());
        }
        return Result<Transaction, Error>::ok(tx);
    });
}

Result<int, Error> TransactionRepository::bulk_upsert(const std::vector<Transaction>& transactions) {
    for (const auto& tx : transactions) {
        auto valid = validate(tx);
        if (valid.is_err()) {
            return Result<int, Error>::err(valid.unwrap_err());
        }
    }

    return engine_.transaction([&](Database& db) -> Result<int, Error> {
        const auto now = Timestamp::now();
        std::unordered_set<std::string> written;

        for (auto tx : transactions) {
            if (tx.created_at.is_epoch()) tx.created_at = now;
            if (tx.updated_at.is_epoch()) tx.updated_at = now;

            auto write_result = write_row(db, tx);
            if (write_result.is_err()) {
                return Result<int, Error>::err(write_result.unwrap_err());
            }
            written.insert(tx.id);
        }
        return Result<int, Error>::ok(static_cast<int>(written.size()));
    });
}

Result<std::optional<Transaction>, Error> TransactionRepository::get(const std::string& id) {
    return engine_.read([&](Database& db) { return find(db, id); });
}

Result<std::vector<Transaction>, Error> TransactionRepository::list(const TransactionFilter& filter) {
    std::string sql = std::string(SELECT_COLUMNS) + " WHERE 1 = 1";
    std::vector<Param> params;

    if (!filter.include_deleted) {
        sql += " AND deleted = 0";
    }
    if (filter.from) {
        sql += " AND date >= ?";
        params.emplace_back(filter.from->to_string());
    }
    if (filter.to) {
        sql += " AND date <= ?";
        params.emplace_back(filter.to->to_string());
    }
    if (filter.query && !filter.query->empty()) {
        sql += " AND (merchant LIKE ? ESCAPE '\\' OR notes LIKE ? ESCAPE '\\')";
        params.emplace_back(contains_pattern(*filter.query));
        params.emplace_back(contains_pattern(*filter.query));
    }
    if (!filter.category_ids.empty()) {
        sql += " AND category_id IN (";
        for (size_t i = 0; i < filter.category_ids.size(); ++i) {
            sql += i == 0 ? "?" : ", ?";
            params.emplace_back(filter.category_ids[i]);
        }
        sql += ")";
    }
    if (filter.min_amount_cents) {
        sql += " AND amount_cents >= ?";
        params.emplace_back(*filter.min_amount_cents);
    }
    if (filter.max_amount_cents) {
        sql += " AND amount_cents <= ?";
        params.emplace_back(*filter.max_amount_cents);
    }
    sql += " ORDER BY date DESC, created_at DESC, id";
    if (filter.limit) {
        sql += " LIMIT ?";
        params.emplace_back(static_cast<int64_t>(*filter.limit));
    }
    sql += ";";

    return engine_.read([&](Database& db) -> Result<std::vector<Transaction>, Error> {
        auto stmt_result = db.prepare(sql);
        if (stmt_result.is_err()) {
            return Result<std::vector<Transaction>, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        auto bind_result = bind_params(stmt, params);
        if (bind_result.is_err()) {
            return Result<std::vector<Transaction>, Error>::err(bind_result.unwrap_err());
        }
        return collect_rows(stmt, row_to_transaction);
    });
}

Result<void, Error> TransactionRepository::remove(const std::string& id) {
    return engine_.transaction([&](Database& db) -> Result<void, Error> {
        auto stmt_result = db.prepare(
            "UPDATE transactions SET deleted = 1, updated_at = ? WHERE id = ? AND deleted = 0;");
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        auto bind_result = stmt.bind_all(Timestamp::now().millis(), id);
        if (bind_result.is_err()) {
            return bind_result;
        }
        auto run_result = stmt.run();
        if (run_result.is_err()) {
            return run_result;
        }
        if (db.changes() == 0) {
            return Result<void, Error>::err(
                Error{ErrorKind::NotFound, "transaction '" + id + "' not found"});
        }
        return Result<void, Error>::ok();
    });
}

Result<void, Error> TransactionRepository::purge(const std::string& id) {
    return engine_.transaction([&](Database& db) -> Result<void, Error> {
        auto stmt_result = db.prepare("DELETE FROM transactions WHERE id = ?;");
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        auto bind_result = stmt.bind_all(id);
        if (bind_result.is_err()) {
            return bind_result;
        }
        auto run_result = stmt.run();
        if (run_result.is_err()) {
            return run_result;
        }
        if (db.changes() == 0) {
            return Result<void, Error>::err(
                Error{ErrorKind::NotFound, "transaction '" + id + "' not found"});
        }
        return Result<void, Error>::ok();
    });
}

Result<int64_t, Error> TransactionRepository::count(bool include_deleted) {
    return engine_.read([&](Database& db) {
        return db.query_int64(include_deleted
            ? "SELECT COUNT(*) FROM transactions;"
            : "SELECT COUNT(*) FROM transactions WHERE deleted = 0;");
    });
}

} // namespace tally::storage
