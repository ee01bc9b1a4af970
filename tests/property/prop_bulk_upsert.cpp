#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "storage/migrations.hpp"
#include "storage/budget_repository.hpp"
#include "storage/category_repository.hpp"
#include "storage/transaction_repository.hpp"
#include <algorithm>
#include <map>
#include <string>
#include <utility>
#include <vector>

using namespace tally;
using namespace tally::storage;

namespace {

struct Store {
    StorageEngine engine{":memory:"};
    CategoryRepository categories{engine};
    TransactionRepository transactions{engine};
    BudgetRepository budgets{engine};

    Store() {
        static_cast<void>(engine.open().unwrap());
        static_cast<void>(engine.migrate(default_registry()).unwrap());
        static_cast<void>(categories.create(
            create_category("Food", CategoryKind::Expense, std::nullopt, "food")).unwrap());
        static_cast<void>(transactions.create(create_transaction(
            *CalendarDate::parse("2024-01-15"), 1, "food", std::nullopt, std::nullopt, "t0")).unwrap());
    }
};

} // namespace

namespace rc {

// Ids come from a small pool so batches repeat and overwrite rows; roughly
// one row in eight points at a category that does not exist.
template<>
struct Arbitrary<Transaction> {
    static Gen<Transaction> arbitrary() {
        return gen::apply(
            [](int id, int day, int64_t cents, bool dangling) {
                auto tx = create_transaction(*CalendarDate::from_ymd(2024, 2, day), cents,
                                             dangling ? "missing" : "food",
                                             std::nullopt, std::nullopt, "t" + std::to_string(id));
                return tx;
            },
            gen::inRange(0, 10),
            gen::inRange(1, 29),
            gen::inRange<int64_t>(-100000, 100000),
            gen::map(gen::inRange(0, 8), [](int n) { return n == 0; }));
    }
};

} // namespace rc

TEST_CASE("Property: transaction bulk upsert is all or nothing", "[property][bulk]") {
    rc::check("a batch lands whole or leaves the store untouched",
        [](const std::vector<Transaction>& batch) {
            Store store;
            const auto before = store.transactions.list(TransactionFilter{.include_deleted = true}).unwrap();

            auto written = store.transactions.bulk_upsert(batch);
            const auto after = store.transactions.list(TransactionFilter{.include_deleted = true}).unwrap();

            const bool dangling = std::any_of(batch.begin(), batch.end(),
                [](const Transaction& tx) { return tx.category_id == "missing"; });
            if (dangling) {
                RC_ASSERT(written.is_err());
                RC_ASSERT(written.unwrap_err().kind == ErrorKind::Validation);
                RC_ASSERT(after == before);
                return;
            }

            std::map<std::string, Transaction> last;
            for (const auto& tx : batch) {
                last[tx.id] = tx;
            }
            RC_ASSERT(written.is_ok());
            RC_ASSERT(written.unwrap() == static_cast<int>(last.size()));
            for (const auto& [id, tx] : last) {
                auto stored = store.transactions.get(id).unwrap();
                RC_ASSERT(stored.has_value());
                RC_ASSERT(stored->amount_cents == tx.amount_cents);
                RC_ASSERT(stored->date == tx.date);
            }
        }
    );
}

TEST_CASE("Property: budget bulk upsert is all or nothing", "[property][bulk]") {
    rc::check("one negative amount rejects the whole batch",
        [](const std::vector<std::pair<int, int64_t>>& entries) {
            Store store;
            std::vector<Budget> batch;
            for (const auto& [month, cents] : entries) {
                const auto m = static_cast<unsigned>(month) % 12 + 1;
                const auto text = "2024-" + std::string(m < 10 ? "0" : "") + std::to_string(m);
                batch.push_back(create_budget(*YearMonth::parse(text), cents % 1000000));
            }

            auto written = store.budgets.bulk_upsert(batch);
            const bool negative = std::any_of(batch.begin(), batch.end(),
                [](const Budget& b) { return b.budget_cents < 0; });

            if (negative) {
                RC_ASSERT(written.is_err());
                RC_ASSERT(store.budgets.count().unwrap() == 0);
            } else {
                RC_ASSERT(written.is_ok());
                RC_ASSERT(store.budgets.count().unwrap() == written.unwrap());
            }
        }
    );
}
