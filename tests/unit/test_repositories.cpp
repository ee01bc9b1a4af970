#include <catch2/catch_test_macros.hpp>
#include "storage/budget_repository.hpp"
#include "storage/category_repository.hpp"
#include "storage/migrations.hpp"
#include "storage/storage_engine.hpp"
#include "storage/sync_state_repository.hpp"
#include "storage/transaction_repository.hpp"

using namespace tally;
using namespace tally::storage;

namespace {

CalendarDate date(const char* text) {
    return *CalendarDate::parse(text);
}

YearMonth month(const char* text) {
    return *YearMonth::parse(text);
}

struct Store {
    StorageEngine engine{":memory:"};
    CategoryRepository categories{engine};
    TransactionRepository transactions{engine};
    BudgetRepository budgets{engine};
    SyncStateRepository sync_state{engine};

    Store() {
        static_cast<void>(engine.open().unwrap());
        static_cast<void>(engine.migrate(default_registry()).unwrap());
    }
};

} // namespace

TEST_CASE("CategoryRepository CRUD", "[repository][category]") {
    Store store;

    SECTION("create then get") {
        auto created = store.categories.create(
            create_category("Food", CategoryKind::Expense, std::nullopt, "food"));
        REQUIRE(created.is_ok());

        auto fetched = store.categories.get("food").unwrap();
        REQUIRE(fetched.has_value());
        REQUIRE(fetched->name == "Food");
        REQUIRE(fetched->kind == CategoryKind::Expense);
        REQUIRE(fetched->active);
        REQUIRE(*fetched == created.unwrap());
    }

    SECTION("create generates an id and timestamps") {
        Category bare{.id = {}, .name = "Misc"};
        auto created = store.categories.create(bare).unwrap();
        REQUIRE(created.id.size() == 36);
        REQUIRE_FALSE(created.created_at.is_epoch());
        REQUIRE(created.updated_at == created.created_at);
    }

    SECTION("create rejects an existing id") {
        REQUIRE(store.categories.create(
            create_category("Food", CategoryKind::Expense, std::nullopt, "food")).is_ok());
        auto again = store.categories.create(
            create_category("Food 2", CategoryKind::Expense, std::nullopt, "food"));
        REQUIRE(again.unwrap_err().kind == ErrorKind::Validation);
    }

    SECTION("get of an unknown id is empty") {
        REQUIRE_FALSE(store.categories.get("missing").unwrap().has_value());
    }

    SECTION("update keeps created_at") {
        auto created = store.categories.create(
            create_category("Food", CategoryKind::Expense, std::nullopt, "food")).unwrap();
        auto updated = store.categories.update(with_active(with_name(created, "Groceries"), false));
        REQUIRE(updated.is_ok());

        auto fetched = *store.categories.get("food").unwrap();
        REQUIRE(fetched.name == "Groceries");
        REQUIRE_FALSE(fetched.active);
        REQUIRE(fetched.created_at == created.created_at);
    }

    SECTION("update of an unknown id is NotFound") {
        auto result = store.categories.update(
            create_category("Ghost", CategoryKind::Expense, std::nullopt, "ghost"));
        REQUIRE(result.unwrap_err().kind == ErrorKind::NotFound);
    }

    SECTION("list filters by kind and activity") {
        REQUIRE(store.categories.create(create_category("Salary", CategoryKind::Income, std::nullopt, "salary")).is_ok());
        REQUIRE(store.categories.create(create_category("Food", CategoryKind::Expense, std::nullopt, "food")).is_ok());
        auto old = store.categories.create(create_category("Old", CategoryKind::Expense, std::nullopt, "old")).unwrap();
        REQUIRE(store.categories.update(with_active(old, false)).is_ok());

        REQUIRE(store.categories.list().unwrap().size() == 3);
        REQUIRE(store.categories.list({.kind = CategoryKind::Income}).unwrap().size() == 1);

        auto active_expenses = store.categories.list({.kind = CategoryKind::Expense, .active_only = true}).unwrap();
        REQUIRE(active_expenses.size() == 1);
        REQUIRE(active_expenses[0].id == "food");
        REQUIRE(store.categories.count().unwrap() == 3);
    }
}

TEST_CASE("CategoryRepository hierarchy rules", "[repository][category]") {
    Store store;
    REQUIRE(store.categories.create(create_category("Food", CategoryKind::Expense, std::nullopt, "food")).is_ok());
    REQUIRE(store.categories.create(create_category("Salary", CategoryKind::Income, std::nullopt, "salary")).is_ok());

    SECTION("A child under an existing parent of the same kind") {
        REQUIRE(store.categories.create(
            create_category("Groceries", CategoryKind::Expense, "food", "groceries")).is_ok());
        auto children = store.categories.children("food").unwrap();
        REQUIRE(children.size() == 1);
        REQUIRE(children[0].id == "groceries");
    }

    SECTION("Missing parent is rejected and nothing is written") {
        auto result = store.categories.create(
            create_category("Orphan", CategoryKind::Expense, "nope", "orphan"));
        REQUIRE(result.unwrap_err().kind == ErrorKind::Validation);
        REQUIRE_FALSE(store.categories.get("orphan").unwrap().has_value());
    }

    SECTION("Parent of another kind is rejected") {
        auto result = store.categories.create(
            create_category("Bonus", CategoryKind::Expense, "salary", "bonus"));
        REQUIRE(result.unwrap_err().kind == ErrorKind::Validation);
    }

    SECTION("Only one level of nesting") {
        REQUIRE(store.categories.create(
            create_category("Groceries", CategoryKind::Expense, "food", "groceries")).is_ok());
        auto grandchild = store.categories.create(
            create_category("Fruit", CategoryKind::Expense, "groceries", "fruit"));
        REQUIRE(grandchild.unwrap_err().kind == ErrorKind::Validation);

        // A parent with children cannot itself be nested.
        REQUIRE(store.categories.create(
            create_category("Living", CategoryKind::Expense, std::nullopt, "living")).is_ok());
        auto food = *store.categories.get("food").unwrap();
        auto nested = store.categories.update(with_parent(food, "living"));
        REQUIRE(nested.unwrap_err().kind == ErrorKind::Validation);
    }

    SECTION("A category cannot be its own parent") {
        auto food = *store.categories.get("food").unwrap();
        REQUIRE(store.categories.update(with_parent(food, "food")).is_err());
    }

    SECTION("bulk_upsert accepts a child listed before its parent") {
        auto written = store.categories.bulk_upsert({
            create_category("Cafe", CategoryKind::Expense, "fun", "cafe"),
            create_category("Fun", CategoryKind::Expense, std::nullopt, "fun"),
        });
        REQUIRE(written.unwrap() == 2);
        REQUIRE(store.categories.children("fun").unwrap().size() == 1);
    }

    SECTION("bulk_upsert is all or nothing") {
        auto written = store.categories.bulk_upsert({
            create_category("Fun", CategoryKind::Expense, std::nullopt, "fun"),
            create_category("Bad", CategoryKind::Expense, "missing", "bad"),
        });
        REQUIRE(written.is_err());
        REQUIRE_FALSE(store.categories.get("fun").unwrap().has_value());
        REQUIRE(store.categories.count().unwrap() == 2);
    }

    SECTION("bulk_upsert overwrites and counts distinct ids") {
        auto food = *store.categories.get("food").unwrap();
        auto written = store.categories.bulk_upsert({
            with_name(food, "Food & Drink"),
            with_name(food, "Eating"),
        });
        REQUIRE(written.unwrap() == 1);
        REQUIRE(store.categories.get("food").unwrap()->name == "Eating");
    }
}

TEST_CASE("CategoryRepository deletion", "[repository][category]") {
    Store store;
    REQUIRE(store.categories.create(create_category("Food", CategoryKind::Expense, std::nullopt, "food")).is_ok());
    REQUIRE(store.categories.create(create_category("Bills", CategoryKind::Expense, std::nullopt, "bills")).is_ok());

    SECTION("Unreferenced category is removed") {
        REQUIRE(store.categories.remove("bills").is_ok());
        REQUIRE_FALSE(store.categories.get("bills").unwrap().has_value());
    }

    SECTION("Removing an unknown category is NotFound") {
        REQUIRE(store.categories.remove("ghost").unwrap_err().kind == ErrorKind::NotFound);
    }

    SECTION("A category with live transactions is kept") {
        REQUIRE(store.transactions.create(
            create_transaction(date("2024-03-01"), -500, "food")).is_ok());
        auto result = store.categories.remove("food");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::Validation);
        REQUIRE(store.categories.get("food").unwrap().has_value());
    }

    SECTION("A category with budgets or children is kept") {
        REQUIRE(store.budgets.upsert(create_budget(month("2024-03"), 1000, "bills")).is_ok());
        REQUIRE(store.categories.remove("bills").is_err());

        REQUIRE(store.categories.create(
            create_category("Groceries", CategoryKind::Expense, "food", "groceries")).is_ok());
        REQUIRE(store.categories.remove("food").is_err());
    }

    SECTION("Tombstoned transactions are purged with their category") {
        auto tx = store.transactions.create(
            create_transaction(date("2024-03-01"), -500, "food")).unwrap();
        REQUIRE(store.transactions.remove(tx.id).is_ok());

        REQUIRE(store.categories.remove("food").is_ok());
        REQUIRE_FALSE(store.transactions.get(tx.id).unwrap().has_value());
    }

    SECTION("Tombstones not yet synced keep their category") {
        auto tx = store.transactions.create(
            create_transaction(date("2024-03-01"), -500, "food")).unwrap();
        auto mark_synced = [&] {
            REQUIRE(store.sync_state.save(SyncState{
                .last_revision = "r1",
                .last_synced_at = Timestamp::now(),
                .synced_seq = store.sync_state.change_counter().unwrap()
            }).is_ok());
        };
        mark_synced();
        REQUIRE(store.transactions.remove(tx.id).is_ok());

        auto refused = store.categories.remove("food");
        REQUIRE(refused.is_err());
        REQUIRE(refused.unwrap_err().kind == ErrorKind::Validation);
        REQUIRE(refused.unwrap_err().message ==
                "category 'food' has 1 deleted transaction(s) not yet synced");
        REQUIRE(store.transactions.get(tx.id).unwrap()->deleted);

        mark_synced();
        REQUIRE(store.categories.remove("food").is_ok());
        REQUIRE_FALSE(store.transactions.get(tx.id).unwrap().has_value());
    }

    SECTION("reassign_and_remove moves everything to the target") {
        REQUIRE(store.categories.create(
            create_category("Groceries", CategoryKind::Expense, "food", "groceries")).is_ok());
        auto tx = store.transactions.create(
            create_transaction(date("2024-03-01"), -500, "food")).unwrap();
        REQUIRE(store.budgets.upsert(create_budget(month("2024-03"), 1000, "food")).is_ok());
        REQUIRE(store.budgets.upsert(create_budget(month("2024-04"), 700, "food")).is_ok());
        REQUIRE(store.budgets.upsert(create_budget(month("2024-03"), 250, "bills")).is_ok());

        REQUIRE(store.categories.reassign_and_remove("food", "bills").is_ok());

        REQUIRE_FALSE(store.categories.get("food").unwrap().has_value());
        REQUIRE(store.transactions.get(tx.id).unwrap()->category_id == "bills");
        REQUIRE(store.budgets.get(month("2024-03"), "bills").unwrap()->budget_cents == 1250);
        REQUIRE(store.budgets.get(month("2024-04"), "bills").unwrap()->budget_cents == 700);
        REQUIRE_FALSE(store.budgets.get(month("2024-03"), "food").unwrap().has_value());
        REQUIRE_FALSE(store.categories.get("groceries").unwrap()->parent_id.has_value());
    }

    SECTION("reassign_and_remove needs two distinct existing categories") {
        REQUIRE(store.categories.reassign_and_remove("food", "food").unwrap_err().kind ==
                ErrorKind::Validation);
        REQUIRE(store.categories.reassign_and_remove("food", "ghost").unwrap_err().kind ==
                ErrorKind::NotFound);
        REQUIRE(store.categories.get("food").unwrap().has_value());
    }
}

TEST_CASE("TransactionRepository", "[repository][transaction]") {
    Store store;
    REQUIRE(store.categories.create(create_category("Food", CategoryKind::Expense, std::nullopt, "food")).is_ok());
    REQUIRE(store.categories.create(create_category("Salary", CategoryKind::Income, std::nullopt, "salary")).is_ok());

    SECTION("create then get") {
        auto tx = store.transactions.create(
            create_transaction(date("2024-03-01"), -1250, "food", "Bakery", "croissants")).unwrap();
        auto fetched = *store.transactions.get(tx.id).unwrap();
        REQUIRE(fetched == tx);
    }

    SECTION("Unknown category is rejected") {
        auto result = store.transactions.create(create_transaction(date("2024-03-01"), -1, "nope"));
        REQUIRE(result.unwrap_err().kind == ErrorKind::Validation);
        REQUIRE(store.transactions.count().unwrap() == 0);
    }

    SECTION("update changes fields, NotFound for unknown ids") {
        auto tx = store.transactions.create(
            create_transaction(date("2024-03-01"), -100, "food")).unwrap();
        REQUIRE(store.transactions.update(with_amount(tx, -300)).is_ok());
        REQUIRE(store.transactions.get(tx.id).unwrap()->amount_cents == -300);

        auto ghost = create_transaction(date("2024-03-01"), -1, "food");
        REQUIRE(store.transactions.update(ghost).unwrap_err().kind == ErrorKind::NotFound);
    }

    SECTION("remove leaves a tombstone") {
        auto tx = store.transactions.create(
            create_transaction(date("2024-03-01"), -100, "food")).unwrap();
        REQUIRE(store.transactions.remove(tx.id).is_ok());

        REQUIRE(store.transactions.get(tx.id).unwrap()->deleted);
        REQUIRE(store.transactions.list().unwrap().empty());
        REQUIRE(store.transactions.list({.include_deleted = true}).unwrap().size() == 1);
        REQUIRE(store.transactions.count().unwrap() == 0);
        REQUIRE(store.transactions.count(true).unwrap() == 1);

        REQUIRE(store.transactions.remove(tx.id).unwrap_err().kind == ErrorKind::NotFound);
    }

    SECTION("purge deletes for good") {
        auto tx = store.transactions.create(
            create_transaction(date("2024-03-01"), -100, "food")).unwrap();
        REQUIRE(store.transactions.purge(tx.id).is_ok());
        REQUIRE_FALSE(store.transactions.get(tx.id).unwrap().has_value());
        REQUIRE(store.transactions.purge(tx.id).unwrap_err().kind == ErrorKind::NotFound);
    }

    SECTION("list filters and orders newest first") {
        REQUIRE(store.transactions.bulk_upsert({
            create_transaction(date("2024-01-15"), -2000, "food", "Market", std::nullopt, "t1"),
            create_transaction(date("2024-02-01"), 300000, "salary", "Acme", "January pay", "t2"),
            create_transaction(date("2024-02-20"), -450, "food", "Cafe 50%", std::nullopt, "t3"),
            create_transaction(date("2024-03-05"), -9900, "food", std::nullopt, "market run", "t4"),
        }).unwrap() == 4);

        auto all = store.transactions.list().unwrap();
        REQUIRE(all.size() == 4);
        REQUIRE(all.front().id == "t4");
        REQUIRE(all.back().id == "t1");

        auto february = store.transactions.list({.from = date("2024-02-01"), .to = date("2024-02-29")}).unwrap();
        REQUIRE(february.size() == 2);

        auto market = store.transactions.list({.query = "market"}).unwrap();
        REQUIRE(market.size() == 2);

        auto percent = store.transactions.list({.query = "50%"}).unwrap();
        REQUIRE(percent.size() == 1);
        REQUIRE(percent[0].id == "t3");

        auto income = store.transactions.list({.category_ids = {"salary"}}).unwrap();
        REQUIRE(income.size() == 1);

        auto big_spend = store.transactions.list({.max_amount_cents = -1000}).unwrap();
        REQUIRE(big_spend.size() == 2);

        auto small = store.transactions.list({.min_amount_cents = -1000, .max_amount_cents = 0}).unwrap();
        REQUIRE(small.size() == 1);

        auto latest = store.transactions.list({.limit = 1}).unwrap();
        REQUIRE(latest.size() == 1);
        REQUIRE(latest[0].id == "t4");
    }

    SECTION("bulk_upsert is all or nothing") {
        auto result = store.transactions.bulk_upsert({
            create_transaction(date("2024-01-15"), -2000, "food"),
            create_transaction(date("2024-01-16"), -100, "missing"),
        });
        REQUIRE(result.is_err());
        REQUIRE(store.transactions.count(true).unwrap() == 0);
    }

    SECTION("bulk_upsert keeps supplied timestamps") {
        auto tx = create_transaction(date("2024-01-15"), -2000, "food", std::nullopt, std::nullopt, "fixed");
        tx.created_at = Timestamp(1000);
        tx.updated_at = Timestamp(2000);
        REQUIRE(store.transactions.bulk_upsert({tx}).is_ok());

        auto fetched = *store.transactions.get("fixed").unwrap();
        REQUIRE(fetched.created_at == Timestamp(1000));
        REQUIRE(fetched.updated_at == Timestamp(2000));
    }
}

TEST_CASE("BudgetRepository", "[repository][budget]") {
    Store store;
    REQUIRE(store.categories.create(create_category("Food", CategoryKind::Expense, std::nullopt, "food")).is_ok());

    SECTION("upsert replaces the amount for the same key") {
        REQUIRE(store.budgets.upsert(create_budget(month("2024-03"), 1000, "food")).is_ok());
        REQUIRE(store.budgets.upsert(create_budget(month("2024-03"), 1500, "food")).is_ok());
        REQUIRE(store.budgets.count().unwrap() == 1);
        REQUIRE(store.budgets.get(month("2024-03"), "food").unwrap()->budget_cents == 1500);
    }

    SECTION("Overall and category budgets are separate keys") {
        REQUIRE(store.budgets.upsert(create_budget(month("2024-03"), 200000)).is_ok());
        REQUIRE(store.budgets.upsert(create_budget(month("2024-03"), 40000, "food")).is_ok());

        auto march = store.budgets.list_for_month(month("2024-03")).unwrap();
        REQUIRE(march.size() == 2);
        REQUIRE(march[0].is_overall());
        REQUIRE(march[1].category_id == "food");
        REQUIRE(store.budgets.list_for_month(month("2024-04")).unwrap().empty());
    }

    SECTION("Duplicate keys in a batch count once, last value wins") {
        auto written = store.budgets.bulk_upsert({
            create_budget(month("2024-03"), 100, "food"),
            create_budget(month("2024-03"), 200, "food"),
            create_budget(month("2024-04"), 300, "food"),
        });
        REQUIRE(written.unwrap() == 2);
        REQUIRE(store.budgets.count().unwrap() == 2);
        REQUIRE(store.budgets.get(month("2024-03"), "food").unwrap()->budget_cents == 200);
    }

    SECTION("Unknown category and negative amounts are rejected") {
        REQUIRE(store.budgets.upsert(create_budget(month("2024-03"), 100, "nope")).unwrap_err().kind ==
                ErrorKind::Validation);
        REQUIRE(store.budgets.upsert(create_budget(month("2024-03"), -100, "food")).unwrap_err().kind ==
                ErrorKind::Validation);
        REQUIRE(store.budgets.count().unwrap() == 0);
    }

    SECTION("remove deletes one key, NotFound when absent") {
        REQUIRE(store.budgets.upsert(create_budget(month("2024-03"), 100, "food")).is_ok());
        REQUIRE(store.budgets.remove(month("2024-03"), "food").is_ok());
        REQUIRE(store.budgets.remove(month("2024-03"), "food").unwrap_err().kind == ErrorKind::NotFound);
    }

    SECTION("list orders by month then category") {
        REQUIRE(store.budgets.bulk_upsert({
            create_budget(month("2024-04"), 1),
            create_budget(month("2024-03"), 2, "food"),
            create_budget(month("2024-03"), 3),
        }).is_ok());
        auto all = store.budgets.list().unwrap();
        REQUIRE(all.size() == 3);
        REQUIRE(budget_key(all[0]) == "2024-03/");
        REQUIRE(budget_key(all[1]) == "2024-03/food");
        REQUIRE(budget_key(all[2]) == "2024-04/");
    }
}

TEST_CASE("SyncStateRepository", "[repository][sync_state]") {
    Store store;

    SECTION("No state until saved") {
        REQUIRE_FALSE(store.sync_state.load().unwrap().has_value());
    }

    SECTION("save then load") {
        SyncState state{.last_revision = "r7", .last_synced_at = Timestamp(42), .synced_seq = 3};
        REQUIRE(store.sync_state.save(state).is_ok());
        REQUIRE(store.sync_state.load().unwrap() == state);

        state.last_revision.reset();
        REQUIRE(store.sync_state.save(state).is_ok());
        REQUIRE_FALSE(store.sync_state.load().unwrap()->last_revision.has_value());
    }

    SECTION("Entity writes make changes pending until recorded") {
        REQUIRE_FALSE(store.sync_state.has_pending_changes().unwrap());

        REQUIRE(store.categories.create(create_category("Food", CategoryKind::Expense)).is_ok());
        REQUIRE(store.sync_state.has_pending_changes().unwrap());

        const auto counter = store.sync_state.change_counter().unwrap();
        REQUIRE(store.sync_state.save({.last_revision = "r1", .synced_seq = counter}).is_ok());
        REQUIRE_FALSE(store.sync_state.has_pending_changes().unwrap());

        REQUIRE(store.budgets.upsert(create_budget(month("2024-03"), 5)).is_ok());
        REQUIRE(store.sync_state.has_pending_changes().unwrap());
        REQUIRE(store.sync_state.change_counter().unwrap() == counter + 1);
    }
}
