#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "import/bulk_importer.hpp"
#include "storage/migrations.hpp"
#include <string>
#include <vector>

using namespace tally;
using namespace tally::importer;
using namespace tally::storage;

namespace {

struct Store {
    StorageEngine engine{":memory:"};
    CategoryRepository categories{engine};
    TransactionRepository transactions{engine};
    BudgetRepository budgets{engine};
    BulkImporter importer{categories, transactions, budgets};

    Store() {
        static_cast<void>(engine.open().unwrap());
        static_cast<void>(engine.migrate(default_registry()).unwrap());
    }
};

struct Counts {
    int64_t categories = 0;
    int64_t transactions = 0;
    int64_t budgets = 0;

    bool operator==(const Counts&) const = default;
};

Counts counts(Store& store) {
    return Counts{
        .categories = store.categories.count().unwrap(),
        .transactions = store.transactions.count(true).unwrap(),
        .budgets = store.budgets.count().unwrap()
    };
}

/**
 * A spreadsheet-like source: flat categories, transactions spread over
 * them and monthly budgets, with cells typed the loose way a sheet would
 * hand them over.
 */
rc::Gen<MemorySource> source_gen() {
    return rc::gen::mapcat(rc::gen::inRange(1, 6), [](int category_count) {
        auto category_rows = rc::gen::just(category_count);

        auto transaction_rows = rc::gen::container<Rows>(rc::gen::apply(
            [category_count](int id, int category, int64_t cents, bool serial_date) {
                return Row{
                    {"id", "t" + std::to_string(id)},
                    {"date", serial_date ? FieldValue(int64_t{45352})
                                         : FieldValue(std::string("2024-03-01"))},
                    {"amount_cents", serial_date ? FieldValue(std::to_string(cents)) : FieldValue(cents)},
                    {"category_id", "c" + std::to_string(category % category_count)},
                };
            },
            rc::gen::inRange(0, 20),
            rc::gen::inRange(0, 100),
            rc::gen::inRange<int64_t>(-500000, 500000),
            rc::gen::arbitrary<bool>()));

        auto budget_rows = rc::gen::container<Rows>(rc::gen::apply(
            [category_count](int month, int category, int64_t cents) {
                return Row{
                    {"month", "2024-" + std::string(month < 10 ? "0" : "") + std::to_string(month)},
                    {"category_id", category == 0 ? std::string()
                                                  : "c" + std::to_string(category % category_count)},
                    {"budget_cents", static_cast<double>(cents)},
                };
            },
            rc::gen::inRange(1, 13),
            rc::gen::inRange(0, 10),
            rc::gen::inRange<int64_t>(0, 1000000)));

        return rc::gen::apply(
            [](int count, Rows transactions, Rows budgets) {
                Rows categories;
                for (int i = 0; i < count; ++i) {
                    categories.push_back(Row{
                        {"id", "c" + std::to_string(i)},
                        {"name", "Category " + std::to_string(i)},
                        {"kind", i % 2 == 0 ? std::string("Expense") : std::string("income")},
                    });
                }
                MemorySource source;
                source.set_group(RecordGroup::Categories, std::move(categories))
                      .set_group(RecordGroup::Transactions, std::move(transactions))
                      .set_group(RecordGroup::Budgets, std::move(budgets));
                return source;
            },
            category_rows, transaction_rows, budget_rows);
    });
}

} // namespace

TEST_CASE("Property: importing the same source twice changes nothing", "[property][import]") {
    rc::check("second import reports the same counts and adds no rows",
        []() {
            auto source = *source_gen();
            Store store;

            const auto first = store.importer.import_from(source);
            RC_ASSERT(first.ok());
            const auto after_first = counts(store);
            const auto transactions = store.transactions.list(TransactionFilter{.include_deleted = true}).unwrap();

            const auto second = store.importer.import_from(source);
            RC_ASSERT(second.ok());
            RC_ASSERT(second.total() == first.total());
            RC_ASSERT(counts(store) == after_first);

            const auto reimported = store.transactions.list(TransactionFilter{.include_deleted = true}).unwrap();
            RC_ASSERT(reimported.size() == transactions.size());
            for (size_t i = 0; i < reimported.size(); ++i) {
                RC_ASSERT(reimported[i].id == transactions[i].id);
                RC_ASSERT(reimported[i].amount_cents == transactions[i].amount_cents);
                RC_ASSERT(reimported[i].category_id == transactions[i].category_id);
            }
        }
    );
}

TEST_CASE("Property: import counts match the store", "[property][import]") {
    rc::check("each group reports the distinct rows it holds",
        []() {
            auto source = *source_gen();
            Store store;

            const auto result = store.importer.import_from(source);
            RC_ASSERT(result.ok());

            const auto stored = counts(store);
            RC_ASSERT(stored.categories == result.categories_imported);
            RC_ASSERT(stored.transactions == result.transactions_imported);
            RC_ASSERT(stored.budgets == result.budgets_imported);
        }
    );
}
