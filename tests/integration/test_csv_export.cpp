#include <catch2/catch_test_macros.hpp>
#include "import/bulk_importer.hpp"
#include "import/csv_directory_source.hpp"
#include "import/csv_export.hpp"
#include "storage/migrations.hpp"
#include "sync/snapshot.hpp"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <algorithm>
#include <tuple>

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

    sync::Snapshot snapshot() {
        auto snapshot = sync::collect_snapshot(engine, categories, transactions, budgets).unwrap();
        auto by_id = [](const auto& a, const auto& b) { return a.id < b.id; };
        std::sort(snapshot.categories.begin(), snapshot.categories.end(), by_id);
        std::sort(snapshot.transactions.begin(), snapshot.transactions.end(), by_id);
        std::sort(snapshot.budgets.begin(), snapshot.budgets.end(),
                  [](const Budget& a, const Budget& b) {
                      return std::tie(a.month, a.category_id) < std::tie(b.month, b.category_id);
                  });
        return snapshot;
    }

    Result<CsvExportResult, Error> export_to(const QString& directory) {
        auto all = sync::collect_snapshot(engine, categories, transactions, budgets).unwrap();
        return export_csv_directory(directory, all.categories, all.transactions, all.budgets);
    }
};

QByteArray read_file(const QString& path) {
    QFile file(path);
    REQUIRE(file.open(QIODevice::ReadOnly));
    return file.readAll();
}

CalendarDate ymd(int y, int m, int d) {
    return CalendarDate::from_ymd(y, m, d).value();
}

void seed(Store& store) {
    auto food = store.categories.create(create_category("Food", CategoryKind::Expense, std::nullopt, "food")).unwrap();
    static_cast<void>(store.categories.create(
        create_category("Dining, out", CategoryKind::Expense, food.id, "dining")).unwrap());
    static_cast<void>(store.categories.create(
        create_category("Salary", CategoryKind::Income, std::nullopt, "salary")).unwrap());

    static_cast<void>(store.transactions.create(create_transaction(
        ymd(2024, 3, 1), -4599, "dining", std::string("Cafe \"Luna\""), std::string("two\nlines"), "t1")).unwrap());
    static_cast<void>(store.transactions.create(create_transaction(
        ymd(2024, 3, 31), 250000, "salary", std::nullopt, std::string(" padded "), "t2")).unwrap());
    static_cast<void>(store.transactions.create(create_transaction(
        ymd(2024, 2, 10), -1200, "food", std::string("Market"), std::nullopt, "t3")).unwrap());
    static_cast<void>(store.transactions.remove("t3").unwrap());

    static_cast<void>(store.budgets.upsert(Budget{YearMonth::parse("2024-03").value(), "", 90000}).unwrap());
    static_cast<void>(store.budgets.upsert(Budget{YearMonth::parse("2024-02").value(), "food", 40000}).unwrap());
}

} // namespace

TEST_CASE("CSV export: writes one file per group", "[integration][export]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto target = QDir(dir.path()).filePath("nested/export");

    Store store;
    seed(store);
    auto result = store.export_to(target).unwrap();

    REQUIRE(result.categories == 3);
    REQUIRE(result.transactions == 3);
    REQUIRE(result.budgets == 2);
    REQUIRE(result.row_count() == 8);

    const auto transactions = read_file(QDir(target).filePath("transactions.csv"));
    REQUIRE(transactions.startsWith("id,date,amount_cents,category_id,merchant,notes,created_at,updated_at,deleted\n"));
    // Newest first; the tombstone is kept
    REQUIRE(transactions.indexOf("t2,2024-03-31") < transactions.indexOf("t1,2024-03-01"));
    REQUIRE(transactions.indexOf("t1,2024-03-01") < transactions.indexOf("t3,2024-02-10"));
    REQUIRE(transactions.contains("\"Cafe \"\"Luna\"\"\",\"two\nlines\""));
    REQUIRE(transactions.trimmed().endsWith(",true"));

    const auto categories = read_file(QDir(target).filePath("categories.csv"));
    REQUIRE(categories.startsWith("id,name,kind,parent_id,active,created_at,updated_at\n"));
    REQUIRE(categories.contains("dining,\"Dining, out\",expense,food,true,"));

    const auto budgets = read_file(QDir(target).filePath("budgets.csv"));
    REQUIRE(budgets == "month,category_id,budget_cents\n2024-02,food,40000\n2024-03,,90000\n");
}

TEST_CASE("CSV export: the folder imports back to the same rows", "[integration][export]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    Store original;
    seed(original);
    static_cast<void>(original.export_to(dir.path()).unwrap());

    Store copy;
    CsvDirectorySource source(dir.path());
    auto imported = copy.importer.import_from(source);
    REQUIRE(imported.ok());
    REQUIRE(imported.categories_imported == 3);
    REQUIRE(imported.transactions_imported == 3);
    REQUIRE(imported.budgets_imported == 2);

    const auto expected = original.snapshot();
    const auto actual = copy.snapshot();
    REQUIRE(actual.categories == expected.categories);
    REQUIRE(actual.transactions == expected.transactions);
    REQUIRE(actual.budgets == expected.budgets);
}

TEST_CASE("CSV export: an empty store writes headers only", "[integration][export]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    Store store;
    auto result = store.export_to(dir.path()).unwrap();
    REQUIRE(result.row_count() == 0);
    REQUIRE(read_file(QDir(dir.path()).filePath("categories.csv")) ==
            "id,name,kind,parent_id,active,created_at,updated_at\n");
}

TEST_CASE("CSV export: an unwritable target fails", "[integration][export]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto blocker = QDir(dir.path()).filePath("file");
    {
        QFile file(blocker);
        REQUIRE(file.open(QIODevice::WriteOnly));
    }

    auto result = export_csv_directory(QDir(blocker).filePath("sub"), {}, {}, {});
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::Storage);
}
