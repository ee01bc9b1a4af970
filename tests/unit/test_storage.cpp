#include <catch2/catch_test_macros.hpp>
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/storage_engine.hpp"

#include <QAtomicInt>
#include <QFile>
#include <QTemporaryDir>
#include <QThread>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace tally;
using namespace tally::storage;

namespace {

int64_t count_rows(Database& db, const std::string& table) {
    return db.query_int64("SELECT COUNT(*) FROM " + table + ";").unwrap();
}

} // namespace

TEST_CASE("Database basic operations", "[storage]") {
    auto db_result = Database::open_memory();
    REQUIRE(db_result.is_ok());
    auto db = std::move(db_result).unwrap();

    SECTION("Execute creates table") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER PRIMARY KEY);").is_ok());
    }

    SECTION("Prepare and step") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER, name TEXT);").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (1, 'Alice');").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (2, NULL);").is_ok());

        auto stmt = db.prepare("SELECT * FROM test ORDER BY id;").unwrap();

        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int(0) == 1);
        REQUIRE(stmt.column_text(1) == "Alice");

        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int(0) == 2);
        REQUIRE_FALSE(stmt.column_optional_text(1).has_value());

        REQUIRE(stmt.step().unwrap() == false);
    }

    SECTION("bind_all binds in order") {
        REQUIRE(db.execute("CREATE TABLE test (a TEXT, b INTEGER, c TEXT);").is_ok());
        auto stmt = db.prepare("INSERT INTO test VALUES (?, ?, ?);").unwrap();
        REQUIRE(stmt.bind_all(std::string("x"), int64_t{42}, std::optional<std::string>{}).is_ok());
        REQUIRE(stmt.run().is_ok());

        auto check = db.prepare("SELECT a, b, c FROM test;").unwrap();
        REQUIRE(check.step().unwrap());
        REQUIRE(check.column_text(0) == "x");
        REQUIRE(check.column_int64(1) == 42);
        REQUIRE(check.column_is_null(2));
    }

    SECTION("Invalid SQL is a storage error with the SQLite code") {
        auto result = db.execute("CREATE TABL broken;");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::Storage);
        REQUIRE(result.unwrap_err().code == SQLITE_ERROR);
    }

    SECTION("Transaction commit") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());

        auto result = db.transaction([&]() -> Result<void, Error> {
            auto first = db.execute("INSERT INTO test VALUES (1);");
            if (first.is_err()) return first;
            return db.execute("INSERT INTO test VALUES (2);");
        });

        REQUIRE(result.is_ok());
        REQUIRE(count_rows(db, "test") == 2);
        REQUIRE(db.transaction_depth() == 0);
    }

    SECTION("Transaction rollback on error") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (1);").is_ok());

        auto result = db.transaction([&]() -> Result<void, Error> {
            auto insert = db.execute("INSERT INTO test VALUES (2);");
            if (insert.is_err()) return insert;
            return Result<void, Error>::err(Error{"forced error"});
        });

        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().message == "forced error");
        REQUIRE(count_rows(db, "test") == 1);
    }

    SECTION("Transaction rollback on exception") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());

        REQUIRE_THROWS_AS(db.transaction([&]() -> Result<void, Error> {
            auto insert = db.execute("INSERT INTO test VALUES (1);");
            if (insert.is_err()) return insert;
            throw std::runtime_error("boom");
        }), std::runtime_error);

        REQUIRE(count_rows(db, "test") == 0);
        REQUIRE(db.transaction_depth() == 0);
    }

    SECTION("Failed inner scope unwinds only itself") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());

        auto result = db.transaction([&]() -> Result<void, Error> {
            auto outer = db.execute("INSERT INTO test VALUES (1);");
            if (outer.is_err()) return outer;

            auto inner = db.transaction([&]() -> Result<void, Error> {
                auto insert = db.execute("INSERT INTO test VALUES (2);");
                if (insert.is_err()) return insert;
                return Result<void, Error>::err(Error{ErrorKind::Validation, "inner failed"});
            });
            REQUIRE(inner.is_err());
            REQUIRE(db.transaction_depth() == 1);
            return Result<void, Error>::ok();
        });

        REQUIRE(result.is_ok());
        REQUIRE(count_rows(db, "test") == 1);
    }
}

TEST_CASE("Database open failures", "[storage]") {
    SECTION("Missing directory is StorageUnavailable") {
        auto result = Database::open("/nonexistent-tally-dir/sub/tally.db");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::StorageUnavailable);
    }

    SECTION("A file that is not a database is StorageUnavailable") {
        QTemporaryDir dir;
        REQUIRE(dir.isValid());
        const auto path = dir.filePath(QStringLiteral("garbage.db"));
        QFile file(path);
        REQUIRE(file.open(QIODevice::WriteOnly));
        file.write(QByteArray(4096, 'x'));
        file.close();

        auto result = Database::open(path.toStdString());
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::StorageUnavailable);
    }
}

TEST_CASE("StorageEngine lifecycle", "[storage][engine]") {
    SECTION("Operations before open are StorageUnavailable") {
        StorageEngine engine(":memory:");
        auto result = engine.read([](Database& db) { return db.query_int64("SELECT 1;"); });
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::StorageUnavailable);

        auto migrated = engine.migrate(default_registry());
        REQUIRE(migrated.unwrap_err().kind == ErrorKind::StorageUnavailable);
        REQUIRE_FALSE(engine.is_ready());
    }

    SECTION("open is idempotent") {
        StorageEngine engine(":memory:");
        auto first = engine.open();
        auto second = engine.open();
        REQUIRE(first.is_ok());
        REQUIRE(second.is_ok());
        REQUIRE(first.unwrap() == second.unwrap());
        REQUIRE(engine.is_open());
    }

    SECTION("migrate marks the engine ready") {
        StorageEngine engine(":memory:");
        REQUIRE(engine.open().is_ok());
        REQUIRE_FALSE(engine.is_ready());
        auto applied = engine.migrate(default_registry());
        REQUIRE(applied.is_ok());
        REQUIRE(applied.unwrap() == default_registry().latest_version());
        REQUIRE(engine.is_ready());
        REQUIRE(engine.schema_version().unwrap() == default_registry().latest_version());
    }

    SECTION("close releases the handle") {
        StorageEngine engine(":memory:");
        REQUIRE(engine.open().is_ok());
        engine.close();
        REQUIRE_FALSE(engine.is_open());
        REQUIRE_FALSE(engine.is_ready());
    }

    SECTION("A file database survives reopening") {
        QTemporaryDir dir;
        REQUIRE(dir.isValid());
        const auto path = dir.filePath(QStringLiteral("tally.db")).toStdString();
        {
            StorageEngine engine(path);
            REQUIRE(engine.open().is_ok());
            REQUIRE(engine.migrate(default_registry()).is_ok());
        }
        StorageEngine engine(path);
        REQUIRE(engine.open().is_ok());
        REQUIRE(engine.migrate(default_registry()).unwrap() == 0);
        REQUIRE(engine.schema_version().unwrap() == default_registry().latest_version());
    }
}

TEST_CASE("StorageEngine scopes", "[storage][engine]") {
    StorageEngine engine(":memory:");
    REQUIRE(engine.open().is_ok());
    REQUIRE(engine.transaction([](Database& db) {
        return db.execute("CREATE TABLE items (id INTEGER PRIMARY KEY, value TEXT);");
    }).is_ok());

    SECTION("Nested transactions become savepoints") {
        auto result = engine.transaction([&](Database& db) -> Result<void, Error> {
            auto outer = db.execute("INSERT INTO items (value) VALUES ('outer');");
            if (outer.is_err()) return outer;

            auto inner = engine.transaction([](Database& inner_db) -> Result<void, Error> {
                auto insert = inner_db.execute("INSERT INTO items (value) VALUES ('inner');");
                if (insert.is_err()) return insert;
                return Result<void, Error>::err(Error{ErrorKind::Validation, "reject inner"});
            });
            REQUIRE(inner.is_err());
            REQUIRE(db.transaction_depth() == 1);
            return Result<void, Error>::ok();
        });
        REQUIRE(result.is_ok());

        auto count = engine.read([](Database& db) {
            return db.query_int64("SELECT COUNT(*) FROM items;");
        });
        REQUIRE(count.unwrap() == 1);
    }

    SECTION("An exception rolls back and propagates") {
        REQUIRE_THROWS_AS(engine.transaction([](Database& db) -> Result<void, Error> {
            auto insert = db.execute("INSERT INTO items (value) VALUES ('lost');");
            if (insert.is_err()) return insert;
            throw std::runtime_error("work failed");
        }), std::runtime_error);

        auto count = engine.read([](Database& db) {
            return db.query_int64("SELECT COUNT(*) FROM items;");
        });
        REQUIRE(count.unwrap() == 0);

        // The writer slot was released.
        REQUIRE(engine.transaction([](Database& db) {
            return db.execute("INSERT INTO items (value) VALUES ('after');");
        }).is_ok());
    }

    SECTION("A write inside a read scope is rejected") {
        auto result = engine.read([&](Database&) -> Result<void, Error> {
            return engine.transaction([](Database& db) {
                return db.execute("INSERT INTO items (value) VALUES ('no');");
            });
        });
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::Storage);
    }

    SECTION("Reads nest and run inside transactions") {
        auto nested = engine.read([&](Database&) {
            return engine.read([](Database& db) { return db.query_int64("SELECT 7;"); });
        });
        REQUIRE(nested.unwrap() == 7);

        auto inside = engine.transaction([&](Database& db) -> Result<int64_t, Error> {
            auto insert = db.execute("INSERT INTO items (value) VALUES ('seen');");
            if (insert.is_err()) return Result<int64_t, Error>::err(insert.unwrap_err());
            return engine.read([](Database& read_db) {
                return read_db.query_int64("SELECT COUNT(*) FROM items;");
            });
        });
        REQUIRE(inside.unwrap() == 1);
    }

    SECTION("Writers from several threads serialize") {
        constexpr int kThreads = 4;
        constexpr int kWrites = 25;
        QAtomicInt failures{0};
        std::vector<std::unique_ptr<QThread>> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back(QThread::create([&] {
                for (int i = 0; i < kWrites; ++i) {
                    auto result = engine.transaction([](Database& db) {
                        return db.execute("INSERT INTO items (value) VALUES ('w');");
                    });
                    if (result.is_err()) failures.fetchAndAddOrdered(1);
                }
            }));
            threads.back()->start();
        }
        for (auto& thread : threads) thread->wait();

        REQUIRE(failures.loadAcquire() == 0);
        auto count = engine.read([](Database& db) {
            return db.query_int64("SELECT COUNT(*) FROM items;");
        });
        REQUIRE(count.unwrap() == kThreads * kWrites);
    }
}
