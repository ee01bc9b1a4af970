#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

using namespace tally;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err carries kind, message and code", "[result]") {
    auto result = Result<int>::err(Error{ErrorKind::Storage, "disk I/O error", 10});

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::Storage);
    REQUIRE(result.unwrap_err().message == "disk I/O error");
    REQUIRE(result.unwrap_err().code == 10);
    REQUIRE(result.unwrap_err().is(ErrorKind::Storage));
}

TEST_CASE("Result::unwrap throws on error", "[result]") {
    auto result = Result<int>::err(Error{"error"});

    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
}

TEST_CASE("Result::unwrap_err throws on success", "[result]") {
    auto result = Result<int>::ok(1);

    REQUIRE_THROWS_AS(result.unwrap_err(), std::runtime_error);
}

TEST_CASE("Result::value_or returns default on error", "[result]") {
    auto ok_result = Result<int>::ok(42);
    auto err_result = Result<int>::err(Error{"error"});

    REQUIRE(ok_result.value_or(0) == 42);
    REQUIRE(err_result.value_or(0) == 0);
}

TEST_CASE("Result::map transforms success value", "[result]") {
    auto mapped = Result<int>::ok(21).map([](int x) { return x * 2; });

    REQUIRE(mapped.is_ok());
    REQUIRE(mapped.unwrap() == 42);
}

TEST_CASE("Result::map propagates error", "[result]") {
    auto mapped = Result<int>::err(Error{ErrorKind::NotFound, "gone"})
                      .map([](int x) { return x * 2; });

    REQUIRE(mapped.is_err());
    REQUIRE(mapped.unwrap_err().kind == ErrorKind::NotFound);
}

TEST_CASE("Result::and_then chains operations", "[result]") {
    auto divide = [](int x) -> Result<int> {
        if (x == 0) return Result<int>::err(Error{ErrorKind::Validation, "division by zero"});
        return Result<int>::ok(100 / x);
    };

    REQUIRE(Result<int>::ok(5).and_then(divide).unwrap() == 20);
    REQUIRE(Result<int>::ok(0).and_then(divide).unwrap_err().message == "division by zero");
}

TEST_CASE("Result<void> reports success and failure", "[result]") {
    auto ok = Result<void, Error>::ok();
    auto err = Result<void, Error>::err(Error{ErrorKind::SyncConflict, "moved"});

    REQUIRE(ok.is_ok());
    REQUIRE_NOTHROW(ok.unwrap());
    REQUIRE(err.is_err());
    REQUIRE_THROWS_AS(err.unwrap(), std::runtime_error);
    REQUIRE(err.unwrap_err().kind == ErrorKind::SyncConflict);
}

TEST_CASE("Result::inspect_err runs only on error", "[result]") {
    int calls = 0;
    Result<int>::ok(1).inspect_err([&](const Error&) { ++calls; });
    Result<int>::err(Error{"bad"}).inspect_err([&](const Error&) { ++calls; });

    REQUIRE(calls == 1);
}

TEST_CASE("Error kinds", "[result]") {
    SECTION("Only startup failures are fatal") {
        REQUIRE(is_fatal(ErrorKind::StorageUnavailable));
        REQUIRE(is_fatal(ErrorKind::MigrationFailed));
        REQUIRE_FALSE(is_fatal(ErrorKind::Validation));
        REQUIRE_FALSE(is_fatal(ErrorKind::SyncConflict));
        REQUIRE_FALSE(is_fatal(ErrorKind::AuthFailed));
    }

    SECTION("Kinds have stable names") {
        REQUIRE(to_string(ErrorKind::SyncUnavailable) == "sync_unavailable");
        REQUIRE(to_string(ErrorKind::NotFound) == "not_found");
    }

    SECTION("Plain message constructor defaults to a storage error") {
        Error error{"boom"};
        REQUIRE(error.kind == ErrorKind::Storage);
        REQUIRE(error.code == 0);
    }
}
