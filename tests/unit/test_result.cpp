#include <catch2/catch_test_macros.hpp>
#include "core/errors.hpp"
#include "core/result.hpp"

#include <string>
#include <vector>

using namespace daybook;

TEST_CASE("Result::ok and err carry value or error", "[result]") {
    auto ok = Result<int, RepositoryError>::ok(7);
    REQUIRE(ok.is_ok());
    REQUIRE_FALSE(ok.is_err());
    REQUIRE(ok.unwrap() == 7);

    auto err = Result<int, RepositoryError>::err(RepositoryError::io("disk full"));
    REQUIRE(err.is_err());
    REQUIRE(err.unwrap_err().kind == RepositoryErrorKind::IO);
    REQUIRE(err.unwrap_err().message == "disk full");
}

TEST_CASE("Result::unwrap throws on the wrong side", "[result]") {
    auto result = Result<int>::err(Error{"no such row"});
    REQUIRE_THROWS_AS(result.unwrap(), BadResultAccess);

    auto success = Result<int>::ok(1);
    REQUIRE_THROWS_AS(success.unwrap_err(), BadResultAccess);

    SECTION("the message names the error kind") {
        auto failed = Result<int, SyncError>::err(SyncError{SyncErrorKind::Offline, "no route"});
        try {
            (void)failed.unwrap();
            FAIL("unwrap() did not throw");
        } catch (const BadResultAccess& e) {
            REQUIRE(std::string(e.what()).find("Offline: no route") != std::string::npos);
        }
    }
}

TEST_CASE("Result::value_or falls back on error", "[result]") {
    REQUIRE(Result<int>::ok(3).value_or(0) == 3);
    REQUIRE(Result<int>::err(Error{"x"}).value_or(0) == 0);
}

TEST_CASE("Result::map and and_then convert between layers", "[result]") {
    SECTION("map transforms the value") {
        auto dates = Result<std::vector<std::string>, Error>::ok({"01-01-2024", "02-01-2024"});
        auto count = dates.map([](const std::vector<std::string>& d) { return d.size(); });
        REQUIRE(count.unwrap() == 2);
    }

    SECTION("match lifts a storage error to a repository error") {
        auto stored = Result<int, Error>::err(Error{"database is locked", 5});
        auto lifted = stored.match(
            [](int v) { return Result<int, RepositoryError>::ok(v); },
            [](const Error& e) { return Result<int, RepositoryError>::err(RepositoryError::from(e)); });
        REQUIRE(lifted.is_err());
        REQUIRE(lifted.unwrap_err().kind == RepositoryErrorKind::IO);
        REQUIRE(lifted.unwrap_err().message == "database is locked");
    }
}

TEST_CASE("Result::and_then chains and short-circuits", "[result]") {
    auto half = [](int x) -> Result<int> {
        if (x % 2 != 0) return Result<int>::err(Error{"odd"});
        return Result<int>::ok(x / 2);
    };

    REQUIRE(Result<int>::ok(8).and_then(half).and_then(half).unwrap() == 2);

    auto failed = Result<int>::ok(6).and_then(half).and_then(half);
    REQUIRE(failed.is_err());
    REQUIRE(failed.unwrap_err().message == "odd");

    auto initial = Result<int>::err(Error{"initial"}).and_then(half);
    REQUIRE(initial.unwrap_err().message == "initial");
}

TEST_CASE("Result::or_else recovers from errors", "[result]") {
    auto fallback = [](const SyncError&) { return Result<int, SyncError>::ok(0); };

    REQUIRE(Result<int, SyncError>::ok(4).or_else(fallback).unwrap() == 4);
    REQUIRE(Result<int, SyncError>::err(SyncError{SyncErrorKind::Offline, "down"})
                .or_else(fallback)
                .unwrap() == 0);
}

TEST_CASE("Result::match folds both cases", "[result]") {
    auto describe = [](const Result<SyncStatus, SyncError>& r) {
        return r.match(
            [](SyncStatus s) { return std::string(to_string(s)); },
            [](const SyncError& e) { return format_sync_error(e); });
    };

    REQUIRE(describe(Result<SyncStatus, SyncError>::ok(SyncStatus::Synced)) == "synced");
    REQUIRE(describe(Result<SyncStatus, SyncError>::err(
                SyncError{SyncErrorKind::Conflict, "stale"})) == "Conflict detected");
}

TEST_CASE("Result::inspect runs only on success", "[result]") {
    int seen = 0;

    auto ok = Result<int>::ok(9);
    REQUIRE(ok.inspect([&](int v) { seen = v; }).unwrap() == 9);
    REQUIRE(seen == 9);

    auto err = Result<int>::err(Error{"bad"});
    REQUIRE(err.inspect([&](int v) { seen = v * 2; }).is_err());
    REQUIRE(seen == 9);
}

TEST_CASE("Result<void> sequences side effects", "[result]") {
    std::vector<std::string> steps;
    auto step = [&](std::string name, bool fail) {
        return [&steps, name, fail]() -> Result<void, Error> {
            steps.push_back(name);
            if (fail) return Result<void, Error>::err(Error{name + " failed"});
            return Result<void, Error>::ok();
        };
    };

    SECTION("all steps run on success") {
        auto r = Result<void, Error>::ok()
            .and_then(step("record", false))
            .and_then(step("meta", false))
            .and_then(step("index", false));
        REQUIRE(r.is_ok());
        REQUIRE(steps == std::vector<std::string>{"record", "meta", "index"});
    }

    SECTION("a failing step stops the chain") {
        auto r = Result<void, Error>::ok()
            .and_then(step("record", false))
            .and_then(step("meta", true))
            .and_then(step("index", false));
        REQUIRE(r.is_err());
        REQUIRE(r.unwrap_err().message == "meta failed");
        REQUIRE(steps == std::vector<std::string>{"record", "meta"});
    }

    SECTION("unwrap throws only on error") {
        REQUIRE_NOTHROW(Result<void, Error>::ok().unwrap());
        REQUIRE_THROWS(Result<void, Error>::err(Error{"x"}).unwrap());
    }
}
