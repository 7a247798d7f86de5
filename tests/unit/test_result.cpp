#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"
#include <string>
#include <vector>

using namespace caretsync;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err carries kind and message", "[result]") {
    auto result = Result<int>::err(Error{ErrorKind::MalformedMessage, "bad json"});

    REQUIRE_FALSE(result.is_ok());
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::MalformedMessage);
    REQUIRE(result.unwrap_err().message == "bad json");
}

TEST_CASE("Result::unwrap throws on error", "[result]") {
    auto result = Result<int>::err(Error{ErrorKind::TransportError, "closed"});

    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
}

TEST_CASE("Result::unwrap_err throws on success", "[result]") {
    auto result = Result<int>::ok(1);

    REQUIRE_THROWS_AS(result.unwrap_err(), std::runtime_error);
}

TEST_CASE("Result::value_or returns default on error", "[result]") {
    auto ok_result = Result<int>::ok(42);
    auto err_result = Result<int>::err(Error{ErrorKind::Unknown, "error"});

    REQUIRE(ok_result.value_or(0) == 42);
    REQUIRE(err_result.value_or(0) == 0);
}

TEST_CASE("Result::map transforms success value", "[result]") {
    auto result = Result<int>::ok(21);
    auto mapped = result.map([](int x) { return x * 2; });

    REQUIRE(mapped.is_ok());
    REQUIRE(mapped.unwrap() == 42);
}

TEST_CASE("Result::map propagates error", "[result]") {
    auto result = Result<int>::err(Error{ErrorKind::InvalidConfig, "error"});
    auto mapped = result.map([](int x) { return x * 2; });

    REQUIRE(mapped.is_err());
    REQUIRE(mapped.unwrap_err().kind == ErrorKind::InvalidConfig);
}

TEST_CASE("Result::and_then chains operations", "[result]") {
    auto divide = [](int x) -> Result<int> {
        if (x == 0) return Result<int>::err(Error{ErrorKind::Unknown, "division by zero"});
        return Result<int>::ok(100 / x);
    };

    REQUIRE(Result<int>::ok(5).and_then(divide).unwrap() == 20);
    REQUIRE(Result<int>::ok(0).and_then(divide).is_err());
}

TEST_CASE("Result::and_then short-circuits on error", "[result]") {
    int calls = 0;
    auto step = [&calls](int x) -> Result<int> {
        ++calls;
        return Result<int>::ok(x);
    };

    auto result = Result<int>::err(Error{ErrorKind::Unknown, "initial error"}).and_then(step);

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().message == "initial error");
    REQUIRE(calls == 0);
}

TEST_CASE("Result::inspect_err runs only on error", "[result]") {
    std::vector<std::string> seen;
    auto record = [&seen](const Error& e) { seen.push_back(e.message); };

    Result<int>::ok(1).inspect_err(record);
    Result<int>::err(Error{ErrorKind::NotConnected, "no link"}).inspect_err(record);

    REQUIRE(seen == std::vector<std::string>{"no link"});
}

TEST_CASE("Result<void> works correctly", "[result]") {
    auto ok_result = Result<void>::ok();
    auto err_result = Result<void>::err(Error{ErrorKind::BindFailure, "port in use"});

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());
    REQUIRE(err_result.unwrap_err().kind == ErrorKind::BindFailure);

    REQUIRE_NOTHROW(ok_result.unwrap());
    REQUIRE_THROWS(err_result.unwrap());
}

TEST_CASE("Result chaining works with different types", "[result]") {
    auto result = Result<int>::ok(5)
        .map([](int x) { return std::to_string(x); })
        .map([](const std::string& s) { return s + " items"; });

    REQUIRE(result.is_ok());
    REQUIRE(result.unwrap() == "5 items");
}

TEST_CASE("ErrorKind names are stable", "[result]") {
    REQUIRE(std::string(to_string(ErrorKind::MalformedMessage)) == "MalformedMessage");
    REQUIRE(std::string(to_string(ErrorKind::HostOperationFailed)) == "HostOperationFailed");
    REQUIRE(std::string(to_string(ErrorKind::BindFailure)) == "BindFailure");
}
