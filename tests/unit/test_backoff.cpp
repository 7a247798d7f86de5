#include <catch2/catch_test_macros.hpp>
#include "core/backoff.hpp"
#include <vector>

using namespace caretsync;
using std::chrono::milliseconds;

TEST_CASE("Backoff: default delay sequence", "[backoff]") {
    constexpr BackoffPolicy policy;

    std::vector<int64_t> delays;
    for (int attempt = 0; attempt < 9; ++attempt) {
        delays.push_back(policy.delay(attempt).count());
    }

    REQUIRE(delays == std::vector<int64_t>{1000, 2000, 4000, 8000, 16000, 30000, 30000, 30000, 30000});
}

TEST_CASE("Backoff: delay is usable at compile time", "[backoff]") {
    constexpr BackoffPolicy policy;
    static_assert(policy.delay(0) == milliseconds(1000));
    static_assert(policy.delay(3) == milliseconds(8000));
    REQUIRE(policy.delay(1000) == milliseconds(30000));
}

TEST_CASE("Backoff: exponent cap applies before the delay cap", "[backoff]") {
    BackoffPolicy policy;
    policy.base_delay = milliseconds(10);
    policy.max_delay = milliseconds(1'000'000);
    policy.max_exponent = 3;

    REQUIRE(policy.delay(2) == milliseconds(40));
    REQUIRE(policy.delay(3) == milliseconds(80));
    REQUIRE(policy.delay(10) == milliseconds(80));
}

TEST_CASE("Backoff: negative attempts use the base delay", "[backoff]") {
    constexpr BackoffPolicy policy;
    REQUIRE(policy.delay(-4) == milliseconds(1000));
}

TEST_CASE("Backoff: attempt budget", "[backoff]") {
    SECTION("Zero retries forever") {
        BackoffPolicy policy;
        REQUIRE_FALSE(policy.exhausted(0));
        REQUIRE_FALSE(policy.exhausted(1'000'000));
    }

    SECTION("A positive cap stops after that many failed cycles") {
        BackoffPolicy policy;
        policy.max_attempts = 3;
        REQUIRE_FALSE(policy.exhausted(0));
        REQUIRE_FALSE(policy.exhausted(2));
        REQUIRE(policy.exhausted(3));
        REQUIRE(policy.exhausted(4));
    }
}
