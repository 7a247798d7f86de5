#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/backoff.hpp"

using namespace caretsync;

TEST_CASE("Property: backoff delay is bounded and non-decreasing", "[property][backoff]") {
    REQUIRE(rc::check("base <= delay(n) <= max and delay(n) <= delay(n+1)",
        []() {
            BackoffPolicy policy;
            policy.base_delay = std::chrono::milliseconds(*rc::gen::inRange(1, 5000));
            policy.max_delay = policy.base_delay + std::chrono::milliseconds(*rc::gen::inRange(0, 100000));
            policy.max_exponent = *rc::gen::inRange(0, 31);
            const int attempt = *rc::gen::inRange(0, 1000);

            const auto d = policy.delay(attempt);
            RC_ASSERT(d >= policy.base_delay);
            RC_ASSERT(d <= policy.max_delay);
            RC_ASSERT(d <= policy.delay(attempt + 1));
        }));
}

TEST_CASE("Property: backoff stops growing past the exponent cap", "[property][backoff]") {
    REQUIRE(rc::check("delay(n) == delay(max_exponent) for n >= max_exponent",
        []() {
            BackoffPolicy policy;
            policy.max_exponent = *rc::gen::inRange(0, 10);
            const int attempt = policy.max_exponent + *rc::gen::inRange(0, 1000);
            RC_ASSERT(policy.delay(attempt) == policy.delay(policy.max_exponent));
        }));
}
