#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace caretsync {

/**
 * BackoffPolicy - Exponential reconnect delay.
 *
 * delay(attempt) = min(base * 2^min(attempt, max_exponent), max_delay)
 */
struct BackoffPolicy {
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    int max_exponent = 5;
    // 0 retries forever.
    int max_attempts = 0;

    [[nodiscard]] constexpr std::chrono::milliseconds delay(int attempt) const {
        const int exponent = std::clamp(attempt, 0, std::clamp(max_exponent, 0, 30));
        const int64_t scaled = base_delay.count() * (int64_t{1} << exponent);
        return std::chrono::milliseconds(std::min<int64_t>(scaled, max_delay.count()));
    }

    // True once `failed_cycles` consecutive failures exhausted the budget.
    [[nodiscard]] constexpr bool exhausted(int failed_cycles) const {
        return max_attempts > 0 && failed_cycles >= max_attempts;
    }
};

} // namespace caretsync
