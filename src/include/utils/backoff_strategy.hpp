#pragma once
/**
 * @file backoff_strategy.hpp
 * @brief Header-only backoff strategies for retry loops.
 *
 * A strategy is a callable taking the 0-based attempt number and sleeping for the
 * corresponding delay. Strategies are plain value types so callers can keep them
 * in configuration and copy them into worker threads.
 *
 * Usage Scenarios:
 * - InterProcessLock: BoundedExponentialBackoff (lock-file contention between processes)
 * - AtomicWriter: ConstantBackoff (transient rename failures)
 */
#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>

namespace fspec::utils
{

/**
 * @brief Exponential backoff clamped to a [min, max] window.
 *
 * delay(n) = min(min_delay * factor^n, max_delay)
 *
 * With the lock defaults (50ms, 500ms, factor 2) the sequence is
 * 50, 100, 200, 400, 500, 500, ... milliseconds.
 *
 * @example
 * BoundedExponentialBackoff backoff{50ms, 500ms, 2.0};
 * for (int attempt = 0; !try_acquire(); ++attempt) {
 *     if (attempt >= retries) { timeout(); break; }
 *     backoff(attempt);
 * }
 */
struct BoundedExponentialBackoff
{
    std::chrono::milliseconds min_delay{50};
    std::chrono::milliseconds max_delay{500};
    double factor = 2.0;

    [[nodiscard]] std::chrono::milliseconds delay_for(int iteration) const noexcept
    {
        if (iteration < 0)
        {
            iteration = 0;
        }
        const double scaled =
            static_cast<double>(min_delay.count()) * std::pow(std::max(factor, 1.0), iteration);
        const double capped = std::min(scaled, static_cast<double>(max_delay.count()));
        return std::chrono::milliseconds(static_cast<long long>(capped));
    }

    void operator()(int iteration) const noexcept
    {
        std::this_thread::sleep_for(delay_for(iteration));
    }
};

/**
 * @brief Constant backoff strategy with fixed delay.
 * @details Always sleeps for a fixed duration regardless of iteration count.
 */
struct ConstantBackoff
{
    std::chrono::microseconds delay;

    explicit ConstantBackoff(std::chrono::microseconds d = std::chrono::microseconds(100))
        : delay(d)
    {
    }

    void operator()(int iteration) const noexcept
    {
        (void)iteration;
        std::this_thread::sleep_for(delay);
    }
};

} // namespace fspec::utils
