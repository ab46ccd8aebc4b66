#pragma once

#include <flightlock/core/lock/distributed_mutex.hpp>

#include <chrono>
#include <functional>

namespace FlightLock {

struct RetryPolicy {
    int max_attempts = 32;
    std::chrono::milliseconds initial_backoff{50};
    std::chrono::milliseconds max_backoff{500};
};

using SleepFn = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief Call mutex.lock() until it succeeds or attempts run out.
 *
 * Only LOCK_CONTENTION is retried, with exponential backoff capped at
 * policy.max_backoff. Any other error is returned immediately.
 * @return std::nullopt once acquired, otherwise the last error
 */
MaybeError lockWithRetry(DistributedMutex& mutex, const RetryPolicy& policy,
                         const SleepFn& sleep = SleepFn());

} // namespace FlightLock
