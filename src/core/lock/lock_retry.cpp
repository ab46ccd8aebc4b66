#include <flightlock/core/lock/lock_retry.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace FlightLock {

MaybeError lockWithRetry(DistributedMutex& mutex, const RetryPolicy& policy, const SleepFn& sleep) {
    const int attempts = std::max(1, policy.max_attempts);
    auto backoff = policy.initial_backoff;
    MaybeError last;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        last = mutex.lock();
        if (!last) {
            if (attempt > 1) {
                spdlog::debug("[LockRetry] Acquired {} on attempt {}/{}", mutex.name(), attempt, attempts);
            }
            return std::nullopt;
        }
        if (last->code != ErrorCode::LOCK_CONTENTION) {
            return last;
        }
        if (attempt == attempts) {
            break;
        }

        if (sleep) {
            sleep(backoff);
        } else {
            std::this_thread::sleep_for(backoff);
        }
        backoff = std::min(backoff * 2, policy.max_backoff);
    }

    spdlog::warn("[LockRetry] Gave up on {} after {} attempts", mutex.name(), attempts);
    return last;
}

} // namespace FlightLock
