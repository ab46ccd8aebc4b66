#pragma once

#include <flightlock/core/errors/error.hpp>
#include <flightlock/core/lock/lease_store.hpp>
#include <flightlock/core/metrics/metrics.hpp>
#include <flightlock/core/utils/clock.hpp>
#include <flightlock/core/utils/owner_token.hpp>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace FlightLock {

/**
 * @struct LockLease
 * @brief Local record of a lease this mutex acquired.
 *
 * The lease store stays the source of truth; expires_at_ms is a local,
 * conservative estimate measured from before the acquiring call.
 */
struct LockLease {
    std::string name;
    std::string owner_token;
    uint64_t expires_at_ms;

    bool expired(uint64_t now_ms) const { return now_ms >= expires_at_ms; }
};

struct UnlockResult {
    bool released;
    MaybeError error;
};

/**
 * @class DistributedMutex
 * @brief Leased lock on a name in a LeaseStore shared by many processes.
 *
 * Unlocked -> Locked (lease with owner token) -> Unlocked on unlock() or on
 * lease expiry. lock() never retries; see lockWithRetry(). Expiry does not
 * interrupt the holder: protected work must finish inside the lease or call
 * extend().
 */
class DistributedMutex {
public:
    DistributedMutex(LeaseStore& store,
                     std::string name,
                     std::chrono::milliseconds ttl,
                     TokenGenerator tokens = &newOwnerToken,
                     LockMetrics* metrics = nullptr,
                     TimeSource now = &Clock::now_ms);

    DistributedMutex(const DistributedMutex&) = delete;
    DistributedMutex& operator=(const DistributedMutex&) = delete;

    /**
     * @brief Create the lease if no unexpired lease exists for name().
     * @return std::nullopt on success, LOCK_CONTENTION if held elsewhere,
     *         STORE_UNAVAILABLE if the store failed
     */
    MaybeError lock();

    /**
     * @brief Release the lease if this mutex's owner token still owns it.
     *
     * released == false with LOCK_OWNERSHIP_MISMATCH means the lease expired
     * or was taken over, i.e. the critical section overran its lease. On
     * STORE_UNAVAILABLE the local lease is kept so the call can be repeated.
     */
    UnlockResult unlock();

    /**
     * @brief Renew the held lease to now + ttl().
     */
    MaybeError extend();

    // Local view: a lease was acquired, not released, and has not expired
    bool isHeld() const;
    std::optional<LockLease> lease() const;

    const std::string& name() const { return name_; }
    std::chrono::milliseconds ttl() const { return ttl_; }

private:
    LeaseStore& store_;
    std::string name_;
    std::chrono::milliseconds ttl_;
    TokenGenerator tokens_;
    LockMetrics* metrics_;
    TimeSource now_;

    mutable std::mutex mutex_;
    std::optional<LockLease> lease_;
};

/**
 * @class ScopedLease
 * @brief Acquires on construction, releases on every exit path.
 *
 *   ScopedLease guard(mutex);
 *   if (!guard.owns()) return *guard.error();
 *   ... critical section ...
 */
class ScopedLease {
public:
    explicit ScopedLease(DistributedMutex& mutex);
    // Takes over a lease already acquired, e.g. through lockWithRetry()
    ScopedLease(DistributedMutex& mutex, std::adopt_lock_t);
    ~ScopedLease();

    ScopedLease(const ScopedLease&) = delete;
    ScopedLease& operator=(const ScopedLease&) = delete;

    bool owns() const { return owns_; }
    const MaybeError& error() const { return error_; }

    // Release early and report the outcome; the destructor then does nothing
    UnlockResult release();

private:
    DistributedMutex& mutex_;
    MaybeError error_;
    bool owns_;
};

} // namespace FlightLock
