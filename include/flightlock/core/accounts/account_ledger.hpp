#pragma once

#include <flightlock/core/errors/error.hpp>
#include <flightlock/core/lock/lock_retry.hpp>
#include <flightlock/core/lock/lock_service.hpp>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace FlightLock {

/**
 * @class AccountBalances
 * @brief Shared balance table. get/set are individually thread-safe, but a
 *        read-modify-write across them is not: callers serialize it per
 *        account with a DistributedMutex.
 */
class AccountBalances {
public:
    int64_t get(const std::string& account_id) const;
    void set(const std::string& account_id, int64_t balance);

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, int64_t> balances_;
};

/**
 * @class AccountLedger
 * @brief Applies deposits under the lock "add-account:{<id>}".
 *
 * Several ledgers over the same LeaseStore and AccountBalances stand in for
 * several service processes.
 */
class AccountLedger {
public:
    AccountLedger(LockService& locks,
                  AccountBalances& balances,
                  RetryPolicy retry = RetryPolicy{},
                  std::chrono::milliseconds work_delay = std::chrono::milliseconds(0));

    /**
     * @brief Single attempt; LOCK_CONTENTION if another ledger is mid-deposit.
     *
     * LOCK_OWNERSHIP_MISMATCH means the deposit was applied but the lease
     * expired before release. A release that hits STORE_UNAVAILABLE is
     * retried once; if that fails too the deposit is applied, the error is
     * returned and the lease is left to expire.
     */
    MaybeError deposit(const std::string& account_id, int64_t amount);

    // Same as deposit() but waits for the lock according to the retry policy
    MaybeError depositWithRetry(const std::string& account_id, int64_t amount);

    int64_t balance(const std::string& account_id) const { return balances_.get(account_id); }

    static std::string lockNameFor(const std::string& account_id);

private:
    MaybeError apply(const std::string& account_id, int64_t amount, bool retry);

    LockService& locks_;
    AccountBalances& balances_;
    RetryPolicy retry_;
    std::chrono::milliseconds work_delay_;
};

} // namespace FlightLock
