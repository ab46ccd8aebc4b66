#include <flightlock/core/accounts/account_ledger.hpp>
#include <spdlog/spdlog.h>

#include <thread>

namespace FlightLock {

int64_t AccountBalances::get(const std::string& account_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(account_id);
    return it == balances_.end() ? 0 : it->second;
}

void AccountBalances::set(const std::string& account_id, int64_t balance) {
    std::lock_guard<std::mutex> lock(mutex_);
    balances_[account_id] = balance;
}

AccountLedger::AccountLedger(LockService& locks,
                             AccountBalances& balances,
                             RetryPolicy retry,
                             std::chrono::milliseconds work_delay)
    : locks_(locks), balances_(balances), retry_(retry), work_delay_(work_delay) {}

std::string AccountLedger::lockNameFor(const std::string& account_id) {
    return "add-account:{" + account_id + "}";
}

MaybeError AccountLedger::deposit(const std::string& account_id, int64_t amount) {
    return apply(account_id, amount, false);
}

MaybeError AccountLedger::depositWithRetry(const std::string& account_id, int64_t amount) {
    return apply(account_id, amount, true);
}

MaybeError AccountLedger::apply(const std::string& account_id, int64_t amount, bool retry) {
    if (account_id.empty()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "account id must not be empty");
    }
    if (amount <= 0) {
        return Error(ErrorCode::INVALID_ARGUMENT, "deposit amount must be positive");
    }

    auto mutex = locks_.newMutex(lockNameFor(account_id));
    MaybeError err = retry ? lockWithRetry(*mutex, retry_) : mutex->lock();
    if (err) {
        spdlog::info("[AccountLedger] Deposit to {} rejected: {}", account_id, err->toString());
        return err;
    }

    ScopedLease guard(*mutex, std::adopt_lock);

    // Read-modify-write; only safe because of the lease
    const int64_t current = balances_.get(account_id);
    if (work_delay_.count() > 0) {
        std::this_thread::sleep_for(work_delay_);
    }
    balances_.set(account_id, current + amount);

    UnlockResult released = guard.release();
    if (!released.released && released.error && released.error->code == ErrorCode::STORE_UNAVAILABLE) {
        // The mutex still holds the lease after a store failure, so one more delete is safe
        spdlog::warn("[AccountLedger] Release of {} failed, retrying once: {}",
                     mutex->name(), released.error->toString());
        released = mutex->unlock();
        if (!released.released && released.error && released.error->code == ErrorCode::STORE_UNAVAILABLE) {
            spdlog::error("[AccountLedger] Lease {} left to expire after {}ms",
                          mutex->name(), mutex->ttl().count());
        }
    }
    if (!released.released) {
        spdlog::error("[AccountLedger] Deposit of {} to {} applied, but release failed: {}",
                      amount, account_id, released.error ? released.error->toString() : "unknown");
        return released.error;
    }

    spdlog::debug("[AccountLedger] Deposited {} to {} (balance {})", amount, account_id, current + amount);
    return std::nullopt;
}

} // namespace FlightLock
