#include <flightlock/core/lock/distributed_mutex.hpp>
#include <spdlog/spdlog.h>

namespace FlightLock {

namespace {
inline void bump(LockMetrics* metrics, std::atomic<uint64_t> LockMetrics::*counter) {
    if (metrics) {
        (metrics->*counter).fetch_add(1, std::memory_order_relaxed);
    }
}
} // namespace

DistributedMutex::DistributedMutex(LeaseStore& store,
                                   std::string name,
                                   std::chrono::milliseconds ttl,
                                   TokenGenerator tokens,
                                   LockMetrics* metrics,
                                   TimeSource now)
    : store_(store),
      name_(std::move(name)),
      ttl_(ttl),
      tokens_(std::move(tokens)),
      metrics_(metrics),
      now_(std::move(now)) {}

MaybeError DistributedMutex::lock() {
    if (name_.empty()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "lock name must not be empty");
    }
    if (ttl_.count() <= 0) {
        return Error(ErrorCode::INVALID_ARGUMENT, "lease ttl must be positive for " + name_);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    const uint64_t start_ms = now_();
    if (lease_ && !lease_->expired(start_ms)) {
        bump(metrics_, &LockMetrics::contended);
        return Error(ErrorCode::LOCK_CONTENTION, "lock " + name_ + " is already held by this mutex");
    }

    std::string token = tokens_();
    if (token.empty()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "owner token for " + name_ + " must not be empty");
    }

    bool acquired = false;
    try {
        acquired = store_.tryCreate(name_, token, ttl_);
    } catch (const StoreError& e) {
        bump(metrics_, &LockMetrics::store_errors);
        spdlog::error("[DistributedMutex] Lease store failed acquiring {}: {}", name_, e.what());
        return Error(ErrorCode::STORE_UNAVAILABLE, e.what());
    }

    if (!acquired) {
        bump(metrics_, &LockMetrics::contended);
        spdlog::debug("[DistributedMutex] {} is held by another owner", name_);
        return Error(ErrorCode::LOCK_CONTENTION, "lock " + name_ + " is held by another owner");
    }

    lease_ = LockLease{name_, std::move(token), start_ms + static_cast<uint64_t>(ttl_.count())};
    bump(metrics_, &LockMetrics::acquired);
    spdlog::debug("[DistributedMutex] Acquired {} (ttl={}ms)", name_, ttl_.count());
    return std::nullopt;
}

UnlockResult DistributedMutex::unlock() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!lease_) {
        return UnlockResult{false, Error(ErrorCode::LOCK_NOT_HELD, "lock " + name_ + " is not held")};
    }

    bool deleted = false;
    try {
        deleted = store_.deleteIfOwner(name_, lease_->owner_token);
    } catch (const StoreError& e) {
        bump(metrics_, &LockMetrics::store_errors);
        spdlog::error("[DistributedMutex] Lease store failed releasing {}: {}", name_, e.what());
        return UnlockResult{false, Error(ErrorCode::STORE_UNAVAILABLE, e.what())};
    }

    lease_.reset();

    if (!deleted) {
        bump(metrics_, &LockMetrics::ownership_lost);
        spdlog::warn("[DistributedMutex] Lease on {} was no longer ours at unlock; "
                     "the critical section outlived its {}ms lease", name_, ttl_.count());
        return UnlockResult{false, Error(ErrorCode::LOCK_OWNERSHIP_MISMATCH,
                                         "lease on " + name_ + " expired or is owned by another token")};
    }

    bump(metrics_, &LockMetrics::released);
    spdlog::debug("[DistributedMutex] Released {}", name_);
    return UnlockResult{true, std::nullopt};
}

MaybeError DistributedMutex::extend() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!lease_) {
        return Error(ErrorCode::LOCK_NOT_HELD, "lock " + name_ + " is not held");
    }

    const uint64_t start_ms = now_();
    bool extended = false;
    try {
        extended = store_.extendIfOwner(name_, lease_->owner_token, ttl_);
    } catch (const StoreError& e) {
        bump(metrics_, &LockMetrics::store_errors);
        spdlog::error("[DistributedMutex] Lease store failed extending {}: {}", name_, e.what());
        return Error(ErrorCode::STORE_UNAVAILABLE, e.what());
    }

    if (!extended) {
        lease_.reset();
        bump(metrics_, &LockMetrics::ownership_lost);
        spdlog::warn("[DistributedMutex] Could not extend {}: lease already lost", name_);
        return Error(ErrorCode::LOCK_OWNERSHIP_MISMATCH,
                     "lease on " + name_ + " expired or is owned by another token");
    }

    lease_->expires_at_ms = start_ms + static_cast<uint64_t>(ttl_.count());
    bump(metrics_, &LockMetrics::extended);
    return std::nullopt;
}

bool DistributedMutex::isHeld() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lease_.has_value() && !lease_->expired(now_());
}

std::optional<LockLease> DistributedMutex::lease() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lease_;
}

// ============================================================================
// SCOPED LEASE
// ============================================================================

ScopedLease::ScopedLease(DistributedMutex& mutex)
    : mutex_(mutex), error_(mutex.lock()), owns_(!error_.has_value()) {}

ScopedLease::ScopedLease(DistributedMutex& mutex, std::adopt_lock_t)
    : mutex_(mutex), error_(std::nullopt), owns_(true) {}

ScopedLease::~ScopedLease() {
    if (!owns_) {
        return;
    }
    UnlockResult result = mutex_.unlock();
    if (!result.released) {
        spdlog::warn("[ScopedLease] Release of {} failed: {}", mutex_.name(),
                     result.error ? result.error->toString() : "unknown");
    }
}

UnlockResult ScopedLease::release() {
    if (!owns_) {
        return UnlockResult{false, Error(ErrorCode::LOCK_NOT_HELD,
                                         "scoped lease on " + mutex_.name() + " was never acquired")};
    }
    owns_ = false;
    return mutex_.unlock();
}

} // namespace FlightLock
