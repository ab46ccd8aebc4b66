#include <flightlock/core/lock/lease_store.hpp>
#include <spdlog/spdlog.h>

namespace FlightLock {

MemoryLeaseStore::MemoryLeaseStore(TimeSource now) : now_(std::move(now)) {}

bool MemoryLeaseStore::tryCreate(const std::string& name, const std::string& token,
                                 std::chrono::milliseconds ttl) {
    const uint64_t now_ms = now_();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = leases_.find(name);
    if (it != leases_.end() && now_ms < it->second.expires_at_ms) {
        return false;
    }
    if (it != leases_.end()) {
        spdlog::debug("[MemoryLeaseStore] Lease {} expired, reclaiming", name);
    }

    leases_[name] = Record{token, now_ms + static_cast<uint64_t>(ttl.count())};
    if (++creates_since_sweep_ >= kSweepInterval) {
        sweepLocked(now_ms);
    }
    return true;
}

bool MemoryLeaseStore::deleteIfOwner(const std::string& name, const std::string& token) {
    const uint64_t now_ms = now_();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = leases_.find(name);
    if (it == leases_.end() || it->second.token != token) {
        return false;
    }
    // An expired lease no longer belongs to anyone; drop it but report the loss
    const bool owned = now_ms < it->second.expires_at_ms;
    leases_.erase(it);
    return owned;
}

bool MemoryLeaseStore::extendIfOwner(const std::string& name, const std::string& token,
                                     std::chrono::milliseconds ttl) {
    const uint64_t now_ms = now_();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = leases_.find(name);
    if (it == leases_.end() || it->second.token != token || now_ms >= it->second.expires_at_ms) {
        return false;
    }
    it->second.expires_at_ms = now_ms + static_cast<uint64_t>(ttl.count());
    return true;
}

std::optional<std::string> MemoryLeaseStore::ownerOf(const std::string& name) const {
    const uint64_t now_ms = now_();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = leases_.find(name);
    if (it == leases_.end() || now_ms >= it->second.expires_at_ms) {
        return std::nullopt;
    }
    return it->second.token;
}

size_t MemoryLeaseStore::purgeExpired() {
    const uint64_t now_ms = now_();
    std::lock_guard<std::mutex> lock(mutex_);
    return sweepLocked(now_ms);
}

size_t MemoryLeaseStore::sweepLocked(uint64_t now_ms) {
    creates_since_sweep_ = 0;
    size_t removed = 0;
    for (auto it = leases_.begin(); it != leases_.end();) {
        if (now_ms >= it->second.expires_at_ms) {
            it = leases_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        spdlog::debug("[MemoryLeaseStore] Purged {} expired leases, size={}", removed, leases_.size());
    }
    return removed;
}

size_t MemoryLeaseStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return leases_.size();
}

} // namespace FlightLock
