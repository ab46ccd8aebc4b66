#include <flightlock/core/cache/cache_store.hpp>
#include <spdlog/spdlog.h>

namespace FlightLock {

MemoryCacheStore::MemoryCacheStore(TimeSource now) : now_(std::move(now)) {}

std::optional<std::string> MemoryCacheStore::read(const std::string& key) {
    const uint64_t now_ms = now_();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (isExpired(it->second, now_ms)) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.raw;
}

void MemoryCacheStore::write(const std::string& key, const std::string& raw,
                             std::chrono::milliseconds ttl) {
    const uint64_t now_ms = now_();
    const uint64_t expires = ttl.count() > 0 ? now_ms + static_cast<uint64_t>(ttl.count()) : 0;

    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = Entry{raw, expires};
}

bool MemoryCacheStore::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(key) > 0;
}

size_t MemoryCacheStore::purgeExpired() {
    const uint64_t now_ms = now_();
    size_t removed = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (isExpired(it->second, now_ms)) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        spdlog::debug("[MemoryCacheStore] Purged {} expired entries, size={}", removed, entries_.size());
    }
    return removed;
}

size_t MemoryCacheStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace FlightLock
