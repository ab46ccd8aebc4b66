#pragma once

#include <flightlock/core/errors/error.hpp>
#include <flightlock/core/utils/clock.hpp>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace FlightLock {

/**
 * @class CacheStore
 * @brief Key-value store with get/set/TTL semantics used by ReadThroughCache.
 *
 * Implementations throw StoreError on transport failure.
 */
class CacheStore {
public:
    virtual ~CacheStore() = default;

    /**
     * @brief Read the raw value for @p key
     * @return std::nullopt when the key is absent or expired
     */
    virtual std::optional<std::string> read(const std::string& key) = 0;

    /**
     * @brief Store @p raw under @p key
     * @param ttl Time to live; zero means no expiry
     */
    virtual void write(const std::string& key, const std::string& raw,
                       std::chrono::milliseconds ttl) = 0;

    /**
     * @brief Remove @p key
     * @return true if an entry was removed
     */
    virtual bool erase(const std::string& key) = 0;
};

/**
 * @class MemoryCacheStore
 * @brief In-process CacheStore. Expired entries are dropped lazily on read
 *        and by purgeExpired().
 */
class MemoryCacheStore : public CacheStore {
public:
    explicit MemoryCacheStore(TimeSource now = &Clock::now_ms);

    std::optional<std::string> read(const std::string& key) override;
    void write(const std::string& key, const std::string& raw,
               std::chrono::milliseconds ttl) override;
    bool erase(const std::string& key) override;

    size_t purgeExpired();
    size_t size() const;

private:
    struct Entry {
        std::string raw;
        uint64_t expires_at_ms;   // 0 = never
    };

    bool isExpired(const Entry& e, uint64_t now_ms) const {
        return e.expires_at_ms != 0 && now_ms >= e.expires_at_ms;
    }

    TimeSource now_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace FlightLock
