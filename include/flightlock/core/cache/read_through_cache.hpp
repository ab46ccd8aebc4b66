#pragma once

#include <flightlock/core/cache/cache_store.hpp>
#include <flightlock/core/coalescer/request_coalescer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <spdlog/spdlog.h>

namespace FlightLock {

struct ReadThroughOptions {
    std::chrono::milliseconds ttl{0};               // TTL for written-back entries, 0 = no expiry
    bool write_back = true;                         // Populate the cache after a successful miss
    std::string coalesce_key_prefix = "singleflight:";
};

/**
 * @class ReadThroughCache
 * @brief Cache lookup in front of a coalesced upstream fetch.
 *
 * Hit:  decode and return, the coalescer is not involved.
 * Miss: RequestCoalescer::execute(prefix + key, fetch) so concurrent
 *       callers for one cold key cause a single upstream read.
 *
 * Codec requirements:
 *   static std::string encode(const T&);
 *   static bool decode(const std::string& raw, T& out, std::string& error);
 *
 * A cached value that fails to decode is reported as TRANSIENT_FETCH and
 * not treated as a miss. A cache store error is logged and treated as a miss.
 *
 * invalidate() and forget() bump a per-key epoch. A fetch that started under
 * an older epoch still returns its value to its callers but does not write
 * it back, so a stale value cannot overwrite the invalidation.
 */
template <typename T, typename Codec>
class ReadThroughCache {
public:
    using Result = KeyedResult<T>;
    using Loader = std::function<Result(const std::string& key)>;

    ReadThroughCache(CacheStore& cache,
                     RequestCoalescer<T>& coalescer,
                     Loader loader,
                     ReadThroughOptions options = ReadThroughOptions{})
        : cache_(cache),
          coalescer_(coalescer),
          loader_(std::move(loader)),
          options_(std::move(options)) {}

    Result get(const std::string& key) {
        if (key.empty()) {
            return Result::failure(ErrorCode::INVALID_ARGUMENT, "cache key must not be empty");
        }

        std::optional<std::string> raw;
        try {
            raw = cache_.read(key);
        } catch (const StoreError& e) {
            spdlog::warn("[ReadThroughCache] Cache read failed for key={}, treating as miss: {}",
                         key, e.what());
        }

        if (raw) {
            hits_.fetch_add(1, std::memory_order_relaxed);
            T value;
            std::string decode_error;
            if (!Codec::decode(*raw, value, decode_error)) {
                spdlog::error("[ReadThroughCache] Corrupt cache entry key={}: {}", key, decode_error);
                return Result::failure(ErrorCode::TRANSIENT_FETCH,
                                       "failed to decode cached value for " + key + ": " + decode_error);
            }
            return Result::success(std::move(value));
        }

        misses_.fetch_add(1, std::memory_order_relaxed);
        return coalescer_.execute(options_.coalesce_key_prefix + key,
                                  [this, key]() { return fetch(key); });
    }

    // Next get() for key starts a new upstream fetch even if one is running
    bool forget(const std::string& key) {
        {
            std::lock_guard<std::mutex> lock(epoch_mutex_);
            ++epochs_[key];
        }
        return coalescer_.forget(options_.coalesce_key_prefix + key);
    }

    void invalidate(const std::string& key) {
        {
            // Serialized with write-back: a fetch either wrote before this
            // erase or sees the new epoch and skips its write
            std::lock_guard<std::mutex> lock(epoch_mutex_);
            ++epochs_[key];
            try {
                cache_.erase(key);
            } catch (const StoreError& e) {
                spdlog::warn("[ReadThroughCache] Cache erase failed for key={}: {}", key, e.what());
            }
        }
        coalescer_.forget(options_.coalesce_key_prefix + key);
    }

    uint64_t hits() const { return hits_.load(std::memory_order_relaxed); }
    uint64_t misses() const { return misses_.load(std::memory_order_relaxed); }
    uint64_t upstreamFetches() const { return fetches_.load(std::memory_order_relaxed); }

private:
    Result fetch(const std::string& key) {
        fetches_.fetch_add(1, std::memory_order_relaxed);
        const uint64_t epoch = epochOf(key);
        Result result = loader_(key);

        if (!result.ok()) {
            spdlog::warn("[ReadThroughCache] Upstream fetch failed for key={}: {}",
                         key, result.error->toString());
            return result;
        }
        if (!result.found()) {
            spdlog::debug("[ReadThroughCache] Upstream has no record for key={}", key);
            return result;
        }

        if (options_.write_back) {
            writeBack(key, *result.value, epoch);
        }
        return result;
    }

    uint64_t epochOf(const std::string& key) {
        std::lock_guard<std::mutex> lock(epoch_mutex_);
        auto it = epochs_.find(key);
        return it == epochs_.end() ? 0 : it->second;
    }

    void writeBack(const std::string& key, const T& value, uint64_t epoch) {
        std::lock_guard<std::mutex> lock(epoch_mutex_);
        auto it = epochs_.find(key);
        if ((it == epochs_.end() ? 0 : it->second) != epoch) {
            spdlog::debug("[ReadThroughCache] Skipping write-back for key={}: invalidated during fetch", key);
            return;
        }
        try {
            cache_.write(key, Codec::encode(value), options_.ttl);
        } catch (const std::exception& e) {
            spdlog::warn("[ReadThroughCache] Write-back failed for key={}: {}", key, e.what());
        }
    }

    CacheStore& cache_;
    RequestCoalescer<T>& coalescer_;
    Loader loader_;
    ReadThroughOptions options_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> fetches_{0};

    std::mutex epoch_mutex_;
    std::unordered_map<std::string, uint64_t> epochs_;  // only keys ever invalidated or forgotten
};

} // namespace FlightLock
