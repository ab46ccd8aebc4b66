#pragma once

#include <flightlock/core/catalog/product.hpp>
#include <flightlock/core/coalescer/keyed_result.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace FlightLock {

/**
 * @class ProductSource
 * @brief Authoritative product storage behind the cache.
 *
 * load() returns KeyedResult::notFound() for an unknown id and a
 * TRANSIENT_FETCH failure when the read itself fails.
 */
class ProductSource {
public:
    virtual ~ProductSource() = default;
    virtual KeyedResult<Product> load(int64_t id) = 0;
};

/**
 * @class MemoryProductSource
 * @brief In-process ProductSource with simulated read latency and
 *        injectable failures.
 */
class MemoryProductSource : public ProductSource {
public:
    explicit MemoryProductSource(std::chrono::milliseconds latency = std::chrono::milliseconds(0));

    KeyedResult<Product> load(int64_t id) override;

    void put(const Product& product);
    // Next @p count loads fail with TRANSIENT_FETCH
    void failNext(int count);

    uint64_t loadCount() const { return loads_.load(std::memory_order_relaxed); }

private:
    std::chrono::milliseconds latency_;
    mutable std::mutex mutex_;
    std::unordered_map<int64_t, Product> products_;
    int pending_failures_ = 0;
    std::atomic<uint64_t> loads_{0};
};

} // namespace FlightLock
