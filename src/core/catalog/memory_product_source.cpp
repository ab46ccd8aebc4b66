#include <flightlock/core/catalog/product_source.hpp>
#include <spdlog/spdlog.h>

#include <string>
#include <thread>

namespace FlightLock {

MemoryProductSource::MemoryProductSource(std::chrono::milliseconds latency)
    : latency_(latency) {}

KeyedResult<Product> MemoryProductSource::load(int64_t id) {
    loads_.fetch_add(1, std::memory_order_relaxed);
    spdlog::debug("[ProductSource] Loading product {}", id);

    if (latency_.count() > 0) {
        std::this_thread::sleep_for(latency_);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_failures_ > 0) {
        --pending_failures_;
        return KeyedResult<Product>::failure(ErrorCode::TRANSIENT_FETCH,
                                             "product source unavailable for id " + std::to_string(id));
    }

    auto it = products_.find(id);
    if (it == products_.end()) {
        return KeyedResult<Product>::notFound();
    }
    return KeyedResult<Product>::success(it->second);
}

void MemoryProductSource::put(const Product& product) {
    std::lock_guard<std::mutex> lock(mutex_);
    products_[product.id] = product;
}

void MemoryProductSource::failNext(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_failures_ = count;
}

} // namespace FlightLock
