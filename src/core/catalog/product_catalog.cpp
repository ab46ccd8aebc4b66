#include <flightlock/core/catalog/product_catalog.hpp>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace FlightLock {

namespace {
constexpr const char* kProductPrefix = "product:";
} // namespace

ProductCatalog::ProductCatalog(CacheStore& cache,
                               RequestCoalescer<Product>& coalescer,
                               ProductSource& source,
                               ReadThroughOptions options)
    : cache_(cache),
      source_(source),
      reader_(cache, coalescer,
              [this](const std::string& key) { return loadByKey(key); },
              std::move(options)) {}

std::string ProductCatalog::keyFor(int64_t id) {
    return kProductPrefix + std::to_string(id);
}

KeyedResult<Product> ProductCatalog::getProduct(int64_t id) {
    return reader_.get(keyFor(id));
}

void ProductCatalog::prime(const Product& product, std::chrono::milliseconds ttl) {
    cache_.write(keyFor(product.id), ProductCodec::encode(product), ttl);
}

KeyedResult<Product> ProductCatalog::loadByKey(const std::string& key) {
    const std::string prefix = kProductPrefix;
    if (key.compare(0, prefix.size(), prefix) != 0) {
        return KeyedResult<Product>::failure(ErrorCode::INVALID_ARGUMENT, "not a product key: " + key);
    }

    int64_t id = 0;
    try {
        id = std::stoll(key.substr(prefix.size()));
    } catch (const std::logic_error&) {
        return KeyedResult<Product>::failure(ErrorCode::INVALID_ARGUMENT, "not a product key: " + key);
    }

    spdlog::debug("[ProductCatalog] Cache miss for {}, loading from source", key);
    return source_.load(id);
}

} // namespace FlightLock
