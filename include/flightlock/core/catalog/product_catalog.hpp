#pragma once

#include <flightlock/core/cache/read_through_cache.hpp>
#include <flightlock/core/catalog/product.hpp>
#include <flightlock/core/catalog/product_source.hpp>

#include <cstdint>
#include <string>

namespace FlightLock {

/**
 * @class ProductCatalog
 * @brief Product lookups through the cache; concurrent misses on one
 *        product share a single ProductSource::load().
 *
 * Cache keys are "product:<id>".
 */
class ProductCatalog {
public:
    ProductCatalog(CacheStore& cache,
                   RequestCoalescer<Product>& coalescer,
                   ProductSource& source,
                   ReadThroughOptions options = ReadThroughOptions{});

    KeyedResult<Product> getProduct(int64_t id);

    // Seed the cache directly, bypassing the source
    void prime(const Product& product, std::chrono::milliseconds ttl);

    bool forget(int64_t id) { return reader_.forget(keyFor(id)); }
    void invalidate(int64_t id) { reader_.invalidate(keyFor(id)); }

    uint64_t cacheHits() const { return reader_.hits(); }
    uint64_t cacheMisses() const { return reader_.misses(); }
    uint64_t upstreamFetches() const { return reader_.upstreamFetches(); }

    static std::string keyFor(int64_t id);

private:
    KeyedResult<Product> loadByKey(const std::string& key);

    CacheStore& cache_;
    ProductSource& source_;
    ReadThroughCache<Product, ProductCodec> reader_;
};

} // namespace FlightLock
