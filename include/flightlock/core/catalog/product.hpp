#pragma once

#include <cstdint>
#include <string>

namespace FlightLock {

struct Product {
    int64_t id = 0;
    std::string name;

    bool operator==(const Product& other) const {
        return id == other.id && name == other.name;
    }
    bool operator!=(const Product& other) const { return !(*this == other); }
};

/**
 * @class ProductCodec
 * @brief JSON encoding of Product: {"id": 1, "name": "Product 1"}
 *
 * Satisfies the ReadThroughCache codec requirements.
 */
class ProductCodec {
public:
    static std::string encode(const Product& product);
    static bool decode(const std::string& raw, Product& out, std::string& error);
};

} // namespace FlightLock
