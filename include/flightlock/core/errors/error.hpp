#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace FlightLock {

/**
 * @enum ErrorCode
 * @brief Failure classes surfaced by the coalescer, the read-through cache
 *        and the distributed mutex.
 */
enum class ErrorCode : uint8_t {
    NOT_FOUND = 0,                 // Store has no record (read-through reports it as empty OK)
    TRANSIENT_FETCH = 1,           // Upstream read or decode failed
    LOCK_CONTENTION = 2,           // Another unexpired lease holds the name
    LOCK_OWNERSHIP_MISMATCH = 3,   // Lease expired or was re-acquired by someone else
    LOCK_NOT_HELD = 4,             // Unlock/extend without a held lease
    STORE_UNAVAILABLE = 5,         // Cache or lease store raised StoreError
    INVALID_ARGUMENT = 6           // Empty key/name, non-positive TTL
};

const char* errorCodeName(ErrorCode code);

/**
 * @struct Error
 * @brief Value-type error passed through unchanged to every waiter.
 */
struct Error {
    ErrorCode code;
    std::string message;

    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    std::string toString() const;

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message;
    }
    bool operator!=(const Error& other) const { return !(*this == other); }
};

using MaybeError = std::optional<Error>;

/**
 * @class StoreError
 * @brief Thrown by CacheStore / LeaseStore implementations on transport or
 *        I/O failure. Translated into ErrorCode::STORE_UNAVAILABLE at the
 *        primitive boundary.
 */
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace FlightLock
