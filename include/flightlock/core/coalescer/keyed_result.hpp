#pragma once

#include <flightlock/core/errors/error.hpp>
#include <optional>
#include <utility>

namespace FlightLock {

/**
 * @struct KeyedResult
 * @brief Outcome of one logical unit of work for a key.
 *
 * Three shapes:
 * - value set, no error          -> success
 * - no value, no error           -> upstream has no record (valid result)
 * - error set                    -> failure, shared to every waiter as-is
 *
 * @c shared is set when the same result was handed to more than one caller.
 */
template <typename T>
struct KeyedResult {
    std::optional<T> value;
    MaybeError error;
    bool shared = false;

    static KeyedResult success(T v) {
        KeyedResult r;
        r.value = std::move(v);
        return r;
    }

    static KeyedResult notFound() {
        return KeyedResult{};
    }

    static KeyedResult failure(Error e) {
        KeyedResult r;
        r.error = std::move(e);
        return r;
    }

    static KeyedResult failure(ErrorCode code, std::string message) {
        return failure(Error(code, std::move(message)));
    }

    bool ok() const { return !error.has_value(); }
    bool found() const { return ok() && value.has_value(); }
};

} // namespace FlightLock
