#include <flightlock/core/errors/error.hpp>

namespace FlightLock {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::NOT_FOUND:               return "NOT_FOUND";
        case ErrorCode::TRANSIENT_FETCH:         return "TRANSIENT_FETCH";
        case ErrorCode::LOCK_CONTENTION:         return "LOCK_CONTENTION";
        case ErrorCode::LOCK_OWNERSHIP_MISMATCH: return "LOCK_OWNERSHIP_MISMATCH";
        case ErrorCode::LOCK_NOT_HELD:           return "LOCK_NOT_HELD";
        case ErrorCode::STORE_UNAVAILABLE:       return "STORE_UNAVAILABLE";
        case ErrorCode::INVALID_ARGUMENT:        return "INVALID_ARGUMENT";
    }
    return "UNKNOWN";
}

std::string Error::toString() const {
    std::string out = errorCodeName(code);
    if (!message.empty()) {
        out += ": ";
        out += message;
    }
    return out;
}

} // namespace FlightLock
