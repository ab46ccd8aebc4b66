// ============================================================================
// CLOCKS
// ============================================================================
// Steady clock for in-process deadlines, wall clock for lease records that
// must be comparable between processes.
// ============================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace FlightLock {

class Clock {
public:
    // Get current time in milliseconds (monotonic, steady)
    static inline uint64_t now_ms() {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ).count();
    }

    // Milliseconds since the Unix epoch
    static inline uint64_t epoch_ms() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ).count();
    }
};

// Millisecond time source; swapped for a manual clock in tests
using TimeSource = std::function<uint64_t()>;

} // namespace FlightLock
