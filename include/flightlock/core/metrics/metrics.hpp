#pragma once
#include <atomic>
#include <cstdint>

namespace FlightLock {

/**
 * @brief Counters for one RequestCoalescer instance
 *
 * All counters are lock-free atomic, relaxed ordering (metrics only).
 */
struct CoalescerMetrics {
    std::atomic<uint64_t> executions{0};     // workFn runs (one per generation)
    std::atomic<uint64_t> joins{0};          // Callers that joined an in-flight Call
    std::atomic<uint64_t> failures{0};       // Generations that ended in error or exception
    std::atomic<uint64_t> forgets{0};        // forget() calls that removed a Call
    std::atomic<uint64_t> rejected{0};       // Invalid keys
};

struct CoalescerSnapshot {
    uint64_t executions;
    uint64_t joins;
    uint64_t failures;
    uint64_t forgets;
    uint64_t rejected;

    // Callers served per execution (1.0 = no coalescing happened)
    double fanout() const {
        return executions > 0 ? static_cast<double>(executions + joins) / executions : 0.0;
    }
};

inline CoalescerSnapshot snapshotOf(const CoalescerMetrics& m) {
    return CoalescerSnapshot{
        m.executions.load(std::memory_order_relaxed),
        m.joins.load(std::memory_order_relaxed),
        m.failures.load(std::memory_order_relaxed),
        m.forgets.load(std::memory_order_relaxed),
        m.rejected.load(std::memory_order_relaxed)
    };
}

/**
 * @brief Counters shared by the mutexes created from one LockService
 */
struct LockMetrics {
    std::atomic<uint64_t> acquired{0};
    std::atomic<uint64_t> contended{0};
    std::atomic<uint64_t> released{0};
    std::atomic<uint64_t> ownership_lost{0};   // unlock/extend found another owner
    std::atomic<uint64_t> extended{0};
    std::atomic<uint64_t> store_errors{0};
};

struct LockSnapshot {
    uint64_t acquired;
    uint64_t contended;
    uint64_t released;
    uint64_t ownership_lost;
    uint64_t extended;
    uint64_t store_errors;
};

inline LockSnapshot snapshotOf(const LockMetrics& m) {
    return LockSnapshot{
        m.acquired.load(std::memory_order_relaxed),
        m.contended.load(std::memory_order_relaxed),
        m.released.load(std::memory_order_relaxed),
        m.ownership_lost.load(std::memory_order_relaxed),
        m.extended.load(std::memory_order_relaxed),
        m.store_errors.load(std::memory_order_relaxed)
    };
}

} // namespace FlightLock
