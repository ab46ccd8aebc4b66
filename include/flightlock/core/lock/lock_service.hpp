#pragma once

#include <flightlock/core/lock/distributed_mutex.hpp>
#include <flightlock/core/lock/lease_store.hpp>
#include <flightlock/core/metrics/metrics.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace FlightLock {

/**
 * @class LockService
 * @brief Creates DistributedMutex instances over one LeaseStore with a
 *        default lease TTL and shared metrics.
 *
 * Each mutex is one acquirer; create a new one per critical section.
 */
class LockService {
public:
    LockService(LeaseStore& store,
                std::chrono::milliseconds default_ttl,
                TokenGenerator tokens = &newOwnerToken,
                TimeSource now = &Clock::now_ms);

    LockService(const LockService&) = delete;
    LockService& operator=(const LockService&) = delete;

    std::unique_ptr<DistributedMutex> newMutex(const std::string& name);
    std::unique_ptr<DistributedMutex> newMutex(const std::string& name, std::chrono::milliseconds ttl);

    std::chrono::milliseconds defaultTtl() const { return default_ttl_; }
    LockSnapshot metrics() const { return snapshotOf(metrics_); }

private:
    LeaseStore& store_;
    std::chrono::milliseconds default_ttl_;
    TokenGenerator tokens_;
    TimeSource now_;
    LockMetrics metrics_;
};

} // namespace FlightLock
