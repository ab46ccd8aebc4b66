#pragma once

#include <flightlock/core/errors/error.hpp>
#include <flightlock/core/utils/clock.hpp>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace FlightLock {

/**
 * @class LeaseStore
 * @brief Shared store holding at most one lease per lock name.
 *
 * Every operation is a conditional write that must be atomic with respect to
 * all other clients of the store. Implementations throw StoreError on
 * transport or I/O failure.
 */
class LeaseStore {
public:
    virtual ~LeaseStore() = default;

    /**
     * @brief Create a lease for @p name owned by @p token
     * @return true if created; false if an unexpired lease already exists
     */
    virtual bool tryCreate(const std::string& name, const std::string& token,
                           std::chrono::milliseconds ttl) = 0;

    /**
     * @brief Delete the lease for @p name only if @p token owns it
     * @return false if the lease is gone, expired, or owned by another token
     */
    virtual bool deleteIfOwner(const std::string& name, const std::string& token) = 0;

    /**
     * @brief Push the expiry of an owned, unexpired lease to now + @p ttl
     */
    virtual bool extendIfOwner(const std::string& name, const std::string& token,
                               std::chrono::milliseconds ttl) = 0;
};

/**
 * @class MemoryLeaseStore
 * @brief LeaseStore shared by threads of one process. Independent
 *        DistributedMutex instances over the same store behave like
 *        independent processes over a shared server.
 */
class MemoryLeaseStore : public LeaseStore {
public:
    explicit MemoryLeaseStore(TimeSource now = &Clock::now_ms);

    bool tryCreate(const std::string& name, const std::string& token,
                   std::chrono::milliseconds ttl) override;
    bool deleteIfOwner(const std::string& name, const std::string& token) override;
    bool extendIfOwner(const std::string& name, const std::string& token,
                       std::chrono::milliseconds ttl) override;

    // Current owner of an unexpired lease (inspection / tests)
    std::optional<std::string> ownerOf(const std::string& name) const;
    size_t size() const;

    // Drop leases left behind by holders that never released them.
    // tryCreate() also sweeps every kSweepInterval creations.
    size_t purgeExpired();

    static constexpr size_t kSweepInterval = 1024;

private:
    struct Record {
        std::string token;
        uint64_t expires_at_ms;
    };

    size_t sweepLocked(uint64_t now_ms);

    TimeSource now_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Record> leases_;
    size_t creates_since_sweep_ = 0;
};

} // namespace FlightLock
