#include <flightlock/core/lock/lock_service.hpp>
#include <spdlog/spdlog.h>

namespace FlightLock {

LockService::LockService(LeaseStore& store,
                         std::chrono::milliseconds default_ttl,
                         TokenGenerator tokens,
                         TimeSource now)
    : store_(store),
      default_ttl_(default_ttl),
      tokens_(std::move(tokens)),
      now_(std::move(now)) {
    spdlog::info("[LockService] Initialized (default lease ttl: {}ms)", default_ttl_.count());
}

std::unique_ptr<DistributedMutex> LockService::newMutex(const std::string& name) {
    return newMutex(name, default_ttl_);
}

std::unique_ptr<DistributedMutex> LockService::newMutex(const std::string& name,
                                                        std::chrono::milliseconds ttl) {
    return std::make_unique<DistributedMutex>(store_, name, ttl, tokens_, &metrics_, now_);
}

} // namespace FlightLock
