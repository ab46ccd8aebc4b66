#pragma once

#include <flightlock/core/lock/lease_store.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace FlightLock {

/**
 * @class FileLeaseStore
 * @brief LeaseStore shared by processes on one host through a directory.
 *
 * Layout:
 *   <dir>/.flightlock.guard     flock(LOCK_EX) held for each operation
 *   <dir>/<escaped-name>.lease  "<token>\n<expiry_epoch_ms>\n"
 *
 * Tokens may contain spaces but not line breaks; tryCreate() throws
 * StoreError for an empty or multi-line token before touching the file.
 *
 * Lease files are replaced with write-to-temp + rename, so a crashed writer
 * never leaves a torn record. Expiry uses the wall clock because steady
 * clocks are not comparable across processes.
 */
class FileLeaseStore : public LeaseStore {
public:
    explicit FileLeaseStore(std::filesystem::path dir, TimeSource now = &Clock::epoch_ms);

    bool tryCreate(const std::string& name, const std::string& token,
                   std::chrono::milliseconds ttl) override;
    bool deleteIfOwner(const std::string& name, const std::string& token) override;
    bool extendIfOwner(const std::string& name, const std::string& token,
                       std::chrono::milliseconds ttl) override;

    std::filesystem::path pathFor(const std::string& name) const;
    const std::filesystem::path& directory() const { return dir_; }

private:
    struct Record {
        std::string token;
        uint64_t expires_at_ms;
    };

    std::optional<Record> readRecord(const std::filesystem::path& path) const;
    void writeRecord(const std::filesystem::path& path, const Record& record) const;
    void removeRecord(const std::filesystem::path& path) const;

    std::filesystem::path dir_;
    std::filesystem::path guard_path_;
    TimeSource now_;
};

} // namespace FlightLock
