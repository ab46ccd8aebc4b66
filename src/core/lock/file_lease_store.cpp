#include <flightlock/core/lock/file_lease_store.hpp>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace FlightLock {

namespace {

// ============================================================================
// GUARD FILE LOCK
// ============================================================================
// Exclusive flock() on the guard file for the lifetime of the object. Every
// open() gets its own file description, so threads of one process exclude
// each other as well as other processes.
// ============================================================================
class GuardLock {
public:
    explicit GuardLock(const std::filesystem::path& path) {
        fd_ = ::open(path.c_str(), O_CLOEXEC | O_RDWR | O_CREAT, 0600);
        if (fd_ < 0) {
            throw StoreError("opening lease guard " + path.string() + ": " + std::strerror(errno));
        }
        while (::flock(fd_, LOCK_EX) != 0) {
            if (errno != EINTR) {
                const int err = errno;
                ::close(fd_);
                throw StoreError("locking lease guard " + path.string() + ": " + std::strerror(err));
            }
        }
    }

    ~GuardLock() {
        // Closing the descriptor drops the flock
        ::close(fd_);
    }

    GuardLock(const GuardLock&) = delete;
    GuardLock& operator=(const GuardLock&) = delete;

private:
    int fd_ = -1;
};

std::string escapeName(const std::string& name) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
            || c == '-' || c == '_' || c == '.') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

// Tokens are stored on their own line
void checkToken(const std::string& token) {
    if (token.empty() || token.find_first_of("\r\n") != std::string::npos) {
        throw StoreError("owner token must be non-empty and single-line");
    }
}

} // namespace

FileLeaseStore::FileLeaseStore(std::filesystem::path dir, TimeSource now)
    : dir_(std::move(dir)), guard_path_(dir_ / ".flightlock.guard"), now_(std::move(now)) {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        throw StoreError("creating lease directory " + dir_.string() + ": " + ec.message());
    }
    spdlog::info("[FileLeaseStore] Using lease directory {}", dir_.string());
}

std::filesystem::path FileLeaseStore::pathFor(const std::string& name) const {
    return dir_ / (escapeName(name) + ".lease");
}

bool FileLeaseStore::tryCreate(const std::string& name, const std::string& token,
                               std::chrono::milliseconds ttl) {
    checkToken(token);
    GuardLock guard(guard_path_);
    const uint64_t now_ms = now_();
    const auto path = pathFor(name);

    auto existing = readRecord(path);
    if (existing && now_ms < existing->expires_at_ms) {
        return false;
    }
    if (existing) {
        spdlog::debug("[FileLeaseStore] Lease {} expired, reclaiming", name);
    }

    writeRecord(path, Record{token, now_ms + static_cast<uint64_t>(ttl.count())});
    return true;
}

bool FileLeaseStore::deleteIfOwner(const std::string& name, const std::string& token) {
    GuardLock guard(guard_path_);
    const uint64_t now_ms = now_();
    const auto path = pathFor(name);

    auto existing = readRecord(path);
    if (!existing || existing->token != token) {
        return false;
    }
    removeRecord(path);
    return now_ms < existing->expires_at_ms;
}

bool FileLeaseStore::extendIfOwner(const std::string& name, const std::string& token,
                                   std::chrono::milliseconds ttl) {
    GuardLock guard(guard_path_);
    const uint64_t now_ms = now_();
    const auto path = pathFor(name);

    auto existing = readRecord(path);
    if (!existing || existing->token != token || now_ms >= existing->expires_at_ms) {
        return false;
    }
    writeRecord(path, Record{token, now_ms + static_cast<uint64_t>(ttl.count())});
    return true;
}

std::optional<FileLeaseStore::Record> FileLeaseStore::readRecord(const std::filesystem::path& path) const {
    std::ifstream in(path);
    if (!in.is_open()) {
        if (!std::filesystem::exists(path)) {
            return std::nullopt;
        }
        throw StoreError("reading lease file " + path.string());
    }

    Record record;
    if (!std::getline(in, record.token) || record.token.empty() || !(in >> record.expires_at_ms)) {
        throw StoreError("malformed lease file " + path.string());
    }
    return record;
}

void FileLeaseStore::writeRecord(const std::filesystem::path& path, const Record& record) const {
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            throw StoreError("opening lease file " + tmp.string());
        }
        out << record.token << '\n' << record.expires_at_ms << '\n';
        out.flush();
        if (!out.good()) {
            throw StoreError("writing lease file " + tmp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        throw StoreError("installing lease file " + path.string() + ": " + ec.message());
    }
}

void FileLeaseStore::removeRecord(const std::filesystem::path& path) const {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        throw StoreError("removing lease file " + path.string() + ": " + ec.message());
    }
}

} // namespace FlightLock
