#include <flightlock/core/utils/owner_token.hpp>

#include <atomic>
#include <cstdint>
#include <random>

#include <unistd.h>

namespace FlightLock {

namespace {
std::atomic<uint64_t> g_sequence{0};

void appendHex(std::string& out, uint64_t value, int digits) {
    static const char* hex = "0123456789abcdef";
    for (int shift = (digits - 1) * 4; shift >= 0; shift -= 4) {
        out.push_back(hex[(value >> shift) & 0x0F]);
    }
}
} // namespace

std::string newOwnerToken() {
    thread_local std::mt19937_64 rng{
        (static_cast<uint64_t>(std::random_device{}()) << 32) ^ std::random_device{}()
    };

    std::string token;
    token.reserve(16 + 16 + 1 + 8 + 1 + 16);
    appendHex(token, rng(), 16);
    appendHex(token, rng(), 16);
    token.push_back('-');
    appendHex(token, static_cast<uint64_t>(::getpid()), 8);
    token.push_back('-');
    appendHex(token, g_sequence.fetch_add(1, std::memory_order_relaxed), 16);
    return token;
}

} // namespace FlightLock
