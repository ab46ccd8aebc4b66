#pragma once
#include <cstdint>
#include <string>

namespace AppConfig {

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

struct CacheConfig {
    uint64_t default_ttl_ms = 0;                       // 0 = entries never expire
    bool write_back = true;
    std::string coalesce_key_prefix = "singleflight:";
};

struct RetryConfig {
    int max_attempts = 32;
    uint64_t initial_backoff_ms = 50;
    uint64_t max_backoff_ms = 500;
};

struct LockConfig {
    std::string backend = "memory";                    // memory | file
    uint64_t lease_ttl_ms = 8000;
    std::string lease_dir = "/tmp/flightlock-leases";  // used by the file backend
    RetryConfig retry;
};

struct DemoConfig {
    int concurrent_requests = 10;
    uint64_t fetch_delay_ms = 300;
    int worker_threads = 4;
    int deposits = 5;
};

struct AppConfiguration {
    std::string app_name;
    std::string version;
    LoggingConfig logging;
    CacheConfig cache;
    LockConfig lock;
    DemoConfig demo;
};

} // namespace AppConfig
