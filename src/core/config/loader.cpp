#include <flightlock/core/config/loader.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace {

YAML::Node requireNode(const YAML::Node& parent, const std::string& key, const std::string& path) {
    YAML::Node node = parent[key];
    if (!node.IsDefined() || node.IsNull()) {
        throw std::runtime_error("Missing required config field: " + path);
    }
    return node;
}

template <typename T>
T readAs(const YAML::Node& node, const std::string& path) {
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion& e) {
        throw std::runtime_error("Invalid type for config field " + path + ": " + e.what());
    }
}

template <typename T>
T requiredField(const YAML::Node& parent, const std::string& key, const std::string& path) {
    return readAs<T>(requireNode(parent, key, path), path);
}

template <typename T>
T optionalField(const YAML::Node& parent, const std::string& key, const std::string& path, const T& fallback) {
    if (!parent || !parent.IsMap()) {
        return fallback;
    }
    YAML::Node node = parent[key];
    if (!node.IsDefined() || node.IsNull()) {
        return fallback;
    }
    return readAs<T>(node, path);
}

// Optional mapping section; absent or null yields an undefined node
YAML::Node optionalSection(const YAML::Node& parent, const std::string& key, const std::string& path) {
    YAML::Node node = parent[key];
    if (node.IsDefined() && !node.IsNull() && !node.IsMap()) {
        throw std::runtime_error("Invalid type for config field " + path + ": expected a mapping");
    }
    return node;
}

uint64_t positiveMs(int64_t value, const std::string& path, bool allowZero) {
    if (value < 0 || (!allowZero && value == 0)) {
        throw std::runtime_error("Invalid value for config field " + path + ": " + std::to_string(value));
    }
    return static_cast<uint64_t>(value);
}

int positiveInt(int value, const std::string& path) {
    if (value <= 0) {
        throw std::runtime_error("Invalid value for config field " + path + ": " + std::to_string(value));
    }
    return value;
}

void validateLogLevel(const std::string& level) {
    static const char* levels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    for (const char* l : levels) {
        if (level == l) return;
    }
    throw std::runtime_error("Invalid value for config field logging.level: " + level);
}

} // namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Cannot open config file: " + filepath);
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error("Malformed config file " + filepath + ": " + e.what());
    }

    if (!root.IsMap()) {
        throw std::runtime_error("Config root must be a mapping: " + filepath);
    }

    AppConfig::AppConfiguration config;
    config.app_name = requiredField<std::string>(root, "app_name", "app_name");
    config.version = requiredField<std::string>(root, "version", "version");

    // logging (optional section)
    YAML::Node logging = optionalSection(root, "logging", "logging");
    config.logging.level = optionalField<std::string>(logging, "level", "logging.level", config.logging.level);
    config.logging.pattern = optionalField<std::string>(logging, "pattern", "logging.pattern", config.logging.pattern);
    validateLogLevel(config.logging.level);

    // cache (optional section)
    YAML::Node cache = optionalSection(root, "cache", "cache");
    config.cache.default_ttl_ms = positiveMs(
        optionalField<int64_t>(cache, "default_ttl_ms", "cache.default_ttl_ms", 0),
        "cache.default_ttl_ms", true);
    config.cache.write_back = optionalField<bool>(cache, "write_back", "cache.write_back", config.cache.write_back);
    config.cache.coalesce_key_prefix = optionalField<std::string>(
        cache, "coalesce_key_prefix", "cache.coalesce_key_prefix", config.cache.coalesce_key_prefix);

    // lock (required section)
    YAML::Node lock = requireNode(root, "lock", "lock");
    if (!lock.IsMap()) {
        throw std::runtime_error("Invalid type for config field lock: expected a mapping");
    }
    config.lock.backend = requiredField<std::string>(lock, "backend", "lock.backend");
    if (config.lock.backend != "memory" && config.lock.backend != "file") {
        throw std::runtime_error("Invalid value for config field lock.backend: " + config.lock.backend);
    }
    config.lock.lease_ttl_ms = positiveMs(
        requiredField<int64_t>(lock, "lease_ttl_ms", "lock.lease_ttl_ms"), "lock.lease_ttl_ms", false);
    config.lock.lease_dir = optionalField<std::string>(lock, "lease_dir", "lock.lease_dir", config.lock.lease_dir);
    if (config.lock.backend == "file" && config.lock.lease_dir.empty()) {
        throw std::runtime_error("Invalid value for config field lock.lease_dir: empty with file backend");
    }

    YAML::Node retry = optionalSection(lock, "retry", "lock.retry");
    config.lock.retry.max_attempts = positiveInt(
        optionalField<int>(retry, "max_attempts", "lock.retry.max_attempts", config.lock.retry.max_attempts),
        "lock.retry.max_attempts");
    config.lock.retry.initial_backoff_ms = positiveMs(
        optionalField<int64_t>(retry, "initial_backoff_ms", "lock.retry.initial_backoff_ms", 50),
        "lock.retry.initial_backoff_ms", false);
    config.lock.retry.max_backoff_ms = positiveMs(
        optionalField<int64_t>(retry, "max_backoff_ms", "lock.retry.max_backoff_ms", 500),
        "lock.retry.max_backoff_ms", false);
    if (config.lock.retry.max_backoff_ms < config.lock.retry.initial_backoff_ms) {
        throw std::runtime_error("Invalid value for config field lock.retry.max_backoff_ms: "
                                 "smaller than initial_backoff_ms");
    }

    // demo (optional section)
    YAML::Node demo = optionalSection(root, "demo", "demo");
    config.demo.concurrent_requests = positiveInt(
        optionalField<int>(demo, "concurrent_requests", "demo.concurrent_requests", config.demo.concurrent_requests),
        "demo.concurrent_requests");
    config.demo.fetch_delay_ms = positiveMs(
        optionalField<int64_t>(demo, "fetch_delay_ms", "demo.fetch_delay_ms", 300),
        "demo.fetch_delay_ms", true);
    config.demo.worker_threads = positiveInt(
        optionalField<int>(demo, "worker_threads", "demo.worker_threads", config.demo.worker_threads),
        "demo.worker_threads");
    config.demo.deposits = positiveInt(
        optionalField<int>(demo, "deposits", "demo.deposits", config.demo.deposits),
        "demo.deposits");

    spdlog::debug("[ConfigLoader] Loaded {} v{} from {}", config.app_name, config.version, filepath);
    return config;
}
