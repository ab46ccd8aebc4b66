#pragma once
#include <flightlock/core/config/app_config.hpp>
#include <string>

class ConfigLoader {
public:
    // Throws std::runtime_error on unreadable file, missing field, wrong type or invalid value
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);
};
