#pragma once

#include "utils/config_validator.h"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace tickagg {

class ConfigError : public std::runtime_error {
private:
    std::vector<std::string> errors_;

public:
    ConfigError(const std::string& what, std::vector<std::string> errors = {})
        : std::runtime_error(what), errors_(std::move(errors)) {}

    const std::vector<std::string>& errors() const { return errors_; }
};

struct AppConfig {
    // feed
    std::string feed_url = "wss://ws.finnhub.io";
    std::string token;

    std::vector<std::string> symbols;

    // storage
    std::string data_dir = "data";

    // schedule
    int dispatch_interval_seconds = 60;
    int candlestick_window_minutes = 1;
    int mean_window_minutes = 15;

    // logging
    std::string log_level = "INFO";
    std::string log_file;

    // Warnings collected while validating; logged by the caller once the logger is up
    std::vector<std::string> warnings;

    nlohmann::json toJson() const;
};

// Validates then reads a configuration document. Throws ConfigError listing every
// validation error.
AppConfig loadConfig(const nlohmann::json& config);

// Reads and parses a JSON file; throws ConfigError on I/O or parse failure
nlohmann::json readConfigFile(const std::string& path);

AppConfig loadConfigFile(const std::string& path);

} // namespace tickagg
