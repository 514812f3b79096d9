#include "utils/app_config.h"
#include <fstream>

namespace tickagg {

nlohmann::json AppConfig::toJson() const {
    nlohmann::json config = {
        {"feed", {
            {"url", feed_url},
            {"token", token}
        }},
        {"symbols", symbols},
        {"storage", {
            {"data_dir", data_dir}
        }},
        {"schedule", {
            {"dispatch_interval_seconds", dispatch_interval_seconds},
            {"candlestick_window_minutes", candlestick_window_minutes},
            {"mean_window_minutes", mean_window_minutes}
        }},
        {"logging", {
            {"level", log_level}
        }}
    };

    if (!log_file.empty()) {
        config["logging"]["file"] = log_file;
    }
    return config;
}

AppConfig loadConfig(const nlohmann::json& config) {
    auto validation = ConfigValidator::validateConfig(config);
    if (!validation.is_valid) {
        std::string what = "Configuration validation failed:";
        for (const auto& error : validation.errors) {
            what += "\n  - " + error;
        }
        throw ConfigError(what, validation.errors);
    }

    AppConfig app;
    app.warnings = validation.warnings;

    const auto& feed = config["feed"];
    app.feed_url = feed.value("url", app.feed_url);
    app.token = feed["token"].get<std::string>();

    app.symbols = config["symbols"].get<std::vector<std::string>>();

    if (config.contains("storage")) {
        app.data_dir = config["storage"].value("data_dir", app.data_dir);
    }

    if (config.contains("schedule")) {
        const auto& schedule = config["schedule"];
        app.dispatch_interval_seconds =
            schedule.value("dispatch_interval_seconds", app.dispatch_interval_seconds);
        app.candlestick_window_minutes =
            schedule.value("candlestick_window_minutes", app.candlestick_window_minutes);
        app.mean_window_minutes =
            schedule.value("mean_window_minutes", app.mean_window_minutes);
    }

    if (config.contains("logging")) {
        const auto& logging = config["logging"];
        app.log_level = logging.value("level", app.log_level);
        app.log_file = logging.value("file", app.log_file);
    }

    return app;
}

nlohmann::json readConfigFile(const std::string& path) {
    std::ifstream config_file(path);
    if (!config_file.is_open()) {
        throw ConfigError("Failed to open config file: " + path);
    }

    auto config = nlohmann::json::parse(config_file, nullptr, false);
    if (config.is_discarded()) {
        throw ConfigError("Failed to parse config file: " + path);
    }
    return config;
}

AppConfig loadConfigFile(const std::string& path) {
    return loadConfig(readConfigFile(path));
}

} // namespace tickagg
