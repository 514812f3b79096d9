#include "utils/config_validator.h"
#include "core/types.h"
#include "utils/logger.h"
#include <map>
#include <limits>
#include <regex>
#include <set>

namespace tickagg {

namespace {

const char* const kPlaceholderToken = "YOUR_FINNHUB_TOKEN";

void addError(ConfigValidator::ValidationResult& result, const std::string& error) {
    result.errors.push_back(error);
    result.is_valid = false;
}

} // namespace

ConfigValidator::ValidationResult ConfigValidator::validateConfig(const nlohmann::json& config) {
    ValidationResult result;
    result.is_valid = true;

    if (!config.is_object()) {
        addError(result, "Configuration must be a JSON object");
        return result;
    }

    validateRequiredSections(config, result);

    if (config.contains("feed")) {
        validateFeedConfig(config["feed"], result);
    }

    if (config.contains("symbols")) {
        validateSymbols(config["symbols"], result);
    }

    if (config.contains("storage")) {
        validateStorageConfig(config["storage"], result);
    }

    if (config.contains("schedule")) {
        validateScheduleConfig(config["schedule"], result);
    }

    if (config.contains("logging")) {
        validateLoggingConfig(config["logging"], result);
    }

    return result;
}

void ConfigValidator::validateRequiredSections(const nlohmann::json& config, ValidationResult& result) {
    const std::vector<std::string> required_sections = {"feed", "symbols"};

    for (const auto& section : required_sections) {
        if (!config.contains(section)) {
            addError(result, "Missing required '" + section + "' configuration section");
        }
    }
}

void ConfigValidator::validateFeedConfig(const nlohmann::json& feed_config, ValidationResult& result) {
    if (!feed_config.is_object()) {
        addError(result, "'feed' section must be an object");
        return;
    }

    if (!feed_config.contains("token") || !feed_config["token"].is_string() ||
        feed_config["token"].get<std::string>().empty() ||
        feed_config["token"] == kPlaceholderToken) {
        addError(result, "Invalid or missing Finnhub API token");
    }

    if (feed_config.contains("url")) {
        if (!feed_config["url"].is_string()) {
            addError(result, "Feed url must be a string");
        } else {
            const std::string url = feed_config["url"];
            if (url.rfind("wss://", 0) != 0 && url.rfind("ws://", 0) != 0) {
                addError(result, "Feed url must start with wss:// or ws:// (current: " + url + ")");
            } else if (url.rfind("ws://", 0) == 0) {
                result.warnings.push_back("Feed url is not using TLS: " + url);
            }
        }
    }
}

void ConfigValidator::validateSymbols(const nlohmann::json& symbols, ValidationResult& result) {
    if (!symbols.is_array() || symbols.empty()) {
        addError(result, "Configuration must include at least one symbol");
        return;
    }

    // Plain tickers (AAPL, BRK.B) or exchange-qualified pairs (BINANCE:BTCUSDT)
    const std::regex ticker_pattern("^[A-Z][A-Z0-9.]{0,9}$");
    const std::regex pair_pattern("^[A-Z0-9]+:[A-Z0-9_\\-]+$");

    std::set<std::string> seen;
    std::map<std::string, std::string> file_names;  // sanitized name -> first symbol
    for (const auto& symbol : symbols) {
        if (!symbol.is_string()) {
            addError(result, "Symbol must be a string: " + symbol.dump());
            continue;
        }

        const std::string sym = symbol;
        if (sym.empty()) {
            addError(result, "Symbol must not be empty");
            continue;
        }
        if (sym.find(',') != std::string::npos) {
            addError(result, "Symbol must not contain ',': " + sym);
            continue;
        }

        if (!std::regex_match(sym, ticker_pattern) && !std::regex_match(sym, pair_pattern)) {
            result.warnings.push_back("Symbol format warning: " + sym +
                                      " is neither an upper-case ticker nor EXCHANGE:PAIR");
        }

        if (!seen.insert(sym).second) {
            result.warnings.push_back("Duplicate symbol " + sym + " will be tracked once");
            continue;
        }

        auto stored = file_names.emplace(sanitizeSymbol(sym), sym);
        if (!stored.second) {
            addError(result, "Symbols " + stored.first->second + " and " + sym +
                             " map to the same store file " + stored.first->first + ".csv");
        }
    }
}

void ConfigValidator::validateStorageConfig(const nlohmann::json& storage_config, ValidationResult& result) {
    if (!storage_config.is_object()) {
        addError(result, "'storage' section must be an object");
        return;
    }

    if (storage_config.contains("data_dir")) {
        if (!storage_config["data_dir"].is_string() ||
            storage_config["data_dir"].get<std::string>().empty()) {
            addError(result, "Storage data_dir must be a non-empty string");
        }
    }
}

void ConfigValidator::validateScheduleConfig(const nlohmann::json& schedule_config, ValidationResult& result) {
    if (!schedule_config.is_object()) {
        addError(result, "'schedule' section must be an object");
        return;
    }

    if (positiveInteger(schedule_config, "dispatch_interval_seconds", "schedule", result) &&
        schedule_config.contains("dispatch_interval_seconds")) {
        int interval = schedule_config["dispatch_interval_seconds"];
        if (interval < 1 || interval > 3600) {
            result.warnings.push_back(
                "dispatch_interval_seconds should be between 1 and 3600 seconds (current: " +
                std::to_string(interval) + ")"
            );
        }
    }

    bool candlestick_ok =
        positiveInteger(schedule_config, "candlestick_window_minutes", "schedule", result);
    bool mean_ok = positiveInteger(schedule_config, "mean_window_minutes", "schedule", result);

    if (candlestick_ok && mean_ok) {
        int candlestick = schedule_config.value("candlestick_window_minutes", 1);
        int mean = schedule_config.value("mean_window_minutes", 15);
        if (mean < candlestick) {
            result.warnings.push_back(
                "mean_window_minutes (" + std::to_string(mean) +
                ") is shorter than candlestick_window_minutes (" + std::to_string(candlestick) + ")"
            );
        }
    }
}

void ConfigValidator::validateLoggingConfig(const nlohmann::json& logging_config, ValidationResult& result) {
    if (!logging_config.is_object()) {
        addError(result, "'logging' section must be an object");
        return;
    }

    if (logging_config.contains("level")) {
        if (!logging_config["level"].is_string() ||
            !isValidLogLevel(logging_config["level"].get<std::string>())) {
            addError(result, "Invalid log level: " + logging_config["level"].dump() +
                             ". Must be one of: DEBUG, INFO, WARNING, ERROR, CRITICAL");
        }
    }

    if (logging_config.contains("file") && !logging_config["file"].is_string()) {
        addError(result, "Log file must be a string");
    }
}

bool ConfigValidator::positiveInteger(const nlohmann::json& section, const std::string& field,
                                      const std::string& section_name, ValidationResult& result) {
    if (!section.contains(field)) {
        return true;
    }

    const auto& value = section[field];
    if (!value.is_number_integer() || value.get<int64_t>() <= 0 ||
        value.get<int64_t>() > std::numeric_limits<int>::max()) {
        addError(result, section_name + " " + field + " must be a positive integer (at most " +
                 std::to_string(std::numeric_limits<int>::max()) + ")");
        return false;
    }
    return true;
}

} // namespace tickagg
