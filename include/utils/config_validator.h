#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace tickagg {

class ConfigValidator {
public:
    struct ValidationResult {
        bool is_valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    static ValidationResult validateConfig(const nlohmann::json& config);

private:
    static void validateRequiredSections(const nlohmann::json& config, ValidationResult& result);
    static void validateFeedConfig(const nlohmann::json& feed_config, ValidationResult& result);
    static void validateSymbols(const nlohmann::json& symbols, ValidationResult& result);
    static void validateStorageConfig(const nlohmann::json& storage_config, ValidationResult& result);
    static void validateScheduleConfig(const nlohmann::json& schedule_config, ValidationResult& result);
    static void validateLoggingConfig(const nlohmann::json& logging_config, ValidationResult& result);

    // Fails when the field is present but not a positive integer
    static bool positiveInteger(const nlohmann::json& section, const std::string& field,
                                const std::string& section_name, ValidationResult& result);
};

} // namespace tickagg
