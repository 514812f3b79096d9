#include <gtest/gtest.h>
#include "utils/app_config.h"
#include "utils/config_validator.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace tickagg;
using json = nlohmann::json;
namespace fs = std::filesystem;

class ConfigValidatorTest : public ::testing::Test {
protected:
    json createValidConfig() {
        return json::parse(R"({
            "feed": {
                "url": "wss://ws.finnhub.io",
                "token": "valid_token_12345"
            },
            "symbols": ["AAPL", "BINANCE:BTCUSDT", "IC MARKETS:1"],
            "storage": {
                "data_dir": "data"
            },
            "schedule": {
                "dispatch_interval_seconds": 60,
                "candlestick_window_minutes": 1,
                "mean_window_minutes": 15
            },
            "logging": {
                "level": "INFO",
                "file": "tickagg.log"
            }
        })");
    }

    static bool contains(const std::vector<std::string>& messages, const std::string& needle) {
        return std::any_of(messages.begin(), messages.end(),
            [&needle](const std::string& message) {
                return message.find(needle) != std::string::npos;
            });
    }
};

TEST_F(ConfigValidatorTest, ValidConfigPasses) {
    auto config = createValidConfig();
    config["symbols"] = json::array({"AAPL", "BINANCE:BTCUSDT"});
    auto result = ConfigValidator::validateConfig(config);

    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(result.warnings.empty());
}

TEST_F(ConfigValidatorTest, MinimalConfigPasses) {
    auto config = json::parse(R"({"feed":{"token":"abc"},"symbols":["AAPL"]})");
    auto result = ConfigValidator::validateConfig(config);

    EXPECT_TRUE(result.is_valid);
}

TEST_F(ConfigValidatorTest, MissingRequiredSections) {
    auto config = createValidConfig();
    config.erase("feed");
    config.erase("symbols");

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(contains(result.errors, "Missing required 'feed'"));
    EXPECT_TRUE(contains(result.errors, "Missing required 'symbols'"));
}

TEST_F(ConfigValidatorTest, NotAnObject) {
    auto result = ConfigValidator::validateConfig(json::array());
    EXPECT_FALSE(result.is_valid);
}

TEST_F(ConfigValidatorTest, PlaceholderToken) {
    auto config = createValidConfig();
    config["feed"]["token"] = "YOUR_FINNHUB_TOKEN";

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(contains(result.errors, "Invalid or missing Finnhub API token"));
}

TEST_F(ConfigValidatorTest, EmptyOrMissingToken) {
    auto config = createValidConfig();
    config["feed"]["token"] = "";
    EXPECT_FALSE(ConfigValidator::validateConfig(config).is_valid);

    config["feed"].erase("token");
    EXPECT_FALSE(ConfigValidator::validateConfig(config).is_valid);
}

TEST_F(ConfigValidatorTest, FeedUrlScheme) {
    auto config = createValidConfig();
    config["feed"]["url"] = "https://finnhub.io";
    auto result = ConfigValidator::validateConfig(config);
    EXPECT_FALSE(result.is_valid);

    config["feed"]["url"] = "ws://localhost:9000";
    result = ConfigValidator::validateConfig(config);
    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(contains(result.warnings, "not using TLS"));
}

TEST_F(ConfigValidatorTest, SymbolFormatWarning) {
    auto config = createValidConfig();
    config["symbols"] = json::array({"AAPL", "lowercase", "IC MARKETS:1"});

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_TRUE(result.is_valid);  // Warnings don't make config invalid
    EXPECT_TRUE(contains(result.warnings, "Symbol format warning: lowercase"));
    EXPECT_TRUE(contains(result.warnings, "Symbol format warning: IC MARKETS:1"));
}

TEST_F(ConfigValidatorTest, DuplicateSymbolWarning) {
    auto config = createValidConfig();
    config["symbols"] = json::array({"AAPL", "AAPL"});

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(contains(result.warnings, "Duplicate symbol AAPL"));
}

TEST_F(ConfigValidatorTest, InvalidSymbols) {
    auto config = createValidConfig();

    config["symbols"] = json::array();
    EXPECT_TRUE(contains(ConfigValidator::validateConfig(config).errors, "at least one symbol"));

    config["symbols"] = json::array({"AAPL", 42});
    EXPECT_TRUE(contains(ConfigValidator::validateConfig(config).errors, "Symbol must be a string"));

    config["symbols"] = json::array({""});
    EXPECT_TRUE(contains(ConfigValidator::validateConfig(config).errors, "must not be empty"));

    config["symbols"] = json::array({"A,B"});
    EXPECT_TRUE(contains(ConfigValidator::validateConfig(config).errors, "must not contain ','"));

    config["symbols"] = "AAPL";
    EXPECT_FALSE(ConfigValidator::validateConfig(config).is_valid);
}

TEST_F(ConfigValidatorTest, ScheduleMustBePositive) {
    auto config = createValidConfig();
    config["schedule"]["dispatch_interval_seconds"] = 0;
    config["schedule"]["mean_window_minutes"] = -15;

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(contains(result.errors, "dispatch_interval_seconds must be a positive integer"));
    EXPECT_TRUE(contains(result.errors, "mean_window_minutes must be a positive integer"));
}

TEST_F(ConfigValidatorTest, ScheduleRejectsValuesBeyondInt) {
    auto config = createValidConfig();
    config["schedule"]["mean_window_minutes"] = 2147483648LL;

    auto result = ConfigValidator::validateConfig(config);
    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(contains(result.errors, "mean_window_minutes must be a positive integer"));
    EXPECT_THROW(loadConfig(config), ConfigError);

    config["schedule"]["mean_window_minutes"] = 2147483647;
    EXPECT_TRUE(ConfigValidator::validateConfig(config).is_valid);
    EXPECT_EQ(loadConfig(config).mean_window_minutes, 2147483647);
}

TEST_F(ConfigValidatorTest, SymbolsSharingStoreFileRejected) {
    auto config = createValidConfig();
    config["symbols"] = json::array({"BINANCE:BTC-USDT", "BINANCE:BTC_USDT"});

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(contains(result.errors, "BINANCE_BTC_USDT.csv"));
}

TEST_F(ConfigValidatorTest, ScheduleWarnings) {
    auto config = createValidConfig();
    config["schedule"]["dispatch_interval_seconds"] = 7200;
    config["schedule"]["candlestick_window_minutes"] = 5;
    config["schedule"]["mean_window_minutes"] = 2;

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(contains(result.warnings, "between 1 and 3600"));
    EXPECT_TRUE(contains(result.warnings, "shorter than candlestick_window_minutes"));
}

TEST_F(ConfigValidatorTest, InvalidLogLevel) {
    auto config = createValidConfig();
    config["logging"]["level"] = "VERBOSE";

    auto result = ConfigValidator::validateConfig(config);

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(contains(result.errors, "Invalid log level"));

    config["logging"]["level"] = "debug";
    EXPECT_TRUE(ConfigValidator::validateConfig(config).is_valid);
}

TEST_F(ConfigValidatorTest, EmptyDataDir) {
    auto config = createValidConfig();
    config["storage"]["data_dir"] = "";

    EXPECT_FALSE(ConfigValidator::validateConfig(config).is_valid);
}

TEST_F(ConfigValidatorTest, LoadConfigReadsEverySection) {
    auto config = createValidConfig();
    config["schedule"]["dispatch_interval_seconds"] = 30;

    AppConfig app = loadConfig(config);

    EXPECT_EQ(app.feed_url, "wss://ws.finnhub.io");
    EXPECT_EQ(app.token, "valid_token_12345");
    ASSERT_EQ(app.symbols.size(), 3u);
    EXPECT_EQ(app.symbols[1], "BINANCE:BTCUSDT");
    EXPECT_EQ(app.data_dir, "data");
    EXPECT_EQ(app.dispatch_interval_seconds, 30);
    EXPECT_EQ(app.candlestick_window_minutes, 1);
    EXPECT_EQ(app.mean_window_minutes, 15);
    EXPECT_EQ(app.log_level, "INFO");
    EXPECT_EQ(app.log_file, "tickagg.log");
    EXPECT_TRUE(contains(app.warnings, "IC MARKETS:1"));
}

TEST_F(ConfigValidatorTest, LoadConfigDefaults) {
    AppConfig app = loadConfig(json::parse(R"({"feed":{"token":"abc"},"symbols":["AAPL"]})"));

    EXPECT_EQ(app.feed_url, "wss://ws.finnhub.io");
    EXPECT_EQ(app.data_dir, "data");
    EXPECT_EQ(app.dispatch_interval_seconds, 60);
    EXPECT_EQ(app.candlestick_window_minutes, 1);
    EXPECT_EQ(app.mean_window_minutes, 15);
    EXPECT_TRUE(app.log_file.empty());
}

TEST_F(ConfigValidatorTest, LoadConfigThrowsWithAllErrors) {
    auto config = createValidConfig();
    config["feed"]["token"] = "";
    config["symbols"] = json::array();

    try {
        loadConfig(config);
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.errors().size(), 2u);
        EXPECT_NE(std::string(e.what()).find("validation failed"), std::string::npos);
    }
}

TEST_F(ConfigValidatorTest, ToJsonRoundTrips) {
    AppConfig app = loadConfig(createValidConfig());
    AppConfig again = loadConfig(app.toJson());

    EXPECT_EQ(again.token, app.token);
    EXPECT_EQ(again.symbols, app.symbols);
    EXPECT_EQ(again.log_file, app.log_file);
}

TEST_F(ConfigValidatorTest, ConfigFile) {
    fs::path path = fs::temp_directory_path() / "tickagg_config_test.json";
    {
        std::ofstream out(path);
        out << createValidConfig().dump(2);
    }
    AppConfig app = loadConfigFile(path.string());
    EXPECT_EQ(app.symbols.size(), 3u);

    {
        std::ofstream out(path);
        out << "{ broken";
    }
    EXPECT_THROW(loadConfigFile(path.string()), ConfigError);

    fs::remove(path);
    EXPECT_THROW(loadConfigFile(path.string()), ConfigError);
}
