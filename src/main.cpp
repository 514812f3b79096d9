#include "core/errors.h"
#include "core/symbol_registry.h"
#include "data/finnhub_websocket_feed.h"
#include "data/tick_ingestor.h"
#include "engine/clock_dispatcher.h"
#include "engine/worker_pool.h"
#include "utils/app_config.h"
#include "utils/logger.h"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <numeric>
#include <thread>
#include <nlohmann/json.hpp>
#include <boost/program_options.hpp>

using namespace tickagg;

// Global flag for graceful shutdown
std::atomic<bool> g_running(true);

void signal_handler(int) {
    g_running = false;
}

namespace {

// Command-line values win over the config file
void applyOverrides(nlohmann::json& config, const boost::program_options::variables_map& vm) {
    if (vm.count("token")) {
        config["feed"]["token"] = vm["token"].as<std::string>();
    }
    if (vm.count("stocks")) {
        config["symbols"] = vm["stocks"].as<std::vector<std::string>>();
    }
    if (vm.count("data-dir")) {
        config["storage"]["data_dir"] = vm["data-dir"].as<std::string>();
    }
    if (vm.count("log-level")) {
        config["logging"]["level"] = vm["log-level"].as<std::string>();
    }
    if (vm.count("log-file")) {
        config["logging"]["file"] = vm["log-file"].as<std::string>();
    }
    if (vm["verbose"].as<bool>()) {
        config["logging"]["level"] = "DEBUG";
    }
}

std::string joinSymbols(const std::vector<std::string>& symbols) {
    return std::accumulate(symbols.begin(), symbols.end(), std::string(),
        [](const std::string& a, const std::string& b) { return a.empty() ? b : a + ", " + b; });
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        // Setup signal handlers
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // Parse command line arguments
        namespace po = boost::program_options;
        po::options_description desc("tickagg Options");
        desc.add_options()
            ("help,h", "Show help message")
            ("config,c", po::value<std::string>(), "Configuration file path (JSON)")
            ("token,t", po::value<std::string>(), "Finnhub API token")
            ("stocks,s", po::value<std::vector<std::string>>()->multitoken(),
             "Symbols to track, e.g. AAPL BINANCE:BTCUSDT")
            ("data-dir", po::value<std::string>(), "Directory for tick logs and summaries")
            ("verbose,v", po::bool_switch()->default_value(false), "Shortcut for --log-level DEBUG")
            ("log-level,l", po::value<std::string>(), "Log level (DEBUG, INFO, WARNING, ERROR, CRITICAL)")
            ("log-file", po::value<std::string>(), "Log file path")
            ("validate-only", po::bool_switch()->default_value(false), "Validate configuration and exit");

        po::variables_map vm;
        try {
            po::store(po::parse_command_line(argc, argv, desc), vm);

            if (vm.count("help")) {
                std::cout << desc << std::endl;
                return 0;
            }

            po::notify(vm);
        } catch (const po::error& e) {
            std::cerr << "Error: " << e.what() << "\n\n";
            std::cerr << desc << std::endl;
            return 1;
        }

        // Load configuration
        AppConfig config;
        try {
            nlohmann::json json = vm.count("config")
                ? readConfigFile(vm["config"].as<std::string>())
                : nlohmann::json::object();
            applyOverrides(json, vm);
            config = loadConfig(json);
        } catch (const ConfigError& e) {
            std::cerr << e.what() << std::endl;
            return 1;
        }

        Logger::initialize(parseLogLevel(config.log_level), config.log_file);
        LOG_INFO("Starting tickagg v" + std::string(PROJECT_VERSION));

        for (const auto& warning : config.warnings) {
            LOG_WARNING("Config warning: " + warning);
        }

        if (vm["validate-only"].as<bool>()) {
            LOG_INFO("Configuration validation successful");
            Logger::getInstance().flush();
            return 0;
        }

        // Storage and per-symbol state
        LOG_INFO("Opening storage under " + config.data_dir + " for symbols: " +
                 joinSymbols(config.symbols));
        SymbolRegistry registry(config.data_dir, config.symbols);

        // Computation loops
        WindowSettings windows;
        windows.candlestick_window_minutes = config.candlestick_window_minutes;
        windows.mean_window_minutes = config.mean_window_minutes;
        WorkerPool workers(registry, windows);
        workers.start();

        ClockDispatcher dispatcher(registry, std::chrono::seconds(config.dispatch_interval_seconds));
        dispatcher.start();

        // Market data feed
        auto ingestor = std::make_shared<TickIngestor>(registry);
        FinnhubWebSocketFeed feed(config.token);
        feed.addListener(ingestor);
        feed.subscribeAll(config.symbols);

        if (!feed.connect(config.feed_url)) {
            LOG_CRITICAL("Failed to connect to " + config.feed_url);
            dispatcher.stop();
            workers.stop();
            return 1;
        }

        LOG_INFO("tickagg is running. Press Ctrl+C to stop.");

        auto last_status = std::chrono::steady_clock::now();
        while (g_running) {
            std::this_thread::sleep_for(std::chrono::seconds(1));

            auto now = std::chrono::steady_clock::now();
            if (now - last_status >= std::chrono::minutes(1)) {
                LOG_INFO("Ticks ingested: " + std::to_string(ingestor->ticksIngested()) +
                         ", dropped: " + std::to_string(ingestor->ticksDropped()) +
                         ", feed errors: " + std::to_string(ingestor->feedErrors()) +
                         ", connected: " + (feed.isConnected() ? "yes" : "no"));
                last_status = now;
            }
        }

        // Cleanup
        LOG_INFO("Shutdown signal received, cleaning up...");

        dispatcher.stop();
        feed.disconnect();
        workers.stop();

        LOG_INFO("=== Final Session Counters ===");
        LOG_INFO("Messages received: " + std::to_string(feed.getMessagesReceived()));
        LOG_INFO("Ticks ingested: " + std::to_string(ingestor->ticksIngested()));
        LOG_INFO("Ticks dropped: " + std::to_string(ingestor->ticksDropped()));
        LOG_INFO("Ticks failed: " + std::to_string(ingestor->ticksFailed()));
        LOG_INFO("Feed errors: " + std::to_string(ingestor->feedErrors()));
        LOG_INFO("Keep-alives: " + std::to_string(ingestor->keepAlives()));
        LOG_INFO("Clock events: " + std::to_string(dispatcher.ticksDispatched()));
        LOG_INFO("Candlesticks written: " + std::to_string(workers.candlesticksWritten()));
        LOG_INFO("Means written: " + std::to_string(workers.meansWritten()));
        LOG_INFO("Failed computations: " + std::to_string(workers.failedComputations()));
        LOG_INFO("Session ended successfully");
        Logger::getInstance().flush();

    } catch (const StartupFailure& e) {
        LOG_CRITICAL("Startup failed: " + std::string(e.what()));
        Logger::getInstance().flush();
        std::cerr << "Startup failed: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        LOG_CRITICAL("Fatal error: " + std::string(e.what()));
        Logger::getInstance().flush();
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
