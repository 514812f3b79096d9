#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace tickagg {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    CRITICAL = 4
};

// Parses DEBUG/INFO/WARNING/ERROR/CRITICAL (case-insensitive), INFO otherwise
LogLevel parseLogLevel(const std::string& level);
bool isValidLogLevel(const std::string& level);

class Logger {
private:
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level;
        std::string message;
        std::thread::id thread_id;
        std::string file;
        int line;
    };

    std::atomic<LogLevel> log_level_;
    std::ofstream log_file_;

    // Async logging
    std::queue<LogEntry> log_queue_;
    std::mutex queue_mutex_;
    std::condition_variable log_cv_;
    std::thread log_thread_;
    std::atomic<bool> running_;

    std::mutex console_mutex_;
    std::mutex file_mutex_;

    static std::unique_ptr<Logger> instance_;
    static std::mutex instance_mutex_;

    Logger(LogLevel level, const std::string& file_path);

    void processLogs();
    void writeLog(const LogEntry& entry);
    static std::string levelToString(LogLevel level);

public:
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Replaces the process logger; pending lines of the old one are flushed
    static void initialize(LogLevel level, const std::string& file_path);
    static Logger& getInstance();

    void log(LogLevel level, const std::string& message,
             const std::string& file = "", int line = 0);

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const { return log_level_.load(); }
    void flush();
};

// Convenience macros
#define LOG_DEBUG(msg) ::tickagg::Logger::getInstance().log(::tickagg::LogLevel::DEBUG, msg, __FILE__, __LINE__)
#define LOG_INFO(msg) ::tickagg::Logger::getInstance().log(::tickagg::LogLevel::INFO, msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) ::tickagg::Logger::getInstance().log(::tickagg::LogLevel::WARNING, msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) ::tickagg::Logger::getInstance().log(::tickagg::LogLevel::ERROR, msg, __FILE__, __LINE__)
#define LOG_CRITICAL(msg) ::tickagg::Logger::getInstance().log(::tickagg::LogLevel::CRITICAL, msg, __FILE__, __LINE__)

// Per-symbol lines, prefixed with [symbol]
#define LOG_SYMBOL_DEBUG(symbol, msg) LOG_DEBUG("[" + std::string(symbol) + "] " + (msg))
#define LOG_SYMBOL_INFO(symbol, msg) LOG_INFO("[" + std::string(symbol) + "] " + (msg))
#define LOG_SYMBOL_WARNING(symbol, msg) LOG_WARNING("[" + std::string(symbol) + "] " + (msg))
#define LOG_SYMBOL_ERROR(symbol, msg) LOG_ERROR("[" + std::string(symbol) + "] " + (msg))

// Performance logging
class PerformanceLogger {
private:
    std::string operation_;
    std::chrono::steady_clock::time_point start_time_;

public:
    explicit PerformanceLogger(const std::string& operation);
    ~PerformanceLogger();
};

#define PERF_LOG(operation) ::tickagg::PerformanceLogger _perf_logger(operation)

} // namespace tickagg
