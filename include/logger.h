#pragma once

#include <string>
#include <memory>

namespace parley {

/**
 * @brief Log levels for filtering output
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Map a config string ("debug", "info", "warn"/"warning", "error") to a level
 * @param text Level name, case-insensitive
 * @param fallback Level used when text is not recognised
 */
LogLevel parse_log_level(const std::string& text, LogLevel fallback = LogLevel::INFO);

/**
 * @brief Lightweight, thread-safe logging system
 *
 * Provides leveled logging with optional file output.
 * Safe for concurrent use from component background threads.
 */
class Logger {
public:
    /**
     * @brief Initialize logger with minimum log level
     * @param min_level Minimum level to output (default: INFO)
     * @param output_file Optional file path for log output (empty = console only)
     */
    static void initialize(LogLevel min_level = LogLevel::INFO,
                          const std::string& output_file = "");

    /**
     * @brief Shutdown logger and close file handles
     */
    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    /**
     * @brief Set minimum log level (filters output)
     */
    static void set_level(LogLevel level);

    /**
     * @brief Get current minimum log level
     */
    static LogLevel get_level();

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

// Convenience macros
#define LOG_DEBUG(msg) parley::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) parley::Logger::info(msg)
#define LOG_WARN(msg) parley::Logger::warn(msg)
#define LOG_ERROR(msg) parley::Logger::error(msg)

// Component-specific logging macros
#define LOG_DISPATCH(msg) parley::Logger::info(std::string("[Dispatcher] ") + (msg))
#define LOG_INPUT(msg) parley::Logger::info(std::string("[Input] ") + (msg))
#define LOG_OUTPUT(msg) parley::Logger::info(std::string("[Output] ") + (msg))
#define LOG_SERVICE(msg) parley::Logger::info(std::string("[Service] ") + (msg))
#define LOG_STATUS(msg) parley::Logger::info(std::string("[Status] ") + (msg))

} // namespace parley
