/**
 * @file logger.hpp
 * @brief Thread-safe logging for agentwatch.
 *
 * Structured log lines with a timestamp, a severity and a component tag.
 * Lines go to stderr unless redirected, so command output on stdout stays
 * machine-readable.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#pragma once

#include "agentwatch/utils/export.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace agentwatch {
namespace utils {

/**
 * @enum LogLevel
 * @brief Logging severity levels.
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

/**
 * @brief Fixed-width name of a level, as printed in log lines.
 */
inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF  ";
        default:              return "?????";
    }
}

/**
 * @brief Parse a level name ("debug", "WARN", ...).
 * @param name Case-insensitive level name.
 * @param fallback Returned when the name is not recognized.
 */
AGENTWATCH_UTILS_API LogLevel parseLogLevel(const std::string& name,
                                            LogLevel fallback = LogLevel::INFO);

/**
 * @class Logger
 * @brief Singleton logger with a configurable level and sink.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_INFO("Cache", "Replaying {} cached instances", count);
 * LOG_WARN("Proc", "Cannot read {}: {}", path, reason);
 * @endcode
 */
class AGENTWATCH_UTILS_API Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    bool isEnabled(LogLevel level) const {
        return level != LogLevel::OFF &&
               static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Enable or disable ANSI colors on the level tag.
     */
    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Redirect log lines. nullptr restores std::cerr.
     */
    void setOutput(std::ostream* out) {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = out ? out : &std::cerr;
    }

    template<typename... Args>
    void log(LogLevel level, const char* component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }
        std::ostringstream message;
        appendFormatted(message, format, std::forward<Args>(args)...);
        write(level, component, message.str());
    }

private:
    Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static void appendFormatted(std::ostringstream& out, const char* format) {
        out << format;
    }

    // Each "{}" takes the next argument; surplus arguments are dropped.
    template<typename T, typename... Args>
    static void appendFormatted(std::ostringstream& out, const char* format,
                                T&& value, Args&&... args) {
        for (; *format; ++format) {
            if (format[0] == '{' && format[1] == '}') {
                out << value;
                appendFormatted(out, format + 2, std::forward<Args>(args)...);
                return;
            }
            out << *format;
        }
    }

    /**
     * @brief Prefix the timestamp and tags, then emit one line under the lock.
     */
    void write(LogLevel level, const char* component, const std::string& message);

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::mutex mutex_;
    std::ostream* out_;
};

}  // namespace utils
}  // namespace agentwatch

// =============================================================================
// Convenience Macros
// =============================================================================

#define LOG_TRACE(component, ...) \
    ::agentwatch::utils::Logger::instance().log(::agentwatch::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::agentwatch::utils::Logger::instance().log(::agentwatch::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::agentwatch::utils::Logger::instance().log(::agentwatch::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::agentwatch::utils::Logger::instance().log(::agentwatch::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::agentwatch::utils::Logger::instance().log(::agentwatch::utils::LogLevel::ERROR, component, __VA_ARGS__)
