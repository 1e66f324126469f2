/**
 * @file logger.cpp
 * @brief Line formatting and level parsing for the Logger.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#include "agentwatch/utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>

namespace agentwatch {
namespace utils {

namespace {

const char* colorFor(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35;1m";
        default:              return "";
    }
}

// [YYYY-MM-DD HH:MM:SS.mmm] in local time
void writeTimestamp(std::ostream& out) {
    using Clock = std::chrono::system_clock;
    auto now = Clock::now();
    std::time_t seconds = Clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);
    out << '[' << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << ']';
}

}  // namespace

Logger::Logger()
    : level_(static_cast<int>(LogLevel::INFO))
    , colorEnabled_(true)
    , out_(&std::cerr)
{}

void Logger::write(LogLevel level, const char* component, const std::string& message) {
    std::ostringstream line;
    writeTimestamp(line);

    if (colorEnabled_.load(std::memory_order_relaxed)) {
        line << ' ' << colorFor(level) << '[' << logLevelToString(level) << "]\033[0m";
    } else {
        line << " [" << logLevelToString(level) << ']';
    }
    line << " [" << component << "] " << message << '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    *out_ << line.str() << std::flush;
}

LogLevel parseLogLevel(const std::string& name, LogLevel fallback) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::TRACE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "FATAL") return LogLevel::FATAL;
    if (upper == "OFF" || upper == "NONE") return LogLevel::OFF;
    return fallback;
}

}  // namespace utils
}  // namespace agentwatch
