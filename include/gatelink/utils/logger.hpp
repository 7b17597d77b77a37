/**
 * @file logger.hpp
 * @brief Thread-safe logging for GateLink.
 *
 * Structured log lines with a level, a component tag and a millisecond
 * timestamp. Output goes to stderr unless a sink is installed (tests install
 * one to capture lines).
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#include "gatelink/utils/export.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace gatelink {
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
 * @class Logger
 * @brief Process-wide logger with configurable level and sink.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_INFO("Discovery", "Resolved gateway {} at {}:{}", name, host, port);
 * @endcode
 */
class GATELINK_UTILS_API Logger {
public:
    /// Receives the level and the fully formatted line (without newline).
    using Sink = std::function<void(LogLevel, const std::string&)>;

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
        return static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Replace the output sink. An empty sink restores stderr output.
     */
    void setSink(Sink sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

    /**
     * @brief Canonical upper-case name of a level ("INFO", "WARN", ...).
     */
    static std::string levelName(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO";
            case LogLevel::WARN:  return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            case LogLevel::OFF:   return "OFF";
        }
        return "?";
    }

    /**
     * @brief Parse a level name (case-sensitive, upper-case).
     * @return The level, or INFO when the name is not recognized.
     */
    static LogLevel parseLevel(const std::string& name) {
        if (name == "TRACE") return LogLevel::TRACE;
        if (name == "DEBUG") return LogLevel::DEBUG;
        if (name == "INFO") return LogLevel::INFO;
        if (name == "WARN") return LogLevel::WARN;
        if (name == "ERROR") return LogLevel::ERROR;
        if (name == "FATAL") return LogLevel::FATAL;
        if (name == "OFF") return LogLevel::OFF;
        return LogLevel::INFO;
    }

    template<typename... Args>
    void log(LogLevel level, const std::string& component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }

        std::string message = formatMessage(format, std::forward<Args>(args)...);

        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time_t_now, &tm_buf);

        std::ostringstream oss;
        oss << "["
            << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count()
            << "] ";

        std::lock_guard<std::mutex> lock(mutex_);
        const bool color = !sink_ && colorEnabled_.load(std::memory_order_relaxed);
        if (color) {
            oss << getColorCode(level);
        }
        std::string name = levelName(level);
        name.resize(5, ' ');
        oss << "[" << name << "]";
        if (color) {
            oss << "\033[0m";
        }
        oss << " [" << component << "] " << message;

        if (sink_) {
            sink_(level, oss.str());
        } else {
            std::cerr << oss.str() << std::endl;
        }
    }

private:
    Logger() : level_(static_cast<int>(LogLevel::INFO)), colorEnabled_(true) {}
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string formatMessage(const char* format) {
        return std::string(format);
    }

    // Substitutes each "{}" in order; surplus placeholders are kept verbatim.
    template<typename T, typename... Args>
    std::string formatMessage(const char* format, T&& value, Args&&... args) {
        std::ostringstream oss;

        while (*format) {
            if (*format == '{' && *(format + 1) == '}') {
                oss << value;
                return oss.str() + formatMessage(format + 2, std::forward<Args>(args)...);
            }
            oss << *format++;
        }

        return oss.str();
    }

    const char* getColorCode(LogLevel level) const {
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

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::mutex mutex_;
    Sink sink_;
};

}  // namespace utils
}  // namespace gatelink

// =============================================================================
// Convenience Macros
// =============================================================================

#define LOG_TRACE(component, ...) \
    ::gatelink::utils::Logger::instance().log(::gatelink::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::gatelink::utils::Logger::instance().log(::gatelink::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::gatelink::utils::Logger::instance().log(::gatelink::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::gatelink::utils::Logger::instance().log(::gatelink::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::gatelink::utils::Logger::instance().log(::gatelink::utils::LogLevel::ERROR, component, __VA_ARGS__)

#define LOG_FATAL(component, ...) \
    ::gatelink::utils::Logger::instance().log(::gatelink::utils::LogLevel::FATAL, component, __VA_ARGS__)
