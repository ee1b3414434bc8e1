/**
 * @file logger.hpp
 * @brief Thread-safe logging for uuidkit.
 *
 * Structured log lines with configurable levels, component tags and
 * timestamps. Output goes to std::cerr unless redirected.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#pragma once

#include "uuidkit/utils/export.hpp"

#include <atomic>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

namespace uuidkit {
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
 * @brief Map a level name (case-insensitive) to a LogLevel.
 * @return The level, or std::nullopt for an unknown name.
 */
UUIDKIT_UTILS_API std::optional<LogLevel> parseLogLevel(const std::string& name);

/**
 * @class Logger
 * @brief Thread-safe singleton logger.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_INFO("Generator", "Using node {}", node_str);
 * LOG_WARN("Interfaces", "getifaddrs failed: errno {}", err);
 * @endcode
 */
class UUIDKIT_UTILS_API Logger {
public:
    /**
     * @brief Get the singleton logger instance.
     */
    static Logger& instance();

    /**
     * @brief Name of a level without padding ("INFO", "WARN", ...).
     */
    static std::string levelName(LogLevel level);

    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    /**
     * @brief Check if a level would be logged.
     */
    bool isEnabled(LogLevel level) const {
        return level != LogLevel::OFF &&
               static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Enable or disable ANSI colour codes around the level tag.
     */
    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Redirect output. Passing nullptr restores std::cerr.
     *
     * The stream must outlive every subsequent log call.
     */
    void setOutput(std::ostream* out);

    /**
     * @brief Log a message; each "{}" in format is replaced by the next argument.
     */
    template<typename... Args>
    void log(LogLevel level, const char* component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }
        std::ostringstream oss;
        formatMessage(oss, format, std::forward<Args>(args)...);
        write(level, component, oss.str());
    }

private:
    Logger();
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write(LogLevel level, const char* component, const std::string& message);

    static void formatMessage(std::ostringstream& oss, const char* format) {
        oss << format;
    }

    template<typename T, typename... Args>
    static void formatMessage(std::ostringstream& oss, const char* format,
                              T&& value, Args&&... args) {
        while (*format) {
            if (*format == '{' && *(format + 1) == '}') {
                oss << value;
                formatMessage(oss, format + 2, std::forward<Args>(args)...);
                return;
            }
            oss << *format++;
        }
    }

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::ostream* out_;
    std::mutex mutex_;
};

}  // namespace utils
}  // namespace uuidkit

// =============================================================================
// Convenience Macros
// =============================================================================

#define LOG_TRACE(component, ...) \
    ::uuidkit::utils::Logger::instance().log(::uuidkit::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::uuidkit::utils::Logger::instance().log(::uuidkit::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::uuidkit::utils::Logger::instance().log(::uuidkit::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::uuidkit::utils::Logger::instance().log(::uuidkit::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::uuidkit::utils::Logger::instance().log(::uuidkit::utils::LogLevel::ERROR, component, __VA_ARGS__)

#define LOG_FATAL(component, ...) \
    ::uuidkit::utils::Logger::instance().log(::uuidkit::utils::LogLevel::FATAL, component, __VA_ARGS__)

// Conditional logging (avoid evaluation if level disabled)
#define LOG_IF(level, component, condition, ...) \
    do { \
        if ((condition) && ::uuidkit::utils::Logger::instance().isEnabled(level)) { \
            ::uuidkit::utils::Logger::instance().log(level, component, __VA_ARGS__); \
        } \
    } while(0)
