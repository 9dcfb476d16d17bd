/**
 * @file logger.hpp
 * @brief Thread-safe logging for the mesh daemon and its libraries.
 *
 * Structured lines with a timestamp, a severity, a component tag and a
 * message built from `{}` placeholders. Output goes to stderr unless a
 * different sink is installed (tests capture into a stringstream).
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include "crossmesh/utils/export.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace crossmesh {
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
 * @brief Parse a level name ("trace", "INFO", "warning", ...). Case-insensitive.
 * @param name Level name.
 * @param fallback Returned when the name is not recognised.
 */
CROSSMESH_UTILS_API LogLevel logLevelFromString(const std::string& name,
                                                LogLevel fallback = LogLevel::INFO);

/**
 * @class Logger
 * @brief Process-wide logger.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_INFO("ConnectionManager", "Connected to {} via {}", clusterId, "relay");
 * @endcode
 */
class CROSSMESH_UTILS_API Logger {
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
        return static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Redirect output. Passing nullptr restores stderr.
     * The stream must outlive every subsequent log call.
     */
    void setSink(std::ostream* sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = sink ? sink : &std::cerr;
    }

    template<typename... Args>
    void log(LogLevel level, const char* component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }

        std::string message = formatMessage(format, std::forward<Args>(args)...);

        std::ostringstream oss;

        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t_now);
#else
        localtime_r(&time_t_now, &tm_buf);
#endif

        oss << "["
            << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count()
            << "] ";

        bool color = colorEnabled_.load(std::memory_order_relaxed);
        if (color) {
            oss << getColorCode(level);
        }
        oss << "[" << logLevelToString(level) << "]";
        if (color) {
            oss << "\033[0m";
        }

        oss << " [" << component << "] " << message;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            (*sink_) << oss.str() << std::endl;
        }

        if (level == LogLevel::FATAL) {
            std::abort();
        }
    }

private:
    Logger()
        : level_(static_cast<int>(LogLevel::INFO))
        , colorEnabled_(true)
        , sink_(&std::cerr)
    {}
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string formatMessage(const char* format) {
        return std::string(format);
    }

    // Substitutes the next "{}" with value; extra arguments without a
    // placeholder are appended after the message.
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

        oss << " " << value;
        return oss.str() + formatMessage("", std::forward<Args>(args)...);
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
    std::ostream* sink_;
};

}  // namespace utils
}  // namespace crossmesh

// =============================================================================
// Convenience Macros
// =============================================================================

#define LOG_TRACE(component, ...) \
    ::crossmesh::utils::Logger::instance().log(::crossmesh::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::crossmesh::utils::Logger::instance().log(::crossmesh::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::crossmesh::utils::Logger::instance().log(::crossmesh::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::crossmesh::utils::Logger::instance().log(::crossmesh::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::crossmesh::utils::Logger::instance().log(::crossmesh::utils::LogLevel::ERROR, component, __VA_ARGS__)

#define LOG_FATAL(component, ...) \
    ::crossmesh::utils::Logger::instance().log(::crossmesh::utils::LogLevel::FATAL, component, __VA_ARGS__)

#define LOG_IF(level, component, condition, ...) \
    do { \
        if ((condition) && ::crossmesh::utils::Logger::instance().isEnabled(level)) { \
            ::crossmesh::utils::Logger::instance().log(level, component, __VA_ARGS__); \
        } \
    } while(0)
