/**
 * @file Logger.hpp
 * @brief Logging infrastructure for ClipGuard diagnostics
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 * 
 * Thread-safe logging with severity filtering, file rotation and a host
 * callback. A Logger is constructed once by the host and passed by
 * reference to every service that logs; there is no global instance.
 */

#pragma once

#ifndef CLIPGUARD_CORE_LOGGER_HPP
#define CLIPGUARD_CORE_LOGGER_HPP

#include <spdlog/common.h>
#include <cstdio>
#include <string>
#include <string_view>
#include <mutex>
#include <memory>
#include <chrono>
#include <functional>

namespace spdlog {
class logger;
}

namespace ClipGuard {
namespace Core {

/**
 * @brief Log severity levels
 */
enum class LogLevel : uint8_t {
    Trace = 0,      ///< Verbose tracing for deep debugging
    Debug = 1,      ///< Debug information for development
    Info = 2,       ///< General informational messages
    Warning = 3,    ///< Warning messages for potential issues
    Error = 4,      ///< Error messages for failures
    Critical = 5,   ///< Critical events requiring immediate attention
    Off = 255       ///< Disable all logging
};

/**
 * @brief Log output targets
 */
enum class LogOutput : uint8_t {
    None = 0,
    Console = 1 << 0,   ///< Output to console/stdout
    File = 1 << 1,      ///< Output to rotating file
    Callback = 1 << 2,  ///< Call host-provided callback
    All = Console | File | Callback
};

inline LogOutput operator|(LogOutput a, LogOutput b) {
    return static_cast<LogOutput>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline LogOutput operator&(LogOutput a, LogOutput b) {
    return static_cast<LogOutput>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

inline bool hasFlag(LogOutput value, LogOutput flag) {
    return (static_cast<uint8_t>(value) & static_cast<uint8_t>(flag)) != 0;
}

/**
 * @brief Parse a level name ("trace", "debug", "info", "warning", "error",
 *        "critical", "off"), case-insensitive
 * @return Parsed level, or Info for unknown names
 */
LogLevel parseLogLevel(std::string_view name);

/**
 * @brief Log callback function type
 * @param level Severity level of the message
 * @param message Formatted log message
 * @param timestamp Message timestamp
 */
using LogCallback = std::function<void(LogLevel level, std::string_view message, 
                                       std::chrono::system_clock::time_point timestamp)>;

/**
 * @brief Thread-safe logger backed by spdlog
 * 
 * Features:
 * - Multiple severity levels with filtering
 * - Console, rotating file and callback sinks
 * - Timestamp and thread ID tracking
 * - Per-level message counters
 */
class Logger {
public:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Initialize the logger
     * @param minLevel Minimum log level to record
     * @param outputs Output targets (console, file, callback)
     * @param logFilePath Path to log file (required if File output enabled)
     * @param maxFileSizeMB Maximum log file size in MB before rotation
     * @return true on success, false if already initialized or sink creation failed
     */
    bool Initialize(LogLevel minLevel = LogLevel::Info,
                    LogOutput outputs = LogOutput::Console,
                    const std::string& logFilePath = "",
                    size_t maxFileSizeMB = 10);

    /**
     * @brief Shutdown the logger and flush all buffers
     */
    void Shutdown();

    void SetMinLevel(LogLevel level);
    LogLevel GetMinLevel() const;

    /**
     * @brief Set host callback for log messages (Callback output)
     */
    void SetCallback(LogCallback callback);

    /**
     * @brief Check if a log level is enabled
     */
    bool IsLevelEnabled(LogLevel level) const;

    /**
     * @brief Log a message at the specified level
     * @param level Severity level
     * @param message Message text
     * @param file Source file name (optional)
     * @param line Source line number (optional)
     */
    void Log(LogLevel level, std::string_view message, 
             const char* file = nullptr, int line = 0);

    /**
     * @brief Log a printf-style formatted message
     */
    template<typename... Args>
    void LogFormat(LogLevel level, const char* format, Args&&... args) {
        if (!IsLevelEnabled(level)) return;
        
        char buffer[1024];
        int result = std::snprintf(buffer, sizeof(buffer), format, std::forward<Args>(args)...);
        
        if (result > 0 && static_cast<size_t>(result) < sizeof(buffer)) {
            Log(level, std::string_view(buffer, result));
        } else if (result > 0) {
            std::string largeBuffer(result + 1, '\0');
            std::snprintf(largeBuffer.data(), largeBuffer.size(), format, std::forward<Args>(args)...);
            largeBuffer.resize(result);
            Log(level, largeBuffer);
        }
    }

    /**
     * @brief Flush all sinks
     */
    void Flush();

    /**
     * @brief Message counters per level
     */
    struct Statistics {
        size_t trace;
        size_t debug;
        size_t info;
        size_t warning;
        size_t error;
        size_t critical;
        size_t dropped;  ///< Messages dropped due to level filtering
    };

    Statistics GetStatistics() const;
    void ResetStatistics();

private:
    static spdlog::level::level_enum ToSpdlogLevel(LogLevel level);
    static LogLevel FromSpdlogLevel(spdlog::level::level_enum level);

    // Configuration
    LogLevel minLevel_ = LogLevel::Info;
    LogOutput outputs_ = LogOutput::Console;
    std::string logFilePath_;
    size_t maxFileSizeBytes_ = 10 * 1024 * 1024;
    LogCallback callback_;

    // State
    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> spdlogger_;
    bool initialized_ = false;

    // Statistics
    mutable std::mutex statsMutex_;
    Statistics stats_{};
};

} // namespace Core
} // namespace ClipGuard

// ============================================================================
// Convenience Macros
// ============================================================================

#ifndef CLIPGUARD_DISABLE_LOGGING

#define CLIPGUARD_LOG_TRACE(logger, msg) \
    (logger).Log(::ClipGuard::Core::LogLevel::Trace, msg, __FILE__, __LINE__)

#define CLIPGUARD_LOG_DEBUG(logger, msg) \
    (logger).Log(::ClipGuard::Core::LogLevel::Debug, msg, __FILE__, __LINE__)

#define CLIPGUARD_LOG_INFO(logger, msg) \
    (logger).Log(::ClipGuard::Core::LogLevel::Info, msg, __FILE__, __LINE__)

#define CLIPGUARD_LOG_WARNING(logger, msg) \
    (logger).Log(::ClipGuard::Core::LogLevel::Warning, msg, __FILE__, __LINE__)

#define CLIPGUARD_LOG_ERROR(logger, msg) \
    (logger).Log(::ClipGuard::Core::LogLevel::Error, msg, __FILE__, __LINE__)

#define CLIPGUARD_LOG_CRITICAL(logger, msg) \
    (logger).Log(::ClipGuard::Core::LogLevel::Critical, msg, __FILE__, __LINE__)

#define CLIPGUARD_LOG_DEBUG_F(logger, fmt, ...) \
    (logger).LogFormat(::ClipGuard::Core::LogLevel::Debug, fmt, __VA_ARGS__)

#define CLIPGUARD_LOG_INFO_F(logger, fmt, ...) \
    (logger).LogFormat(::ClipGuard::Core::LogLevel::Info, fmt, __VA_ARGS__)

#define CLIPGUARD_LOG_WARNING_F(logger, fmt, ...) \
    (logger).LogFormat(::ClipGuard::Core::LogLevel::Warning, fmt, __VA_ARGS__)

#define CLIPGUARD_LOG_ERROR_F(logger, fmt, ...) \
    (logger).LogFormat(::ClipGuard::Core::LogLevel::Error, fmt, __VA_ARGS__)

#else
#define CLIPGUARD_LOG_TRACE(logger, msg) ((void)0)
#define CLIPGUARD_LOG_DEBUG(logger, msg) ((void)0)
#define CLIPGUARD_LOG_INFO(logger, msg) ((void)0)
#define CLIPGUARD_LOG_WARNING(logger, msg) ((void)0)
#define CLIPGUARD_LOG_ERROR(logger, msg) ((void)0)
#define CLIPGUARD_LOG_CRITICAL(logger, msg) ((void)0)
#define CLIPGUARD_LOG_DEBUG_F(logger, fmt, ...) ((void)0)
#define CLIPGUARD_LOG_INFO_F(logger, fmt, ...) ((void)0)
#define CLIPGUARD_LOG_WARNING_F(logger, fmt, ...) ((void)0)
#define CLIPGUARD_LOG_ERROR_F(logger, fmt, ...) ((void)0)
#endif // CLIPGUARD_DISABLE_LOGGING

#endif // CLIPGUARD_CORE_LOGGER_HPP
