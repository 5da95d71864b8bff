// =============================================================================
// xz-blocks - Logger Module
// =============================================================================
// Low-latency asynchronous logging using the Quill library.
//
// This module provides a global logger instance with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console and file output
// - Lazy default initialization, so library code can log before (or without)
//   an explicit init() call from the application
//
// Usage:
//   xzb::log::init("xzb.log", xzb::log::Level::kInfo);
//   XZB_LOG_INFO("Opened stream with {} blocks", count);
//
// When init() has not been called, the first logging call initializes a
// console logger whose level is read from the XZB_LOG_LEVEL environment
// variable (default: warning).
// =============================================================================

#ifndef XZB_COMMON_LOGGER_H
#define XZB_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace xzb::log {

// =============================================================================
// Log Level Enumeration
// =============================================================================

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

// =============================================================================
// Logger Configuration
// =============================================================================

/// @brief Configuration options for logger initialization.
struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kWarning;

    /// @brief Enable console (stdout) output.
    bool enableConsole = true;

    /// @brief Logger name for identification.
    std::string loggerName = "xzb";
};

/// @brief Environment variable consulted by the lazy default initialization.
inline constexpr const char* kLogLevelEnvVar = "XZB_LOG_LEVEL";

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note Has no effect if the logger is already initialized.
void init(const Config& config);

/// @brief Initialize the global logger with a file and level.
/// @param logFile Path to log file. Empty string disables file logging.
/// @param level Minimum log level to output.
void init(std::string_view logFile = "", Level level = Level::kWarning);

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, initializing it with
///         defaults if no explicit init() happened yet.
[[nodiscard]] quill::Logger* logger();

/// @brief Check if the logger has been initialized.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Flush all pending log messages.
void flush();

/// @brief Shutdown the logging system.
/// @note Flushes all pending messages and stops the backend thread.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

/// @brief Convert xzb::log::Level to Quill's LogLevel.
[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Convert string to log level.
/// @param levelStr String representation (case-insensitive).
/// @param fallback Level returned for unknown strings.
[[nodiscard]] Level levelFromString(std::string_view levelStr,
                                    Level fallback = Level::kInfo) noexcept;

/// @brief Convert log level to string.
[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace xzb::log

// =============================================================================
// Convenience Macros
// =============================================================================

/// @brief Log a trace message.
#define XZB_LOG_TRACE(fmt, ...) \
    LOG_TRACE_L1(xzb::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define XZB_LOG_DEBUG(fmt, ...) \
    LOG_DEBUG(xzb::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define XZB_LOG_INFO(fmt, ...) \
    LOG_INFO(xzb::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define XZB_LOG_WARNING(fmt, ...) \
    LOG_WARNING(xzb::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define XZB_LOG_ERROR(fmt, ...) \
    LOG_ERROR(xzb::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define XZB_LOG_CRITICAL(fmt, ...) \
    LOG_CRITICAL(xzb::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // XZB_COMMON_LOGGER_H
