// =============================================================================
// lci - Logger Module
// =============================================================================
// Low-latency asynchronous logging using Quill library.
//
// This module provides a global logger instance with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console and file output
// - Thread-safe logging (files are decoded on TBB worker threads)
//
// Usage:
//   lci::log::init("lci.log", lci::log::Level::kInfo);
//   LCI_LOG_INFO("Decoded {} blocks", 42);
//
// The LCI_LOG_* macros are no-ops until init() has been called, so the
// decoding library can be used (and tested) without a logging backend.
// =============================================================================

#ifndef LCI_COMMON_LOGGER_H
#define LCI_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace lci::log {

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

/// @brief Configuration options for logger initialization.
struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kInfo;

    /// @brief Enable console output.
    bool enableConsole = true;

    /// @brief Logger name for identification.
    std::string loggerName = "lci";
};

/// @brief Initialize the global logger with the specified configuration.
/// @note Should be called once at application startup; repeated calls are ignored.
void init(const Config& config);

/// @brief Initialize the global logger with default settings.
/// @param logFile Path to log file. Empty string disables file logging.
/// @param level Minimum log level to output.
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Check if the logger has been initialized.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Flush all pending log messages.
void flush();

/// @brief Flush pending messages and stop the backend thread.
void shutdown();

/// @brief Convert lci::log::Level to Quill's LogLevel.
[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Convert string to log level (case-insensitive, defaults to kInfo).
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

/// @brief Convert log level to string.
[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace lci::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define LCI_LOG_TRACE(fmt, ...)                                          \
    do {                                                                 \
        if (quill::Logger* lciLogger_ = lci::log::logger()) {            \
            LOG_TRACE_L1(lciLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);    \
        }                                                                \
    } while (false)

#define LCI_LOG_DEBUG(fmt, ...)                                          \
    do {                                                                 \
        if (quill::Logger* lciLogger_ = lci::log::logger()) {            \
            LOG_DEBUG(lciLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);       \
        }                                                                \
    } while (false)

#define LCI_LOG_INFO(fmt, ...)                                           \
    do {                                                                 \
        if (quill::Logger* lciLogger_ = lci::log::logger()) {            \
            LOG_INFO(lciLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);        \
        }                                                                \
    } while (false)

#define LCI_LOG_WARNING(fmt, ...)                                        \
    do {                                                                 \
        if (quill::Logger* lciLogger_ = lci::log::logger()) {            \
            LOG_WARNING(lciLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);     \
        }                                                                \
    } while (false)

#define LCI_LOG_ERROR(fmt, ...)                                          \
    do {                                                                 \
        if (quill::Logger* lciLogger_ = lci::log::logger()) {            \
            LOG_ERROR(lciLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);       \
        }                                                                \
    } while (false)

#define LCI_LOG_CRITICAL(fmt, ...)                                       \
    do {                                                                 \
        if (quill::Logger* lciLogger_ = lci::log::logger()) {            \
            LOG_CRITICAL(lciLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);    \
        }                                                                \
    } while (false)

#endif  // LCI_COMMON_LOGGER_H
