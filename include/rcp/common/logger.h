// =============================================================================
// rcp-packager - Logger Module
// =============================================================================
// Asynchronous logging for the command layer, backed by Quill.
//
// The core library (codecs, messages, package I/O) does not log; it raises
// typed exceptions. Commands and the CLI entry point log through the
// RCP_LOG_* macros once init() has run.
//
// Usage:
//   rcp::log::init({.logFile = "export.log", .level = rcp::log::Level::kDebug});
//   RCP_LOG_INFO("Wrote package {}", root.string());
// =============================================================================

#ifndef RCP_COMMON_LOGGER_H
#define RCP_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace rcp::log {

/// @brief Log levels, ordered by severity.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

/// @brief Logger initialization options.
struct Config {
    /// @brief Log file path. Empty disables the file sink.
    std::string logFile;

    /// @brief Minimum level written by any sink.
    Level level = Level::kInfo;

    /// @brief Write to the console sink.
    bool enableConsole = true;

    /// @brief Logger name shown in records.
    std::string loggerName = "rcp";
};

/// @brief Initialize the process logger. Later calls are ignored.
void init(const Config& config);

/// @brief Pick a level from CLI verbosity flags.
/// @param verbosity Number of -v flags.
/// @param quiet Whether -q was given (wins over verbosity).
[[nodiscard]] Level levelFromVerbosity(int verbosity, bool quiet) noexcept;

/// @brief Get the process logger, nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

[[nodiscard]] bool isInitialized() noexcept;

/// @brief Block until queued records are written.
void flush();

/// @brief Flush and stop the backend thread.
void shutdown();

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Parse a level name (case-insensitive); unknown names map to kInfo.
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace rcp::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define RCP_LOG_TRACE(fmt, ...) \
    LOG_TRACE_L1(rcp::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define RCP_LOG_DEBUG(fmt, ...) \
    LOG_DEBUG(rcp::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define RCP_LOG_INFO(fmt, ...) \
    LOG_INFO(rcp::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define RCP_LOG_WARNING(fmt, ...) \
    LOG_WARNING(rcp::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define RCP_LOG_ERROR(fmt, ...) \
    LOG_ERROR(rcp::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define RCP_LOG_CRITICAL(fmt, ...) \
    LOG_CRITICAL(rcp::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // RCP_COMMON_LOGGER_H
