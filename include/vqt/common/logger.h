// =============================================================================
// vq-tiers - Logger Module
// =============================================================================
// Process-wide Quill logger shared by the traversal, the filter and the CLI.
//
// main() configures it once from -v/-q/--log-file. Library code and tests that
// log before (or without) init() get a console logger at info level, so the
// VQT_LOG_* macros are always safe to call, including from shard threads.
//
// Usage:
//   vqt::log::Config config;
//   config.level = vqt::log::levelForVerbosity(2, false);  // trace
//   vqt::log::init(config);
//   VQT_LOG_INFO("Processed {} sites", 42);
// =============================================================================

#ifndef VQT_COMMON_LOGGER_H
#define VQT_COMMON_LOGGER_H

#include <string>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace vqt::log {

/// @brief Severity, least to most severe.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

/// @brief Logger setup chosen on the command line.
struct Config {
    /// @brief Extra file sink, truncated on open. Empty for console only.
    std::string logFile;

    Level level = Level::kInfo;

    /// @brief Console sink on stdout; dropped only when a log file is given.
    bool console = true;
};

/// @brief Level for the -v count and -q flag.
/// @note -q wins over -v; one -v gives debug, two or more give trace.
[[nodiscard]] Level levelForVerbosity(int verbosity, bool quiet) noexcept;

/// @brief Start the backend and create the "vqt" logger.
/// @note A second call, or a call after the first log statement, keeps the
///       existing logger.
void init(const Config& config);

/// @brief The "vqt" logger, created with the default Config on first use.
[[nodiscard]] quill::Logger* logger();

[[nodiscard]] bool isInitialized() noexcept;

/// @brief Block until queued messages are written.
void flush();

/// @brief Flush, stop the backend thread and forget the logger.
void shutdown();

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

}  // namespace vqt::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define VQT_LOG_TRACE(fmt, ...) \
    LOG_TRACE_L1(vqt::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define VQT_LOG_DEBUG(fmt, ...) \
    LOG_DEBUG(vqt::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define VQT_LOG_INFO(fmt, ...) \
    LOG_INFO(vqt::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define VQT_LOG_WARNING(fmt, ...) \
    LOG_WARNING(vqt::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define VQT_LOG_ERROR(fmt, ...) \
    LOG_ERROR(vqt::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define VQT_LOG_CRITICAL(fmt, ...) \
    LOG_CRITICAL(vqt::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // VQT_COMMON_LOGGER_H
