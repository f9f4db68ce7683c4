#pragma once

/// @file logging.h
/// @brief driftwatch logging utilities wrapping spdlog

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace driftwatch {

class Config;

/// @brief Log levels matching spdlog levels
enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kCritical = spdlog::level::critical,
    kOff = spdlog::level::off
};

/// @brief Logging configuration
struct LogConfig {
    std::string name = "driftwatch";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v";

    // Console output goes to stderr so stdout stays free for reports
    bool console_to_stderr = true;

    // Rotating file log, written in addition to the console when set
    std::string file_path;
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 5;
};

/// @brief Parse a level name ("trace", "debug", "info", "warn", "error",
///        "critical", "off")
/// @return The level, or nullopt for an unknown name
std::optional<LogLevel> LogLevelFromString(std::string_view name);

/// @brief Read the "logging" section of a configuration
///
/// Recognized keys: logging.level, logging.file, logging.pattern.
/// @return Logging configuration, or InvalidConfiguration for an unknown
///         level name
absl::StatusOr<LogConfig> LogConfigFromConfig(const Config& config);

/// @brief Build a logger without installing it
/// @return The logger, or InvalidConfiguration when a sink cannot be
///         opened (for example an unwritable log file)
absl::StatusOr<std::shared_ptr<spdlog::logger>> CreateLogger(const LogConfig& config);

/// @brief Initialize the global logger with the given configuration
///
/// Does nothing when a logger is already installed.
absl::Status InitLogging(const LogConfig& config = {});

/// @brief Get the global logger instance
/// @return Shared pointer to the logger
std::shared_ptr<spdlog::logger> GetLogger();

/// @brief Set the global log level
/// @param level Log level to set
void SetLogLevel(LogLevel level);

/// @brief Shutdown the logging system
void ShutdownLogging();

// Convenience macros for logging
#define DRIFTWATCH_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::driftwatch::GetLogger(), __VA_ARGS__)
#define DRIFTWATCH_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::driftwatch::GetLogger(), __VA_ARGS__)
#define DRIFTWATCH_LOG_INFO(...) SPDLOG_LOGGER_INFO(::driftwatch::GetLogger(), __VA_ARGS__)
#define DRIFTWATCH_LOG_WARN(...) SPDLOG_LOGGER_WARN(::driftwatch::GetLogger(), __VA_ARGS__)
#define DRIFTWATCH_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::driftwatch::GetLogger(), __VA_ARGS__)
#define DRIFTWATCH_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::driftwatch::GetLogger(), __VA_ARGS__)

}  // namespace driftwatch
