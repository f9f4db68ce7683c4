#include "logging.h"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <vector>

#include "config.h"
#include "error.h"

namespace driftwatch {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;

}  // namespace

std::optional<LogLevel> LogLevelFromString(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::kTrace;
    if (lowered == "debug") return LogLevel::kDebug;
    if (lowered == "info") return LogLevel::kInfo;
    if (lowered == "warn" || lowered == "warning") return LogLevel::kWarn;
    if (lowered == "error") return LogLevel::kError;
    if (lowered == "critical") return LogLevel::kCritical;
    if (lowered == "off") return LogLevel::kOff;
    return std::nullopt;
}

absl::StatusOr<LogConfig> LogConfigFromConfig(const Config& config) {
    LogConfig log_config;
    if (config.HasKey("logging.level")) {
        const std::string name = config.GetString("logging.level");
        auto level = LogLevelFromString(name);
        if (!level.has_value()) {
            return InvalidConfigurationError(absl::StrCat("Unknown log level '", name, "'"));
        }
        log_config.level = *level;
    }
    log_config.file_path = config.GetString("logging.file", log_config.file_path);
    log_config.pattern = config.GetString("logging.pattern", log_config.pattern);
    return log_config;
}

absl::StatusOr<std::shared_ptr<spdlog::logger>> CreateLogger(const LogConfig& config) {
    const auto level = static_cast<spdlog::level::level_enum>(config.level);
    std::vector<spdlog::sink_ptr> sinks;

    // Console sink (always enabled)
    spdlog::sink_ptr console_sink;
    if (config.console_to_stderr) {
        console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
        console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    console_sink->set_level(level);
    sinks.push_back(console_sink);

    if (!config.file_path.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path,
                config.max_file_size,
                config.max_files
            );
            file_sink->set_level(level);
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            return InvalidConfigurationError(
                absl::StrCat("Cannot open log file '", config.file_path, "': ", e.what()));
        }
    }

    auto logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern(config.pattern);

    // Flush on warn and above
    logger->flush_on(spdlog::level::warn);
    return logger;
}

absl::Status InitLogging(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        return absl::OkStatus();
    }

    DRIFTWATCH_ASSIGN_OR_RETURN(g_logger, CreateLogger(config));
    spdlog::set_default_logger(g_logger);
    return absl::OkStatus();
}

std::shared_ptr<spdlog::logger> GetLogger() {
    {
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        if (g_logger) {
            return g_logger;
        }
    }
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger) {
        // Console-only defaults; spdlog's own logger if even that is refused
        auto logger = CreateLogger(LogConfig{});
        g_logger = logger.ok() ? *std::move(logger) : spdlog::default_logger();
        spdlog::set_default_logger(g_logger);
    }
    return g_logger;
}

void SetLogLevel(LogLevel level) {
    auto logger = GetLogger();
    auto spd_level = static_cast<spdlog::level::level_enum>(level);
    logger->set_level(spd_level);
    for (auto& sink : logger->sinks()) {
        sink->set_level(spd_level);
    }
}

void ShutdownLogging() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        g_logger->flush();
        spdlog::shutdown();
        g_logger.reset();
    }
}

}  // namespace driftwatch
