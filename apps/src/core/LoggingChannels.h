#pragma once

// Enable all log levels for SPDLOG_LOGGER_* macros (must be before spdlog includes).
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace Biomorph {

/**
 * @brief Subsystem channels, each backed by its own named spdlog logger.
 */
enum class LogChannel {
    Combat,
    Config,
    Creature,
    Evolution,
    Physics,
    PowerUp,
    Reproduction,
    Sim,
    Stats
};

inline const char* toString(LogChannel channel)
{
    switch (channel) {
        case LogChannel::Combat:
            return "combat";
        case LogChannel::Config:
            return "config";
        case LogChannel::Creature:
            return "creature";
        case LogChannel::Evolution:
            return "evolution";
        case LogChannel::Physics:
            return "physics";
        case LogChannel::PowerUp:
            return "powerup";
        case LogChannel::Reproduction:
            return "reproduction";
        case LogChannel::Sim:
            return "sim";
        case LogChannel::Stats:
            return "stats";
    }
    return "sim";
}

/**
 * @brief Registry of per-subsystem loggers sharing one console sink and one file sink.
 *
 * Channels let a run be narrowed down ("combat:trace,*:warn") without drowning
 * in physics chatter.
 */
class LoggingChannels {
public:
    /**
     * @brief Initialize with built-in defaults.
     * @param consoleLevel Level for the console sink
     * @param fileLevel Level for the biomorph.log sink
     * @param componentName Injected into the log pattern unless "default"
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug,
        const std::string& componentName = "default");

    /**
     * @brief Initialize from a JSON logging config.
     * Looks for <configPath>.local first, then <configPath>. Writes a default
     * file if neither exists.
     * @return false if logging was already initialized
     */
    static bool initializeFromConfig(
        const std::string& configPath = "logging-config.json",
        const std::string& componentName = "default");

    static std::shared_ptr<spdlog::logger> get(LogChannel channel);

    /**
     * @brief Override channel levels.
     * @param spec "channel:level[,channel:level...]", "*" addresses every channel.
     * Examples:
     *   "combat:debug,physics:warn"
     *   "*:off,evolution:info"
     */
    static void configureFromString(const std::string& spec);

    static void setChannelLevel(LogChannel channel, spdlog::level::level_enum level);
    static void setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

    static nlohmann::json defaultConfig();

private:
    static void createLogger(
        const std::string& name,
        const std::vector<spdlog::sink_ptr>& sinks,
        spdlog::level::level_enum level);

    static void createChannelLoggers();
    static void installDefaultLogger(
        spdlog::level::level_enum consoleLevel,
        spdlog::level::level_enum fileLevel,
        const std::string& logPath,
        const std::string& componentName);

    static nlohmann::json loadConfigFile(const std::string& configPath);
    static bool createDefaultConfigFile(const std::string& path);
    static void applyConfig(const nlohmann::json& config, const std::string& componentName);
    static void createSpecializedSinks(const nlohmann::json& specializedConfig);
    static std::string patternFor(const std::string& basePattern, const std::string& componentName);

    static bool initialized_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

#ifdef LOG_TRACE
#undef LOG_TRACE
#endif
#ifdef LOG_DEBUG
#undef LOG_DEBUG
#endif
#ifdef LOG_INFO
#undef LOG_INFO
#endif
#ifdef LOG_WARN
#undef LOG_WARN
#endif
#ifdef LOG_ERROR
#undef LOG_ERROR
#endif

#define LOG_TRACE(channel, ...) \
    SPDLOG_LOGGER_TRACE(::Biomorph::LoggingChannels::get(::Biomorph::LogChannel::channel), __VA_ARGS__)
#define LOG_DEBUG(channel, ...) \
    SPDLOG_LOGGER_DEBUG(::Biomorph::LoggingChannels::get(::Biomorph::LogChannel::channel), __VA_ARGS__)
#define LOG_INFO(channel, ...) \
    SPDLOG_LOGGER_INFO(::Biomorph::LoggingChannels::get(::Biomorph::LogChannel::channel), __VA_ARGS__)
#define LOG_WARN(channel, ...) \
    SPDLOG_LOGGER_WARN(::Biomorph::LoggingChannels::get(::Biomorph::LogChannel::channel), __VA_ARGS__)
#define LOG_ERROR(channel, ...) \
    SPDLOG_LOGGER_ERROR(::Biomorph::LoggingChannels::get(::Biomorph::LogChannel::channel), __VA_ARGS__)

// Default logger, no channel in the output.
#define SLOG_TRACE(...) SPDLOG_LOGGER_TRACE(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_INFO(...) SPDLOG_LOGGER_INFO(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_WARN(...) SPDLOG_LOGGER_WARN(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_ERROR(...) SPDLOG_LOGGER_ERROR(spdlog::default_logger(), __VA_ARGS__)

} // namespace Biomorph
