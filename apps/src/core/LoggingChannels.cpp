#include "LoggingChannels.h"
#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace Biomorph {

namespace {

constexpr const char* kDefaultPattern = "[%H:%M:%S.%e] [%n] [%^%l%$] [%s:%#] %v";
constexpr const char* kDefaultLoggerPattern = "[%H:%M:%S.%e] [%^%l%$] [%s:%#] %v";
constexpr const char* kLogFile = "biomorph.log";

// Channel name and its level when no config says otherwise.
const std::array<std::pair<LogChannel, const char*>, 9> kChannelDefaults = { {
    { LogChannel::Combat, "info" },
    { LogChannel::Config, "info" },
    { LogChannel::Creature, "info" },
    { LogChannel::Evolution, "info" },
    { LogChannel::Physics, "warn" },
    { LogChannel::PowerUp, "info" },
    { LogChannel::Reproduction, "info" },
    { LogChannel::Sim, "info" },
    { LogChannel::Stats, "info" },
} };

std::string trim(const std::string& s)
{
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

} // namespace

bool LoggingChannels::initialized_ = false;
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

std::string LoggingChannels::patternFor(
    const std::string& basePattern, const std::string& componentName)
{
    if (componentName == "default") {
        return basePattern;
    }

    // Component name goes right after the timestamp.
    const size_t pos = basePattern.find("] ");
    if (pos == std::string::npos) {
        return "[" + componentName + "] " + basePattern;
    }
    return basePattern.substr(0, pos + 2) + "[" + componentName + "] "
        + basePattern.substr(pos + 2);
}

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(consoleLevel);
    auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kLogFile, true);
    fileSink->set_level(fileLevel);
    sharedSinks_ = { consoleSink, fileSink };

    const std::string pattern = patternFor(kDefaultPattern, componentName);
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    createChannelLoggers();
    for (const auto& [channel, level] : kChannelDefaults) {
        spdlog::get(toString(channel))->set_level(parseLevelString(level));
    }

    installDefaultLogger(consoleLevel, fileLevel, kLogFile, componentName);
    spdlog::flush_every(std::chrono::seconds(1));

    initialized_ = true;
    SLOG_DEBUG("LoggingChannels initialized with built-in defaults");
}

bool LoggingChannels::initializeFromConfig(
    const std::string& configPath, const std::string& componentName)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return false;
    }

    applyConfig(loadConfigFile(configPath), componentName);

    initialized_ = true;
    return true;
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    // Tests built on gtest_main never call initialize().
    if (!initialized_) {
        initialize();
    }

    auto logger = spdlog::get(toString(channel));
    if (!logger) {
        // A channel logger can only vanish if someone called spdlog::drop_all().
        createLogger(toString(channel), sharedSinks_, spdlog::level::info);
        logger = spdlog::get(toString(channel));
    }
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    if (spec.empty()) return;

    std::stringstream ss(spec);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item = trim(item);
        const size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            spdlog::warn("Invalid channel spec (missing colon): {}", item);
            continue;
        }

        const std::string channel = trim(item.substr(0, colonPos));
        const auto level = parseLevelString(trim(item.substr(colonPos + 1)));

        if (channel == "*") {
            for (const auto& entry : kChannelDefaults) {
                setChannelLevel(entry.first, level);
            }
        }
        else {
            setChannelLevel(channel, level);
        }
    }
}

void LoggingChannels::setChannelLevel(LogChannel channel, spdlog::level::level_enum level)
{
    get(channel)->set_level(level);
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    auto logger = spdlog::get(channel);
    if (!logger) {
        spdlog::warn("Unknown log channel '{}'", channel);
        return;
    }
    logger->set_level(level);
    spdlog::debug("Set channel '{}' to level: {}", channel, spdlog::level::to_string_view(level));
}

void LoggingChannels::createLogger(
    const std::string& name,
    const std::vector<spdlog::sink_ptr>& sinks,
    spdlog::level::level_enum level)
{
    if (spdlog::get(name)) {
        spdlog::drop(name);
    }
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    spdlog::register_logger(logger);
}

void LoggingChannels::createChannelLoggers()
{
    for (const auto& entry : kChannelDefaults) {
        createLogger(toString(entry.first), sharedSinks_, spdlog::level::trace);
    }
}

void LoggingChannels::installDefaultLogger(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& logPath,
    const std::string& componentName)
{
    // Separate sink instances so the channel-less pattern does not leak into channel loggers.
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(consoleLevel);
    auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath, false);
    fileSink->set_level(fileLevel);

    const std::string pattern = patternFor(kDefaultLoggerPattern, componentName);
    consoleSink->set_pattern(pattern);
    fileSink->set_pattern(pattern);

    std::vector<spdlog::sink_ptr> sinks = { consoleSink, fileSink };
    auto logger = std::make_shared<spdlog::logger>(
        componentName.empty() ? "default" : componentName, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::info);
    spdlog::set_default_logger(logger);
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "trace") {
        return spdlog::level::trace;
    }
    else if (lower == "debug") {
        return spdlog::level::debug;
    }
    else if (lower == "info") {
        return spdlog::level::info;
    }
    else if (lower == "warn" || lower == "warning") {
        return spdlog::level::warn;
    }
    else if (lower == "error" || lower == "err") {
        return spdlog::level::err;
    }
    else if (lower == "critical") {
        return spdlog::level::critical;
    }
    else if (lower == "off") {
        return spdlog::level::off;
    }

    spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
    return spdlog::level::info;
}

nlohmann::json LoggingChannels::defaultConfig()
{
    nlohmann::json channels = nlohmann::json::object();
    for (const auto& [channel, level] : kChannelDefaults) {
        channels[toString(channel)] = level;
    }

#ifdef BIOMORPH_PRODUCTION_BUILD
    // Production: quieter file, rotating logs.
    nlohmann::json file = { { "enabled", true },
                            { "level", "info" },
                            { "path", kLogFile },
                            { "truncate", false },
                            { "max_size_mb", 10 },
                            { "max_files", 3 } };
    const char* fileLevel = "info";
#else
    // Development: verbose file, fresh log each run.
    nlohmann::json file = {
        { "enabled", true }, { "level", "debug" }, { "path", kLogFile }, { "truncate", true }
    };
    const char* fileLevel = "debug";
#endif

    return {
        { "defaults",
          { { "console_level", "info" },
            { "file_level", fileLevel },
            { "pattern", kDefaultPattern },
            { "flush_interval_ms", 1000 } } },
        { "sinks",
          { { "console", { { "enabled", true }, { "level", "info" } } },
            { "file", file },
            { "specialized",
              { { "combat_trace",
                  { { "enabled", false },
                    { "channel_filter", nlohmann::json::array({ "combat" }) },
                    { "path", "combat-trace.log" },
                    { "level", "trace" } } } } } } },
        { "channels", channels },
    };
}

bool LoggingChannels::createDefaultConfigFile(const std::string& path)
{
    std::ofstream configFile(path);
    if (!configFile.is_open()) {
        spdlog::error("Failed to create config file: {}", path);
        return false;
    }
    configFile << defaultConfig().dump(2) << std::endl;
    spdlog::info("Created default logging config file: {}", path);
    return true;
}

nlohmann::json LoggingChannels::loadConfigFile(const std::string& configPath)
{
    namespace fs = std::filesystem;

    const std::string localPath = configPath + ".local";
    std::string pathToUse;

    if (fs::exists(localPath)) {
        pathToUse = localPath;
    }
    else if (fs::exists(configPath)) {
        pathToUse = configPath;
    }
    else if (createDefaultConfigFile(configPath)) {
        pathToUse = configPath;
    }
    else {
        spdlog::warn("Could not create logging config, using built-in defaults");
        return defaultConfig();
    }

    try {
        std::ifstream configFile(pathToUse);
        if (!configFile.is_open()) {
            spdlog::error("Cannot open logging config {}, using built-in defaults", pathToUse);
            return defaultConfig();
        }
        return nlohmann::json::parse(configFile);
    }
    catch (const nlohmann::json::parse_error& e) {
        spdlog::error(
            "Failed to parse logging config {}: {}, using built-in defaults", pathToUse, e.what());
        return defaultConfig();
    }
}

void LoggingChannels::applyConfig(const nlohmann::json& config, const std::string& componentName)
{
    auto consoleLevel = spdlog::level::info;
    auto fileLevel = spdlog::level::debug;
    std::string basePattern = kDefaultPattern;
    int flushIntervalMs = 1000;

    try {
        if (config.contains("defaults")) {
            const auto& defaults = config["defaults"];
            consoleLevel = parseLevelString(defaults.value("console_level", "info"));
            fileLevel = parseLevelString(defaults.value("file_level", "debug"));
            basePattern = defaults.value("pattern", basePattern);
            flushIntervalMs = defaults.value("flush_interval_ms", flushIntervalMs);
        }
    }
    catch (const nlohmann::json::exception& e) {
        spdlog::warn("Error reading logging defaults: {}, using built-in defaults", e.what());
    }

    std::vector<spdlog::sink_ptr> sinks;
    std::string logPath = kLogFile;

    try {
        const auto& sinksConfig = config.contains("sinks") ? config["sinks"] : nlohmann::json{};

        const auto consoleCfg = sinksConfig.value("console", nlohmann::json::object());
        if (consoleCfg.value("enabled", true)) {
            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_level(parseLevelString(consoleCfg.value("level", "info")));
            sinks.push_back(consoleSink);
        }

        const auto fileCfg = sinksConfig.value("file", nlohmann::json::object());
        if (fileCfg.value("enabled", true)) {
            logPath = fileCfg.value("path", std::string(kLogFile));
            spdlog::sink_ptr fileSink;
            if (fileCfg.contains("max_size_mb")) {
                const size_t maxSizeMB = fileCfg.value("max_size_mb", 100);
                const size_t maxFiles = fileCfg.value("max_files", 3);
                fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logPath, maxSizeMB * 1024 * 1024, maxFiles);
            }
            else {
                fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                    logPath, fileCfg.value("truncate", true));
            }
            fileSink->set_level(parseLevelString(fileCfg.value("level", "debug")));
            sinks.push_back(fileSink);
        }

        if (sinksConfig.contains("specialized")) {
            createSpecializedSinks(sinksConfig["specialized"]);
        }
    }
    catch (const std::exception& e) {
        spdlog::error("Error creating sinks from config: {}, using defaults", e.what());
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_level(consoleLevel);
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kLogFile, true);
        fileSink->set_level(fileLevel);
        sinks = { consoleSink, fileSink };
    }

    sharedSinks_ = sinks;
    const std::string pattern = patternFor(basePattern, componentName);
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    createChannelLoggers();
    for (const auto& [channel, level] : kChannelDefaults) {
        spdlog::get(toString(channel))->set_level(parseLevelString(level));
    }

    try {
        if (config.contains("channels")) {
            for (const auto& [channel, levelStr] : config["channels"].items()) {
                setChannelLevel(channel, parseLevelString(levelStr.get<std::string>()));
            }
        }
    }
    catch (const nlohmann::json::exception& e) {
        spdlog::warn("Error applying channel levels from config: {}", e.what());
    }

    installDefaultLogger(consoleLevel, fileLevel, logPath, componentName);
    spdlog::flush_every(std::chrono::milliseconds(flushIntervalMs));

    SLOG_INFO("LoggingChannels initialized from config");
}

void LoggingChannels::createSpecializedSinks(const nlohmann::json& specializedConfig)
{
    for (const auto& [name, cfg] : specializedConfig.items()) {
        if (!cfg.value("enabled", false)) {
            continue;
        }

        const std::string path = cfg.value("path", name + ".log");
        const auto level = parseLevelString(cfg.value("level", "trace"));
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, true);
        sink->set_level(level);

        // Each filtered channel gets a "<channel>_<name>" logger writing only to this file.
        for (const auto& channel : cfg.value("channel_filter", std::vector<std::string>{})) {
            auto logger = std::make_shared<spdlog::logger>(channel + "_" + name, sink);
            logger->set_level(level);
            spdlog::register_logger(logger);
            spdlog::info("Specialized sink '{}' for channel '{}' -> {}", name, channel, path);
        }
    }
}

} // namespace Biomorph
