#include "LoggingChannels.h"
#include <algorithm>
#include <array>
#include <cassert>
#include <cctype>
#include <chrono>
#include <sstream>

namespace RNodeClient {

bool LoggingChannels::initialized_ = false;
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

namespace {

constexpr std::array<LogChannel, 4> kAllChannels = {
    LogChannel::Cli, LogChannel::Network, LogChannel::Repl, LogChannel::Web
};

spdlog::sink_ptr makeConsoleSink(bool toStderr, spdlog::level::level_enum level)
{
    spdlog::sink_ptr sink;
    if (toStderr) {
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    else {
        sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    sink->set_level(level);
    return sink;
}

// Returns null when the file cannot be opened; logging then stays console-only.
spdlog::sink_ptr makeFileSink(
    const std::string& path, spdlog::level::level_enum level, std::string& failure)
{
    try {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
        sink->set_level(level);
        return sink;
    }
    catch (const spdlog::spdlog_ex& e) {
        failure = e.what();
        return nullptr;
    }
}

// Channel loggers show their name; the default logger omits it.
std::string makePattern(const std::string& componentName, bool withChannel)
{
    std::string pattern = "[%H:%M:%S.%e] ";
    if (componentName != "default") {
        pattern += "[" + componentName + "] ";
    }
    if (withChannel) {
        pattern += "[%n] ";
    }
    return pattern + "[%^%l%$] [%s:%#] %v";
}

std::string trim(const std::string& text)
{
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

} // namespace

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName,
    bool consoleToStderr,
    const std::string& logFile)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    std::string fileFailure;
    spdlog::sink_ptr fileSink;
    if (!logFile.empty()) {
        fileSink = makeFileSink(logFile, fileLevel, fileFailure);
    }

    sharedSinks_ = { makeConsoleSink(consoleToStderr, consoleLevel) };
    if (fileSink) {
        sharedSinks_.push_back(fileSink);
    }
    const std::string channelPattern = makePattern(componentName, true);
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(channelPattern);
    }

    for (LogChannel channel : kAllChannels) {
        createLogger(toString(channel), sharedSinks_, spdlog::level::info);
    }

    // The default logger gets its own sinks so its pattern leaves the channels alone.
    std::vector<spdlog::sink_ptr> defaultSinks = { makeConsoleSink(consoleToStderr, consoleLevel) };
    if (fileSink) {
        defaultSinks.push_back(fileSink);
    }
    const std::string defaultPattern = makePattern(componentName, false);
    for (auto& sink : defaultSinks) {
        sink->set_pattern(defaultPattern);
    }

    const std::string loggerName = componentName.empty() ? "default" : componentName;
    auto defaultLogger =
        std::make_shared<spdlog::logger>(loggerName, defaultSinks.begin(), defaultSinks.end());
    defaultLogger->set_level(spdlog::level::info);
    spdlog::set_default_logger(defaultLogger);

    spdlog::flush_every(std::chrono::seconds(1));

    initialized_ = true;
    if (!fileFailure.empty()) {
        SLOG_WARN("Logging to console only: {}", fileFailure);
    }
    SLOG_DEBUG("LoggingChannels initialized");
}

void LoggingChannels::shutdown()
{
    if (!initialized_) {
        return;
    }
    spdlog::shutdown();
    sharedSinks_.clear();
    initialized_ = false;
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    // Tests built on gtest_main never call initialize().
    if (!initialized_) {
        initialize();
    }

    auto logger = spdlog::get(toString(channel));
    assert(logger && "LogChannel not found after initialization");
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    if (spec.empty()) {
        return;
    }

    std::stringstream ss(spec);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (item.empty()) {
            continue;
        }

        const size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            spdlog::warn("Invalid channel spec (missing colon): {}", item);
            continue;
        }

        const std::string channel = trim(item.substr(0, colonPos));
        const auto level = parseLevelString(trim(item.substr(colonPos + 1)));

        if (channel == "*") {
            spdlog::apply_all(
                [level](std::shared_ptr<spdlog::logger> logger) { logger->set_level(level); });
            spdlog::debug("Set all channels to level: {}", spdlog::level::to_string_view(level));
        }
        else if (!setChannelLevel(channel, level)) {
            spdlog::warn("Unknown log channel '{}' in spec", channel);
        }
    }
}

void LoggingChannels::setChannelLevel(LogChannel channel, spdlog::level::level_enum level)
{
    get(channel)->set_level(level);
}

bool LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    const auto known = std::find_if(kAllChannels.begin(), kAllChannels.end(), [&](LogChannel c) {
        return channel == toString(c);
    });
    if (known == kAllChannels.end()) {
        return false;
    }

    setChannelLevel(*known, level);
    spdlog::debug("Set channel '{}' to level: {}", channel, spdlog::level::to_string_view(level));
    return true;
}

void LoggingChannels::createLogger(
    const std::string& name,
    const std::vector<spdlog::sink_ptr>& sinks,
    spdlog::level::level_enum level)
{
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    spdlog::register_logger(logger);
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "warning") {
        return spdlog::level::warn;
    }
    if (lower == "error") {
        return spdlog::level::err;
    }

    // from_str maps unknown names to off.
    const auto level = spdlog::level::from_str(lower);
    if (level == spdlog::level::off && lower != "off") {
        spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
        return spdlog::level::info;
    }
    return level;
}

} // namespace RNodeClient
