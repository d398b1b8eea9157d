#pragma once

// Compile in every level; filtering happens at runtime per channel.
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <memory>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace RNodeClient {

// One named logger per subsystem; levels can be tuned independently with --log-channels.
enum class LogChannel { Cli, Network, Repl, Web };

inline const char* toString(LogChannel channel)
{
    switch (channel) {
        case LogChannel::Cli:
            return "cli";
        case LogChannel::Network:
            return "network";
        case LogChannel::Repl:
            return "repl";
        case LogChannel::Web:
            return "web";
    }
    return "";
}

/**
 * @brief Registry of the per-subsystem spdlog loggers.
 *
 * All channels share one console sink and, when requested, one log file, so
 * filtering happens per logger while ordering across channels is preserved.
 */
class LoggingChannels {
public:
    /**
     * @brief Create the sinks and one logger per LogChannel. Safe to call more than once.
     * @param componentName Shown in every line of the pattern (e.g., "cli").
     * @param consoleToStderr Keeps stdout clean for command output.
     * @param logFile Appended to when non-empty. If it cannot be opened a warning is
     *   logged and only the console sink is used.
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug,
        const std::string& componentName = "default",
        bool consoleToStderr = false,
        const std::string& logFile = "");

    // Flushes and drops every logger so initialize() can run again.
    static void shutdown();

    static std::shared_ptr<spdlog::logger> get(LogChannel channel);

    /**
     * @brief Apply a comma separated list of "channel:level" pairs.
     *
     * "*" addresses every channel, and later entries win, so "*:off,web:trace"
     * silences everything except the web layer. Unknown channels are reported and skipped.
     */
    static void configureFromString(const std::string& spec);

    static void setChannelLevel(LogChannel channel, spdlog::level::level_enum level);
    static bool setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    // Accepts spdlog level names plus "warning" and "error"; anything else maps to info.
    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

private:
    static void createLogger(
        const std::string& name,
        const std::vector<spdlog::sink_ptr>& sinks,
        spdlog::level::level_enum level);

    static bool initialized_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

// libdatachannel's headers define LOG_* too; ours take precedence.
#undef LOG_TRACE
#undef LOG_DEBUG
#undef LOG_INFO
#undef LOG_WARN
#undef LOG_ERROR

#define RNODE_CHANNEL_LOGGER(channel) \
    ::RNodeClient::LoggingChannels::get(::RNodeClient::LogChannel::channel)

#define LOG_TRACE(channel, ...) SPDLOG_LOGGER_TRACE(RNODE_CHANNEL_LOGGER(channel), __VA_ARGS__)
#define LOG_DEBUG(channel, ...) SPDLOG_LOGGER_DEBUG(RNODE_CHANNEL_LOGGER(channel), __VA_ARGS__)
#define LOG_INFO(channel, ...) SPDLOG_LOGGER_INFO(RNODE_CHANNEL_LOGGER(channel), __VA_ARGS__)
#define LOG_WARN(channel, ...) SPDLOG_LOGGER_WARN(RNODE_CHANNEL_LOGGER(channel), __VA_ARGS__)
#define LOG_ERROR(channel, ...) SPDLOG_LOGGER_ERROR(RNODE_CHANNEL_LOGGER(channel), __VA_ARGS__)

// Default logger, for messages that belong to no channel.
#define SLOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_WARN(...) SPDLOG_LOGGER_WARN(spdlog::default_logger(), __VA_ARGS__)

} // namespace RNodeClient
