/// @file log.cpp
/// @brief Channel logger construction and configuration

#include <forge/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <mutex>
#include <vector>

namespace forge_core {

namespace {

constexpr std::size_t CHANNEL_COUNT = ALL_LOG_CHANNELS.size();

struct ChannelLoggers {
    std::mutex mutex;
    LogConfig config;
    std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console;
    std::array<std::shared_ptr<spdlog::logger>, CHANNEL_COUNT> loggers;
};

ChannelLoggers& channels() {
    static ChannelLoggers state;
    return state;
}

std::size_t index_of(LogChannel channel) {
    return static_cast<std::size_t>(channel);
}

/// Console sink shared by all channels, file sink per channel
std::vector<spdlog::sink_ptr> make_sinks(ChannelLoggers& state, LogChannel channel) {
    std::vector<spdlog::sink_ptr> sinks;

    if (state.config.console_enabled) {
        if (!state.console) {
            state.console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            state.console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        }
        sinks.push_back(state.console);
    }

    if (!state.config.log_directory.empty()) {
        const std::filesystem::path file =
            std::filesystem::path(state.config.log_directory) / (std::string(channel_name(channel)) + ".log");
        try {
            auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file.string(), state.config.max_file_size, state.config.max_files);
            rotating->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            sinks.push_back(std::move(rotating));
        } catch (const spdlog::spdlog_ex& ex) {
            FORGE_LOG_WARN("No log file for channel '{}': {}", channel_name(channel), ex.what());
        }
    }

    return sinks;
}

} // anonymous namespace

// =============================================================================
// Channels
// =============================================================================

const char* channel_name(LogChannel channel) {
    switch (channel) {
        case LogChannel::Core: return "core";
        case LogChannel::Filters: return "filters";
        case LogChannel::Layers: return "layers";
        case LogChannel::Preview: return "preview";
        case LogChannel::History: return "history";
    }
    return "forge";
}

std::optional<LogChannel> parse_log_channel(const std::string& name) {
    for (const LogChannel channel : ALL_LOG_CHANNELS) {
        if (name == channel_name(channel)) {
            return channel;
        }
    }
    return std::nullopt;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

spdlog::level::level_enum LogConfig::level_for(LogChannel channel) const {
    auto it = channel_levels.find(channel);
    return it != channel_levels.end() ? it->second : level;
}

// =============================================================================
// Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    auto& state = channels();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.config = config;

    for (const LogChannel channel : ALL_LOG_CHANNELS) {
        auto& logger = state.loggers[index_of(channel)];
        if (!logger) {
            continue;
        }
        logger->sinks() = make_sinks(state, channel);
        logger->set_level(config.level_for(channel));
    }

    spdlog::set_level(config.level);
}

std::shared_ptr<spdlog::logger> channel_logger(LogChannel channel) {
    auto& state = channels();
    std::lock_guard<std::mutex> lock(state.mutex);

    auto& logger = state.loggers[index_of(channel)];
    if (!logger) {
        auto sinks = make_sinks(state, channel);
        logger = std::make_shared<spdlog::logger>(channel_name(channel), sinks.begin(), sinks.end());
        logger->set_level(state.config.level_for(channel));
    }
    return logger;
}

void shutdown_logging() {
    auto& state = channels();
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        for (auto& logger : state.loggers) {
            if (logger) {
                logger->flush();
                logger.reset();
            }
        }
        state.console.reset();
    }
    spdlog::shutdown();
}

} // namespace forge_core
