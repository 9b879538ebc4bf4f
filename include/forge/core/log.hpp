#pragma once

/// @file log.hpp
/// @brief Per-subsystem spdlog loggers for forge
///
/// Every editor subsystem logs through its own channel. Channels share the
/// console sink, get one rotating file each when a log directory is set, and
/// may run at a level different from the global one.

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

// =============================================================================
// Logging Macros
// =============================================================================

#define FORGE_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define FORGE_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define FORGE_LOG_WARN(...) spdlog::warn(__VA_ARGS__)

namespace forge_core {

// =============================================================================
// Channels
// =============================================================================

enum class LogChannel : std::uint8_t {
    Core,
    Filters,
    Layers,
    Preview,
    History,
};

inline constexpr std::array<LogChannel, 5> ALL_LOG_CHANNELS{
    LogChannel::Core, LogChannel::Filters, LogChannel::Layers, LogChannel::Preview, LogChannel::History,
};

/// Logger name, also the log file stem
[[nodiscard]] const char* channel_name(LogChannel channel);

[[nodiscard]] std::optional<LogChannel> parse_log_channel(const std::string& name);

/// trace, debug, info, warn|warning, error|err, critical, off
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

// =============================================================================
// Configuration
// =============================================================================

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    /// Overrides `level` for single channels
    std::map<LogChannel, spdlog::level::level_enum> channel_levels;
    bool console_enabled = true;
    /// Rotating per-channel files are written here when not empty
    std::string log_directory;
    std::size_t max_file_size = 5 * 1024 * 1024;
    std::size_t max_files = 3;

    [[nodiscard]] spdlog::level::level_enum level_for(LogChannel channel) const;
};

/// Console pattern and info level for the default logger, before config is read
inline void init_logging() {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
}

/// Rebuild every channel's sinks and levels
void configure_logging(const LogConfig& config);

/// Flush and drop every channel logger
void shutdown_logging();

// =============================================================================
// Channel Loggers
// =============================================================================

[[nodiscard]] std::shared_ptr<spdlog::logger> channel_logger(LogChannel channel);

/// Config and timers
inline std::shared_ptr<spdlog::logger> core_logger() { return channel_logger(LogChannel::Core); }

/// Filter pipeline and filter service traffic
inline std::shared_ptr<spdlog::logger> filter_logger() { return channel_logger(LogChannel::Filters); }

/// Layer stack and ordering engine
inline std::shared_ptr<spdlog::logger> layer_logger() { return channel_logger(LogChannel::Layers); }

/// Thumbnail and navigator refresh scheduling
inline std::shared_ptr<spdlog::logger> preview_logger() { return channel_logger(LogChannel::Preview); }

inline std::shared_ptr<spdlog::logger> history_logger() { return channel_logger(LogChannel::History); }

} // namespace forge_core
