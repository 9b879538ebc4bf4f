/// @file config.hpp
/// @brief Layered configuration for the editing core
///
/// Provides layered configuration with:
/// - Built-in defaults
/// - JSON configuration files (flattened to dotted keys)
/// - Environment variables
/// - Command-line overrides

#pragma once

#include <forge/core/error.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace forge_editor {

/// Configuration value
using ConfigValue = std::variant<
    bool,
    std::int64_t,
    double,
    std::string,
    std::vector<std::string>
>;

// =============================================================================
// Config Layer
// =============================================================================

/// Configuration layer priority (lower = higher priority)
enum class ConfigLayerPriority : std::int32_t {
    CommandLine = -1000,    ///< Command-line arguments (highest)
    Environment = -500,     ///< Environment variables
    User = 0,               ///< User configuration file
    Default = 1000,         ///< Built-in defaults (lowest)
};

/// A configuration layer
class ConfigLayer {
public:
    explicit ConfigLayer(const std::string& name, ConfigLayerPriority priority = ConfigLayerPriority::User)
        : m_name(name), m_priority(priority) {}

    [[nodiscard]] const std::string& name() const { return m_name; }
    [[nodiscard]] ConfigLayerPriority priority() const { return m_priority; }

    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;
    void set(const std::string& key, ConfigValue value);
    bool remove(const std::string& key);
    void clear();

    [[nodiscard]] std::vector<std::string> keys() const;
    [[nodiscard]] std::size_t size() const { return m_values.size(); }
    [[nodiscard]] bool empty() const { return m_values.empty(); }

private:
    std::string m_name;
    ConfigLayerPriority m_priority;
    std::map<std::string, ConfigValue> m_values;
};

// =============================================================================
// Config Manager
// =============================================================================

/// Layered configuration manager
class ConfigManager {
public:
    using ChangeCallback = std::function<void(const std::string& key, const ConfigValue& value)>;

    ConfigManager() = default;

    // Non-copyable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // =========================================================================
    // Layer Management
    // =========================================================================

    void add_layer(std::unique_ptr<ConfigLayer> layer);

    [[nodiscard]] ConfigLayer* get_layer(const std::string& name);
    [[nodiscard]] const ConfigLayer* get_layer(const std::string& name) const;

    bool remove_layer(const std::string& name);

    [[nodiscard]] std::size_t layer_count() const { return m_layers.size(); }

    // =========================================================================
    // Value Access (Merged View)
    // =========================================================================

    [[nodiscard]] bool contains(const std::string& key) const;

    /// Value from the highest priority layer that has it
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;

    [[nodiscard]] bool get_bool(const std::string& key, bool default_value = false) const;
    [[nodiscard]] std::int64_t get_int(const std::string& key, std::int64_t default_value = 0) const;
    [[nodiscard]] double get_float(const std::string& key, double default_value = 0.0) const;
    [[nodiscard]] std::string get_string(const std::string& key, const std::string& default_value = "") const;
    [[nodiscard]] std::vector<std::string> get_string_array(
        const std::string& key,
        const std::vector<std::string>& default_value = {}) const;

    // =========================================================================
    // Value Setting
    // =========================================================================

    /// Set value in a layer (created with User priority if missing)
    void set(const std::string& key, ConfigValue value, const std::string& layer_name = "user");

    void set_bool(const std::string& key, bool value, const std::string& layer_name = "user");
    void set_int(const std::string& key, std::int64_t value, const std::string& layer_name = "user");
    void set_float(const std::string& key, double value, const std::string& layer_name = "user");
    void set_string(const std::string& key, const std::string& value, const std::string& layer_name = "user");

    // =========================================================================
    // Sources
    // =========================================================================

    /// Load a JSON file into a layer. Nested objects become dotted keys.
    forge_core::Result<void> load_json(const std::filesystem::path& path, const std::string& layer_name = "user");

    /// Load JSON text into a layer
    forge_core::Result<void> load_json_string(const std::string& text, const std::string& layer_name = "user");

    /// Parse `--key=value`, `--key value` and `--flag` arguments into the cmdline layer.
    /// Dashes in keys become dots.
    forge_core::Result<void> parse_args(int argc, char** argv);
    forge_core::Result<void> parse_args(const std::vector<std::string>& args);

    /// Read the known keys from `<prefix><KEY>` environment variables
    /// (FORGE_PREVIEW_REFRESH_INTERVAL_MS -> preview.refresh_interval_ms)
    void load_environment(const std::string& prefix = "FORGE_");

    // =========================================================================
    // Events
    // =========================================================================

    void on_change(ChangeCallback callback);

    // =========================================================================
    // Defaults
    // =========================================================================

    /// Create default layers and fill the defaults layer
    void setup_defaults();

    /// Create default layers (defaults, user, environment, cmdline)
    void create_default_layers();

private:
    [[nodiscard]] std::vector<ConfigLayer*> sorted_layers() const;
    /// Caller holds m_mutex
    [[nodiscard]] ConfigLayer& ensure_layer(const std::string& name, ConfigLayerPriority priority);
    void notify_change(const std::string& key, const ConfigValue& value);

private:
    std::vector<std::unique_ptr<ConfigLayer>> m_layers;
    mutable std::mutex m_mutex;
    std::vector<ChangeCallback> m_change_callbacks;
};

/// Convert a command-line or environment string to the narrowest value type
[[nodiscard]] ConfigValue infer_config_value(const std::string& text);

// =============================================================================
// Config Keys (Constants)
// =============================================================================

namespace config_keys {

// Filters
constexpr const char* FILTERS_PREVIEW_DEBOUNCE_MS = "filters.preview_debounce_ms";
constexpr const char* FILTERS_ENDPOINT = "filters.endpoint";

// Preview
constexpr const char* PREVIEW_REFRESH_INTERVAL_MS = "preview.refresh_interval_ms";
constexpr const char* PREVIEW_THUMBNAIL_SIZE = "preview.thumbnail_size";
constexpr const char* PREVIEW_CHECKER_SIZE = "preview.checker_size";

// Layers
constexpr const char* LAYERS_DRAG_EDGE_FRACTION = "layers.drag_edge_fraction";

// Logging
constexpr const char* LOG_LEVEL = "log.level";
constexpr const char* LOG_DIRECTORY = "log.dir";
/// Followed by a channel name, e.g. log.channels.filters = debug
constexpr const char* LOG_CHANNEL_PREFIX = "log.channels.";

} // namespace config_keys

// =============================================================================
// Editor Config
// =============================================================================

constexpr std::int64_t MIN_REFRESH_INTERVAL_MS = 50;
constexpr std::int64_t MAX_REFRESH_INTERVAL_MS = 5000;

/// Resolved, validated configuration
struct EditorConfig {
    std::chrono::milliseconds preview_debounce{150};
    std::string filter_endpoint = "/api/filters";

    std::chrono::milliseconds refresh_interval{250};
    std::uint32_t thumbnail_size = 40;
    std::uint32_t checker_size = 5;

    double drag_edge_fraction = 0.3;

    std::string log_level = "info";
    std::string log_directory;
    /// Channel name -> level name
    std::map<std::string, std::string> log_channel_levels;
};

/// Build an EditorConfig from the merged view, clamping out-of-range values
[[nodiscard]] EditorConfig build_editor_config(const ConfigManager& config);

} // namespace forge_editor
