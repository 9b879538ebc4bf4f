/// @file config.cpp
/// @brief Layered configuration implementation

#include <forge/editor/config.hpp>
#include <forge/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace forge_editor {

// =============================================================================
// ConfigLayer
// =============================================================================

bool ConfigLayer::contains(const std::string& key) const {
    return m_values.find(key) != m_values.end();
}

std::optional<ConfigValue> ConfigLayer::get(const std::string& key) const {
    auto it = m_values.find(key);
    if (it != m_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void ConfigLayer::set(const std::string& key, ConfigValue value) {
    m_values[key] = std::move(value);
}

bool ConfigLayer::remove(const std::string& key) {
    return m_values.erase(key) > 0;
}

void ConfigLayer::clear() {
    m_values.clear();
}

std::vector<std::string> ConfigLayer::keys() const {
    std::vector<std::string> result;
    result.reserve(m_values.size());
    for (const auto& [key, _] : m_values) {
        result.push_back(key);
    }
    return result;
}

// =============================================================================
// Value Inference
// =============================================================================

ConfigValue infer_config_value(const std::string& text) {
    if (text == "true" || text == "false") {
        return ConfigValue{text == "true"};
    }

    // Try int
    try {
        std::size_t pos = 0;
        std::int64_t int_val = std::stoll(text, &pos);
        if (pos == text.size()) {
            return ConfigValue{int_val};
        }
    } catch (const std::exception&) {
        // Not an integer
    }

    // Try float
    try {
        std::size_t pos = 0;
        double float_val = std::stod(text, &pos);
        if (pos == text.size()) {
            return ConfigValue{float_val};
        }
    } catch (const std::exception&) {
        // Not a number
    }

    return ConfigValue{text};
}

namespace {

/// Flatten a JSON object into dotted keys
void flatten_json(const nlohmann::json& node, const std::string& prefix, ConfigLayer& layer) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        const std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
        const auto& value = it.value();

        if (value.is_object()) {
            flatten_json(value, key, layer);
        } else if (value.is_boolean()) {
            layer.set(key, ConfigValue{value.get<bool>()});
        } else if (value.is_number_integer()) {
            layer.set(key, ConfigValue{value.get<std::int64_t>()});
        } else if (value.is_number_float()) {
            layer.set(key, ConfigValue{value.get<double>()});
        } else if (value.is_string()) {
            layer.set(key, ConfigValue{value.get<std::string>()});
        } else if (value.is_array()) {
            std::vector<std::string> strings;
            bool all_strings = true;
            for (const auto& element : value) {
                if (!element.is_string()) {
                    all_strings = false;
                    break;
                }
                strings.push_back(element.get<std::string>());
            }
            if (all_strings) {
                layer.set(key, ConfigValue{std::move(strings)});
            } else {
                FORGE_LOG_WARN("Config key '{}' skipped: only string arrays are supported", key);
            }
        }
    }
}

std::string env_name_for(const std::string& prefix, const std::string& key) {
    std::string name = prefix;
    for (char c : key) {
        name += (c == '.') ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return name;
}

} // namespace

// =============================================================================
// ConfigManager
// =============================================================================

void ConfigManager::add_layer(std::unique_ptr<ConfigLayer> layer) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_layers.push_back(std::move(layer));
}

ConfigLayer* ConfigManager::get_layer(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    return nullptr;
}

const ConfigLayer* ConfigManager::get_layer(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    return nullptr;
}

bool ConfigManager::remove_layer(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::remove_if(m_layers.begin(), m_layers.end(),
        [&name](const std::unique_ptr<ConfigLayer>& layer) {
            return layer->name() == name;
        });
    if (it != m_layers.end()) {
        m_layers.erase(it, m_layers.end());
        return true;
    }
    return false;
}

bool ConfigManager::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& layer : m_layers) {
        if (layer->contains(key)) {
            return true;
        }
    }
    return false;
}

std::optional<ConfigValue> ConfigManager::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto* layer : sorted_layers()) {
        auto value = layer->get(key);
        if (value) {
            return value;
        }
    }
    return std::nullopt;
}

bool ConfigManager::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<bool>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        return *v == "true" || *v == "1" || *v == "yes";
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v != 0;
    }

    return default_value;
}

std::int64_t ConfigManager::get_int(const std::string& key, std::int64_t default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        try {
            return std::stoll(*v);
        } catch (const std::exception&) {
            FORGE_LOG_WARN("Config key '{}' is not an integer: '{}'", key, *v);
            return default_value;
        }
    }
    if (auto* v = std::get_if<double>(&*value)) {
        return static_cast<std::int64_t>(*v);
    }
    if (auto* v = std::get_if<bool>(&*value)) {
        return *v ? 1 : 0;
    }

    return default_value;
}

double ConfigManager::get_float(const std::string& key, double default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<double>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return static_cast<double>(*v);
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        try {
            return std::stod(*v);
        } catch (const std::exception&) {
            FORGE_LOG_WARN("Config key '{}' is not a number: '{}'", key, *v);
            return default_value;
        }
    }

    return default_value;
}

std::string ConfigManager::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::string>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<bool>(&*value)) {
        return *v ? "true" : "false";
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return std::to_string(*v);
    }
    if (auto* v = std::get_if<double>(&*value)) {
        return std::to_string(*v);
    }

    return default_value;
}

std::vector<std::string> ConfigManager::get_string_array(
    const std::string& key,
    const std::vector<std::string>& default_value) const
{
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::vector<std::string>>(&*value)) {
        return *v;
    }

    return default_value;
}

void ConfigManager::set(const std::string& key, ConfigValue value, const std::string& layer_name) {
    ConfigValue stored;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ConfigLayer& layer = ensure_layer(layer_name, ConfigLayerPriority::User);
        layer.set(key, value);
        stored = std::move(value);
    }
    notify_change(key, stored);
}

void ConfigManager::set_bool(const std::string& key, bool value, const std::string& layer_name) {
    set(key, ConfigValue{value}, layer_name);
}

void ConfigManager::set_int(const std::string& key, std::int64_t value, const std::string& layer_name) {
    set(key, ConfigValue{value}, layer_name);
}

void ConfigManager::set_float(const std::string& key, double value, const std::string& layer_name) {
    set(key, ConfigValue{value}, layer_name);
}

void ConfigManager::set_string(const std::string& key, const std::string& value, const std::string& layer_name) {
    set(key, ConfigValue{value}, layer_name);
}

forge_core::Result<void> ConfigManager::load_json(
    const std::filesystem::path& path,
    const std::string& layer_name)
{
    std::ifstream file(path);
    if (!file) {
        return forge_core::Error{forge_core::ErrorCode::IOError, "Failed to open file: " + path.string()};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = load_json_string(buffer.str(), layer_name);
    if (!result) {
        auto err = result.error();
        err.with_context("path", path.string());
        return err;
    }
    FORGE_LOG_DEBUG("Loaded config '{}' into layer '{}'", path.string(), layer_name);
    return forge_core::Ok();
}

forge_core::Result<void> ConfigManager::load_json_string(const std::string& text, const std::string& layer_name) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return forge_core::Error{forge_core::ErrorCode::ParseError,
            std::string("Invalid config JSON: ") + e.what()};
    }

    if (!root.is_object()) {
        return forge_core::Error{forge_core::ErrorCode::ParseError, "Config JSON must be an object"};
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    ConfigLayer& layer = ensure_layer(layer_name, ConfigLayerPriority::User);
    flatten_json(root, "", layer);
    return forge_core::Ok();
}

forge_core::Result<void> ConfigManager::parse_args(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_args(args);
}

forge_core::Result<void> ConfigManager::parse_args(const std::vector<std::string>& args) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ConfigLayer& layer = ensure_layer("cmdline", ConfigLayerPriority::CommandLine);

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (!arg.starts_with("--")) {
            return forge_core::Error{forge_core::ErrorCode::InvalidArgument,
                "Unexpected argument: " + arg};
        }

        std::string key_value = arg.substr(2);
        auto eq_pos = key_value.find('=');

        std::string key;
        std::string value;

        if (eq_pos != std::string::npos) {
            // --key=value format
            key = key_value.substr(0, eq_pos);
            value = key_value.substr(eq_pos + 1);
        } else if (i + 1 < args.size() && !args[i + 1].starts_with("-")) {
            // --key value format
            key = key_value;
            value = args[++i];
        } else {
            // --flag format (boolean true)
            key = key_value;
            value = "true";
        }

        if (key.empty()) {
            return forge_core::Error{forge_core::ErrorCode::InvalidArgument,
                "Empty option name in: " + arg};
        }

        // --log-level -> log.level
        std::replace(key.begin(), key.end(), '-', '.');
        layer.set(key, infer_config_value(value));
    }

    return forge_core::Ok();
}

void ConfigManager::load_environment(const std::string& prefix) {
    static const char* known_keys[] = {
        config_keys::FILTERS_PREVIEW_DEBOUNCE_MS,
        config_keys::FILTERS_ENDPOINT,
        config_keys::PREVIEW_REFRESH_INTERVAL_MS,
        config_keys::PREVIEW_THUMBNAIL_SIZE,
        config_keys::PREVIEW_CHECKER_SIZE,
        config_keys::LAYERS_DRAG_EDGE_FRACTION,
        config_keys::LOG_LEVEL,
        config_keys::LOG_DIRECTORY,
    };

    std::lock_guard<std::mutex> lock(m_mutex);
    ConfigLayer& layer = ensure_layer("environment", ConfigLayerPriority::Environment);

    for (const char* key : known_keys) {
        const std::string env_name = env_name_for(prefix, key);
        const char* value = std::getenv(env_name.c_str());
        if (value) {
            layer.set(key, infer_config_value(value));
        }
    }
}

void ConfigManager::on_change(ChangeCallback callback) {
    m_change_callbacks.push_back(std::move(callback));
}

void ConfigManager::setup_defaults() {
    create_default_layers();

    auto* defaults = get_layer("defaults");
    if (!defaults) return;

    // Filter defaults
    defaults->set(config_keys::FILTERS_PREVIEW_DEBOUNCE_MS, ConfigValue{std::int64_t(150)});
    defaults->set(config_keys::FILTERS_ENDPOINT, ConfigValue{std::string("/api/filters")});

    // Preview defaults
    defaults->set(config_keys::PREVIEW_REFRESH_INTERVAL_MS, ConfigValue{std::int64_t(250)});
    defaults->set(config_keys::PREVIEW_THUMBNAIL_SIZE, ConfigValue{std::int64_t(40)});
    defaults->set(config_keys::PREVIEW_CHECKER_SIZE, ConfigValue{std::int64_t(5)});

    // Layer defaults
    defaults->set(config_keys::LAYERS_DRAG_EDGE_FRACTION, ConfigValue{0.3});

    // Logging defaults
    defaults->set(config_keys::LOG_LEVEL, ConfigValue{std::string("info")});
    defaults->set(config_keys::LOG_DIRECTORY, ConfigValue{std::string()});
}

void ConfigManager::create_default_layers() {
    std::lock_guard<std::mutex> lock(m_mutex);
    (void)ensure_layer("cmdline", ConfigLayerPriority::CommandLine);
    (void)ensure_layer("environment", ConfigLayerPriority::Environment);
    (void)ensure_layer("user", ConfigLayerPriority::User);
    (void)ensure_layer("defaults", ConfigLayerPriority::Default);
}

std::vector<ConfigLayer*> ConfigManager::sorted_layers() const {
    std::vector<ConfigLayer*> result;
    for (const auto& layer : m_layers) {
        result.push_back(layer.get());
    }

    // Lower value = higher priority
    std::stable_sort(result.begin(), result.end(),
        [](const ConfigLayer* a, const ConfigLayer* b) {
            return static_cast<int>(a->priority()) < static_cast<int>(b->priority());
        });

    return result;
}

ConfigLayer& ConfigManager::ensure_layer(const std::string& name, ConfigLayerPriority priority) {
    for (auto& layer : m_layers) {
        if (layer->name() == name) {
            return *layer;
        }
    }
    m_layers.push_back(std::make_unique<ConfigLayer>(name, priority));
    return *m_layers.back();
}

void ConfigManager::notify_change(const std::string& key, const ConfigValue& value) {
    for (const auto& callback : m_change_callbacks) {
        callback(key, value);
    }
}

// =============================================================================
// EditorConfig
// =============================================================================

EditorConfig build_editor_config(const ConfigManager& config) {
    EditorConfig result;

    auto debounce = config.get_int(config_keys::FILTERS_PREVIEW_DEBOUNCE_MS, 150);
    if (debounce < 0) {
        FORGE_LOG_WARN("{} = {} is negative, using 0", config_keys::FILTERS_PREVIEW_DEBOUNCE_MS, debounce);
        debounce = 0;
    }
    result.preview_debounce = std::chrono::milliseconds(debounce);
    result.filter_endpoint = config.get_string(config_keys::FILTERS_ENDPOINT, result.filter_endpoint);

    auto interval = config.get_int(config_keys::PREVIEW_REFRESH_INTERVAL_MS, 250);
    auto clamped = std::clamp(interval, MIN_REFRESH_INTERVAL_MS, MAX_REFRESH_INTERVAL_MS);
    if (clamped != interval) {
        FORGE_LOG_WARN("{} = {} out of range, clamped to {}",
            config_keys::PREVIEW_REFRESH_INTERVAL_MS, interval, clamped);
    }
    result.refresh_interval = std::chrono::milliseconds(clamped);

    auto thumb = config.get_int(config_keys::PREVIEW_THUMBNAIL_SIZE, 40);
    if (thumb < 1) {
        FORGE_LOG_WARN("{} = {} invalid, using 40", config_keys::PREVIEW_THUMBNAIL_SIZE, thumb);
        thumb = 40;
    }
    result.thumbnail_size = static_cast<std::uint32_t>(thumb);

    auto checker = config.get_int(config_keys::PREVIEW_CHECKER_SIZE, 5);
    if (checker < 1) {
        FORGE_LOG_WARN("{} = {} invalid, using 5", config_keys::PREVIEW_CHECKER_SIZE, checker);
        checker = 5;
    }
    result.checker_size = static_cast<std::uint32_t>(checker);

    auto fraction = config.get_float(config_keys::LAYERS_DRAG_EDGE_FRACTION, 0.3);
    if (!(fraction > 0.0 && fraction < 0.5)) {
        FORGE_LOG_WARN("{} = {} outside (0, 0.5), using 0.3", config_keys::LAYERS_DRAG_EDGE_FRACTION, fraction);
        fraction = 0.3;
    }
    result.drag_edge_fraction = fraction;

    result.log_level = config.get_string(config_keys::LOG_LEVEL, result.log_level);
    result.log_directory = config.get_string(config_keys::LOG_DIRECTORY, result.log_directory);
    for (const forge_core::LogChannel channel : forge_core::ALL_LOG_CHANNELS) {
        const std::string name = forge_core::channel_name(channel);
        const std::string level = config.get_string(config_keys::LOG_CHANNEL_PREFIX + name);
        if (!level.empty()) {
            result.log_channel_levels[name] = level;
        }
    }

    return result;
}

} // namespace forge_editor
