/// @file registry.cpp
/// @brief Filter registry loading and parameter defaults

#include <forge/filter/registry.hpp>
#include <forge/core/log.hpp>

#include <algorithm>
#include <cctype>

namespace forge_filter {

std::optional<ParamType> parse_param_type(const std::string& name) {
    if (name == "range") return ParamType::Range;
    if (name == "select") return ParamType::Select;
    if (name == "checkbox") return ParamType::Checkbox;
    if (name == "color") return ParamType::Color;
    return std::nullopt;
}

nlohmann::json default_param_value(const ParamDef& param) {
    if (param.default_value) {
        return *param.default_value;
    }
    switch (param.type) {
        case ParamType::Range: return param.min;
        case ParamType::Select: return param.options.empty() ? nlohmann::json("") : param.options.front();
        case ParamType::Checkbox: return false;
        case ParamType::Color: return DEFAULT_PARAM_COLOR;
    }
    return "";
}

const ParamDef* FilterDef::find_param(const std::string& param_id) const {
    for (const auto& param : params) {
        if (param.id == param_id) {
            return &param;
        }
    }
    return nullptr;
}

forge_core::Result<void> validate_param_value(const std::string& param_id, const nlohmann::json& value) {
    try {
        (void)value.dump();
    } catch (const nlohmann::json::type_error& e) {
        return forge_core::Error{forge_core::ErrorCode::InvalidArgument,
            "Parameter '" + param_id + "' is not serializable: " + e.what()};
    }
    return forge_core::Ok();
}

nlohmann::json default_params(const FilterDef& def) {
    nlohmann::json values = nlohmann::json::object();
    for (const auto& param : def.params) {
        values[param.id] = default_param_value(param);
    }
    if (def.preset_params.is_object()) {
        for (auto it = def.preset_params.begin(); it != def.preset_params.end(); ++it) {
            values[it.key()] = it.value();
        }
    }
    return values;
}

std::string history_label(const FilterDef& def, const nlohmann::json& params) {
    if (!def.expand_param.empty() && !def.base_name.empty() && params.is_object()) {
        auto it = params.find(def.expand_param);
        if (it != params.end() && !it->is_null()) {
            std::string value = it->is_string() ? it->get<std::string>() : it->dump();
            if (!value.empty()) {
                value[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(value[0])));
            }
            return def.base_name + " (" + value + ")";
        }
    }
    return def.name;
}

// =============================================================================
// Parsing
// =============================================================================

namespace {

std::string string_field(const nlohmann::json& obj, const char* key, const std::string& fallback = {}) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return fallback;
}

std::optional<double> number_field(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_number()) {
        return it->get<double>();
    }
    return std::nullopt;
}

forge_core::Result<ParamDef> parse_param(const std::string& filter_id, const nlohmann::json& data) {
    using forge_core::FilterError;

    if (!data.is_object()) {
        return forge_core::Err<ParamDef>(FilterError::invalid_definition(filter_id, "parameter is not an object"));
    }

    ParamDef param;
    param.id = string_field(data, "id");
    if (param.id.empty()) {
        return forge_core::Err<ParamDef>(FilterError::invalid_definition(filter_id, "parameter without 'id'"));
    }
    param.name = string_field(data, "name", string_field(data, "label", param.id));

    auto type = parse_param_type(string_field(data, "type"));
    if (!type) {
        return forge_core::Err<ParamDef>(FilterError::invalid_definition(filter_id,
            "parameter '" + param.id + "' has unknown type '" + string_field(data, "type") + "'"));
    }
    param.type = *type;

    if (auto it = data.find("default"); it != data.end() && !it->is_null()) {
        param.default_value = *it;
    }
    param.min = number_field(data, "min").value_or(0.0);
    param.max = number_field(data, "max").value_or(param.type == ParamType::Range ? 100.0 : 1.0);
    param.step = number_field(data, "step").value_or(1.0);

    if (auto it = data.find("options"); it != data.end() && it->is_array()) {
        for (const auto& option : *it) {
            param.options.push_back(option);
        }
    }

    if (param.type == ParamType::Select && param.options.empty()) {
        return forge_core::Err<ParamDef>(FilterError::invalid_definition(filter_id, "select parameter '" + param.id + "' has no options"));
    }
    if (param.type == ParamType::Range && param.max < param.min) {
        return forge_core::Err<ParamDef>(FilterError::invalid_definition(filter_id, "range parameter '" + param.id + "' has max < min"));
    }

    return param;
}

} // anonymous namespace

forge_core::Result<FilterDef> FilterRegistry::parse_definition(const nlohmann::json& entry) {
    using forge_core::FilterError;

    if (!entry.is_object()) {
        return forge_core::Err<FilterDef>(FilterError::invalid_definition("", "entry is not an object"));
    }

    FilterDef def;
    def.id = string_field(entry, "id");
    if (def.id.empty()) {
        return forge_core::Err<FilterDef>(FilterError::invalid_definition("", "entry without 'id'"));
    }
    def.name = string_field(entry, "name", def.id);
    def.category = string_field(entry, "category", "Other");
    def.expand_param = string_field(entry, "expandParam");
    def.base_name = string_field(entry, "baseName");
    def.source = string_field(entry, "source", def.source);

    if (auto it = entry.find("presetParams"); it != entry.end() && it->is_object()) {
        def.preset_params = *it;
    }

    if (auto it = entry.find("params"); it != entry.end()) {
        if (!it->is_array()) {
            return forge_core::Err<FilterDef>(FilterError::invalid_definition(def.id, "'params' is not an array"));
        }
        for (const auto& raw : *it) {
            auto param = parse_param(def.id, raw);
            if (!param) {
                forge_core::filter_logger()->warn("Skipping parameter: {}", param.error().message());
                continue;
            }
            def.params.push_back(std::move(*param));
        }
    }

    return def;
}

forge_core::Result<FilterRegistry> FilterRegistry::from_json(const nlohmann::json& data) {
    // The service may wrap the list as {"filters": [...]}
    const nlohmann::json* list = &data;
    if (data.is_object()) {
        auto it = data.find("filters");
        if (it != data.end()) {
            list = &*it;
        }
    }
    if (!list->is_array()) {
        return forge_core::Error{forge_core::ErrorCode::ParseError, "Filter registry must be a JSON array"};
    }

    FilterRegistry registry;
    std::size_t skipped = 0;
    for (const auto& entry : *list) {
        auto def = parse_definition(entry);
        if (!def) {
            forge_core::filter_logger()->warn("Skipping filter: {}", def.error().message());
            ++skipped;
            continue;
        }
        registry.add(std::move(*def));
    }

    forge_core::filter_logger()->debug("Filter registry loaded: {} filters, {} skipped",
        registry.size(), skipped);
    return registry;
}

forge_core::Result<FilterRegistry> FilterRegistry::from_json_string(const std::string& text) {
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return forge_core::Error{forge_core::ErrorCode::ParseError,
            std::string("Invalid filter registry JSON: ") + e.what()};
    }
    return from_json(data);
}

// =============================================================================
// Lookup
// =============================================================================

void FilterRegistry::add(FilterDef def) {
    for (auto& existing : m_defs) {
        if (existing.id == def.id) {
            existing = std::move(def);
            return;
        }
    }
    m_defs.push_back(std::move(def));
}

const FilterDef* FilterRegistry::find(const std::string& id) const {
    for (const auto& def : m_defs) {
        if (def.id == id) {
            return &def;
        }
    }
    return nullptr;
}

std::vector<std::string> FilterRegistry::categories() const {
    std::vector<std::string> result;
    for (const auto& def : m_defs) {
        if (std::find(result.begin(), result.end(), def.category) == result.end()) {
            result.push_back(def.category);
        }
    }
    return result;
}

std::vector<const FilterDef*> FilterRegistry::in_category(const std::string& category) const {
    std::vector<const FilterDef*> result;
    for (const auto& def : m_defs) {
        if (def.category == category) {
            result.push_back(&def);
        }
    }
    return result;
}

} // namespace forge_filter
