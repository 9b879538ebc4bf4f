#pragma once

/// @file registry.hpp
/// @brief Filter definitions as published by the filter service
///
/// The registry is consumed, not owned: it is loaded from the service's
/// JSON listing. Entries or parameters that don't describe a usable filter
/// are skipped with a warning.

#include <forge/core/error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace forge_filter {

// =============================================================================
// Parameters
// =============================================================================

enum class ParamType : std::uint8_t {
    Range,
    Select,
    Checkbox,
    Color,
};

[[nodiscard]] inline const char* to_string(ParamType type) {
    switch (type) {
        case ParamType::Range: return "range";
        case ParamType::Select: return "select";
        case ParamType::Checkbox: return "checkbox";
        case ParamType::Color: return "color";
    }
    return "unknown";
}

[[nodiscard]] std::optional<ParamType> parse_param_type(const std::string& name);

/// Color used when a color parameter declares no default
constexpr const char* DEFAULT_PARAM_COLOR = "#FFFFFF";

struct ParamDef {
    std::string id;
    std::string name;
    ParamType type = ParamType::Range;
    std::optional<nlohmann::json> default_value;
    double min = 0.0;
    double max = 1.0;
    double step = 1.0;
    std::vector<nlohmann::json> options;
};

/// Declared default, else range -> min, select -> first option,
/// checkbox -> false, color -> "#FFFFFF"
[[nodiscard]] nlohmann::json default_param_value(const ParamDef& param);

/// Rejects values that cannot be serialized, such as strings that are not valid UTF-8
[[nodiscard]] forge_core::Result<void> validate_param_value(const std::string& param_id, const nlohmann::json& value);

// =============================================================================
// Filter Definition
// =============================================================================

struct FilterDef {
    std::string id;
    std::string name;
    std::string category;
    std::vector<ParamDef> params;
    /// Values fixed by an expanded composite entry, applied over defaults
    nlohmann::json preset_params = nlohmann::json::object();
    /// Parameter whose value names the sub-operation of a composite entry
    std::string expand_param;
    std::string base_name;
    std::string source = "wasm";

    [[nodiscard]] bool has_params() const { return !params.empty(); }
    [[nodiscard]] const ParamDef* find_param(const std::string& param_id) const;
};

/// Parameter defaults with preset_params merged on top
[[nodiscard]] nlohmann::json default_params(const FilterDef& def);

/// Display label: `"<base_name> (<Value>)"` for composite entries, else the name
[[nodiscard]] std::string history_label(const FilterDef& def, const nlohmann::json& params);

// =============================================================================
// Filter Registry
// =============================================================================

class FilterRegistry {
public:
    FilterRegistry() = default;

    /// Build from a JSON array of definitions
    [[nodiscard]] static forge_core::Result<FilterRegistry> from_json(const nlohmann::json& data);

    /// Parse and build from JSON text
    [[nodiscard]] static forge_core::Result<FilterRegistry> from_json_string(const std::string& text);

    /// Parse one definition
    [[nodiscard]] static forge_core::Result<FilterDef> parse_definition(const nlohmann::json& entry);

    /// Add or replace by id
    void add(FilterDef def);

    [[nodiscard]] const FilterDef* find(const std::string& id) const;
    [[nodiscard]] bool contains(const std::string& id) const { return find(id) != nullptr; }

    [[nodiscard]] const std::vector<FilterDef>& definitions() const { return m_defs; }
    [[nodiscard]] std::size_t size() const { return m_defs.size(); }
    [[nodiscard]] bool empty() const { return m_defs.empty(); }

    /// Categories in first-seen order
    [[nodiscard]] std::vector<std::string> categories() const;
    [[nodiscard]] std::vector<const FilterDef*> in_category(const std::string& category) const;

private:
    std::vector<FilterDef> m_defs;
};

} // namespace forge_filter
