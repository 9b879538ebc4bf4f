#pragma once

/// @file instance.hpp
/// @brief Non-destructive filter instances attached to a layer
///
/// A layer's filter list is applied first to last. The serialized form
/// is what filter-list edits are diffed against.

#include <forge/core/error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace forge_filter {

// =============================================================================
// Filter Instance ID
// =============================================================================

struct FilterInstanceId {
    std::uint64_t id = 0;

    [[nodiscard]] bool operator==(const FilterInstanceId& other) const { return id == other.id; }
    [[nodiscard]] bool operator!=(const FilterInstanceId& other) const { return id != other.id; }

    [[nodiscard]] bool is_valid() const { return id != 0; }

    [[nodiscard]] static FilterInstanceId invalid() { return FilterInstanceId{0}; }

    /// Allocate a fresh process-unique id
    [[nodiscard]] static FilterInstanceId generate();
};

// =============================================================================
// Filter Instance
// =============================================================================

/// One application of a registry filter to a layer
struct FilterInstance {
    FilterInstanceId id;
    /// Registry filter id (e.g. "gaussian_blur")
    std::string filter_id;
    std::string name = "Filter";
    bool enabled = true;
    /// Parameter name -> value (JSON object)
    nlohmann::json params = nlohmann::json::object();
    /// Execution source ("wasm", "js", "backend")
    std::string source = "wasm";

    /// Snapshot used for storage and diffing
    [[nodiscard]] nlohmann::json serialize() const;

    /// Rebuild from a snapshot; the original id is kept
    [[nodiscard]] static forge_core::Result<FilterInstance> deserialize(const nlohmann::json& data);

    /// Copy with a fresh id
    [[nodiscard]] FilterInstance clone() const;
};

/// Serialized form of a whole filter list, compared as a string
[[nodiscard]] std::string serialize_filter_list(const std::vector<FilterInstance>& filters);

} // namespace forge_filter

template<>
struct std::hash<forge_filter::FilterInstanceId> {
    std::size_t operator()(const forge_filter::FilterInstanceId& id) const noexcept {
        return std::hash<std::uint64_t>{}(id.id);
    }
};
