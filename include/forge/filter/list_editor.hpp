#pragma once

/// @file list_editor.hpp
/// @brief Editing session over a layer's non-destructive filter list
///
/// Edits apply to the layer immediately and only invalidate its filter
/// cache. One "Modify Layer Filters" history entry is recorded when the
/// editor closes, and only if the serialized list differs from when it
/// was opened.

#include "instance.hpp"
#include "registry.hpp"

#include <forge/core/error.hpp>
#include <forge/editor/session.hpp>
#include <forge/layer/types.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace forge_filter {

constexpr const char* MODIFY_FILTERS_LABEL = "Modify Layer Filters";

class FilterListEditor {
public:
    FilterListEditor(forge_editor::EditorSession& session, const FilterRegistry& registry);

    /// Start editing `layer`'s filter list. Closes any earlier edit first.
    [[nodiscard]] forge_core::Result<void> open(forge_layer::LayerId layer);

    /// Append an instance of a registry filter with default parameters
    [[nodiscard]] forge_core::Result<FilterInstanceId> add_filter(const std::string& filter_id);

    /// Move by a signed offset; out-of-range targets leave the list unchanged
    /// @return true if the filter moved
    bool move_filter(FilterInstanceId id, int delta);

    bool remove_filter(FilterInstanceId id);

    bool set_enabled(FilterInstanceId id, bool enabled);

    bool set_param(FilterInstanceId id, const std::string& name, nlohmann::json value);

    /// Finish editing, recording history if the list changed
    /// @return true if a history entry was recorded
    bool close();

    [[nodiscard]] bool is_open() const { return m_layer.has_value(); }
    [[nodiscard]] std::optional<forge_layer::LayerId> layer() const { return m_layer; }

private:
    [[nodiscard]] forge_layer::Layer* target();
    void changed(forge_layer::Layer& layer);

    forge_editor::EditorSession& m_editor;
    const FilterRegistry& m_registry;
    std::optional<forge_layer::LayerId> m_layer;
    std::string m_before;
};

} // namespace forge_filter
