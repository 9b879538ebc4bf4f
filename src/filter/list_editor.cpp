/// @file list_editor.cpp
/// @brief FilterListEditor implementation

#include <forge/filter/list_editor.hpp>
#include <forge/core/log.hpp>
#include <forge/layer/layer.hpp>

#include <utility>

namespace forge_filter {

FilterListEditor::FilterListEditor(forge_editor::EditorSession& session, const FilterRegistry& registry)
    : m_editor(session)
    , m_registry(registry)
{}

forge_core::Result<void> FilterListEditor::open(forge_layer::LayerId layer_id) {
    if (m_layer) {
        close();
    }

    const forge_layer::Layer* layer = m_editor.layers().find(layer_id);
    if (!layer) {
        return forge_core::Err(forge_core::LayerError::not_found(layer_id.id));
    }

    m_layer = layer_id;
    m_before = serialize_filter_list(layer->filters());
    return forge_core::Ok();
}

forge_core::Result<FilterInstanceId> FilterListEditor::add_filter(const std::string& filter_id) {
    forge_layer::Layer* layer = target();
    if (!layer) {
        return forge_core::Err<FilterInstanceId>(forge_core::FilterError::no_session());
    }

    const FilterDef* def = m_registry.find(filter_id);
    if (!def) {
        return forge_core::Err<FilterInstanceId>(forge_core::FilterError::not_found(filter_id));
    }

    FilterInstance instance;
    instance.id = FilterInstanceId::generate();
    instance.filter_id = def->id;
    instance.name = def->name;
    instance.source = def->source;
    for (const auto& param : def->params) {
        instance.params[param.id] = default_param_value(param);
    }

    const FilterInstanceId id = instance.id;
    layer->filters().push_back(std::move(instance));
    changed(*layer);
    return id;
}

bool FilterListEditor::move_filter(FilterInstanceId id, int delta) {
    forge_layer::Layer* layer = target();
    if (!layer) {
        return false;
    }

    auto index = layer->filter_index(id);
    if (!index) {
        return false;
    }

    const auto destination = static_cast<std::int64_t>(*index) + delta;
    auto& filters = layer->filters();
    if (destination < 0 || destination >= static_cast<std::int64_t>(filters.size()) ||
        destination == static_cast<std::int64_t>(*index)) {
        return false;
    }

    FilterInstance moved = std::move(filters[*index]);
    filters.erase(filters.begin() + static_cast<std::ptrdiff_t>(*index));
    filters.insert(filters.begin() + static_cast<std::ptrdiff_t>(destination), std::move(moved));
    changed(*layer);
    return true;
}

bool FilterListEditor::remove_filter(FilterInstanceId id) {
    forge_layer::Layer* layer = target();
    if (!layer) {
        return false;
    }

    auto index = layer->filter_index(id);
    if (!index) {
        return false;
    }

    auto& filters = layer->filters();
    filters.erase(filters.begin() + static_cast<std::ptrdiff_t>(*index));
    changed(*layer);
    return true;
}

bool FilterListEditor::set_enabled(FilterInstanceId id, bool enabled) {
    forge_layer::Layer* layer = target();
    if (!layer) {
        return false;
    }

    FilterInstance* filter = layer->find_filter(id);
    if (!filter || filter->enabled == enabled) {
        return false;
    }

    filter->enabled = enabled;
    changed(*layer);
    return true;
}

bool FilterListEditor::set_param(FilterInstanceId id, const std::string& name, nlohmann::json value) {
    forge_layer::Layer* layer = target();
    if (!layer) {
        return false;
    }

    FilterInstance* filter = layer->find_filter(id);
    if (!filter) {
        return false;
    }
    if (auto valid = validate_param_value(name, value); !valid) {
        forge_core::filter_logger()->warn("{}", valid.error().message());
        return false;
    }

    filter->params[name] = std::move(value);
    changed(*layer);
    return true;
}

bool FilterListEditor::close() {
    if (!m_layer) {
        return false;
    }

    const forge_layer::LayerId layer_id = *m_layer;
    m_layer.reset();
    const std::string before = std::exchange(m_before, std::string());

    const forge_layer::Layer* layer = m_editor.layers().find(layer_id);
    if (!layer) {
        return false;
    }

    if (serialize_filter_list(layer->filters()) == before) {
        return false;
    }

    m_editor.history().save_state(MODIFY_FILTERS_LABEL);
    m_editor.history().finish_state();
    m_editor.mark_modified();
    forge_core::filter_logger()->debug("Filter list of layer '{}' modified", layer->name());
    return true;
}

forge_layer::Layer* FilterListEditor::target() {
    return m_layer ? m_editor.layers().find(*m_layer) : nullptr;
}

void FilterListEditor::changed(forge_layer::Layer& layer) {
    layer.invalidate_filter_cache();
    m_editor.request_render();
}

} // namespace forge_filter
