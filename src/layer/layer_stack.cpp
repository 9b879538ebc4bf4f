/// @file layer_stack.cpp
/// @brief LayerStack implementation

#include <forge/layer/layer_stack.hpp>
#include <forge/core/log.hpp>

#include <algorithm>

namespace forge_layer {

using forge_core::Err;
using forge_core::LayerError;
using forge_core::Ok;

LayerStack::LayerStack(std::uint32_t width, std::uint32_t height)
    : m_width(width)
    , m_height(height)
{}

// =============================================================================
// Lookup
// =============================================================================

Layer* LayerStack::layer_at(std::size_t index) {
    return index < m_layers.size() ? m_layers[index].get() : nullptr;
}

const Layer* LayerStack::layer_at(std::size_t index) const {
    return index < m_layers.size() ? m_layers[index].get() : nullptr;
}

Layer* LayerStack::find(LayerId id) {
    for (auto& layer : m_layers) {
        if (layer->id() == id) {
            return layer.get();
        }
    }
    return nullptr;
}

const Layer* LayerStack::find(LayerId id) const {
    for (const auto& layer : m_layers) {
        if (layer->id() == id) {
            return layer.get();
        }
    }
    return nullptr;
}

std::optional<std::size_t> LayerStack::index_of(LayerId id) const {
    for (std::size_t i = 0; i < m_layers.size(); ++i) {
        if (m_layers[i]->id() == id) {
            return i;
        }
    }
    return std::nullopt;
}

std::vector<LayerId> LayerStack::layer_ids() const {
    std::vector<LayerId> ids;
    ids.reserve(m_layers.size());
    for (const auto& layer : m_layers) {
        ids.push_back(layer->id());
    }
    return ids;
}

// =============================================================================
// Active Layer
// =============================================================================

Layer* LayerStack::active_layer() {
    return find(m_active);
}

const Layer* LayerStack::active_layer() const {
    return find(m_active);
}

std::optional<std::size_t> LayerStack::active_index() const {
    return index_of(m_active);
}

void LayerStack::set_active_index(std::size_t index) {
    if (index < m_layers.size()) {
        m_active = m_layers[index]->id();
    }
}

bool LayerStack::set_active_by_id(LayerId id) {
    if (!find(id)) {
        return false;
    }
    m_active = id;
    return true;
}

void LayerStack::fallback_active(std::size_t removed_index) {
    if (m_layers.empty()) {
        m_active = LayerId::invalid();
        return;
    }
    if (!find(m_active)) {
        m_active = m_layers[std::min(removed_index, m_layers.size() - 1)]->id();
    }
}

// =============================================================================
// Add / Remove
// =============================================================================

Layer& LayerStack::add_layer(std::unique_ptr<Layer> layer, InsertPosition position) {
    Layer& ref = *layer;
    if (position == InsertPosition::Top) {
        m_layers.insert(m_layers.begin(), std::move(layer));
    } else {
        m_layers.push_back(std::move(layer));
    }
    m_active = ref.id();
    bump_structure();
    forge_core::layer_logger()->debug("Added layer '{}' ({})", ref.name(), ref.id().id);
    return ref;
}

Layer& LayerStack::add_raster_layer(const std::string& name) {
    return add_layer(Layer::raster(name, m_width, m_height));
}

forge_core::Result<void> LayerStack::remove_layer(std::size_t index) {
    if (m_layers.size() <= 1) {
        return Err(LayerError::last_layer());
    }
    if (index >= m_layers.size()) {
        return Err(LayerError::out_of_range(index));
    }

    const Layer& removed = *m_layers[index];
    if (removed.is_group()) {
        for (Layer* child : children(removed.id())) {
            child->set_parent(removed.parent());
        }
    }

    forge_core::layer_logger()->debug("Removed layer '{}' ({})", removed.name(), removed.id().id);
    m_layers.erase(m_layers.begin() + static_cast<std::ptrdiff_t>(index));
    fallback_active(index);
    bump_structure();
    return Ok();
}

forge_core::Result<void> LayerStack::remove_layer_by_id(LayerId id) {
    auto index = index_of(id);
    if (!index) {
        return Err(LayerError::not_found(id.id));
    }
    return remove_layer(*index);
}

forge_core::Result<LayerId> LayerStack::duplicate_layer(std::size_t index) {
    if (index >= m_layers.size()) {
        return Err<LayerId>(LayerError::out_of_range(index));
    }

    auto copy = m_layers[index]->duplicate();
    LayerId id = copy->id();
    m_layers.insert(m_layers.begin() + static_cast<std::ptrdiff_t>(index), std::move(copy));
    m_active = id;
    bump_structure();
    return Ok(id);
}

std::unique_ptr<Layer> LayerStack::detach(std::size_t index) {
    if (index >= m_layers.size()) {
        return nullptr;
    }
    auto layer = std::move(m_layers[index]);
    m_layers.erase(m_layers.begin() + static_cast<std::ptrdiff_t>(index));
    bump_structure();
    return layer;
}

void LayerStack::insert(std::size_t index, std::unique_ptr<Layer> layer) {
    if (!layer) {
        return;
    }
    index = std::min(index, m_layers.size());
    m_layers.insert(m_layers.begin() + static_cast<std::ptrdiff_t>(index), std::move(layer));
    bump_structure();
}

// =============================================================================
// Reordering
// =============================================================================

bool LayerStack::move_layer(std::size_t from, std::size_t to) {
    if (from >= m_layers.size() || to >= m_layers.size() || from == to) {
        return false;
    }

    auto layer = std::move(m_layers[from]);
    m_layers.erase(m_layers.begin() + static_cast<std::ptrdiff_t>(from));
    m_layers.insert(m_layers.begin() + static_cast<std::ptrdiff_t>(to), std::move(layer));
    bump_structure();
    return true;
}

bool LayerStack::move_layer_up(std::size_t index) {
    if (index == 0 || index >= m_layers.size()) {
        return false;
    }
    return move_layer(index, index - 1);
}

bool LayerStack::move_layer_down(std::size_t index) {
    if (index + 1 >= m_layers.size()) {
        return false;
    }
    return move_layer(index, index + 1);
}

bool LayerStack::move_layer_to_top(std::size_t index) {
    if (index >= m_layers.size()) {
        return false;
    }

    std::size_t top = 0;
    const auto& parent = m_layers[index]->parent();
    if (parent) {
        for (std::size_t i = 0; i < m_layers.size(); ++i) {
            if (m_layers[i]->parent() == parent) {
                top = i;
                break;
            }
        }
    }

    return move_layer(index, top);
}

bool LayerStack::move_layer_to_bottom(std::size_t index) {
    if (index >= m_layers.size()) {
        return false;
    }

    std::size_t bottom = m_layers.size() - 1;
    const auto& parent = m_layers[index]->parent();
    if (parent) {
        for (std::size_t i = m_layers.size(); i-- > 0;) {
            if (m_layers[i]->parent() == parent) {
                bottom = i;
                break;
            }
        }
    }

    return move_layer(index, bottom);
}

// =============================================================================
// Groups
// =============================================================================

std::vector<Layer*> LayerStack::children(std::optional<LayerId> group) const {
    std::vector<Layer*> result;
    for (const auto& layer : m_layers) {
        if (layer->parent() == group) {
            result.push_back(layer.get());
        }
    }
    return result;
}

std::vector<Layer*> LayerStack::descendants(LayerId group) const {
    std::vector<Layer*> result;
    collect_descendants(group, result, 0);
    return result;
}

void LayerStack::collect_descendants(LayerId group, std::vector<Layer*>& out, std::size_t depth) const {
    if (depth > m_layers.size()) {
        return;
    }
    for (Layer* child : children(group)) {
        out.push_back(child);
        if (child->is_group()) {
            collect_descendants(child->id(), out, depth + 1);
        }
    }
}

bool LayerStack::is_ancestor(LayerId ancestor, LayerId id) const {
    const Layer* current = find(id);
    std::size_t steps = 0;
    while (current && current->parent() && steps++ <= m_layers.size()) {
        if (*current->parent() == ancestor) {
            return true;
        }
        current = find(*current->parent());
    }
    return false;
}

LayerId LayerStack::create_group(const std::string& name, std::optional<LayerId> parent, std::size_t insert_index) {
    auto group = Layer::group(name);
    group->set_parent(parent);
    LayerId id = group->id();
    insert(insert_index, std::move(group));
    forge_core::layer_logger()->debug("Created group '{}' ({})", name, id.id);
    return id;
}

forge_core::Result<LayerId> LayerStack::group_layers(const std::vector<LayerId>& ids, const std::string& name) {
    std::size_t min_index = m_layers.size();
    std::vector<Layer*> members;

    for (LayerId id : ids) {
        auto index = index_of(id);
        if (index) {
            min_index = std::min(min_index, *index);
            members.push_back(m_layers[*index].get());
        }
    }

    if (members.empty()) {
        return Err<LayerId>(LayerError::not_found(ids.empty() ? 0 : ids.front().id));
    }

    LayerId group = create_group(name, members.front()->parent(), min_index);
    for (Layer* member : members) {
        member->set_parent(group);
    }
    return Ok(group);
}

forge_core::Result<void> LayerStack::ungroup(LayerId group_id) {
    auto index = index_of(group_id);
    if (!index) {
        return Err(LayerError::not_found(group_id.id));
    }
    Layer& group = *m_layers[*index];
    if (!group.is_group()) {
        return Err(LayerError::not_a_group(group_id.id));
    }

    for (Layer* child : children(group_id)) {
        child->set_parent(group.parent());
    }

    m_layers.erase(m_layers.begin() + static_cast<std::ptrdiff_t>(*index));
    fallback_active(*index);
    bump_structure();
    return Ok();
}

forge_core::Result<void> LayerStack::move_to_group(LayerId layer_id, std::optional<LayerId> group_id) {
    Layer* layer = find(layer_id);
    if (!layer) {
        return Err(LayerError::not_found(layer_id.id));
    }

    if (group_id) {
        const Layer* group = find(*group_id);
        if (!group) {
            return Err(LayerError::not_found(group_id->id));
        }
        if (!group->is_group()) {
            return Err(LayerError::not_a_group(group_id->id));
        }
        if (*group_id == layer_id || is_ancestor(layer_id, *group_id)) {
            return Err(LayerError::cycle(layer_id.id, group_id->id));
        }
    }

    layer->set_parent(group_id);
    bump_structure();
    return Ok();
}

forge_core::Result<void> LayerStack::delete_group(LayerId group_id, bool delete_children) {
    auto index = index_of(group_id);
    if (!index) {
        return Err(LayerError::not_found(group_id.id));
    }
    if (!m_layers[*index]->is_group()) {
        return Err(LayerError::not_a_group(group_id.id));
    }

    if (delete_children) {
        std::vector<LayerId> doomed;
        for (Layer* d : descendants(group_id)) {
            doomed.push_back(d->id());
        }
        for (LayerId id : doomed) {
            if (auto i = index_of(id)) {
                m_layers.erase(m_layers.begin() + static_cast<std::ptrdiff_t>(*i));
            }
        }
    } else {
        auto parent = m_layers[*index]->parent();
        for (Layer* child : children(group_id)) {
            child->set_parent(parent);
        }
    }

    auto group_index = index_of(group_id);
    m_layers.erase(m_layers.begin() + static_cast<std::ptrdiff_t>(*group_index));

    if (m_layers.empty()) {
        m_layers.push_back(Layer::raster("Layer 1", m_width, m_height));
    }
    fallback_active(*group_index);
    bump_structure();
    return Ok();
}

// =============================================================================
// Effective Properties
// =============================================================================

bool LayerStack::is_effectively_visible(const Layer& layer) const {
    if (!layer.visible()) {
        return false;
    }
    const Layer* current = &layer;
    std::size_t steps = 0;
    while (current->parent() && steps++ <= m_layers.size()) {
        const Layer* parent = find(*current->parent());
        if (!parent) {
            break;
        }
        if (!parent->visible()) {
            return false;
        }
        current = parent;
    }
    return true;
}

double LayerStack::effective_opacity(const Layer& layer) const {
    double opacity = layer.opacity();
    const Layer* current = &layer;
    std::size_t steps = 0;
    while (current->parent() && steps++ <= m_layers.size()) {
        const Layer* parent = find(*current->parent());
        if (!parent) {
            break;
        }
        if (parent->blend_mode() != BlendMode::PassThrough) {
            opacity *= parent->opacity();
        }
        current = parent;
    }
    return opacity;
}

bool LayerStack::is_effectively_locked(const Layer& layer) const {
    if (layer.locked()) {
        return true;
    }
    const Layer* current = &layer;
    std::size_t steps = 0;
    while (current->parent() && steps++ <= m_layers.size()) {
        const Layer* parent = find(*current->parent());
        if (!parent) {
            break;
        }
        if (parent->locked()) {
            return true;
        }
        current = parent;
    }
    return false;
}

// =============================================================================
// Property Edits
// =============================================================================

bool LayerStack::set_layer_visible(LayerId id, bool visible) {
    Layer* layer = find(id);
    if (!layer) {
        return false;
    }
    layer->set_visible(visible);
    bump_structure();
    return true;
}

bool LayerStack::set_layer_opacity(LayerId id, double opacity) {
    Layer* layer = find(id);
    if (!layer) {
        return false;
    }
    layer->set_opacity(opacity);
    bump_structure();
    return true;
}

bool LayerStack::set_layer_blend_mode(LayerId id, BlendMode mode) {
    Layer* layer = find(id);
    if (!layer) {
        return false;
    }
    layer->set_blend_mode(mode);
    bump_structure();
    return true;
}

bool LayerStack::rename_layer(LayerId id, const std::string& name) {
    Layer* layer = find(id);
    if (!layer) {
        return false;
    }
    layer->set_name(name);
    bump_structure();
    return true;
}

} // namespace forge_layer
