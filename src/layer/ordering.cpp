/// @file ordering.cpp
/// @brief LayerOrderingEngine implementation

#include <forge/layer/ordering.hpp>
#include <forge/core/log.hpp>

#include <algorithm>

namespace forge_layer {

DropZone compute_drop_zone(double y, double row_height, bool is_group, double edge_fraction) {
    const double edge = edge_fraction * row_height;
    if (y < edge) {
        return DropZone::InsertBefore;
    }
    if (y > row_height - edge) {
        return DropZone::InsertAfter;
    }
    return is_group ? DropZone::InsertIntoGroup : DropZone::InsertBefore;
}

LayerOrderingEngine::LayerOrderingEngine(LayerStack& stack, forge_history::HistoryService& history,
                                         double edge_fraction)
    : m_stack(stack)
    , m_history(history)
    , m_edge_fraction(edge_fraction)
{}

// =============================================================================
// Drag State Machine
// =============================================================================

void LayerOrderingEngine::begin_drag(LayerId source) {
    m_state = DragState::Dragging;
    m_source = source;
    m_target.reset();
    m_zone.reset();
}

void LayerOrderingEngine::hover(LayerId target, double y, double row_height) {
    if (m_state == DragState::Idle) {
        return;
    }

    const Layer* layer = m_stack.find(target);
    if (!layer || target == m_source) {
        m_state = DragState::Dragging;
        m_target.reset();
        m_zone.reset();
        return;
    }

    hover_zone(target, compute_drop_zone(y, row_height, layer->is_group(), m_edge_fraction));
}

void LayerOrderingEngine::hover_zone(LayerId target, DropZone zone) {
    if (m_state == DragState::Idle) {
        return;
    }
    m_state = DragState::HoveringTarget;
    m_target = target;
    m_zone = zone;
}

DropOutcome LayerOrderingEngine::drop() {
    DropOutcome outcome = DropOutcome::Ignored;
    if (m_state == DragState::HoveringTarget && m_source && m_target && m_zone) {
        outcome = move(*m_source, *m_target, *m_zone);
    }
    end_drag();
    return outcome;
}

void LayerOrderingEngine::end_drag() {
    m_state = DragState::Idle;
    m_source.reset();
    m_target.reset();
    m_zone.reset();
}

// =============================================================================
// Mutation
// =============================================================================

DropOutcome LayerOrderingEngine::move(LayerId source_id, LayerId target_id, DropZone zone) {
    auto log = forge_core::layer_logger();

    Layer* source = m_stack.find(source_id);
    Layer* target = m_stack.find(target_id);
    if (!source || !target) {
        log->debug("Drop ignored: layer {} or {} no longer exists", source_id.id, target_id.id);
        return DropOutcome::Ignored;
    }
    if (source_id == target_id) {
        return DropOutcome::Ignored;
    }

    if (zone == DropZone::InsertIntoGroup && !target->is_group()) {
        zone = DropZone::InsertBefore;
    }

    if (zone == DropZone::InsertIntoGroup) {
        if (m_stack.is_ancestor(source_id, target_id)) {
            log->debug("Drop ignored: {} is inside {}", target_id.id, source_id.id);
            return DropOutcome::Ignored;
        }

        m_history.begin_capture("Move Layer");
        m_history.begin_structural_change();
        auto moved = m_stack.move_to_group(source_id, target_id);
        if (!moved) {
            m_history.abort_capture();
            log->warn("Drop into group failed: {}", moved.error().message());
            return DropOutcome::Ignored;
        }
        m_history.commit_capture();

        m_stack.set_active_by_id(source_id);
        log->debug("Layer {} moved into group {}", source_id.id, target_id.id);
        if (m_on_change) {
            m_on_change();
        }
        return DropOutcome::Reparented;
    }

    // Source takes the target's parent; that must not put a group inside itself
    const std::optional<LayerId> new_parent = target->parent();
    if (new_parent && (*new_parent == source_id || m_stack.is_ancestor(source_id, *new_parent))) {
        log->debug("Drop ignored: {} would nest inside itself", source_id.id);
        return DropOutcome::Ignored;
    }

    auto source_index = m_stack.index_of(source_id);
    if (!source_index) {
        return DropOutcome::Ignored;
    }

    m_history.begin_capture("Move Layer");
    m_history.begin_structural_change();

    auto detached = m_stack.detach(*source_index);

    // Indices after the source shifted by one; look the target up again
    std::size_t insert_index = m_stack.index_of(target_id).value_or(m_stack.size());
    if (zone == DropZone::InsertAfter) {
        insert_index += 1;
    }
    insert_index = std::min(insert_index, m_stack.size());

    detached->set_parent(new_parent);
    m_stack.insert(insert_index, std::move(detached));
    m_stack.set_active_by_id(source_id);

    m_history.commit_capture();

    log->debug("Layer {} moved {} {} (index {} -> {})",
        source_id.id, to_string(zone), target_id.id, *source_index, insert_index);
    if (m_on_change) {
        m_on_change();
    }
    return DropOutcome::Moved;
}

} // namespace forge_layer
