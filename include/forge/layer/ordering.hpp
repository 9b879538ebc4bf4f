#pragma once

/// @file ordering.hpp
/// @brief Drag-driven layer reordering and reparenting
///
/// Drag geometry is reduced to a DropZone by a pure function. The engine
/// is an explicit state machine:
///
///     Idle -> Dragging{source} -> HoveringTarget{target, zone} -> (drop) -> Idle
///
/// A drop consumes the last known zone and applies exactly one move or
/// reparent inside a "Move Layer" structural history capture. Drops against
/// missing layers, onto the source itself, or that would nest a group inside
/// its own subtree change nothing and record nothing.

#include "fwd.hpp"
#include "layer_stack.hpp"
#include "types.hpp"

#include <forge/history/history.hpp>

#include <cstdint>
#include <functional>
#include <optional>

namespace forge_layer {

// =============================================================================
// Drop Zones
// =============================================================================

enum class DropZone : std::uint8_t {
    InsertBefore,
    InsertAfter,
    InsertIntoGroup,
};

[[nodiscard]] inline const char* to_string(DropZone zone) {
    switch (zone) {
        case DropZone::InsertBefore: return "before";
        case DropZone::InsertAfter: return "after";
        case DropZone::InsertIntoGroup: return "into";
    }
    return "unknown";
}

/// Fraction of a row treated as top/bottom edge
constexpr double DEFAULT_EDGE_FRACTION = 0.3;

/// Map a pointer offset `y` inside a row of height `row_height` to a zone.
/// The middle band only means "into" for group rows; elsewhere it is "before".
[[nodiscard]] DropZone compute_drop_zone(double y, double row_height, bool is_group,
                                         double edge_fraction = DEFAULT_EDGE_FRACTION);

// =============================================================================
// Drag State
// =============================================================================

enum class DragState : std::uint8_t {
    Idle,
    Dragging,
    HoveringTarget,
};

[[nodiscard]] inline const char* to_string(DragState state) {
    switch (state) {
        case DragState::Idle: return "Idle";
        case DragState::Dragging: return "Dragging";
        case DragState::HoveringTarget: return "HoveringTarget";
    }
    return "Unknown";
}

/// What a drop did
enum class DropOutcome : std::uint8_t {
    Moved,
    Reparented,
    Ignored,
};

// =============================================================================
// Layer Ordering Engine
// =============================================================================

class LayerOrderingEngine {
public:
    using ChangeCallback = std::function<void()>;

    LayerOrderingEngine(LayerStack& stack, forge_history::HistoryService& history,
                        double edge_fraction = DEFAULT_EDGE_FRACTION);

    [[nodiscard]] DragState state() const { return m_state; }
    [[nodiscard]] std::optional<LayerId> source() const { return m_source; }
    [[nodiscard]] std::optional<LayerId> target() const { return m_target; }
    [[nodiscard]] std::optional<DropZone> zone() const { return m_zone; }
    [[nodiscard]] double edge_fraction() const { return m_edge_fraction; }

    /// Called after every applied move or reparent
    void set_on_change(ChangeCallback callback) { m_on_change = std::move(callback); }

    /// Start dragging `source`; any earlier drag is discarded
    void begin_drag(LayerId source);

    /// Pointer over `target`'s row at offset `y` of `row_height`.
    /// Hovering the source row clears the hover.
    void hover(LayerId target, double y, double row_height);

    /// Pointer over `target` with an already known zone
    void hover_zone(LayerId target, DropZone zone);

    /// Apply the drop for the last hover and return to Idle
    DropOutcome drop();

    /// Abandon the drag
    void end_drag();

    /// Apply one move/reparent directly, with history capture
    DropOutcome move(LayerId source, LayerId target, DropZone zone);

private:
    LayerStack& m_stack;
    forge_history::HistoryService& m_history;
    double m_edge_fraction;
    ChangeCallback m_on_change;

    DragState m_state = DragState::Idle;
    std::optional<LayerId> m_source;
    std::optional<LayerId> m_target;
    std::optional<DropZone> m_zone;
};

} // namespace forge_layer
