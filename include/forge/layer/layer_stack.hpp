#pragma once

/// @file layer_stack.hpp
/// @brief Ordered layer list with group nesting
///
/// Index 0 is the top of the stack. Z-order is the array position only;
/// group membership is carried by each layer's parent id and does not
/// require children to be contiguous. Every operation that changes order,
/// membership or composition bumps structural_version().

#include "fwd.hpp"
#include "layer.hpp"

#include <forge/core/error.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace forge_layer {

/// Where add_layer inserts
enum class InsertPosition : std::uint8_t {
    Top,
    Bottom,
};

class LayerStack {
public:
    LayerStack(std::uint32_t width, std::uint32_t height);

    LayerStack(const LayerStack&) = delete;
    LayerStack& operator=(const LayerStack&) = delete;

    /// Document size
    [[nodiscard]] std::uint32_t width() const { return m_width; }
    [[nodiscard]] std::uint32_t height() const { return m_height; }

    [[nodiscard]] std::size_t size() const { return m_layers.size(); }
    [[nodiscard]] bool empty() const { return m_layers.empty(); }

    // =========================================================================
    // Lookup
    // =========================================================================

    [[nodiscard]] Layer* layer_at(std::size_t index);
    [[nodiscard]] const Layer* layer_at(std::size_t index) const;

    [[nodiscard]] Layer* find(LayerId id);
    [[nodiscard]] const Layer* find(LayerId id) const;

    [[nodiscard]] std::optional<std::size_t> index_of(LayerId id) const;

    /// Ids in z-order (top first)
    [[nodiscard]] std::vector<LayerId> layer_ids() const;

    // =========================================================================
    // Active Layer
    // =========================================================================

    /// Active layer, tracked by id so reorders never leave it stale
    [[nodiscard]] Layer* active_layer();
    [[nodiscard]] const Layer* active_layer() const;
    [[nodiscard]] std::optional<std::size_t> active_index() const;
    [[nodiscard]] LayerId active_id() const { return m_active; }

    void set_active_index(std::size_t index);
    bool set_active_by_id(LayerId id);

    // =========================================================================
    // Add / Remove
    // =========================================================================

    /// Insert a layer and make it active
    Layer& add_layer(std::unique_ptr<Layer> layer, InsertPosition position = InsertPosition::Top);

    /// Convenience: document-sized transparent raster layer at the top
    Layer& add_raster_layer(const std::string& name);

    /// Remove by index; the stack always keeps at least one layer
    [[nodiscard]] forge_core::Result<void> remove_layer(std::size_t index);
    [[nodiscard]] forge_core::Result<void> remove_layer_by_id(LayerId id);

    /// Duplicate above the original and make the copy active
    [[nodiscard]] forge_core::Result<LayerId> duplicate_layer(std::size_t index);

    /// Remove the layer at `index` and hand it to the caller. No minimum-size
    /// rule; the caller is expected to insert() it back.
    [[nodiscard]] std::unique_ptr<Layer> detach(std::size_t index);

    /// Insert at an index clamped to [0, size()]
    void insert(std::size_t index, std::unique_ptr<Layer> layer);

    // =========================================================================
    // Reordering
    // =========================================================================

    /// Move between two valid indices; false if either is out of range or equal
    bool move_layer(std::size_t from, std::size_t to);

    bool move_layer_up(std::size_t index);
    bool move_layer_down(std::size_t index);
    /// Top/bottom of the layer's own nesting level
    bool move_layer_to_top(std::size_t index);
    bool move_layer_to_bottom(std::size_t index);

    // =========================================================================
    // Groups
    // =========================================================================

    /// Direct children of a group (nullopt = root level), in z-order
    [[nodiscard]] std::vector<Layer*> children(std::optional<LayerId> group) const;

    /// All descendants of a group, depth-first
    [[nodiscard]] std::vector<Layer*> descendants(LayerId group) const;

    /// True if `ancestor` is on the parent chain of `id`
    [[nodiscard]] bool is_ancestor(LayerId ancestor, LayerId id) const;

    /// Create an empty group at `insert_index`
    LayerId create_group(const std::string& name, std::optional<LayerId> parent = std::nullopt,
                         std::size_t insert_index = 0);

    /// Wrap existing layers in a new group placed at the topmost member's index
    [[nodiscard]] forge_core::Result<LayerId> group_layers(const std::vector<LayerId>& ids,
                                                           const std::string& name = "Group");

    /// Dissolve a group; its children move to the group's parent
    [[nodiscard]] forge_core::Result<void> ungroup(LayerId group);

    /// Reparent a layer (nullopt = root). Rejects non-groups and cycles.
    [[nodiscard]] forge_core::Result<void> move_to_group(LayerId layer, std::optional<LayerId> group);

    /// Delete a group; children are either deleted too or lifted to its parent
    [[nodiscard]] forge_core::Result<void> delete_group(LayerId group, bool delete_children = false);

    // =========================================================================
    // Effective Properties
    // =========================================================================

    [[nodiscard]] bool is_effectively_visible(const Layer& layer) const;
    /// Opacity multiplied through non-passthrough parent groups
    [[nodiscard]] double effective_opacity(const Layer& layer) const;
    [[nodiscard]] bool is_effectively_locked(const Layer& layer) const;

    // =========================================================================
    // Property Edits (structural)
    // =========================================================================

    bool set_layer_visible(LayerId id, bool visible);
    bool set_layer_opacity(LayerId id, double opacity);
    bool set_layer_blend_mode(LayerId id, BlendMode mode);
    bool rename_layer(LayerId id, const std::string& name);

    // =========================================================================
    // Structural Version
    // =========================================================================

    /// Stack-wide counter for order / membership / composition changes
    [[nodiscard]] std::uint64_t structural_version() const { return m_structural_version; }

    void bump_structure() { ++m_structural_version; }

private:
    void fallback_active(std::size_t removed_index);
    void collect_descendants(LayerId group, std::vector<Layer*>& out, std::size_t depth) const;

    std::uint32_t m_width;
    std::uint32_t m_height;
    std::vector<std::unique_ptr<Layer>> m_layers;
    LayerId m_active;
    std::uint64_t m_structural_version = 0;
};

} // namespace forge_layer
