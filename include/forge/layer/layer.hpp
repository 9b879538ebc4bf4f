#pragma once

/// @file layer.hpp
/// @brief A single document layer
///
/// Every pixel mutation goes through a Layer method that stamps a fresh
/// change counter. Write access is arbitrated by SurfaceOwner: while a
/// filter preview or direct filter holds the surface, painting is refused.

#include "fwd.hpp"
#include "types.hpp"

#include <forge/core/error.hpp>
#include <forge/filter/instance.hpp>
#include <forge/raster/surface.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace forge_layer {

// =============================================================================
// Layer
// =============================================================================

class Layer {
public:
    Layer(LayerId id, std::string name, LayerKind kind, std::uint32_t width, std::uint32_t height);

    /// Create a transparent raster layer
    [[nodiscard]] static std::unique_ptr<Layer> raster(std::string name, std::uint32_t width, std::uint32_t height);

    /// Create an empty group (passthrough blending)
    [[nodiscard]] static std::unique_ptr<Layer> group(std::string name);

    /// Create a vector layer whose surface caches the rasterized payload
    [[nodiscard]] static std::unique_ptr<Layer> vector(
        std::string name, std::uint32_t width, std::uint32_t height, std::string source);

    /// Allocate a fresh layer id
    [[nodiscard]] static LayerId next_id();

    // =========================================================================
    // Identity & Properties
    // =========================================================================

    [[nodiscard]] LayerId id() const { return m_id; }
    [[nodiscard]] LayerKind kind() const { return m_kind; }
    [[nodiscard]] bool is_group() const { return m_kind == LayerKind::Group; }
    [[nodiscard]] bool is_vector() const { return m_kind == LayerKind::Vector; }

    [[nodiscard]] const std::string& name() const { return m_name; }
    void set_name(std::string name) { m_name = std::move(name); }

    [[nodiscard]] const std::optional<LayerId>& parent() const { return m_parent; }
    void set_parent(std::optional<LayerId> parent) { m_parent = parent; }

    [[nodiscard]] bool visible() const { return m_visible; }
    void set_visible(bool visible) { m_visible = visible; }

    [[nodiscard]] double opacity() const { return m_opacity; }
    void set_opacity(double opacity);

    [[nodiscard]] BlendMode blend_mode() const { return m_blend_mode; }
    void set_blend_mode(BlendMode mode) { m_blend_mode = mode; }

    [[nodiscard]] bool locked() const { return m_locked; }
    void set_locked(bool locked) { m_locked = locked; }

    [[nodiscard]] const LayerTransform& transform() const { return m_transform; }
    void set_transform(const LayerTransform& transform);

    // =========================================================================
    // Pixels
    // =========================================================================

    [[nodiscard]] const forge_raster::Surface& surface() const { return m_surface; }
    [[nodiscard]] std::uint32_t width() const { return m_surface.width(); }
    [[nodiscard]] std::uint32_t height() const { return m_surface.height(); }

    /// Current surface owner
    [[nodiscard]] SurfaceOwner surface_owner() const { return m_owner; }

    /// Take exclusive write access; fails if someone else holds it
    [[nodiscard]] forge_core::Result<void> claim_surface(SurfaceOwner owner);

    /// Give up write access (no-op unless `owner` holds it)
    void release_surface(SurfaceOwner owner);

    /// Replace the whole surface
    [[nodiscard]] forge_core::Result<void> set_surface(forge_raster::Surface surface,
                                                       SurfaceOwner as = SurfaceOwner::None);

    /// Overwrite a rectangle with tightly packed RGBA8
    [[nodiscard]] forge_core::Result<void> write_region(const forge_raster::Rect& region,
                                                        std::span<const std::uint8_t> bytes,
                                                        SurfaceOwner as = SurfaceOwner::None);

    /// Run a painting operation against the surface as the paint tool
    [[nodiscard]] forge_core::Result<void> paint(const std::function<void(forge_raster::Surface&)>& stroke);

    /// Monotonic pixel version; changes on every pixel mutation, never reused
    [[nodiscard]] std::uint64_t change_counter() const { return m_change_counter; }

    /// Stamp a new change counter value
    void mark_changed();

    // =========================================================================
    // Vector Payload
    // =========================================================================

    [[nodiscard]] const std::string& vector_source() const { return m_vector_source; }
    void set_vector_source(std::string source);

    // =========================================================================
    // Filters
    // =========================================================================

    [[nodiscard]] const std::vector<forge_filter::FilterInstance>& filters() const { return m_filters; }
    [[nodiscard]] std::vector<forge_filter::FilterInstance>& filters() { return m_filters; }

    [[nodiscard]] forge_filter::FilterInstance* find_filter(forge_filter::FilterInstanceId id);
    [[nodiscard]] std::optional<std::size_t> filter_index(forge_filter::FilterInstanceId id) const;

    /// Any enabled filter present
    [[nodiscard]] bool has_active_filters() const;

    /// Bumped whenever the composited filter output must be rebuilt.
    /// Does not touch change_counter().
    [[nodiscard]] std::uint64_t filter_revision() const { return m_filter_revision; }
    void invalidate_filter_cache() { ++m_filter_revision; }

    // =========================================================================
    // Copying
    // =========================================================================

    /// Deep copy under a new id, named "<name> (copy)"; filters get fresh ids
    [[nodiscard]] std::unique_ptr<Layer> duplicate() const;

private:
    [[nodiscard]] forge_core::Result<void> check_write(SurfaceOwner as) const;

    LayerId m_id;
    std::string m_name;
    LayerKind m_kind;
    std::optional<LayerId> m_parent;
    bool m_visible = true;
    double m_opacity = 1.0;
    BlendMode m_blend_mode = BlendMode::Normal;
    bool m_locked = false;
    LayerTransform m_transform;

    forge_raster::Surface m_surface;
    SurfaceOwner m_owner = SurfaceOwner::None;
    std::uint64_t m_change_counter = 0;

    std::string m_vector_source;

    std::vector<forge_filter::FilterInstance> m_filters;
    std::uint64_t m_filter_revision = 0;
};

} // namespace forge_layer
