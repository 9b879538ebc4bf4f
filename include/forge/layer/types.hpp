#pragma once

/// @file types.hpp
/// @brief Basic layer types: ids, kinds, blend modes, transforms

#include "fwd.hpp"

#include <cmath>
#include <cstdint>
#include <functional>
#include <string>

namespace forge_layer {

// =============================================================================
// Layer ID
// =============================================================================

/// Unique layer identifier
struct LayerId {
    std::uint64_t id = 0;

    [[nodiscard]] bool operator==(const LayerId& other) const { return id == other.id; }
    [[nodiscard]] bool operator!=(const LayerId& other) const { return id != other.id; }
    [[nodiscard]] bool operator<(const LayerId& other) const { return id < other.id; }

    [[nodiscard]] bool is_valid() const { return id != 0; }

    [[nodiscard]] static LayerId invalid() { return LayerId{0}; }
};

} // namespace forge_layer

template<>
struct std::hash<forge_layer::LayerId> {
    std::size_t operator()(const forge_layer::LayerId& id) const noexcept {
        return std::hash<std::uint64_t>{}(id.id);
    }
};

namespace forge_layer {

// =============================================================================
// Layer Kind
// =============================================================================

/// What a layer holds
enum class LayerKind : std::uint8_t {
    /// Pixel surface
    Raster,
    /// Vector payload rasterized into its surface
    Vector,
    /// Container; children reference it through their parent id
    Group,
};

[[nodiscard]] inline const char* to_string(LayerKind kind) {
    switch (kind) {
        case LayerKind::Raster: return "Raster";
        case LayerKind::Vector: return "Vector";
        case LayerKind::Group: return "Group";
    }
    return "Unknown";
}

// =============================================================================
// Blend Mode
// =============================================================================

/// Blend mode for layer compositing
enum class BlendMode : std::uint8_t {
    Normal,
    Multiply,
    Screen,
    Overlay,
    Darken,
    Lighten,
    ColorDodge,
    ColorBurn,
    HardLight,
    SoftLight,
    Difference,
    Exclusion,
    /// Groups only: children blend straight into the backdrop
    PassThrough,
};

[[nodiscard]] inline const char* to_string(BlendMode mode) {
    switch (mode) {
        case BlendMode::Normal: return "normal";
        case BlendMode::Multiply: return "multiply";
        case BlendMode::Screen: return "screen";
        case BlendMode::Overlay: return "overlay";
        case BlendMode::Darken: return "darken";
        case BlendMode::Lighten: return "lighten";
        case BlendMode::ColorDodge: return "color-dodge";
        case BlendMode::ColorBurn: return "color-burn";
        case BlendMode::HardLight: return "hard-light";
        case BlendMode::SoftLight: return "soft-light";
        case BlendMode::Difference: return "difference";
        case BlendMode::Exclusion: return "exclusion";
        case BlendMode::PassThrough: return "passthrough";
    }
    return "unknown";
}

// =============================================================================
// Surface Owner
// =============================================================================

/// Who currently holds write access to a layer's surface
enum class SurfaceOwner : std::uint8_t {
    None,
    PaintTool,
    PreviewSession,
    DirectFilter,
};

[[nodiscard]] inline const char* to_string(SurfaceOwner owner) {
    switch (owner) {
        case SurfaceOwner::None: return "none";
        case SurfaceOwner::PaintTool: return "paint tool";
        case SurfaceOwner::PreviewSession: return "filter preview";
        case SurfaceOwner::DirectFilter: return "filter";
    }
    return "unknown";
}

// =============================================================================
// Layer Transform
// =============================================================================

/// Point in document or layer space
struct Point {
    double x = 0.0;
    double y = 0.0;
};

/// Layer-to-document affine transform: scale, then rotate, then translate.
/// Scale and rotation are about the layer's pixel origin.
struct LayerTransform {
    double translate_x = 0.0;
    double translate_y = 0.0;
    double scale_x = 1.0;
    double scale_y = 1.0;
    /// Radians, clockwise in document space (y down)
    double rotation = 0.0;

    [[nodiscard]] static LayerTransform identity() { return LayerTransform{}; }

    [[nodiscard]] static LayerTransform offset(double x, double y) {
        LayerTransform t;
        t.translate_x = x;
        t.translate_y = y;
        return t;
    }

    [[nodiscard]] bool is_identity() const {
        return translate_x == 0.0 && translate_y == 0.0 &&
               scale_x == 1.0 && scale_y == 1.0 &&
               rotation == 0.0;
    }

    [[nodiscard]] bool is_axis_aligned() const { return rotation == 0.0; }

    [[nodiscard]] LayerTransform& with_translation(double x, double y) {
        translate_x = x;
        translate_y = y;
        return *this;
    }

    [[nodiscard]] LayerTransform& with_scale(double x, double y) {
        scale_x = x;
        scale_y = y;
        return *this;
    }

    [[nodiscard]] LayerTransform& with_rotation(double r) {
        rotation = r;
        return *this;
    }

    /// Map a layer pixel coordinate to document space
    [[nodiscard]] Point to_document(Point local) const {
        double sx = local.x * scale_x;
        double sy = local.y * scale_y;
        double c = std::cos(rotation);
        double s = std::sin(rotation);
        return Point{sx * c - sy * s + translate_x, sx * s + sy * c + translate_y};
    }

    /// Map a document coordinate back to layer pixel space.
    /// Degenerate (zero) scale maps everything to the origin.
    [[nodiscard]] Point to_local(Point doc) const {
        double dx = doc.x - translate_x;
        double dy = doc.y - translate_y;
        double c = std::cos(rotation);
        double s = std::sin(rotation);
        double rx = dx * c + dy * s;
        double ry = -dx * s + dy * c;
        return Point{
            scale_x != 0.0 ? rx / scale_x : 0.0,
            scale_y != 0.0 ? ry / scale_y : 0.0,
        };
    }
};

} // namespace forge_layer
