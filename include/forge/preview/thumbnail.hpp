#pragma once

/// @file thumbnail.hpp
/// @brief Fixed-size layer thumbnails over a transparency checkerboard
///
/// A thumbnail is a square RGBA8 surface. The background is a checkerboard
/// of white and #CCCCCC cells; the layer's pixels are scaled to fit with
/// the aspect ratio preserved, centered, and composited source-over with
/// bilinear sampling.

#include <forge/layer/fwd.hpp>
#include <forge/layer/types.hpp>
#include <forge/raster/surface.hpp>

#include <cstdint>
#include <memory>
#include <unordered_map>

namespace forge_preview {

constexpr std::uint32_t DEFAULT_THUMBNAIL_SIZE = 40;
constexpr std::uint32_t DEFAULT_CHECKER_SIZE = 5;

constexpr forge_raster::Rgba CHECKER_LIGHT = forge_raster::Rgba::opaque(0xFF, 0xFF, 0xFF);
constexpr forge_raster::Rgba CHECKER_DARK = forge_raster::Rgba::opaque(0xCC, 0xCC, 0xCC);

// =============================================================================
// Sampling Helpers
// =============================================================================

/// Premultiplied color in 0..255 per channel
struct Sample {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
    double a = 0.0;
};

/// Bilinear sample at a continuous pixel coordinate (pixel centers sit on
/// integers). Coordinates are clamped to the surface edge.
[[nodiscard]] Sample sample_bilinear(const forge_raster::Surface& surface, double x, double y);

/// Composite a premultiplied sample over the pixel at (x, y)
void composite_over(forge_raster::Surface& target, std::uint32_t x, std::uint32_t y, const Sample& sample);

/// Paint the checkerboard background over the whole surface
void fill_checkerboard(forge_raster::Surface& target, std::uint32_t cell);

/// Where a `width` x `height` image lands when fitted into a square of `size`
struct FitRect {
    double scale = 0.0;
    double offset_x = 0.0;
    double offset_y = 0.0;
    double width = 0.0;
    double height = 0.0;

    [[nodiscard]] bool contains(double x, double y) const {
        return x >= offset_x && x < offset_x + width && y >= offset_y && y < offset_y + height;
    }
};

[[nodiscard]] FitRect fit_into(double width, double height, std::uint32_t size);

// =============================================================================
// ThumbnailRenderer
// =============================================================================

/// Kind-specific drawing of a layer into a checkered thumbnail
class ThumbnailRenderer {
public:
    virtual ~ThumbnailRenderer() = default;

    /// Draw `layer` over the already painted background of `target`
    virtual void render(const forge_layer::Layer& layer, forge_raster::Surface& target) const = 0;
};

/// Fits the layer's transformed document-space footprint, so rotated and
/// scaled layers appear the way they sit in the document
class TransformedThumbnailRenderer : public ThumbnailRenderer {
public:
    void render(const forge_layer::Layer& layer, forge_raster::Surface& target) const override;
};

// =============================================================================
// ThumbnailGenerator
// =============================================================================

class ThumbnailGenerator {
public:
    explicit ThumbnailGenerator(std::uint32_t size = DEFAULT_THUMBNAIL_SIZE,
                                std::uint32_t checker = DEFAULT_CHECKER_SIZE);

    [[nodiscard]] std::uint32_t size() const { return m_size; }
    [[nodiscard]] std::uint32_t checker_size() const { return m_checker; }

    /// Prefer `renderer` for layers of `kind`; nullptr restores the scaled blit
    void set_renderer(forge_layer::LayerKind kind, std::unique_ptr<ThumbnailRenderer> renderer);

    [[nodiscard]] bool has_renderer(forge_layer::LayerKind kind) const;

    /// Render a thumbnail. Groups and empty surfaces yield only the checkerboard.
    [[nodiscard]] forge_raster::Surface generate(const forge_layer::Layer& layer) const;

private:
    void blit_scaled(const forge_raster::Surface& source, forge_raster::Surface& target) const;

    std::uint32_t m_size;
    std::uint32_t m_checker;
    std::unordered_map<forge_layer::LayerKind, std::unique_ptr<ThumbnailRenderer>> m_renderers;
};

} // namespace forge_preview
