#pragma once

/// @file surface.hpp
/// @brief RGBA8 raster surfaces and integer pixel rectangles
///
/// Pixels are stored row-major, top row first, four bytes per pixel in
/// R, G, B, A order. This is the same layout the filter service consumes.

#include <forge/core/error.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace forge_raster {

// =============================================================================
// Rect
// =============================================================================

/// Integer pixel rectangle
struct Rect {
    std::int32_t x = 0;
    std::int32_t y = 0;
    std::int32_t width = 0;
    std::int32_t height = 0;

    [[nodiscard]] static Rect from_size(std::int32_t w, std::int32_t h) {
        return Rect{0, 0, w, h};
    }

    [[nodiscard]] bool is_empty() const { return width <= 0 || height <= 0; }

    [[nodiscard]] std::int32_t right() const { return x + width; }
    [[nodiscard]] std::int32_t bottom() const { return y + height; }

    [[nodiscard]] std::int64_t area() const {
        return is_empty() ? 0 : static_cast<std::int64_t>(width) * height;
    }

    /// Overlap of two rectangles (empty when disjoint)
    [[nodiscard]] Rect intersection(const Rect& other) const {
        std::int32_t x0 = std::max(x, other.x);
        std::int32_t y0 = std::max(y, other.y);
        std::int32_t x1 = std::min(right(), other.right());
        std::int32_t y1 = std::min(bottom(), other.bottom());
        if (x1 <= x0 || y1 <= y0) {
            return Rect{x0, y0, 0, 0};
        }
        return Rect{x0, y0, x1 - x0, y1 - y0};
    }

    [[nodiscard]] bool operator==(const Rect& other) const = default;
};

// =============================================================================
// Rgba
// =============================================================================

/// One RGBA8 pixel
struct Rgba {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 0;

    [[nodiscard]] static constexpr Rgba opaque(std::uint8_t r, std::uint8_t g, std::uint8_t b) {
        return Rgba{r, g, b, 255};
    }

    /// Parse "#RRGGBB" or "#RRGGBBAA"
    [[nodiscard]] static std::optional<Rgba> from_hex(const std::string& hex);

    /// Format as "#RRGGBB" (alpha omitted when opaque)
    [[nodiscard]] std::string to_hex() const;

    [[nodiscard]] bool operator==(const Rgba& other) const = default;
};

// =============================================================================
// Surface
// =============================================================================

/// Owned RGBA8 pixel buffer
class Surface {
public:
    static constexpr std::size_t BYTES_PER_PIXEL = 4;

    Surface() = default;
    Surface(std::uint32_t width, std::uint32_t height, Rgba fill = {});

    /// Wrap existing pixel bytes; fails unless size is width*height*4
    [[nodiscard]] static forge_core::Result<Surface> from_bytes(
        std::uint32_t width, std::uint32_t height, std::vector<std::uint8_t> bytes);

    [[nodiscard]] std::uint32_t width() const { return m_width; }
    [[nodiscard]] std::uint32_t height() const { return m_height; }
    [[nodiscard]] bool empty() const { return m_width == 0 || m_height == 0; }
    [[nodiscard]] std::size_t byte_size() const { return m_pixels.size(); }

    [[nodiscard]] Rect bounds() const {
        return Rect::from_size(static_cast<std::int32_t>(m_width), static_cast<std::int32_t>(m_height));
    }

    [[nodiscard]] const std::vector<std::uint8_t>& bytes() const { return m_pixels; }
    [[nodiscard]] std::vector<std::uint8_t>& bytes() { return m_pixels; }

    /// Read one pixel (must be in bounds)
    [[nodiscard]] Rgba pixel(std::uint32_t x, std::uint32_t y) const;

    /// Write one pixel (ignored when out of bounds)
    void set_pixel(std::uint32_t x, std::uint32_t y, Rgba color);

    /// Fill every pixel
    void fill(Rgba color);

    /// Fill a rectangle, clipped to the surface
    void fill_rect(const Rect& rect, Rgba color);

    /// Copy a region out as tightly packed RGBA8
    [[nodiscard]] forge_core::Result<std::vector<std::uint8_t>> read_region(const Rect& region) const;

    /// Write tightly packed RGBA8 into a region; pixels outside the region are untouched
    [[nodiscard]] forge_core::Result<void> write_region(const Rect& region, std::span<const std::uint8_t> bytes);

    [[nodiscard]] bool operator==(const Surface& other) const = default;

private:
    [[nodiscard]] std::size_t offset(std::uint32_t x, std::uint32_t y) const {
        return (static_cast<std::size_t>(y) * m_width + x) * BYTES_PER_PIXEL;
    }

    std::uint32_t m_width = 0;
    std::uint32_t m_height = 0;
    std::vector<std::uint8_t> m_pixels;
};

} // namespace forge_raster
