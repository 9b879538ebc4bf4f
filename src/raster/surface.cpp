/// @file surface.cpp
/// @brief Surface and Rgba implementation

#include <forge/raster/surface.hpp>

#include <cstdio>
#include <cstring>

namespace forge_raster {

namespace {

[[nodiscard]] int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

[[nodiscard]] forge_core::Error region_error(const Rect& region, const Surface& surface) {
    return forge_core::Error(forge_core::ErrorCode::InvalidArgument,
        "Region " + std::to_string(region.x) + "," + std::to_string(region.y) + " " +
        std::to_string(region.width) + "x" + std::to_string(region.height) +
        " is outside surface " + std::to_string(surface.width()) + "x" + std::to_string(surface.height()));
}

} // anonymous namespace

// =============================================================================
// Rgba
// =============================================================================

std::optional<Rgba> Rgba::from_hex(const std::string& hex) {
    if (hex.empty() || hex[0] != '#' || (hex.size() != 7 && hex.size() != 9)) {
        return std::nullopt;
    }

    std::uint8_t channels[4] = {0, 0, 0, 255};
    std::size_t count = (hex.size() - 1) / 2;
    for (std::size_t i = 0; i < count; ++i) {
        int hi = hex_digit(hex[1 + i * 2]);
        int lo = hex_digit(hex[2 + i * 2]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        channels[i] = static_cast<std::uint8_t>(hi * 16 + lo);
    }
    return Rgba{channels[0], channels[1], channels[2], channels[3]};
}

std::string Rgba::to_hex() const {
    char buffer[10];
    if (a == 255) {
        std::snprintf(buffer, sizeof(buffer), "#%02X%02X%02X", r, g, b);
    } else {
        std::snprintf(buffer, sizeof(buffer), "#%02X%02X%02X%02X", r, g, b, a);
    }
    return buffer;
}

// =============================================================================
// Surface
// =============================================================================

Surface::Surface(std::uint32_t width, std::uint32_t height, Rgba fill_color)
    : m_width(width)
    , m_height(height)
    , m_pixels(static_cast<std::size_t>(width) * height * BYTES_PER_PIXEL, 0)
{
    if (fill_color != Rgba{}) {
        fill(fill_color);
    }
}

forge_core::Result<Surface> Surface::from_bytes(
    std::uint32_t width, std::uint32_t height, std::vector<std::uint8_t> bytes)
{
    std::size_t expected = static_cast<std::size_t>(width) * height * BYTES_PER_PIXEL;
    if (bytes.size() != expected) {
        return forge_core::Err<Surface>(forge_core::WireError::size_mismatch(expected, bytes.size()));
    }

    Surface surface;
    surface.m_width = width;
    surface.m_height = height;
    surface.m_pixels = std::move(bytes);
    return forge_core::Ok(std::move(surface));
}

Rgba Surface::pixel(std::uint32_t x, std::uint32_t y) const {
    const std::uint8_t* p = m_pixels.data() + offset(x, y);
    return Rgba{p[0], p[1], p[2], p[3]};
}

void Surface::set_pixel(std::uint32_t x, std::uint32_t y, Rgba color) {
    if (x >= m_width || y >= m_height) {
        return;
    }
    std::uint8_t* p = m_pixels.data() + offset(x, y);
    p[0] = color.r;
    p[1] = color.g;
    p[2] = color.b;
    p[3] = color.a;
}

void Surface::fill(Rgba color) {
    for (std::size_t i = 0; i < m_pixels.size(); i += BYTES_PER_PIXEL) {
        m_pixels[i] = color.r;
        m_pixels[i + 1] = color.g;
        m_pixels[i + 2] = color.b;
        m_pixels[i + 3] = color.a;
    }
}

void Surface::fill_rect(const Rect& rect, Rgba color) {
    Rect clipped = rect.intersection(bounds());
    for (std::int32_t y = clipped.y; y < clipped.bottom(); ++y) {
        for (std::int32_t x = clipped.x; x < clipped.right(); ++x) {
            set_pixel(static_cast<std::uint32_t>(x), static_cast<std::uint32_t>(y), color);
        }
    }
}

forge_core::Result<std::vector<std::uint8_t>> Surface::read_region(const Rect& region) const {
    if (region.is_empty() || region.intersection(bounds()) != region) {
        return forge_core::Err<std::vector<std::uint8_t>>(region_error(region, *this));
    }

    const std::size_t row_bytes = static_cast<std::size_t>(region.width) * BYTES_PER_PIXEL;
    std::vector<std::uint8_t> out(row_bytes * static_cast<std::size_t>(region.height));

    for (std::int32_t row = 0; row < region.height; ++row) {
        const std::uint8_t* src = m_pixels.data() +
            offset(static_cast<std::uint32_t>(region.x), static_cast<std::uint32_t>(region.y + row));
        std::memcpy(out.data() + row_bytes * static_cast<std::size_t>(row), src, row_bytes);
    }

    return forge_core::Ok(std::move(out));
}

forge_core::Result<void> Surface::write_region(const Rect& region, std::span<const std::uint8_t> bytes) {
    if (region.is_empty() || region.intersection(bounds()) != region) {
        return forge_core::Err(region_error(region, *this));
    }

    const std::size_t row_bytes = static_cast<std::size_t>(region.width) * BYTES_PER_PIXEL;
    const std::size_t expected = row_bytes * static_cast<std::size_t>(region.height);
    if (bytes.size() != expected) {
        return forge_core::Err(forge_core::WireError::size_mismatch(expected, bytes.size()));
    }

    for (std::int32_t row = 0; row < region.height; ++row) {
        std::uint8_t* dst = m_pixels.data() +
            offset(static_cast<std::uint32_t>(region.x), static_cast<std::uint32_t>(region.y + row));
        std::memcpy(dst, bytes.data() + row_bytes * static_cast<std::size_t>(row), row_bytes);
    }

    return forge_core::Ok();
}

} // namespace forge_raster
