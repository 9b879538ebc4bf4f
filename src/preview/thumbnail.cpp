/// @file thumbnail.cpp
/// @brief Thumbnail rendering

#include <forge/preview/thumbnail.hpp>
#include <forge/layer/layer.hpp>

#include <algorithm>
#include <cmath>

namespace forge_preview {

namespace {

[[nodiscard]] std::uint8_t to_channel(double value) {
    return static_cast<std::uint8_t>(std::clamp(std::lround(value), 0L, 255L));
}

[[nodiscard]] Sample premultiplied(const forge_raster::Rgba& p) {
    const double a = p.a / 255.0;
    return Sample{p.r * a, p.g * a, p.b * a, static_cast<double>(p.a)};
}

} // namespace

// =============================================================================
// Sampling Helpers
// =============================================================================

Sample sample_bilinear(const forge_raster::Surface& surface, double x, double y) {
    if (surface.empty()) {
        return {};
    }

    const double max_x = static_cast<double>(surface.width() - 1);
    const double max_y = static_cast<double>(surface.height() - 1);
    x = std::clamp(x, 0.0, max_x);
    y = std::clamp(y, 0.0, max_y);

    const auto x0 = static_cast<std::uint32_t>(std::floor(x));
    const auto y0 = static_cast<std::uint32_t>(std::floor(y));
    const std::uint32_t x1 = std::min(x0 + 1, surface.width() - 1);
    const std::uint32_t y1 = std::min(y0 + 1, surface.height() - 1);
    const double fx = x - x0;
    const double fy = y - y0;

    const Sample p00 = premultiplied(surface.pixel(x0, y0));
    const Sample p10 = premultiplied(surface.pixel(x1, y0));
    const Sample p01 = premultiplied(surface.pixel(x0, y1));
    const Sample p11 = premultiplied(surface.pixel(x1, y1));

    const double w00 = (1.0 - fx) * (1.0 - fy);
    const double w10 = fx * (1.0 - fy);
    const double w01 = (1.0 - fx) * fy;
    const double w11 = fx * fy;

    return Sample{
        p00.r * w00 + p10.r * w10 + p01.r * w01 + p11.r * w11,
        p00.g * w00 + p10.g * w10 + p01.g * w01 + p11.g * w11,
        p00.b * w00 + p10.b * w10 + p01.b * w01 + p11.b * w11,
        p00.a * w00 + p10.a * w10 + p01.a * w01 + p11.a * w11,
    };
}

void composite_over(forge_raster::Surface& target, std::uint32_t x, std::uint32_t y, const Sample& sample) {
    if (x >= target.width() || y >= target.height() || sample.a <= 0.0) {
        return;
    }

    const forge_raster::Rgba dst = target.pixel(x, y);
    const double keep = 1.0 - sample.a / 255.0;
    target.set_pixel(x, y, forge_raster::Rgba{
        to_channel(sample.r + dst.r * keep),
        to_channel(sample.g + dst.g * keep),
        to_channel(sample.b + dst.b * keep),
        to_channel(sample.a + dst.a * keep),
    });
}

void fill_checkerboard(forge_raster::Surface& target, std::uint32_t cell) {
    cell = std::max<std::uint32_t>(cell, 1);
    for (std::uint32_t y = 0; y < target.height(); ++y) {
        for (std::uint32_t x = 0; x < target.width(); ++x) {
            const bool light = ((x / cell) + (y / cell)) % 2 == 0;
            target.set_pixel(x, y, light ? CHECKER_LIGHT : CHECKER_DARK);
        }
    }
}

FitRect fit_into(double width, double height, std::uint32_t size) {
    FitRect fit;
    if (width <= 0.0 || height <= 0.0 || size == 0) {
        return fit;
    }

    const double extent = static_cast<double>(size);
    fit.scale = std::min(extent / width, extent / height);
    fit.width = width * fit.scale;
    fit.height = height * fit.scale;
    fit.offset_x = (extent - fit.width) / 2.0;
    fit.offset_y = (extent - fit.height) / 2.0;
    return fit;
}

// =============================================================================
// TransformedThumbnailRenderer
// =============================================================================

void TransformedThumbnailRenderer::render(const forge_layer::Layer& layer, forge_raster::Surface& target) const {
    const forge_raster::Surface& source = layer.surface();
    if (source.empty()) {
        return;
    }

    const forge_layer::LayerTransform& transform = layer.transform();
    const double w = static_cast<double>(source.width());
    const double h = static_cast<double>(source.height());
    const forge_layer::Point corners[4] = {
        transform.to_document({0.0, 0.0}),
        transform.to_document({w, 0.0}),
        transform.to_document({0.0, h}),
        transform.to_document({w, h}),
    };

    double min_x = corners[0].x;
    double max_x = corners[0].x;
    double min_y = corners[0].y;
    double max_y = corners[0].y;
    for (const auto& corner : corners) {
        min_x = std::min(min_x, corner.x);
        max_x = std::max(max_x, corner.x);
        min_y = std::min(min_y, corner.y);
        max_y = std::max(max_y, corner.y);
    }

    const FitRect fit = fit_into(max_x - min_x, max_y - min_y, std::min(target.width(), target.height()));
    if (fit.scale <= 0.0) {
        return;
    }

    for (std::uint32_t ty = 0; ty < target.height(); ++ty) {
        for (std::uint32_t tx = 0; tx < target.width(); ++tx) {
            const double cx = tx + 0.5;
            const double cy = ty + 0.5;
            if (!fit.contains(cx, cy)) {
                continue;
            }

            const forge_layer::Point doc{
                min_x + (cx - fit.offset_x) / fit.scale,
                min_y + (cy - fit.offset_y) / fit.scale,
            };
            const forge_layer::Point local = transform.to_local(doc);
            if (local.x < 0.0 || local.y < 0.0 || local.x >= w || local.y >= h) {
                continue;
            }

            composite_over(target, tx, ty, sample_bilinear(source, local.x - 0.5, local.y - 0.5));
        }
    }
}

// =============================================================================
// ThumbnailGenerator
// =============================================================================

ThumbnailGenerator::ThumbnailGenerator(std::uint32_t size, std::uint32_t checker)
    : m_size(size > 0 ? size : DEFAULT_THUMBNAIL_SIZE)
    , m_checker(checker > 0 ? checker : DEFAULT_CHECKER_SIZE)
{}

void ThumbnailGenerator::set_renderer(forge_layer::LayerKind kind, std::unique_ptr<ThumbnailRenderer> renderer) {
    if (renderer) {
        m_renderers[kind] = std::move(renderer);
    } else {
        m_renderers.erase(kind);
    }
}

bool ThumbnailGenerator::has_renderer(forge_layer::LayerKind kind) const {
    return m_renderers.find(kind) != m_renderers.end();
}

forge_raster::Surface ThumbnailGenerator::generate(const forge_layer::Layer& layer) const {
    forge_raster::Surface thumbnail(m_size, m_size);
    fill_checkerboard(thumbnail, m_checker);

    if (layer.is_group() || layer.surface().empty()) {
        return thumbnail;
    }

    auto it = m_renderers.find(layer.kind());
    if (it != m_renderers.end()) {
        it->second->render(layer, thumbnail);
    } else {
        blit_scaled(layer.surface(), thumbnail);
    }
    return thumbnail;
}

void ThumbnailGenerator::blit_scaled(const forge_raster::Surface& source, forge_raster::Surface& target) const {
    const FitRect fit = fit_into(source.width(), source.height(), m_size);
    if (fit.scale <= 0.0) {
        return;
    }

    for (std::uint32_t ty = 0; ty < target.height(); ++ty) {
        for (std::uint32_t tx = 0; tx < target.width(); ++tx) {
            const double cx = tx + 0.5;
            const double cy = ty + 0.5;
            if (!fit.contains(cx, cy)) {
                continue;
            }

            const double u = (cx - fit.offset_x) / fit.scale - 0.5;
            const double v = (cy - fit.offset_y) / fit.scale - 0.5;
            composite_over(target, tx, ty, sample_bilinear(source, u, v));
        }
    }
}

} // namespace forge_preview
