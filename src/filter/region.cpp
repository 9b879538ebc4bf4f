/// @file region.cpp
/// @brief Selection to layer-pixel region clipping

#include <forge/filter/region.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

namespace forge_filter {

forge_raster::Rect effective_region(
    const forge_layer::Layer& layer,
    const std::optional<forge_editor::Selection>& selection)
{
    const forge_raster::Rect bounds = layer.surface().bounds();
    if (!selection || !selection->has_area()) {
        return bounds;
    }

    const auto& sel = *selection;
    const auto& transform = layer.transform();

    const std::array<forge_layer::Point, 4> corners{{
        transform.to_local({sel.x, sel.y}),
        transform.to_local({sel.x + sel.width, sel.y}),
        transform.to_local({sel.x, sel.y + sel.height}),
        transform.to_local({sel.x + sel.width, sel.y + sel.height}),
    }};

    double min_x = std::numeric_limits<double>::max();
    double min_y = std::numeric_limits<double>::max();
    double max_x = std::numeric_limits<double>::lowest();
    double max_y = std::numeric_limits<double>::lowest();
    for (const auto& corner : corners) {
        min_x = std::min(min_x, corner.x);
        min_y = std::min(min_y, corner.y);
        max_x = std::max(max_x, corner.x);
        max_y = std::max(max_y, corner.y);
    }

    // Clamp in double first so huge selections can't overflow int32
    const double limit_w = static_cast<double>(bounds.width);
    const double limit_h = static_cast<double>(bounds.height);
    const double x0 = std::clamp(std::floor(min_x), 0.0, limit_w);
    const double y0 = std::clamp(std::floor(min_y), 0.0, limit_h);
    const double x1 = std::clamp(std::ceil(max_x), 0.0, limit_w);
    const double y1 = std::clamp(std::ceil(max_y), 0.0, limit_h);

    forge_raster::Rect region;
    region.x = static_cast<std::int32_t>(x0);
    region.y = static_cast<std::int32_t>(y0);
    region.width = std::max(0, static_cast<std::int32_t>(x1 - x0));
    region.height = std::max(0, static_cast<std::int32_t>(y1 - y0));
    return region;
}

} // namespace forge_filter
