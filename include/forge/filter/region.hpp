#pragma once

/// @file region.hpp
/// @brief Selection to layer-pixel region clipping

#include <forge/editor/session.hpp>
#include <forge/layer/layer.hpp>
#include <forge/raster/surface.hpp>

#include <optional>

namespace forge_filter {

/// Pixel region a filter acts on.
///
/// Without a positive-area selection this is the whole layer. Otherwise the
/// selection's corners are mapped through the inverse layer transform, the
/// bounding box is floored/ceiled to whole pixels and clamped to the layer.
/// An empty result means the filter is a no-op.
[[nodiscard]] forge_raster::Rect effective_region(
    const forge_layer::Layer& layer,
    const std::optional<forge_editor::Selection>& selection);

} // namespace forge_filter
