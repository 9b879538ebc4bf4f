/// @file layer.cpp
/// @brief Layer implementation

#include <forge/layer/layer.hpp>
#include <forge/core/id.hpp>

#include <algorithm>

namespace forge_layer {

namespace {

forge_core::IdGenerator& layer_ids() {
    static forge_core::IdGenerator generator;
    return generator;
}

} // anonymous namespace

Layer::Layer(LayerId id, std::string name, LayerKind kind, std::uint32_t width, std::uint32_t height)
    : m_id(id)
    , m_name(std::move(name))
    , m_kind(kind)
    , m_surface(kind == LayerKind::Group ? forge_raster::Surface() : forge_raster::Surface(width, height))
    , m_change_counter(forge_core::next_change_stamp())
{
    if (kind == LayerKind::Group) {
        m_blend_mode = BlendMode::PassThrough;
    }
}

std::unique_ptr<Layer> Layer::raster(std::string name, std::uint32_t width, std::uint32_t height) {
    return std::make_unique<Layer>(next_id(), std::move(name), LayerKind::Raster, width, height);
}

std::unique_ptr<Layer> Layer::group(std::string name) {
    return std::make_unique<Layer>(next_id(), std::move(name), LayerKind::Group, 0, 0);
}

std::unique_ptr<Layer> Layer::vector(
    std::string name, std::uint32_t width, std::uint32_t height, std::string source)
{
    auto layer = std::make_unique<Layer>(next_id(), std::move(name), LayerKind::Vector, width, height);
    layer->m_vector_source = std::move(source);
    return layer;
}

LayerId Layer::next_id() {
    return LayerId{layer_ids().next()};
}

void Layer::set_opacity(double opacity) {
    m_opacity = std::clamp(opacity, 0.0, 1.0);
}

void Layer::set_transform(const LayerTransform& transform) {
    m_transform = transform;
    mark_changed();
}

// =============================================================================
// Surface Ownership
// =============================================================================

forge_core::Result<void> Layer::claim_surface(SurfaceOwner owner) {
    if (m_owner != SurfaceOwner::None && m_owner != owner) {
        return forge_core::Err(forge_core::LayerError::surface_locked(m_id.id, to_string(m_owner)));
    }
    m_owner = owner;
    return forge_core::Ok();
}

void Layer::release_surface(SurfaceOwner owner) {
    if (m_owner == owner) {
        m_owner = SurfaceOwner::None;
    }
}

forge_core::Result<void> Layer::check_write(SurfaceOwner as) const {
    if (m_owner != SurfaceOwner::None && m_owner != as) {
        return forge_core::Err(forge_core::LayerError::surface_locked(m_id.id, to_string(m_owner)));
    }
    return forge_core::Ok();
}

// =============================================================================
// Pixel Mutation
// =============================================================================

forge_core::Result<void> Layer::set_surface(forge_raster::Surface surface, SurfaceOwner as) {
    auto allowed = check_write(as);
    if (!allowed) {
        return allowed;
    }
    m_surface = std::move(surface);
    mark_changed();
    return forge_core::Ok();
}

forge_core::Result<void> Layer::write_region(
    const forge_raster::Rect& region, std::span<const std::uint8_t> bytes, SurfaceOwner as)
{
    auto allowed = check_write(as);
    if (!allowed) {
        return allowed;
    }
    auto written = m_surface.write_region(region, bytes);
    if (!written) {
        return written;
    }
    mark_changed();
    return forge_core::Ok();
}

forge_core::Result<void> Layer::paint(const std::function<void(forge_raster::Surface&)>& stroke) {
    auto allowed = check_write(SurfaceOwner::PaintTool);
    if (!allowed) {
        return allowed;
    }
    stroke(m_surface);
    mark_changed();
    return forge_core::Ok();
}

void Layer::mark_changed() {
    m_change_counter = forge_core::next_change_stamp();
}

void Layer::set_vector_source(std::string source) {
    m_vector_source = std::move(source);
    mark_changed();
}

// =============================================================================
// Filters
// =============================================================================

forge_filter::FilterInstance* Layer::find_filter(forge_filter::FilterInstanceId id) {
    auto it = std::find_if(m_filters.begin(), m_filters.end(),
        [id](const forge_filter::FilterInstance& f) { return f.id == id; });
    return it != m_filters.end() ? &*it : nullptr;
}

std::optional<std::size_t> Layer::filter_index(forge_filter::FilterInstanceId id) const {
    for (std::size_t i = 0; i < m_filters.size(); ++i) {
        if (m_filters[i].id == id) {
            return i;
        }
    }
    return std::nullopt;
}

bool Layer::has_active_filters() const {
    return std::any_of(m_filters.begin(), m_filters.end(),
        [](const forge_filter::FilterInstance& f) { return f.enabled; });
}

// =============================================================================
// Copying
// =============================================================================

std::unique_ptr<Layer> Layer::duplicate() const {
    auto copy = std::make_unique<Layer>(next_id(), m_name + " (copy)", m_kind, 0, 0);
    copy->m_parent = m_parent;
    copy->m_visible = m_visible;
    copy->m_opacity = m_opacity;
    copy->m_blend_mode = m_blend_mode;
    copy->m_locked = m_locked;
    copy->m_transform = m_transform;
    copy->m_surface = m_surface;
    copy->m_vector_source = m_vector_source;
    copy->m_filters.reserve(m_filters.size());
    for (const auto& filter : m_filters) {
        copy->m_filters.push_back(filter.clone());
    }
    return copy;
}

} // namespace forge_layer
