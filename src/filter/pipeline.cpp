/// @file pipeline.cpp
/// @brief FilterPipeline implementation

#include <forge/filter/pipeline.hpp>
#include <forge/filter/instance.hpp>
#include <forge/filter/region.hpp>
#include <forge/core/log.hpp>
#include <forge/layer/layer.hpp>

namespace forge_filter {

using forge_core::Err;
using forge_core::Error;
using forge_core::ErrorCode;
using forge_core::FilterError;
using forge_core::Ok;
using forge_layer::SurfaceOwner;

FilterPipeline::FilterPipeline(forge_editor::EditorSession& session, FilterService& service,
                               std::chrono::milliseconds debounce)
    : m_editor(session)
    , m_service(service)
    , m_debounce(debounce < std::chrono::milliseconds::zero() ? std::chrono::milliseconds::zero() : debounce)
    , m_lifetime(std::make_shared<int>(0))
{}

FilterPipeline::~FilterPipeline() {
    teardown();
}

// =============================================================================
// Dialog
// =============================================================================

forge_core::Result<void> FilterPipeline::open_filter_dialog(const FilterDef& def) {
    auto log = forge_core::filter_logger();

    if (m_session) {
        return Err(FilterError::session_active(m_session->filter.id));
    }
    if (!def.has_params()) {
        return apply_direct(def);
    }
    if (m_direct) {
        return Err(FilterError::surface_busy(to_string(SurfaceOwner::DirectFilter)));
    }

    forge_layer::Layer* layer = m_editor.layers().active_layer();
    if (!layer) {
        return Err(Error{ErrorCode::InvalidState, "No active layer"});
    }
    if (layer->is_group()) {
        return Err(Error{ErrorCode::InvalidState, "Layer '" + layer->name() + "' has no pixels to filter"});
    }

    auto claimed = layer->claim_surface(SurfaceOwner::PreviewSession);
    if (!claimed) {
        return Err(FilterError::surface_busy(to_string(layer->surface_owner())));
    }

    PreviewSession session;
    session.layer = layer->id();
    session.snapshot = layer->surface();
    session.filter = def;
    session.params = default_params(def);
    session.filters_before = serialize_filter_list(layer->filters());
    m_session = std::move(session);

    log->debug("Filter dialog '{}' opened on layer '{}'", def.id, layer->name());
    schedule_preview();
    return Ok();
}

forge_core::Result<void> FilterPipeline::set_param(const std::string& param_id, nlohmann::json value) {
    if (!m_session) {
        return Err(FilterError::no_session());
    }

    const bool declared = m_session->filter.find_param(param_id) != nullptr;
    const bool preset = m_session->filter.preset_params.is_object() &&
                        m_session->filter.preset_params.contains(param_id);
    if (!declared && !preset) {
        return Err(Error{ErrorCode::InvalidArgument,
            "Filter '" + m_session->filter.id + "' has no parameter '" + param_id + "'"});
    }

    if (auto valid = validate_param_value(param_id, value); !valid) {
        return valid;
    }

    m_session->params[param_id] = std::move(value);
    schedule_preview();
    return Ok();
}

forge_core::Result<void> FilterPipeline::reset_params() {
    if (!m_session) {
        return Err(FilterError::no_session());
    }
    m_session->params = default_params(m_session->filter);
    schedule_preview();
    return Ok();
}

forge_core::Result<void> FilterPipeline::set_preview_enabled(bool enabled) {
    if (!m_session) {
        return Err(FilterError::no_session());
    }
    if (m_session->preview_enabled == enabled) {
        return Ok();
    }

    m_session->preview_enabled = enabled;
    if (enabled) {
        schedule_preview();
    } else {
        m_editor.timers().cancel(m_session->debounce);
        m_session->debounce = forge_core::TimerHandle::invalid();
        // In-flight replies must not land while preview is off
        m_session->latest_sequence = 0;
        restore_snapshot(true);
    }
    return Ok();
}

forge_core::Result<void> FilterPipeline::commit() {
    if (!m_session) {
        return Err(FilterError::no_session());
    }

    m_editor.timers().cancel(m_session->debounce);
    m_session->latest_sequence = 0;

    forge_layer::Layer* layer = session_layer();
    if (!layer) {
        const auto id = m_session->layer.id;
        m_session.reset();
        return Err(forge_core::LayerError::not_found(id));
    }

    const std::string label = history_label(m_session->filter, m_session->params);
    const bool filters_changed = serialize_filter_list(layer->filters()) != m_session->filters_before;
    const bool pixels_changed = layer->surface() != m_session->snapshot;

    if (filters_changed || pixels_changed) {
        // History sees the pre-dialog pixels at save_state and the result at finish_state
        forge_raster::Surface committed = layer->surface();
        auto& history = m_editor.history();

        auto restored = layer->set_surface(m_session->snapshot, SurfaceOwner::PreviewSession);
        if (!restored) {
            return restored;
        }
        history.save_state("Filter: " + label);
        auto applied = layer->set_surface(std::move(committed), SurfaceOwner::PreviewSession);
        if (!applied) {
            history.abort_capture();
            return applied;
        }
        history.finish_state();
        m_editor.mark_modified();
    } else {
        forge_core::filter_logger()->debug("Filter '{}' committed without changes", m_session->filter.id);
    }

    end_session();
    m_editor.request_render();
    m_editor.report_status(label + " applied");
    return Ok();
}

forge_core::Result<void> FilterPipeline::cancel() {
    if (!m_session) {
        return Err(FilterError::no_session());
    }

    m_editor.timers().cancel(m_session->debounce);
    m_session->latest_sequence = 0;
    restore_snapshot(false);
    end_session();

    m_editor.request_render();
    m_editor.report_status("Filter cancelled");
    return Ok();
}

// =============================================================================
// Preview
// =============================================================================

void FilterPipeline::schedule_preview() {
    if (!m_session || !m_session->preview_enabled) {
        return;
    }

    auto& timers = m_editor.timers();
    timers.cancel(m_session->debounce);

    std::weak_ptr<int> alive = m_lifetime;
    m_session->debounce = timers.schedule(m_debounce, [this, alive]() {
        if (alive.expired()) {
            return;
        }
        recompute();
    });
}

void FilterPipeline::recompute() {
    if (!m_session) {
        return;
    }
    m_session->debounce = forge_core::TimerHandle::invalid();
    if (!m_session->preview_enabled) {
        return;
    }

    forge_layer::Layer* layer = session_layer();
    if (!layer) {
        forge_core::filter_logger()->warn("Preview target layer {} is gone; closing filter dialog",
            m_session->layer.id);
        m_session.reset();
        return;
    }

    // Start from the original pixels, without a visible refresh
    restore_snapshot(false);

    const forge_raster::Rect region = effective_region(*layer, m_editor.selection());
    if (region.is_empty()) {
        forge_core::filter_logger()->debug("Preview skipped: empty filter region");
        m_session->latest_sequence = 0;
        m_editor.request_render();
        return;
    }

    auto pixels = m_session->snapshot.read_region(region);
    if (!pixels) {
        forge_core::filter_logger()->warn("Preview skipped: {}", pixels.error().message());
        return;
    }

    const std::uint64_t sequence = ++m_next_sequence;
    m_session->latest_sequence = sequence;
    ++m_preview_requests;

    FilterRequest request;
    request.filter_id = m_session->filter.id;
    request.width = static_cast<std::uint32_t>(region.width);
    request.height = static_cast<std::uint32_t>(region.height);
    request.params = m_session->params;
    request.pixels = std::move(*pixels);

    forge_core::filter_logger()->trace("Preview request #{} for '{}' ({}x{} at {},{})",
        sequence, request.filter_id, region.width, region.height, region.x, region.y);

    std::weak_ptr<int> alive = m_lifetime;
    m_service.execute(std::move(request), [this, alive, sequence, region](FilterResult result) {
        if (alive.expired()) {
            return;
        }
        on_preview_result(sequence, region, std::move(result));
    });
}

void FilterPipeline::on_preview_result(std::uint64_t sequence, forge_raster::Rect region, FilterResult result) {
    auto log = forge_core::filter_logger();

    if (!m_session || m_session->latest_sequence != sequence) {
        ++m_stale_responses;
        log->debug("Discarding superseded preview response #{}", sequence);
        return;
    }
    m_session->latest_sequence = 0;

    forge_layer::Layer* layer = session_layer();
    if (!layer) {
        return;
    }

    if (!result) {
        restore_snapshot(true);
        log->warn("Preview of '{}' failed: {}", m_session->filter.id, result.error().message());
        m_editor.report_status("Preview failed: " + result.error().message());
        return;
    }

    // Each applied preview starts from the snapshot
    restore_snapshot(false);
    auto written = layer->write_region(region, *result, SurfaceOwner::PreviewSession);
    if (!written) {
        restore_snapshot(true);
        log->warn("Preview of '{}' could not be applied: {}", m_session->filter.id, written.error().message());
        m_editor.report_status("Preview failed: " + written.error().message());
        return;
    }

    m_editor.request_render();
}

// =============================================================================
// Direct Application
// =============================================================================

forge_core::Result<void> FilterPipeline::apply_direct(const FilterDef& def, DoneCallback on_done) {
    if (m_session) {
        return Err(FilterError::session_active(m_session->filter.id));
    }
    if (m_direct) {
        return Err(FilterError::surface_busy(to_string(SurfaceOwner::DirectFilter)));
    }

    forge_layer::Layer* layer = m_editor.layers().active_layer();
    if (!layer) {
        return Err(Error{ErrorCode::InvalidState, "No active layer"});
    }
    if (layer->is_group()) {
        return Err(Error{ErrorCode::InvalidState, "Layer '" + layer->name() + "' has no pixels to filter"});
    }

    const nlohmann::json params = def.preset_params.is_object() ? def.preset_params : nlohmann::json::object();
    const std::string label = history_label(def, params);

    const forge_raster::Rect region = effective_region(*layer, m_editor.selection());
    if (region.is_empty()) {
        forge_core::filter_logger()->debug("'{}' not applied: empty filter region", def.id);
        if (on_done) {
            on_done(Ok());
        }
        return Ok();
    }

    auto pixels = layer->surface().read_region(region);
    if (!pixels) {
        return Err(pixels.error());
    }

    auto claimed = layer->claim_surface(SurfaceOwner::DirectFilter);
    if (!claimed) {
        return Err(FilterError::surface_busy(to_string(layer->surface_owner())));
    }

    m_editor.report_status("Applying " + label + "...");

    DirectApplication direct;
    direct.layer = layer->id();
    direct.region = region;
    direct.label = label;
    direct.sequence = ++m_next_sequence;
    direct.on_done = std::move(on_done);
    m_direct = std::move(direct);

    FilterRequest request;
    request.filter_id = def.id;
    request.width = static_cast<std::uint32_t>(region.width);
    request.height = static_cast<std::uint32_t>(region.height);
    request.params = params;
    request.pixels = std::move(*pixels);

    const std::uint64_t sequence = m_direct->sequence;
    std::weak_ptr<int> alive = m_lifetime;
    m_service.execute(std::move(request), [this, alive, sequence](FilterResult result) {
        if (alive.expired()) {
            return;
        }
        on_direct_result(sequence, std::move(result));
    });
    return Ok();
}

void FilterPipeline::on_direct_result(std::uint64_t sequence, FilterResult result) {
    if (!m_direct || m_direct->sequence != sequence) {
        return;
    }

    forge_layer::Layer* layer = m_editor.layers().find(m_direct->layer);
    if (!layer) {
        finish_direct(Err(forge_core::LayerError::not_found(m_direct->layer.id)));
        return;
    }

    // Opened at reply time; edits made while the request was pending keep their own entries
    m_editor.history().save_state("Filter: " + m_direct->label);

    if (!result) {
        m_editor.history().abort_capture();
        layer->release_surface(SurfaceOwner::DirectFilter);
        finish_direct(Err(result.error()));
        return;
    }

    auto written = layer->write_region(m_direct->region, *result, SurfaceOwner::DirectFilter);
    layer->release_surface(SurfaceOwner::DirectFilter);
    if (!written) {
        m_editor.history().abort_capture();
        finish_direct(std::move(written));
        return;
    }

    m_editor.history().finish_state();
    m_editor.mark_modified();
    m_editor.request_render();
    finish_direct(Ok());
}

void FilterPipeline::finish_direct(forge_core::Result<void> outcome) {
    DirectApplication direct = std::move(*m_direct);
    m_direct.reset();

    if (outcome) {
        m_editor.report_status(direct.label + " applied");
    } else {
        forge_core::filter_logger()->warn("Filter '{}' failed: {}", direct.label, outcome.error().message());
        m_editor.report_status("Filter failed: " + outcome.error().message());
    }

    if (direct.on_done) {
        direct.on_done(std::move(outcome));
    }
}

// =============================================================================
// Lifetime
// =============================================================================

void FilterPipeline::teardown() {
    if (m_session) {
        m_editor.timers().cancel(m_session->debounce);
        restore_snapshot(false);
        end_session();
    }

    if (m_direct) {
        if (forge_layer::Layer* layer = m_editor.layers().find(m_direct->layer)) {
            layer->release_surface(SurfaceOwner::DirectFilter);
        }
        m_direct.reset();
    }

    // Outstanding callbacks see an expired token
    m_lifetime = std::make_shared<int>(0);
}

// =============================================================================
// Helpers
// =============================================================================

forge_layer::Layer* FilterPipeline::session_layer() {
    return m_session ? m_editor.layers().find(m_session->layer) : nullptr;
}

void FilterPipeline::restore_snapshot(bool refresh) {
    forge_layer::Layer* layer = session_layer();
    if (!layer) {
        return;
    }
    if (layer->surface() != m_session->snapshot) {
        auto restored = layer->set_surface(m_session->snapshot, SurfaceOwner::PreviewSession);
        if (!restored) {
            forge_core::filter_logger()->error("Could not restore layer {}: {}",
                m_session->layer.id, restored.error().message());
        }
    }
    if (refresh) {
        m_editor.request_render();
    }
}

void FilterPipeline::end_session() {
    if (forge_layer::Layer* layer = session_layer()) {
        layer->release_surface(SurfaceOwner::PreviewSession);
    }
    m_session.reset();
}

} // namespace forge_filter
