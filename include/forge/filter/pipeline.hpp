#pragma once

/// @file pipeline.hpp
/// @brief Speculative filter preview, commit and cancel
///
/// States: Idle -> ParamsEditing -> {Committed | Cancelled} -> Idle
///
/// Opening a parameterized filter snapshots the active layer's pixels and
/// claims its surface. Parameter edits restart a trailing debounce; when it
/// fires the snapshot is restored and one request is issued for the current
/// region and parameters. Every request carries a sequence number and only
/// the response to the latest one is applied. Cancel restores the snapshot
/// bit-exact; commit keeps what is applied and records history only when the
/// result differs from the pre-dialog state.

#include "registry.hpp"
#include "service.hpp"

#include <forge/core/error.hpp>
#include <forge/core/timer.hpp>
#include <forge/editor/session.hpp>
#include <forge/layer/types.hpp>
#include <forge/raster/surface.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace forge_filter {

enum class PipelineState : std::uint8_t {
    Idle,
    ParamsEditing,
};

[[nodiscard]] inline const char* to_string(PipelineState state) {
    switch (state) {
        case PipelineState::Idle: return "Idle";
        case PipelineState::ParamsEditing: return "ParamsEditing";
    }
    return "Unknown";
}

/// Default trailing debounce for parameter edits
constexpr std::chrono::milliseconds DEFAULT_PREVIEW_DEBOUNCE{150};

/// Transient state of an open filter dialog
struct PreviewSession {
    forge_layer::LayerId layer;
    /// Exact pixels preceding the first preview
    forge_raster::Surface snapshot;
    FilterDef filter;
    nlohmann::json params = nlohmann::json::object();
    /// Sequence number of the newest request; 0 when none is current
    std::uint64_t latest_sequence = 0;
    forge_core::TimerHandle debounce;
    bool preview_enabled = true;
    /// Serialized filter list when the dialog opened
    std::string filters_before;
};

class FilterPipeline {
public:
    using DoneCallback = std::function<void(forge_core::Result<void>)>;

    /// `session` and `service` must outlive the pipeline
    FilterPipeline(forge_editor::EditorSession& session, FilterService& service,
                   std::chrono::milliseconds debounce = DEFAULT_PREVIEW_DEBOUNCE);
    ~FilterPipeline();

    FilterPipeline(const FilterPipeline&) = delete;
    FilterPipeline& operator=(const FilterPipeline&) = delete;

    // =========================================================================
    // Dialog
    // =========================================================================

    /// Open the dialog for `def` on the active layer. A filter without
    /// parameters is applied directly instead.
    [[nodiscard]] forge_core::Result<void> open_filter_dialog(const FilterDef& def);

    /// Change one parameter and restart the debounce
    [[nodiscard]] forge_core::Result<void> set_param(const std::string& param_id, nlohmann::json value);

    /// Restore defaults (with presets) and restart the debounce
    [[nodiscard]] forge_core::Result<void> reset_params();

    /// Turning preview off shows the original pixels until it is turned back on
    [[nodiscard]] forge_core::Result<void> set_preview_enabled(bool enabled);

    /// Keep the applied pixels
    [[nodiscard]] forge_core::Result<void> commit();

    /// Restore the original pixels and discard the session
    [[nodiscard]] forge_core::Result<void> cancel();

    /// Same as cancel
    [[nodiscard]] forge_core::Result<void> close_dialog() { return cancel(); }

    // =========================================================================
    // Direct Application
    // =========================================================================

    /// Run `def` once over the active layer with its preset parameters, inside
    /// a "Filter: <label>" history capture. `on_done` reports the outcome.
    [[nodiscard]] forge_core::Result<void> apply_direct(const FilterDef& def, DoneCallback on_done = {});

    // =========================================================================
    // Lifetime
    // =========================================================================

    /// Cancel timers and drop all sessions; late responses are ignored
    void teardown();

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] PipelineState state() const {
        return m_session ? PipelineState::ParamsEditing : PipelineState::Idle;
    }
    [[nodiscard]] bool is_editing() const { return m_session.has_value(); }
    [[nodiscard]] const PreviewSession* session() const { return m_session ? &*m_session : nullptr; }
    [[nodiscard]] bool direct_in_flight() const { return m_direct.has_value(); }

    [[nodiscard]] std::chrono::milliseconds debounce() const { return m_debounce; }

    /// Preview requests handed to the service
    [[nodiscard]] std::uint64_t preview_requests() const { return m_preview_requests; }
    /// Responses dropped because a newer request superseded them
    [[nodiscard]] std::uint64_t stale_responses() const { return m_stale_responses; }

private:
    struct DirectApplication {
        forge_layer::LayerId layer;
        forge_raster::Rect region;
        std::string label;
        std::uint64_t sequence = 0;
        DoneCallback on_done;
    };

    void schedule_preview();
    void recompute();
    void on_preview_result(std::uint64_t sequence, forge_raster::Rect region, FilterResult result);
    void on_direct_result(std::uint64_t sequence, FilterResult result);
    void finish_direct(forge_core::Result<void> outcome);

    /// Put the snapshot back on the session's layer
    void restore_snapshot(bool refresh);
    void end_session();

    [[nodiscard]] forge_layer::Layer* session_layer();

    forge_editor::EditorSession& m_editor;
    FilterService& m_service;
    std::chrono::milliseconds m_debounce;

    std::optional<PreviewSession> m_session;
    std::optional<DirectApplication> m_direct;

    /// Pipeline-wide, so a reply from a closed session never matches a new one
    std::uint64_t m_next_sequence = 0;
    std::uint64_t m_preview_requests = 0;
    std::uint64_t m_stale_responses = 0;

    /// Expires on teardown; callbacks hold a weak_ptr to it
    std::shared_ptr<int> m_lifetime;
};

} // namespace forge_filter
