#pragma once

/// @file session.hpp
/// @brief Explicit editing context shared by the interactive components
///
/// An EditorSession owns the document's layer stack and references the
/// history service and timer queue. Components take the session instead of
/// reaching for a global "current document". Visual refresh and status
/// messages are explicit observer notifications.

#include <forge/core/timer.hpp>
#include <forge/history/history.hpp>
#include <forge/layer/layer_stack.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace forge_editor {

// =============================================================================
// Selection
// =============================================================================

/// Axis-aligned document-space selection
struct Selection {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    /// Non-positive area means "whole layer"
    [[nodiscard]] bool has_area() const { return width > 0.0 && height > 0.0; }
};

// =============================================================================
// Observers
// =============================================================================

struct SubscriptionId {
    std::uint64_t id = 0;

    bool operator==(const SubscriptionId& other) const { return id == other.id; }
    bool operator!=(const SubscriptionId& other) const { return id != other.id; }

    [[nodiscard]] bool is_valid() const { return id != 0; }
};

// =============================================================================
// Editor Session
// =============================================================================

class EditorSession {
public:
    using RenderObserver = std::function<void()>;
    using StatusObserver = std::function<void(const std::string&)>;

    EditorSession(std::uint32_t width, std::uint32_t height,
                  forge_history::HistoryService& history,
                  forge_core::TimerQueue& timers);

    EditorSession(const EditorSession&) = delete;
    EditorSession& operator=(const EditorSession&) = delete;

    [[nodiscard]] forge_layer::LayerStack& layers() { return m_layers; }
    [[nodiscard]] const forge_layer::LayerStack& layers() const { return m_layers; }
    [[nodiscard]] forge_history::HistoryService& history() { return m_history; }
    [[nodiscard]] forge_core::TimerQueue& timers() { return m_timers; }

    // =========================================================================
    // Selection
    // =========================================================================

    [[nodiscard]] const std::optional<Selection>& selection() const { return m_selection; }
    void set_selection(const Selection& selection) { m_selection = selection; }
    void clear_selection() { m_selection.reset(); }

    // =========================================================================
    // Notifications
    // =========================================================================

    [[nodiscard]] SubscriptionId on_render_requested(RenderObserver observer);
    [[nodiscard]] SubscriptionId on_status(StatusObserver observer);
    bool unsubscribe(SubscriptionId id);

    /// Ask the renderer for a visible refresh
    void request_render();

    /// Surface a short user-facing message
    void report_status(const std::string& message);

    [[nodiscard]] std::uint64_t render_request_count() const { return m_render_requests; }
    [[nodiscard]] const std::string& last_status() const { return m_last_status; }

    // =========================================================================
    // Document State
    // =========================================================================

    [[nodiscard]] bool is_modified() const { return m_modified; }
    void mark_modified() { m_modified = true; }
    void clear_modified() { m_modified = false; }

private:
    forge_layer::LayerStack m_layers;
    forge_history::HistoryService& m_history;
    forge_core::TimerQueue& m_timers;
    std::optional<Selection> m_selection;

    std::vector<std::pair<SubscriptionId, RenderObserver>> m_render_observers;
    std::vector<std::pair<SubscriptionId, StatusObserver>> m_status_observers;
    std::uint64_t m_next_subscription_id = 1;

    std::uint64_t m_render_requests = 0;
    std::string m_last_status;
    bool m_modified = false;
};

} // namespace forge_editor
