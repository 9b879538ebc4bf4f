#pragma once

/// @file scheduler.hpp
/// @brief Polling scheduler for thumbnail and navigator refreshes
///
/// Mutation sites never notify the scheduler. On every tick it compares
/// each layer's change counter and the stack's structural version with the
/// values it saw last time. Changed layers get a fresh thumbnail; if
/// anything changed at all, the navigator refresh fires exactly once.
/// An idle tick costs one counter comparison per layer.

#include "thumbnail.hpp"

#include <forge/core/timer.hpp>
#include <forge/editor/session.hpp>
#include <forge/layer/types.hpp>
#include <forge/raster/surface.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace forge_preview {

constexpr std::chrono::milliseconds DEFAULT_REFRESH_INTERVAL{250};

class ChangeCoalescingScheduler {
public:
    using Duration = std::chrono::milliseconds;
    using NavigatorCallback = std::function<void()>;

    ChangeCoalescingScheduler(forge_editor::EditorSession& session,
                              ThumbnailGenerator& thumbnails,
                              Duration interval = DEFAULT_REFRESH_INTERVAL);
    ~ChangeCoalescingScheduler();

    ChangeCoalescingScheduler(const ChangeCoalescingScheduler&) = delete;
    ChangeCoalescingScheduler& operator=(const ChangeCoalescingScheduler&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Begin polling on the session's timer queue
    void start();

    /// Cancel the pending tick; nothing runs after this returns
    void stop();

    [[nodiscard]] bool is_running() const { return m_running; }

    /// Clamp to [50, 5000] ms. A running scheduler picks the new interval up
    /// from the next tick on.
    void set_interval(Duration interval);
    [[nodiscard]] Duration interval() const { return m_interval; }

    [[nodiscard]] static Duration clamp_interval(Duration interval);

    // =========================================================================
    // Polling
    // =========================================================================

    /// One polling cycle. Called by the timer; public so hosts can drive it.
    void poll();

    /// Queue a layer for regeneration on the next poll
    void mark_dirty(forge_layer::LayerId layer);

    /// Regenerate every thumbnail and fire the navigator now
    void force_refresh_all();

    void set_navigator_callback(NavigatorCallback callback) { m_navigator = std::move(callback); }

    // =========================================================================
    // Queries
    // =========================================================================

    /// Latest thumbnail of a layer, nullptr before its first poll
    [[nodiscard]] const forge_raster::Surface* thumbnail(forge_layer::LayerId layer) const;

    [[nodiscard]] const std::unordered_set<forge_layer::LayerId>& dirty_layers() const { return m_dirty; }
    [[nodiscard]] std::size_t tracked_layers() const { return m_last_seen.size(); }

    [[nodiscard]] std::uint64_t polls() const { return m_polls; }
    [[nodiscard]] std::uint64_t thumbnails_rendered() const { return m_thumbnails_rendered; }
    [[nodiscard]] std::uint64_t navigator_refreshes() const { return m_navigator_refreshes; }

private:
    void schedule_next();
    void prune_deleted();
    void regenerate(const forge_layer::Layer& layer);
    void refresh_navigator();

    forge_editor::EditorSession& m_editor;
    ThumbnailGenerator& m_thumbnails;
    Duration m_interval;
    forge_core::TimerHandle m_timer;
    bool m_running = false;
    NavigatorCallback m_navigator;

    std::unordered_set<forge_layer::LayerId> m_dirty;
    std::unordered_map<forge_layer::LayerId, std::uint64_t> m_last_seen;
    std::optional<std::uint64_t> m_last_structural;
    std::unordered_map<forge_layer::LayerId, forge_raster::Surface> m_cache;

    std::uint64_t m_polls = 0;
    std::uint64_t m_thumbnails_rendered = 0;
    std::uint64_t m_navigator_refreshes = 0;

    std::shared_ptr<int> m_lifetime;
};

} // namespace forge_preview
