/// @file scheduler.cpp
/// @brief ChangeCoalescingScheduler implementation

#include <forge/preview/scheduler.hpp>
#include <forge/core/log.hpp>
#include <forge/editor/config.hpp>
#include <forge/layer/layer.hpp>
#include <forge/layer/layer_stack.hpp>

#include <algorithm>

namespace forge_preview {

ChangeCoalescingScheduler::ChangeCoalescingScheduler(forge_editor::EditorSession& session,
                                                     ThumbnailGenerator& thumbnails,
                                                     Duration interval)
    : m_editor(session)
    , m_thumbnails(thumbnails)
    , m_interval(clamp_interval(interval))
    , m_lifetime(std::make_shared<int>(0))
{}

ChangeCoalescingScheduler::~ChangeCoalescingScheduler() {
    stop();
    m_lifetime.reset();
}

ChangeCoalescingScheduler::Duration ChangeCoalescingScheduler::clamp_interval(Duration interval) {
    return std::clamp(interval,
                      Duration(forge_editor::MIN_REFRESH_INTERVAL_MS),
                      Duration(forge_editor::MAX_REFRESH_INTERVAL_MS));
}

// =============================================================================
// Lifecycle
// =============================================================================

void ChangeCoalescingScheduler::start() {
    if (is_running()) {
        return;
    }
    forge_core::preview_logger()->debug("Preview polling started ({} ms)", m_interval.count());
    m_running = true;
    schedule_next();
}

void ChangeCoalescingScheduler::stop() {
    if (!m_running) {
        return;
    }
    m_running = false;
    if (m_timer.is_valid()) {
        m_editor.timers().cancel(m_timer);
        m_timer = forge_core::TimerHandle::invalid();
    }
    forge_core::preview_logger()->debug("Preview polling stopped");
}

void ChangeCoalescingScheduler::set_interval(Duration interval) {
    const Duration clamped = clamp_interval(interval);
    if (clamped != interval) {
        forge_core::preview_logger()->warn("Refresh interval {} ms clamped to {} ms",
            interval.count(), clamped.count());
    }
    m_interval = clamped;
}

void ChangeCoalescingScheduler::schedule_next() {
    std::weak_ptr<int> alive = m_lifetime;
    m_timer = m_editor.timers().schedule(m_interval, [this, alive]() {
        if (alive.expired()) {
            return;
        }
        m_timer = forge_core::TimerHandle::invalid();
        poll();
        // The navigator callback may have stopped or restarted polling
        if (m_running && !m_timer.is_valid()) {
            schedule_next();
        }
    });
}

// =============================================================================
// Polling
// =============================================================================

void ChangeCoalescingScheduler::poll() {
    ++m_polls;
    prune_deleted();

    const forge_layer::LayerStack& stack = m_editor.layers();
    bool any_changed = false;
    for (std::size_t i = 0; i < stack.size(); ++i) {
        const forge_layer::Layer* layer = stack.layer_at(i);
        auto it = m_last_seen.find(layer->id());
        if (it == m_last_seen.end() || it->second != layer->change_counter()) {
            m_last_seen[layer->id()] = layer->change_counter();
            m_dirty.insert(layer->id());
            any_changed = true;
        }
    }

    for (const forge_layer::LayerId id : m_dirty) {
        if (const forge_layer::Layer* layer = stack.find(id)) {
            regenerate(*layer);
        }
    }
    m_dirty.clear();

    const bool structure_changed = m_last_structural != stack.structural_version();
    m_last_structural = stack.structural_version();
    if (structure_changed || any_changed) {
        refresh_navigator();
    }
}

void ChangeCoalescingScheduler::mark_dirty(forge_layer::LayerId layer) {
    m_dirty.insert(layer);
}

void ChangeCoalescingScheduler::force_refresh_all() {
    prune_deleted();
    m_dirty.clear();

    const forge_layer::LayerStack& stack = m_editor.layers();
    for (std::size_t i = 0; i < stack.size(); ++i) {
        const forge_layer::Layer* layer = stack.layer_at(i);
        m_last_seen[layer->id()] = layer->change_counter();
        regenerate(*layer);
    }
    m_last_structural = stack.structural_version();
    refresh_navigator();
}

void ChangeCoalescingScheduler::prune_deleted() {
    const forge_layer::LayerStack& stack = m_editor.layers();
    std::size_t pruned = 0;

    for (auto it = m_dirty.begin(); it != m_dirty.end();) {
        if (!stack.find(*it)) {
            it = m_dirty.erase(it);
            ++pruned;
        } else {
            ++it;
        }
    }
    for (auto it = m_last_seen.begin(); it != m_last_seen.end();) {
        if (!stack.find(it->first)) {
            m_cache.erase(it->first);
            it = m_last_seen.erase(it);
            ++pruned;
        } else {
            ++it;
        }
    }

    if (pruned > 0) {
        forge_core::preview_logger()->trace("Pruned {} stale preview entries", pruned);
    }
}

void ChangeCoalescingScheduler::regenerate(const forge_layer::Layer& layer) {
    m_cache[layer.id()] = m_thumbnails.generate(layer);
    ++m_thumbnails_rendered;
}

void ChangeCoalescingScheduler::refresh_navigator() {
    ++m_navigator_refreshes;
    if (m_navigator) {
        m_navigator();
    }
}

// =============================================================================
// Queries
// =============================================================================

const forge_raster::Surface* ChangeCoalescingScheduler::thumbnail(forge_layer::LayerId layer) const {
    auto it = m_cache.find(layer);
    return it != m_cache.end() ? &it->second : nullptr;
}

} // namespace forge_preview
