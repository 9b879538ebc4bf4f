#pragma once

/// @file timer.hpp
/// @brief Cancelable relative-delay timers for forge_core
///
/// The editing core never touches a platform timer. Debounce windows,
/// polling ticks and asynchronous service replies are all scheduled on a
/// TimerQueue, which the host advances from its own loop.

#include "fwd.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>

namespace forge_core {

// =============================================================================
// Timer Handle
// =============================================================================

/// Handle returned by TimerQueue::schedule
struct TimerHandle {
    std::uint64_t id = 0;

    [[nodiscard]] bool operator==(const TimerHandle& other) const { return id == other.id; }
    [[nodiscard]] bool operator!=(const TimerHandle& other) const { return id != other.id; }

    [[nodiscard]] bool is_valid() const { return id != 0; }

    [[nodiscard]] static TimerHandle invalid() { return TimerHandle{0}; }
};

// =============================================================================
// Timer Queue
// =============================================================================

/// Single-threaded timer queue on a virtual clock
class TimerQueue {
public:
    using Duration = std::chrono::milliseconds;
    using Callback = std::function<void()>;

    TimerQueue() = default;

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    /// Schedule a callback to run once after `delay`
    TimerHandle schedule(Duration delay, Callback callback);

    /// Cancel a pending timer
    /// @return true if the timer was still pending
    bool cancel(TimerHandle handle);

    /// Check whether a timer is still pending
    [[nodiscard]] bool is_pending(TimerHandle handle) const;

    /// Drop every pending timer without running it
    void clear();

    /// Number of pending timers
    [[nodiscard]] std::size_t pending_count() const { return m_queue.size(); }

    /// Move the clock forward by `dt`, running every timer that comes due in
    /// deadline order (ties in scheduling order). Timers scheduled by a
    /// callback run in the same call if they fall inside the window.
    /// @return Number of callbacks run
    std::size_t advance(Duration dt);

    /// Run timers already due without moving the clock
    std::size_t run_due() { return advance(Duration::zero()); }

    /// Current virtual time
    [[nodiscard]] Duration now() const { return m_now; }

    /// Deadline of the earliest pending timer
    [[nodiscard]] std::optional<Duration> next_deadline() const;

private:
    using Key = std::pair<Duration::rep, std::uint64_t>;

    Duration m_now{0};
    std::uint64_t m_next_id = 1;
    std::map<Key, Callback> m_queue;
    std::unordered_map<std::uint64_t, Duration::rep> m_deadlines;
};

} // namespace forge_core
