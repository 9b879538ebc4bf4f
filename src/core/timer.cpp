/// @file timer.cpp
/// @brief TimerQueue implementation

#include <forge/core/timer.hpp>
#include <forge/core/log.hpp>

namespace forge_core {

TimerHandle TimerQueue::schedule(Duration delay, Callback callback) {
    if (delay < Duration::zero()) {
        delay = Duration::zero();
    }

    TimerHandle handle{m_next_id++};
    auto deadline = (m_now + delay).count();
    m_queue.emplace(Key{deadline, handle.id}, std::move(callback));
    m_deadlines.emplace(handle.id, deadline);
    return handle;
}

bool TimerQueue::cancel(TimerHandle handle) {
    auto it = m_deadlines.find(handle.id);
    if (it == m_deadlines.end()) {
        return false;
    }
    m_queue.erase(Key{it->second, handle.id});
    m_deadlines.erase(it);
    return true;
}

bool TimerQueue::is_pending(TimerHandle handle) const {
    return m_deadlines.find(handle.id) != m_deadlines.end();
}

void TimerQueue::clear() {
    if (!m_queue.empty()) {
        core_logger()->debug("Dropping {} pending timers", m_queue.size());
    }
    m_queue.clear();
    m_deadlines.clear();
}

std::size_t TimerQueue::advance(Duration dt) {
    const auto target = m_now + (dt < Duration::zero() ? Duration::zero() : dt);
    std::size_t fired = 0;

    while (!m_queue.empty()) {
        auto it = m_queue.begin();
        if (it->first.first > target.count()) {
            break;
        }

        m_now = Duration(it->first.first);
        Callback callback = std::move(it->second);
        m_deadlines.erase(it->first.second);
        m_queue.erase(it);

        if (callback) {
            callback();
        }
        ++fired;
    }

    m_now = target;
    return fired;
}

std::optional<TimerQueue::Duration> TimerQueue::next_deadline() const {
    if (m_queue.empty()) {
        return std::nullopt;
    }
    return Duration(m_queue.begin()->first.first);
}

} // namespace forge_core
