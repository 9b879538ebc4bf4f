/// @file session.cpp
/// @brief EditorSession implementation

#include <forge/editor/session.hpp>
#include <forge/core/log.hpp>

#include <algorithm>

namespace forge_editor {

EditorSession::EditorSession(std::uint32_t width, std::uint32_t height,
                             forge_history::HistoryService& history,
                             forge_core::TimerQueue& timers)
    : m_layers(width, height)
    , m_history(history)
    , m_timers(timers)
{}

SubscriptionId EditorSession::on_render_requested(RenderObserver observer) {
    SubscriptionId id{m_next_subscription_id++};
    m_render_observers.emplace_back(id, std::move(observer));
    return id;
}

SubscriptionId EditorSession::on_status(StatusObserver observer) {
    SubscriptionId id{m_next_subscription_id++};
    m_status_observers.emplace_back(id, std::move(observer));
    return id;
}

bool EditorSession::unsubscribe(SubscriptionId id) {
    auto matches = [id](const auto& entry) { return entry.first == id; };

    auto render_it = std::remove_if(m_render_observers.begin(), m_render_observers.end(), matches);
    bool removed = render_it != m_render_observers.end();
    m_render_observers.erase(render_it, m_render_observers.end());

    auto status_it = std::remove_if(m_status_observers.begin(), m_status_observers.end(), matches);
    removed = removed || status_it != m_status_observers.end();
    m_status_observers.erase(status_it, m_status_observers.end());

    return removed;
}

void EditorSession::request_render() {
    ++m_render_requests;
    // Copy so an observer may unsubscribe itself
    auto observers = m_render_observers;
    for (const auto& [id, observer] : observers) {
        observer();
    }
}

void EditorSession::report_status(const std::string& message) {
    m_last_status = message;
    FORGE_LOG_INFO("{}", message);
    auto observers = m_status_observers;
    for (const auto& [id, observer] : observers) {
        observer(message);
    }
}

} // namespace forge_editor
