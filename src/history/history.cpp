/// @file history.cpp
/// @brief HistoryJournal implementation

#include <forge/history/history.hpp>
#include <forge/core/log.hpp>

namespace forge_history {

void HistoryJournal::open(const std::string& label) {
    if (m_open) {
        forge_core::history_logger()->warn(
            "Capture '{}' still open when '{}' started; dropping it", m_open->label, label);
        ++m_aborted;
    }

    HistoryEntry entry;
    entry.sequence = m_next_sequence++;
    entry.label = label;
    m_open = std::move(entry);
    forge_core::history_logger()->trace("Capture #{} '{}' opened", m_open->sequence, label);
}

void HistoryJournal::close() {
    if (!m_open) {
        forge_core::history_logger()->warn("Commit without an open capture ignored");
        return;
    }

    m_open->state = CaptureState::Committed;
    forge_core::history_logger()->debug("History entry #{} '{}'{}",
        m_open->sequence, m_open->label, m_open->structural ? " (structural)" : "");
    m_entries.push_back(std::move(*m_open));
    m_open.reset();
}

void HistoryJournal::begin_capture(const std::string& label) {
    open(label);
}

void HistoryJournal::begin_structural_change() {
    if (!m_open) {
        forge_core::history_logger()->warn("Structural change marked outside a capture");
        return;
    }
    m_open->structural = true;
}

void HistoryJournal::commit_capture() {
    close();
}

void HistoryJournal::abort_capture() {
    if (!m_open) {
        return;
    }
    forge_core::history_logger()->debug("Capture #{} '{}' aborted", m_open->sequence, m_open->label);
    m_open.reset();
    ++m_aborted;
}

void HistoryJournal::save_state(const std::string& label) {
    open(label);
}

void HistoryJournal::finish_state() {
    close();
}

std::vector<std::string> HistoryJournal::labels() const {
    std::vector<std::string> result;
    result.reserve(m_entries.size());
    for (const auto& entry : m_entries) {
        result.push_back(entry.label);
    }
    return result;
}

void HistoryJournal::clear() {
    m_entries.clear();
    m_open.reset();
    m_aborted = 0;
}

} // namespace forge_history
