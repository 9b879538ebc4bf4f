#pragma once

/// @file history.hpp
/// @brief Undo/history capture contract and a recording implementation
///
/// The editing core only brackets its mutations; how the history service
/// snapshots and replays them is its own business. Two bracket styles exist:
/// - begin_capture / begin_structural_change / commit_capture | abort_capture
///   for layer-structure edits
/// - save_state / finish_state for pixel-only edits (abort_capture also
///   cancels an open save_state)

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace forge_history {

// =============================================================================
// History Service
// =============================================================================

class HistoryService {
public:
    virtual ~HistoryService() = default;

    virtual void begin_capture(const std::string& label) = 0;
    virtual void begin_structural_change() = 0;
    virtual void commit_capture() = 0;
    virtual void abort_capture() = 0;

    virtual void save_state(const std::string& label) = 0;
    virtual void finish_state() = 0;
};

// =============================================================================
// Capture State
// =============================================================================

enum class CaptureState : std::uint8_t {
    Open,
    Committed,
    Aborted,
};

[[nodiscard]] inline const char* capture_state_name(CaptureState state) noexcept {
    switch (state) {
        case CaptureState::Open: return "Open";
        case CaptureState::Committed: return "Committed";
        case CaptureState::Aborted: return "Aborted";
    }
    return "Unknown";
}

/// One recorded history entry
struct HistoryEntry {
    std::uint64_t sequence = 0;
    std::string label;
    bool structural = false;
    CaptureState state = CaptureState::Open;
};

// =============================================================================
// History Journal
// =============================================================================

/// HistoryService that records committed entries in order.
/// Used by the headless driver and by tests to observe what was captured.
class HistoryJournal : public HistoryService {
public:
    void begin_capture(const std::string& label) override;
    void begin_structural_change() override;
    void commit_capture() override;
    void abort_capture() override;

    void save_state(const std::string& label) override;
    void finish_state() override;

    /// Committed entries, oldest first
    [[nodiscard]] const std::vector<HistoryEntry>& entries() const { return m_entries; }
    [[nodiscard]] std::size_t size() const { return m_entries.size(); }

    /// Labels of committed entries, oldest first
    [[nodiscard]] std::vector<std::string> labels() const;

    /// Capture currently open, if any
    [[nodiscard]] const std::optional<HistoryEntry>& open_capture() const { return m_open; }
    [[nodiscard]] bool is_capturing() const { return m_open.has_value(); }

    /// Number of captures dropped by abort_capture()
    [[nodiscard]] std::size_t aborted_count() const { return m_aborted; }

    void clear();

private:
    void open(const std::string& label);
    void close();

    std::vector<HistoryEntry> m_entries;
    std::optional<HistoryEntry> m_open;
    std::uint64_t m_next_sequence = 1;
    std::size_t m_aborted = 0;
};

} // namespace forge_history
