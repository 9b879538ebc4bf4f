#pragma once

/// @file id.hpp
/// @brief ID generation and change stamps for forge_core

#include "fwd.hpp"
#include <atomic>
#include <cstdint>

namespace forge_core {

// =============================================================================
// IdGenerator
// =============================================================================

/// Thread-safe generator of non-zero 64-bit ids (0 is reserved for "invalid")
class IdGenerator {
public:
    IdGenerator() noexcept : m_next(1) {}

    /// Generate next id
    [[nodiscard]] std::uint64_t next() noexcept {
        return m_next.fetch_add(1, std::memory_order_relaxed);
    }

    /// Get the id the next call would return (approximate, for debugging)
    [[nodiscard]] std::uint64_t current() const noexcept {
        return m_next.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::uint64_t> m_next;
};

// =============================================================================
// Change Stamps
// =============================================================================

/// Next value from the process-wide change stamp sequence.
/// Stamps are strictly increasing and never handed out twice, so a
/// per-layer change counter can't repeat even if a layer id is recycled.
[[nodiscard]] inline std::uint64_t next_change_stamp() noexcept {
    static std::atomic<std::uint64_t> s_stamp{0};
    return s_stamp.fetch_add(1, std::memory_order_relaxed) + 1;
}

} // namespace forge_core
