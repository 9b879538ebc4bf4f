#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for forge_core module

#include <cstdint>

namespace forge_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct FilterError;
struct LayerError;
struct WireError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// ID Types
// =============================================================================

class IdGenerator;

// =============================================================================
// Timers
// =============================================================================

struct TimerHandle;
class TimerQueue;

} // namespace forge_core
