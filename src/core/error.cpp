/// @file error.cpp
/// @brief Error handling implementation for forge_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities
/// - Error statistics used by the headless driver

#include <forge/core/error.hpp>
#include <atomic>
#include <sstream>
#include <vector>

namespace forge_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_filter_error(const FilterError& err) {
    std::ostringstream oss;
    oss << "[FilterError] " << err.message;

    if (!err.filter_id.empty()) {
        oss << " (filter: " << err.filter_id << ")";
    }

    return oss.str();
}

std::string format_layer_error(const LayerError& err) {
    std::ostringstream oss;
    oss << "[LayerError] " << err.message;
    return oss.str();
}

std::string format_wire_error(const WireError& err) {
    std::ostringstream oss;
    oss << "[WireError] " << err.message;

    if (err.kind == WireError::Kind::SizeMismatch || err.kind == WireError::Kind::Truncated) {
        oss << " (expected: " << err.expected << ", found: " << err.found << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, FilterError>) {
            oss << detail::format_filter_error(err);
        } else if constexpr (std::is_same_v<T, LayerError>) {
            oss << detail::format_layer_error(err);
        } else if constexpr (std::is_same_v<T, WireError>) {
            oss << detail::format_wire_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::uint8_t>, Error>;

// =============================================================================
// Error Statistics
// =============================================================================

namespace debug {

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> filter_errors{0};
    std::atomic<std::uint64_t> layer_errors{0};
    std::atomic<std::uint64_t> wire_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<FilterError>()) {
        s_error_stats.filter_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<LayerError>()) {
        s_error_stats.layer_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<WireError>()) {
        s_error_stats.wire_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.filter_errors.store(0, std::memory_order_relaxed);
    s_error_stats.layer_errors.store(0, std::memory_order_relaxed);
    s_error_stats.wire_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Filter: " << s_error_stats.filter_errors.load() << "\n"
        << "  Layer: " << s_error_stats.layer_errors.load() << "\n"
        << "  Wire: " << s_error_stats.wire_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace forge_core
