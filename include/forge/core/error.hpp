#pragma once

/// @file error.hpp
/// @brief Error handling types for forge_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace forge_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    ServiceFailure,
    Cancelled,
    NotSupported,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::ServiceFailure: return "ServiceFailure";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Filter pipeline errors
struct FilterError {
    enum class Kind : std::uint8_t {
        NotFound,           // Filter id not in registry
        InvalidDefinition,  // Registry entry malformed
        ExecutionFailed,    // Filter service reported failure
        SessionActive,      // A preview session is already open
        NoSession,          // Operation needs an open preview session
        SurfaceBusy,        // Target surface owned by someone else
        EmptyRegion,        // Effective region has no pixels
    };

    Kind kind;
    std::string message;
    std::string filter_id;
    std::string detail;  // Verbatim service detail for ExecutionFailed

    [[nodiscard]] static FilterError not_found(const std::string& id) {
        return FilterError{Kind::NotFound, "Filter not found: " + id, id, {}};
    }

    [[nodiscard]] static FilterError invalid_definition(const std::string& id, const std::string& reason) {
        return FilterError{Kind::InvalidDefinition, "Invalid filter definition '" + id + "': " + reason, id, reason};
    }

    [[nodiscard]] static FilterError execution_failed(const std::string& id, const std::string& detail) {
        return FilterError{Kind::ExecutionFailed, detail, id, detail};
    }

    [[nodiscard]] static FilterError session_active(const std::string& id) {
        return FilterError{Kind::SessionActive, "Preview session already active for " + id, id, {}};
    }

    [[nodiscard]] static FilterError no_session() {
        return FilterError{Kind::NoSession, "No preview session is open", {}, {}};
    }

    [[nodiscard]] static FilterError surface_busy(const std::string& owner) {
        return FilterError{Kind::SurfaceBusy, "Layer surface is owned by " + owner, {}, owner};
    }

    [[nodiscard]] static FilterError empty_region() {
        return FilterError{Kind::EmptyRegion, "Filter region is empty", {}, {}};
    }
};

/// Layer stack errors
struct LayerError {
    enum class Kind : std::uint8_t {
        NotFound,        // Layer id not in stack
        NotAGroup,       // Operation requires a group layer
        Cycle,           // Reparent would create a cycle
        LastLayer,       // Stack must keep at least one layer
        OutOfRange,      // Index outside the stack
        SurfaceLocked,   // Surface claimed by another owner
    };

    Kind kind;
    std::string message;
    std::uint64_t layer_id = 0;

    [[nodiscard]] static LayerError not_found(std::uint64_t id) {
        return LayerError{Kind::NotFound, "Layer not found: " + std::to_string(id), id};
    }

    [[nodiscard]] static LayerError not_a_group(std::uint64_t id) {
        return LayerError{Kind::NotAGroup, "Layer is not a group: " + std::to_string(id), id};
    }

    [[nodiscard]] static LayerError cycle(std::uint64_t id, std::uint64_t group) {
        return LayerError{Kind::Cycle,
            "Moving layer " + std::to_string(id) + " into " + std::to_string(group) + " would create a cycle", id};
    }

    [[nodiscard]] static LayerError last_layer() {
        return LayerError{Kind::LastLayer, "Cannot remove the last layer", 0};
    }

    [[nodiscard]] static LayerError out_of_range(std::size_t index) {
        return LayerError{Kind::OutOfRange, "Layer index out of range: " + std::to_string(index), 0};
    }

    [[nodiscard]] static LayerError surface_locked(std::uint64_t id, const std::string& owner) {
        return LayerError{Kind::SurfaceLocked,
            "Surface of layer " + std::to_string(id) + " is owned by " + owner, id};
    }
};

/// Filter wire protocol errors
struct WireError {
    enum class Kind : std::uint8_t {
        Truncated,     // Buffer shorter than its header claims
        BadMetadata,   // Metadata JSON missing or malformed
        SizeMismatch,  // Pixel payload does not match dimensions
        Service,       // Service returned a failure response
    };

    Kind kind;
    std::string message;
    std::size_t expected = 0;
    std::size_t found = 0;

    [[nodiscard]] static WireError truncated(std::size_t expected_size, std::size_t found_size) {
        return WireError{Kind::Truncated,
            "Truncated message: expected " + std::to_string(expected_size) +
            " bytes, found " + std::to_string(found_size), expected_size, found_size};
    }

    [[nodiscard]] static WireError bad_metadata(const std::string& reason) {
        return WireError{Kind::BadMetadata, "Bad metadata: " + reason, 0, 0};
    }

    [[nodiscard]] static WireError size_mismatch(std::size_t expected_size, std::size_t found_size) {
        return WireError{Kind::SizeMismatch,
            "Unexpected response size: expected " + std::to_string(expected_size) +
            " bytes, got " + std::to_string(found_size), expected_size, found_size};
    }

    /// Failure reported by the service; message is its detail verbatim
    [[nodiscard]] static WireError service(const std::string& detail) {
        return WireError{Kind::Service, detail, 0, 0};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        FilterError,
        LayerError,
        WireError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(FilterError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(LayerError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(WireError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(FilterError::Kind kind) {
        switch (kind) {
            case FilterError::Kind::NotFound: return ErrorCode::NotFound;
            case FilterError::Kind::InvalidDefinition: return ErrorCode::ValidationError;
            case FilterError::Kind::ExecutionFailed: return ErrorCode::ServiceFailure;
            case FilterError::Kind::SessionActive: return ErrorCode::InvalidState;
            case FilterError::Kind::NoSession: return ErrorCode::InvalidState;
            case FilterError::Kind::SurfaceBusy: return ErrorCode::InvalidState;
            case FilterError::Kind::EmptyRegion: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(LayerError::Kind kind) {
        switch (kind) {
            case LayerError::Kind::NotFound: return ErrorCode::NotFound;
            case LayerError::Kind::NotAGroup: return ErrorCode::InvalidArgument;
            case LayerError::Kind::Cycle: return ErrorCode::InvalidArgument;
            case LayerError::Kind::LastLayer: return ErrorCode::InvalidState;
            case LayerError::Kind::OutOfRange: return ErrorCode::InvalidArgument;
            case LayerError::Kind::SurfaceLocked: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(WireError::Kind kind) {
        switch (kind) {
            case WireError::Kind::Truncated: return ErrorCode::ParseError;
            case WireError::Kind::BadMetadata: return ErrorCode::ParseError;
            case WireError::Kind::SizeMismatch: return ErrorCode::ValidationError;
            case WireError::Kind::Service: return ErrorCode::ServiceFailure;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type carrying either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + m_error.message());
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + m_error.message());
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap
    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error: " + m_error.message());
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace forge_core
