#pragma once

/// @file error.hpp
/// @brief Error handling types for cortex_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace cortex_core {

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
    Timeout,
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
        case ErrorCode::Timeout: return "Timeout";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Behavior tree scheduling errors
struct TreeError {
    enum class Kind : std::uint8_t {
        TreeNotFound,       // No tree registered under the id
        EntityNotAssigned,  // Entity has no tree mapped to it
        DepthExceeded,      // Tree deeper than the configured limit
        InvalidConfig,      // Configuration rejected
    };

    Kind kind;
    std::string message;
    std::string tree;    // Tree id or name
    std::string entity;  // For EntityNotAssigned

    /// Factory methods
    [[nodiscard]] static TreeError tree_not_found(const std::string& tree_id) {
        return TreeError{Kind::TreeNotFound, "Behavior tree not found: " + tree_id, tree_id, {}};
    }

    [[nodiscard]] static TreeError entity_not_assigned(const std::string& entity_id) {
        return TreeError{Kind::EntityNotAssigned,
            "No behavior tree assigned to entity: " + entity_id, {}, entity_id};
    }

    [[nodiscard]] static TreeError depth_exceeded(const std::string& tree_name, std::size_t depth, std::size_t limit) {
        return TreeError{Kind::DepthExceeded,
            "Tree '" + tree_name + "' depth " + std::to_string(depth) +
            " exceeds limit " + std::to_string(limit), tree_name, {}};
    }

    [[nodiscard]] static TreeError invalid_config(const std::string& reason) {
        return TreeError{Kind::InvalidConfig, "Invalid tree configuration: " + reason, {}, {}};
    }
};

/// Event dispatch errors
struct EventError {
    enum class Kind : std::uint8_t {
        HandlerNotFound,       // Unknown handler id
        TriggerNotFound,       // Unknown trigger id
        CustomActionNotFound,  // Custom action name not registered
        InvalidHook,           // Hook registration rejected
        ActionFailed,          // A custom action reported failure
    };

    Kind kind;
    std::string message;
    std::string subject;  // Handler/trigger id or hook name

    [[nodiscard]] static EventError handler_not_found(const std::string& id) {
        return EventError{Kind::HandlerNotFound, "Event handler not found: " + id, id};
    }

    [[nodiscard]] static EventError trigger_not_found(const std::string& id) {
        return EventError{Kind::TriggerNotFound, "Event trigger not found: " + id, id};
    }

    [[nodiscard]] static EventError custom_action_not_found(const std::string& name) {
        return EventError{Kind::CustomActionNotFound, "Custom action '" + name + "' not found", name};
    }

    [[nodiscard]] static EventError invalid_hook(const std::string& name, const std::string& reason) {
        return EventError{Kind::InvalidHook, "Invalid hook '" + name + "': " + reason, name};
    }

    [[nodiscard]] static EventError action_failed(const std::string& name, const std::string& reason) {
        return EventError{Kind::ActionFailed, "Action '" + name + "' failed: " + reason, name};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        TreeError,
        EventError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(TreeError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(EventError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
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
    static ErrorCode to_error_code(TreeError::Kind kind) {
        switch (kind) {
            case TreeError::Kind::TreeNotFound: return ErrorCode::NotFound;
            case TreeError::Kind::EntityNotAssigned: return ErrorCode::InvalidArgument;
            case TreeError::Kind::DepthExceeded: return ErrorCode::ValidationError;
            case TreeError::Kind::InvalidConfig: return ErrorCode::ValidationError;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(EventError::Kind kind) {
        switch (kind) {
            case EventError::Kind::HandlerNotFound: return ErrorCode::NotFound;
            case EventError::Kind::TriggerNotFound: return ErrorCode::NotFound;
            case EventError::Kind::CustomActionNotFound: return ErrorCode::InvalidArgument;
            case EventError::Kind::InvalidHook: return ErrorCode::InvalidArgument;
            case EventError::Kind::ActionFailed: return ErrorCode::InvalidState;
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
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
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

    /// Handle error case
    template<typename F>
    auto or_else(F&& func) -> Result<T, E> {
        if (m_value.has_value()) {
            return Result<T, E>(std::move(*m_value));
        }
        return func(m_error);
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

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool
    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap
    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
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

/// Build a full error message with kind details and context
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

} // namespace cortex_core
