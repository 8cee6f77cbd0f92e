#pragma once

/// @file error.hpp
/// @brief Error handling types for weave_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace weave_core {

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
    CycleDetected,
    IOError,
    ParseError,
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
        case ErrorCode::CycleDetected: return "CycleDetected";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::Timeout: return "Timeout";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Dependency graph structural errors. The graph is unchanged when one is returned.
struct GraphError {
    enum class Kind : std::uint8_t {
        Cycle,           // Insert would close a cycle
        SelfDependency,  // Node lists itself as a dependency
    };

    Kind kind;
    std::string message;
    std::string node;        // Node being inserted
    std::string dependency;  // Dependency that closes the cycle

    [[nodiscard]] static GraphError cycle(const std::string& node_id, const std::string& dep) {
        return GraphError{Kind::Cycle,
            "Adding '" + node_id + "' with dependency '" + dep + "' would create a cycle",
            node_id, dep};
    }

    [[nodiscard]] static GraphError unsortable(std::size_t emitted, std::size_t total) {
        return GraphError{Kind::Cycle,
            "Topological sort emitted " + std::to_string(emitted) + " of " +
            std::to_string(total) + " nodes", {}, {}};
    }

    [[nodiscard]] static GraphError self_dependency(const std::string& node_id) {
        return GraphError{Kind::SelfDependency,
            "Node '" + node_id + "' cannot depend on itself", node_id, node_id};
    }
};

/// Ledger bookkeeping errors
struct LedgerError {
    enum class Kind : std::uint8_t {
        DuplicateEvent,  // Event id already recorded
        UnknownEvent,    // Event id not recorded
    };

    Kind kind;
    std::string message;
    std::string event_id;

    [[nodiscard]] static LedgerError duplicate_event(const std::string& id) {
        return LedgerError{Kind::DuplicateEvent, "Event already recorded: " + id, id};
    }

    [[nodiscard]] static LedgerError unknown_event(const std::string& id) {
        return LedgerError{Kind::UnknownEvent, "Event not recorded: " + id, id};
    }
};

/// Governance (yield approval) errors
struct ApprovalError {
    enum class Kind : std::uint8_t {
        InvalidApprover,  // Approver outside the required set
        AlreadyPending,   // Request id already in flight
        NotAYield,        // Turn is not a Yield turn
    };

    Kind kind;
    std::string message;
    std::string request_id;
    std::string approver;

    [[nodiscard]] static ApprovalError invalid_approver(const std::string& id, const std::string& who) {
        return ApprovalError{Kind::InvalidApprover,
            "'" + who + "' is not a required approver of " + id, id, who};
    }

    [[nodiscard]] static ApprovalError already_pending(const std::string& id) {
        return ApprovalError{Kind::AlreadyPending, "Approval already pending: " + id, id, {}};
    }

    [[nodiscard]] static ApprovalError not_a_yield(const std::string& id) {
        return ApprovalError{Kind::NotAYield, "Turn is not a yield: " + id, id, {}};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        GraphError,
        LedgerError,
        ApprovalError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(GraphError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(LedgerError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ApprovalError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}

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

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(GraphError::Kind) {
        return ErrorCode::CycleDetected;
    }

    static ErrorCode to_error_code(LedgerError::Kind kind) {
        switch (kind) {
            case LedgerError::Kind::DuplicateEvent: return ErrorCode::AlreadyExists;
            case LedgerError::Kind::UnknownEvent: return ErrorCode::NotFound;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ApprovalError::Kind kind) {
        switch (kind) {
            case ApprovalError::Kind::InvalidApprover: return ErrorCode::InvalidArgument;
            case ApprovalError::Kind::AlreadyPending: return ErrorCode::AlreadyExists;
            case ApprovalError::Kind::NotAYield: return ErrorCode::InvalidArgument;
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

/// Result type (similar to Rust's Result<T, E>)
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

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    explicit operator bool() const noexcept { return m_value.has_value(); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

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

    Result() : m_has_value(true) {}
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

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

/// Get count of cycle/self-dependency rejections
std::uint64_t graph_error_count();

/// Get count of approval errors
std::uint64_t approval_error_count();

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace weave_core
