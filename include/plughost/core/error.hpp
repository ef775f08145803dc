#pragma once

/// @file error.hpp
/// @brief Error handling types for plughost_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace plughost_core {

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
    IncompatibleVersion,
    DependencyMissing,
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
        case ErrorCode::IncompatibleVersion: return "IncompatibleVersion";
        case ErrorCode::DependencyMissing: return "DependencyMissing";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Descriptor resolution errors
///
/// Only conditions that abort a resolution run are reported this way.
/// Missing dependencies, conflicts and duplicates are absorbed by the
/// resolver and surface through the log and the resolution report.
struct ResolutionError {
    enum class Kind : std::uint8_t {
        IndexCorrupted,   // Identity index disagrees with the node table
        CycleDetected,    // Ordering cycle under CyclePolicy::Reject
        NullDescriptor,   // Caller passed a null descriptor pointer
    };

    Kind kind;
    std::string message;
    std::string descriptor_id;
    std::string detail;

    [[nodiscard]] static ResolutionError index_corrupted(const std::string& id, const std::string& what) {
        return ResolutionError{Kind::IndexCorrupted,
            "Descriptor index corrupted for " + id + ": " + what, id, what};
    }

    [[nodiscard]] static ResolutionError cycle_detected(const std::string& cycle) {
        return ResolutionError{Kind::CycleDetected, "Ordering cycle detected: " + cycle, {}, cycle};
    }

    [[nodiscard]] static ResolutionError null_descriptor(std::size_t position) {
        return ResolutionError{Kind::NullDescriptor,
            "Null descriptor at input position " + std::to_string(position), {}, {}};
    }
};

/// Enablement manifest errors
struct ManifestError {
    enum class Kind : std::uint8_t {
        NotFound,           // Manifest file does not exist
        ParseFailed,        // Manifest content is malformed
        WriteFailed,        // Manifest could not be persisted
        UnknownDescriptor,  // No state recorded for the descriptor
        SystemDescriptor,   // System descriptors cannot be disabled
    };

    Kind kind;
    std::string message;
    std::string path;
    std::string descriptor_id;

    [[nodiscard]] static ManifestError not_found(const std::string& file) {
        return ManifestError{Kind::NotFound, "Manifest not found: " + file, file, {}};
    }

    [[nodiscard]] static ManifestError parse_failed(const std::string& file, const std::string& reason) {
        return ManifestError{Kind::ParseFailed, "Manifest '" + file + "' is malformed: " + reason, file, {}};
    }

    [[nodiscard]] static ManifestError write_failed(const std::string& file, const std::string& reason) {
        return ManifestError{Kind::WriteFailed, "Failed to write manifest '" + file + "': " + reason, file, {}};
    }

    [[nodiscard]] static ManifestError unknown_descriptor(const std::string& id) {
        return ManifestError{Kind::UnknownDescriptor, "No manifest state for descriptor " + id, {}, id};
    }

    [[nodiscard]] static ManifestError system_descriptor(const std::string& id) {
        return ManifestError{Kind::SystemDescriptor, "System descriptor cannot be disabled: " + id, {}, id};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        ResolutionError,
        ManifestError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(ResolutionError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ManifestError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
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
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(ResolutionError::Kind kind) {
        switch (kind) {
            case ResolutionError::Kind::IndexCorrupted: return ErrorCode::InvalidState;
            case ResolutionError::Kind::CycleDetected: return ErrorCode::ValidationError;
            case ResolutionError::Kind::NullDescriptor: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ManifestError::Kind kind) {
        switch (kind) {
            case ManifestError::Kind::NotFound: return ErrorCode::NotFound;
            case ManifestError::Kind::ParseFailed: return ErrorCode::ParseError;
            case ManifestError::Kind::WriteFailed: return ErrorCode::IOError;
            case ManifestError::Kind::UnknownDescriptor: return ErrorCode::NotFound;
            case ManifestError::Kind::SystemDescriptor: return ErrorCode::InvalidArgument;
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

/// Build a full error message with code, detail and context
std::string build_error_chain(const Error& error);

} // namespace plughost_core
