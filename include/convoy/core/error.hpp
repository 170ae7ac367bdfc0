#pragma once

/// @file error.hpp
/// @brief Error handling types for convoy_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace convoy_core {

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
        case ErrorCode::IncompatibleVersion: return "IncompatibleVersion";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Catalog lookup errors
struct CatalogError {
    enum class Kind : std::uint8_t {
        DefinitionNotFound,  // Neither GUID nor legacy id resolved
        AlreadyRegistered,   // Definition key collision
        InvalidDefinition,   // Definition data rejected
    };

    Kind kind;
    std::string message;
    std::string definition_kind;  // "vehicle", "item", "barricade", "structure"
    std::string guid;
    std::uint16_t legacy_id = 0;

    [[nodiscard]] static CatalogError definition_not_found(
        const std::string& kind, const std::string& guid_str, std::uint16_t id)
    {
        return CatalogError{Kind::DefinitionNotFound,
            "No " + kind + " definition for guid " + guid_str + " or legacy id " + std::to_string(id),
            kind, guid_str, id};
    }

    [[nodiscard]] static CatalogError already_registered(
        const std::string& kind, const std::string& guid_str, std::uint16_t id)
    {
        return CatalogError{Kind::AlreadyRegistered,
            "Duplicate " + kind + " definition (guid " + guid_str + ", id " + std::to_string(id) + ")",
            kind, guid_str, id};
    }

    [[nodiscard]] static CatalogError invalid_definition(const std::string& kind, const std::string& reason) {
        return CatalogError{Kind::InvalidDefinition, "Invalid " + kind + " definition: " + reason, kind, {}, 0};
    }
};

/// Live world errors
struct WorldError {
    enum class Kind : std::uint8_t {
        SpawnFailed,      // World refused to create a vehicle
        PlacementFailed,  // World refused to place a child on an anchor
        NotFound,         // Instance no longer exists
    };

    Kind kind;
    std::string message;

    [[nodiscard]] static WorldError spawn_failed(const std::string& reason) {
        return WorldError{Kind::SpawnFailed, "Vehicle spawn failed: " + reason};
    }

    [[nodiscard]] static WorldError placement_failed(const std::string& reason) {
        return WorldError{Kind::PlacementFailed, "Placement failed: " + reason};
    }

    [[nodiscard]] static WorldError not_found(std::uint32_t instance_id) {
        return WorldError{Kind::NotFound, "No live instance " + std::to_string(instance_id)};
    }
};

/// Snapshot codec errors
struct CodecError {
    enum class Kind : std::uint8_t {
        MissingField,        // Required field absent
        InvalidField,        // Field has wrong type, size or range
        InvalidGuid,         // GUID string malformed
        InvalidEncoding,     // Blob encoding malformed
        UnsupportedVersion,  // Unknown format_version
    };

    Kind kind;
    std::string message;
    std::string field;

    [[nodiscard]] static CodecError missing_field(const std::string& name) {
        return CodecError{Kind::MissingField, "Missing field: " + name, name};
    }

    [[nodiscard]] static CodecError invalid_field(const std::string& name, const std::string& reason) {
        return CodecError{Kind::InvalidField, "Invalid field '" + name + "': " + reason, name};
    }

    [[nodiscard]] static CodecError invalid_guid(const std::string& name, const std::string& text) {
        return CodecError{Kind::InvalidGuid, "Invalid guid in '" + name + "': " + text, name};
    }

    [[nodiscard]] static CodecError invalid_encoding(const std::string& name) {
        return CodecError{Kind::InvalidEncoding, "Invalid base64 in '" + name + "'", name};
    }

    [[nodiscard]] static CodecError unsupported_version(std::int64_t version) {
        return CodecError{Kind::UnsupportedVersion,
            "Unsupported format_version " + std::to_string(version), "format_version"};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        CatalogError,
        WorldError,
        CodecError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(CatalogError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(WorldError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(CodecError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
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

    /// Get all context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(CatalogError::Kind kind) {
        switch (kind) {
            case CatalogError::Kind::DefinitionNotFound: return ErrorCode::NotFound;
            case CatalogError::Kind::AlreadyRegistered: return ErrorCode::AlreadyExists;
            case CatalogError::Kind::InvalidDefinition: return ErrorCode::ValidationError;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(WorldError::Kind kind) {
        switch (kind) {
            case WorldError::Kind::SpawnFailed: return ErrorCode::InvalidState;
            case WorldError::Kind::PlacementFailed: return ErrorCode::InvalidState;
            case WorldError::Kind::NotFound: return ErrorCode::NotFound;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(CodecError::Kind kind) {
        switch (kind) {
            case CodecError::Kind::MissingField: return ErrorCode::ParseError;
            case CodecError::Kind::InvalidField: return ErrorCode::ParseError;
            case CodecError::Kind::InvalidGuid: return ErrorCode::ParseError;
            case CodecError::Kind::InvalidEncoding: return ErrorCode::ParseError;
            case CodecError::Kind::UnsupportedVersion: return ErrorCode::IncompatibleVersion;
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

/// Build a full error message with code, kind details and context
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Get count of catalog errors
std::uint64_t catalog_error_count();

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace convoy_core
