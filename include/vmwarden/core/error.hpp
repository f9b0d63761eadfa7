#pragma once

/// @file error.hpp
/// @brief Error handling types for vmw_core

#include "fwd.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace vmw_core {

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
    ProtocolError,
    SpawnFailed,
    Timeout,
    Cancelled,
    InternalError,
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
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::SpawnFailed: return "SpawnFailed";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::InternalError: return "InternalError";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Hypervisor process errors
struct ProcessError {
    enum class Kind : std::uint8_t {
        SpawnFailed,    // fork/exec did not produce a child
        WaitFailed,     // waitpid reported an error
        LogUnavailable, // output redirection target could not be opened
    };

    Kind kind;
    std::string message;
    std::string program;
    int os_error = 0;

    [[nodiscard]] static ProcessError spawn_failed(const std::string& program, int err, const std::string& reason) {
        return ProcessError{Kind::SpawnFailed, "Failed to start '" + program + "': " + reason, program, err};
    }

    [[nodiscard]] static ProcessError wait_failed(int err, const std::string& reason) {
        return ProcessError{Kind::WaitFailed, "Failed to wait for process: " + reason, {}, err};
    }

    [[nodiscard]] static ProcessError log_unavailable(const std::string& path, int err, const std::string& reason) {
        return ProcessError{Kind::LogUnavailable, "Cannot open log '" + path + "': " + reason, {}, err};
    }
};

/// Control protocol errors
struct ProtocolError {
    enum class Kind : std::uint8_t {
        ConnectFailed,      // control endpoint missing or refused
        Malformed,          // reply is not valid JSON
        UnexpectedReply,    // valid JSON, not what the protocol requires
        Closed,             // peer closed the stream
    };

    Kind kind;
    std::string message;
    std::string endpoint;
    std::string reply;

    [[nodiscard]] static ProtocolError connect_failed(const std::string& endpoint, const std::string& reason) {
        return ProtocolError{Kind::ConnectFailed, "Cannot connect to " + endpoint + ": " + reason, endpoint, {}};
    }

    [[nodiscard]] static ProtocolError malformed(const std::string& endpoint, const std::string& reply) {
        return ProtocolError{Kind::Malformed, "Malformed reply from " + endpoint, endpoint, reply};
    }

    [[nodiscard]] static ProtocolError unexpected_reply(const std::string& endpoint, const std::string& reply) {
        return ProtocolError{Kind::UnexpectedReply, "Unexpected reply from " + endpoint, endpoint, reply};
    }

    [[nodiscard]] static ProtocolError line_too_long(const std::string& endpoint, std::size_t limit) {
        return ProtocolError{Kind::UnexpectedReply,
                             "Line longer than " + std::to_string(limit) + " bytes from " + endpoint,
                             endpoint, {}};
    }

    [[nodiscard]] static ProtocolError closed(const std::string& endpoint) {
        return ProtocolError{Kind::Closed, "Connection closed by " + endpoint, endpoint, {}};
    }
};

/// Configuration file errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        Unreadable,     // file exists but cannot be read
        Malformed,      // not valid JSON
        InvalidEntry,   // valid JSON with the wrong shape
        Unwritable,     // cannot save
    };

    Kind kind;
    std::string message;
    std::string path;
    std::string entry;

    [[nodiscard]] static ConfigError unreadable(const std::string& path) {
        return ConfigError{Kind::Unreadable, "Cannot read config file: " + path, path, {}};
    }

    [[nodiscard]] static ConfigError malformed(const std::string& path, const std::string& reason) {
        return ConfigError{Kind::Malformed, "Corrupt config file " + path + ": " + reason, path, {}};
    }

    [[nodiscard]] static ConfigError invalid_entry(const std::string& path, const std::string& entry,
                                                   const std::string& reason) {
        return ConfigError{Kind::InvalidEntry, "Invalid entry '" + entry + "': " + reason, path, entry};
    }

    [[nodiscard]] static ConfigError unwritable(const std::string& path, const std::string& reason) {
        return ConfigError{Kind::Unwritable, "Cannot write config file " + path + ": " + reason, path, {}};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        ProcessError,
        ProtocolError,
        ConfigError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(ProcessError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ProtocolError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
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

    /// All context entries, ordered by key
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(ProcessError::Kind kind) {
        switch (kind) {
            case ProcessError::Kind::SpawnFailed: return ErrorCode::SpawnFailed;
            case ProcessError::Kind::WaitFailed: return ErrorCode::InternalError;
            case ProcessError::Kind::LogUnavailable: return ErrorCode::IOError;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ProtocolError::Kind kind) {
        switch (kind) {
            case ProtocolError::Kind::ConnectFailed: return ErrorCode::IOError;
            case ProtocolError::Kind::Malformed: return ErrorCode::ParseError;
            case ProtocolError::Kind::UnexpectedReply: return ErrorCode::ProtocolError;
            case ProtocolError::Kind::Closed: return ErrorCode::IOError;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::Unreadable: return ErrorCode::IOError;
            case ConfigError::Kind::Malformed: return ErrorCode::ParseError;
            case ConfigError::Kind::InvalidEntry: return ErrorCode::InvalidArgument;
            case ConfigError::Kind::Unwritable: return ErrorCode::IOError;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// ErrorException
// =============================================================================

/// Exception carrying an Error, for code that reports failures by throwing
/// (coroutine task bodies)
class ErrorException : public std::runtime_error {
public:
    explicit ErrorException(Error error)
        : std::runtime_error(error.message())
        , m_error(std::move(error))
    {}

    [[nodiscard]] const Error& error() const noexcept { return m_error; }

private:
    Error m_error;
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

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
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

/// Build a full error message including kind details and context
std::string build_error_chain(const Error& error);

} // namespace vmw_core
