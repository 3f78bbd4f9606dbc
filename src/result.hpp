// =============================================================================
// HostLink - Result Type for Unified Error Handling
// =============================================================================
// A Result<T, E> type that carries either a success value or an Error.
// Errors are values: transport, protocol and transfer failures travel back to
// the caller through Result and never as exceptions.
//
// Usage:
//   Result<size_t> readSome(uint8_t* buf, size_t len) {
//       if (!open_) return Err<size_t>(ErrorKind::LinkLost, "link closed");
//       return Ok(n);
//   }
//
//   auto r = link.read(buf, sizeof(buf));
//   if (r.is_err() && r.error().kind == ErrorKind::LinkLost) { ... }
// =============================================================================

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace hostlink {

// =============================================================================
// Error Taxonomy
// =============================================================================

enum class ErrorKind {
    // Transport / permission
    PermissionDenied,
    BackendUnavailable,
    HostUnreachable,
    // Request level
    Timeout,
    LinkLost,
    // Protocol level
    Malformed,
    Truncated,
    FrameTooLarge,
    // Control
    Cancelled,
    Busy,
    NotFound,
    InvalidArgument,
    Io,
    // Host reported an error record (code = host error code)
    Remote
};

inline const char* errorKindName(ErrorKind k) {
    switch (k) {
        case ErrorKind::PermissionDenied:   return "PermissionDenied";
        case ErrorKind::BackendUnavailable: return "BackendUnavailable";
        case ErrorKind::HostUnreachable:    return "HostUnreachable";
        case ErrorKind::Timeout:            return "Timeout";
        case ErrorKind::LinkLost:           return "LinkLost";
        case ErrorKind::Malformed:          return "Malformed";
        case ErrorKind::Truncated:          return "Truncated";
        case ErrorKind::FrameTooLarge:      return "FrameTooLarge";
        case ErrorKind::Cancelled:          return "Cancelled";
        case ErrorKind::Busy:               return "Busy";
        case ErrorKind::NotFound:           return "NotFound";
        case ErrorKind::InvalidArgument:    return "InvalidArgument";
        case ErrorKind::Io:                 return "Io";
        case ErrorKind::Remote:             return "Remote";
    }
    return "Unknown";
}

struct Error {
    ErrorKind kind = ErrorKind::Io;
    std::string message;
    int code = 0;

    Error() = default;
    explicit Error(ErrorKind k, std::string msg = {}, int c = 0)
        : kind(k), message(std::move(msg)), code(c) {}

    // "Timeout: no response for LIST_DIR"
    std::string describe() const {
        std::string s = errorKindName(kind);
        if (!message.empty()) {
            s += ": ";
            s += message;
        }
        return s;
    }

    bool operator==(const Error& other) const {
        return kind == other.kind && code == other.code && message == other.message;
    }
};

// =============================================================================
// Result<T, E> Type
// =============================================================================

template<typename T, typename E = Error>
class Result {
public:
    // Success constructor
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    // Error constructor (from E or derived)
    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }

    explicit operator bool() const { return is_ok(); }

    // Access value (throws if error)
    T& value() & {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    const T& value() const& {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    T&& value() && {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(std::move(data_));
    }

    // Access error (throws if success)
    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    T value_or(T default_value) const& {
        return is_ok() ? std::get<0>(data_) : std::move(default_value);
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<1>(data_);
        return std::nullopt;
    }

    // Map success value, keep error
    template<typename F>
    auto map(F&& f) const& -> Result<decltype(f(std::declval<T>())), E> {
        using U = decltype(f(std::declval<T>()));
        if (is_ok()) return Result<U, E>(f(std::get<0>(data_)));
        return Result<U, E>(std::get<1>(data_));
    }

private:
    std::variant<T, E> data_;
};

// =============================================================================
// Result<void, E> Specialization
// =============================================================================

template<typename E>
class Result<void, E> {
public:
    Result() : data_(std::monostate{}) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(E(std::move(error))) {}

    bool is_ok() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_err() const { return std::holds_alternative<E>(data_); }
    explicit operator bool() const { return is_ok(); }

    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<E>(data_);
        return std::nullopt;
    }

private:
    std::variant<std::monostate, E> data_;
};

using Status = Result<void, Error>;

// =============================================================================
// Helper Functions
// =============================================================================

template<typename T>
Result<std::decay_t<T>, Error> Ok(T&& value) {
    return Result<std::decay_t<T>, Error>(std::forward<T>(value));
}

inline Status Ok() {
    return Status();
}

template<typename T>
Result<T, Error> Err(Error error) {
    return Result<T, Error>(std::move(error));
}

template<typename T>
Result<T, Error> Err(ErrorKind kind, std::string message = {}, int code = 0) {
    return Result<T, Error>(Error(kind, std::move(message), code));
}

} // namespace hostlink
