// =============================================================================
// Retina - Result<T, E>
// =============================================================================
// Every fallible Retina call returns a Result. The error side carries an
// ErrorKind so the controller and the host layer can route failures
// (skip the tick, report Busy, stop the loop) without parsing messages.
//
//   auto fp = fingerprinter.fingerprint(frame);
//   if (fp.is_err()) RLOG_WARN(TAG, "%s", fp.error().message.c_str());
//   auto lib = RETINA_TRY(TemplateLibrary::load(specs));
// =============================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace retina {

enum class ErrorKind {
    Generic = 0,
    InvalidFrame,      // malformed capture input, never retried
    CaptureFailed,     // frame source could not produce a frame
    TemplateLoadError, // manifest / reference image problems
    ConfigError,       // invalid policy values at construction
    LinkTimeout,       // no valid acknowledgement within the timeout
    LinkIoError,       // connection-level failure, fatal to the session
    DispatchFailed,    // command exhausted its retries
    DeviceBusy,        // a command is already in flight
    SessionClosed      // session is broken or stopped
};

inline const char* errorKindToString(ErrorKind k) {
    switch (k) {
        case ErrorKind::Generic:           return "Generic";
        case ErrorKind::InvalidFrame:      return "InvalidFrame";
        case ErrorKind::CaptureFailed:     return "CaptureFailed";
        case ErrorKind::TemplateLoadError: return "TemplateLoadError";
        case ErrorKind::ConfigError:       return "ConfigError";
        case ErrorKind::LinkTimeout:       return "LinkTimeout";
        case ErrorKind::LinkIoError:       return "LinkIoError";
        case ErrorKind::DispatchFailed:    return "DispatchFailed";
        case ErrorKind::DeviceBusy:        return "DeviceBusy";
        case ErrorKind::SessionClosed:     return "SessionClosed";
    }
    return "Unknown";
}

struct Error {
    std::string message;
    ErrorKind kind = ErrorKind::Generic;
    int code = 0;  // errno, 0 if none

    Error() = default;
    explicit Error(std::string msg, ErrorKind k = ErrorKind::Generic, int c = 0)
        : message(std::move(msg)), kind(k), code(c) {}
    explicit Error(const char* msg, ErrorKind k = ErrorKind::Generic, int c = 0)
        : message(msg), kind(k), code(c) {}

    // Re-raise under a new kind, prefixing where it happened.
    // e.g. a keyboard_protocol error surfaces as "template 'x': unknown key 'f13'"
    Error wrap(const std::string& context, ErrorKind k) const {
        return Error(context + ": " + message, k, code);
    }

    bool operator==(const Error& other) const {
        return kind == other.kind && code == other.code && message == other.message;
    }
};

template<typename T, typename E = Error>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }
    explicit operator bool() const { return is_ok(); }

    T& value() & {
        check_ok();
        return std::get<0>(data_);
    }
    const T& value() const& {
        check_ok();
        return std::get<0>(data_);
    }
    T&& value() && {
        check_ok();
        return std::get<0>(std::move(data_));
    }

    E& error() & {
        check_err();
        return std::get<1>(data_);
    }
    const E& error() const& {
        check_err();
        return std::get<1>(data_);
    }

    T value_or(T fallback) const& {
        return is_ok() ? std::get<0>(data_) : std::move(fallback);
    }

    template<typename F>
    auto map(F&& f) const& -> Result<decltype(f(std::declval<T>())), E> {
        using U = decltype(f(std::declval<T>()));
        if (is_ok()) return Result<U, E>(f(std::get<0>(data_)));
        return Result<U, E>(std::get<1>(data_));
    }

private:
    void check_ok() const {
        if (is_err()) throw std::runtime_error("Result is error: " + std::get<1>(data_).message);
    }
    void check_err() const {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
    }

    std::variant<T, E> data_;
};

template<typename E>
class Result<void, E> {
public:
    Result() : data_(std::monostate{}) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(E(std::move(error))) {}

    bool is_ok() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_err() const { return std::holds_alternative<E>(data_); }
    explicit operator bool() const { return is_ok(); }

    void value() const {
        if (is_err()) throw std::runtime_error("Result is error: " + std::get<E>(data_).message);
    }

    const E& error() const {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

private:
    std::variant<std::monostate, E> data_;
};

template<typename T>
Result<std::decay_t<T>, Error> Ok(T&& value) {
    return Result<std::decay_t<T>, Error>(std::forward<T>(value));
}

inline Result<void, Error> Ok() {
    return Result<void, Error>();
}

template<typename T>
Result<T, Error> Err(std::string message, ErrorKind kind = ErrorKind::Generic, int code = 0) {
    return Result<T, Error>(Error(std::move(message), kind, code));
}

// Unwraps a Result or returns its error from the enclosing function.
// GNU statement expression: needs -std=gnu++17 (CMAKE_CXX_EXTENSIONS ON).
#define RETINA_TRY(expr) \
    ({ \
        auto _retina_r = (expr); \
        if (_retina_r.is_err()) return _retina_r.error(); \
        std::move(_retina_r).value(); \
    })

} // namespace retina
