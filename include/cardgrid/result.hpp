#pragma once

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace cardgrid {

//=============================================================================
// ErrorCode - failure kinds reported by the layout pipeline
//=============================================================================
enum class ErrorCode {
    Generic,
    MissingSectionKey,      // record without a grouping key
    SectionOrderMismatch,   // explicit section order is not a bijection
    MergeOverflow,          // merged sections do not fit on one row
    MergeOrderMismatch,     // merged sections absent or out of order
    InvalidGeometry,        // card too small for its text and circle
    InvalidConfig,          // structurally invalid configuration
    Io,                     // file could not be read or written
    Parse                   // malformed input document
};

const char* errorCodeName(ErrorCode code) noexcept;

//=============================================================================
// Error - message + code + optional chained cause
//=============================================================================
class Error {
public:
    explicit Error(std::string message, ErrorCode code = ErrorCode::Generic)
        : _message(std::move(message)), _code(code) {}

    Error(std::string message, Error cause)
        : _message(std::move(message))
        , _code(cause.code())
        , _cause(std::make_shared<const Error>(std::move(cause))) {}

    const std::string& message() const { return _message; }
    ErrorCode code() const { return _code; }
    const Error* cause() const { return _cause.get(); }

    // "outer: inner: innermost"
    std::string to_string() const {
        std::string out = _message;
        for (const Error* e = cause(); e; e = e->cause()) {
            out += ": ";
            out += e->message();
        }
        return out;
    }

private:
    std::string _message;
    ErrorCode _code;
    std::shared_ptr<const Error> _cause;
};

//=============================================================================
// Result<T> - value or Error
//=============================================================================
template<typename T>
class [[nodiscard]] Result {
public:
    using value_type = T;

    Result(T value) : _state(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : _state(std::in_place_index<1>, std::move(error)) {}

    bool has_value() const { return _state.index() == 0; }
    explicit operator bool() const { return has_value(); }

    T& value() & { return std::get<0>(_state); }
    const T& value() const& { return std::get<0>(_state); }
    T&& value() && { return std::get<0>(std::move(_state)); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(*this).value(); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    const Error& error() const { return std::get<1>(_state); }

private:
    std::variant<T, Error> _state;
};

template<>
class [[nodiscard]] Result<void> {
public:
    using value_type = void;

    Result() = default;
    Result(Error error) : _error(std::move(error)) {}

    bool has_value() const { return !_error.has_value(); }
    explicit operator bool() const { return has_value(); }

    const Error& error() const { return *_error; }

private:
    std::optional<Error> _error;
};

//=============================================================================
// Helpers
//=============================================================================
inline Result<void> Ok() { return Result<void>(); }

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T = void>
Result<T> Err(std::string message, ErrorCode code = ErrorCode::Generic) {
    return Result<T>(Error(std::move(message), code));
}

// Wrap a failed lower-level result, keeping its code
template<typename T = void, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    return Result<T>(Error(std::move(message), cause.error()));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    return result ? std::string() : result.error().to_string();
}

inline const char* errorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Generic:              return "Generic";
        case ErrorCode::MissingSectionKey:    return "MissingSectionKey";
        case ErrorCode::SectionOrderMismatch: return "SectionOrderMismatch";
        case ErrorCode::MergeOverflow:        return "MergeOverflow";
        case ErrorCode::MergeOrderMismatch:   return "MergeOrderMismatch";
        case ErrorCode::InvalidGeometry:      return "InvalidGeometry";
        case ErrorCode::InvalidConfig:        return "InvalidConfig";
        case ErrorCode::Io:                   return "Io";
        case ErrorCode::Parse:                return "Parse";
    }
    return "Unknown";
}

} // namespace cardgrid
