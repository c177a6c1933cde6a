#pragma once

#include <string>
#include <utility>

namespace gitscribe {

enum class ErrorCode {
    None = 0,
    InvalidArgs,
    IoError,
    InputTooLarge,
    EmptyPatch,
    UnsupportedInput,
    InternalError
};

inline const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::InvalidArgs: return "InvalidArgs";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::InputTooLarge: return "InputTooLarge";
        case ErrorCode::EmptyPatch: return "EmptyPatch";
        case ErrorCode::UnsupportedInput: return "UnsupportedInput";
        case ErrorCode::InternalError: return "InternalError";
    }
    return "Unknown";
}

struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
};

/**
 * @brief Value-or-error result used for recoverable failures
 *
 * Decoders never throw on bad data; operations that can fail for a reason
 * the caller must handle (I/O, oversized input, nothing to patch) return
 * an Expected instead.
 */
template <typename T>
class Expected {
public:
    Expected(const T& value) : hasValue(true), value_(value) {}
    Expected(T&& value) : hasValue(true), value_(std::move(value)) {}
    Expected(const Error& err) : hasValue(false), error_(err) {}
    Expected(Error&& err) : hasValue(false), error_(std::move(err)) {}

    bool has_value() const { return hasValue; }
    explicit operator bool() const { return hasValue; }
    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }

    T value_or(T fallback) const { return hasValue ? value_ : std::move(fallback); }

private:
    bool hasValue{false};
    T value_{};
    Error error_{};
};

template <>
class Expected<void> {
public:
    Expected() : ok(true) {}
    Expected(const Error& err) : ok(false), error_(err) {}
    Expected(Error&& err) : ok(false), error_(std::move(err)) {}
    bool has_value() const { return ok; }
    explicit operator bool() const { return ok; }
    const Error& error() const { return error_; }

private:
    bool ok{false};
    Error error_{};
};

}
