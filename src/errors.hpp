#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace wfmk {

enum class ErrorKind {
    NetworkUnreachable,
    HttpStatus,
    MalformedResponse,
    Timeout,
    CacheIo,
    InvalidConfiguration,
};

const char* toString(ErrorKind kind);

/// A failed resolution. httpStatus is only meaningful for ErrorKind::HttpStatus.
struct Error {
    ErrorKind    kind;
    std::string  detail;
    unsigned int httpStatus = 0;

    std::string message() const;
};

/// Raised at startup for invalid options (non-positive rate limit, bad TTL...).
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

/// Raised by cache stores for failures the caller has to know about (clear).
class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string& what) : std::runtime_error(what) {}
};

/// Either a value or an Error, never both.
template <typename T>
class Result {
public:
    static Result success(T value) { return Result(ValueTag{}, std::move(value)); }
    static Result failure(Error error) { return Result(ErrorTag{}, std::move(error)); }

    bool ok() const { return mState.index() == 0; }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<0>(mState); }
    T&       value()       { return std::get<0>(mState); }
    const Error& error() const { return std::get<1>(mState); }

private:
    // Tagged so a T constructible from Error can never pick the wrong slot.
    struct ValueTag {};
    struct ErrorTag {};
    Result(ValueTag, T value) : mState(std::in_place_index<0>, std::move(value)) {}
    Result(ErrorTag, Error error) : mState(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, Error> mState;
};

} // namespace wfmk
