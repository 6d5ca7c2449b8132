#pragma once

#include "core/errors.h"

#include <optional>
#include <string>
#include <utility>

namespace candlecast::core {

enum class ErrorCode {
    Ok = 0,
    Parse,
    Io,
    Range,
    Timeout,
    Proto,
    NoMem,
    Invalid,
    NotFound,
    Quota,
    Unavailable
};

inline ErrorCode to_error(CandlecastStatus status) {
    switch (status) {
        case CANDLECAST_OK: return ErrorCode::Ok;
        case CANDLECAST_ERR_PARSE: return ErrorCode::Parse;
        case CANDLECAST_ERR_IO: return ErrorCode::Io;
        case CANDLECAST_ERR_RANGE: return ErrorCode::Range;
        case CANDLECAST_ERR_TIMEOUT: return ErrorCode::Timeout;
        case CANDLECAST_ERR_PROTO: return ErrorCode::Proto;
        case CANDLECAST_ERR_NOMEM: return ErrorCode::NoMem;
        case CANDLECAST_ERR_INVALID: return ErrorCode::Invalid;
        case CANDLECAST_ERR_NOT_FOUND: return ErrorCode::NotFound;
        case CANDLECAST_ERR_QUOTA: return ErrorCode::Quota;
        case CANDLECAST_ERR_UNAVAILABLE: return ErrorCode::Unavailable;
        default: return ErrorCode::Invalid;
    }
}

inline CandlecastStatus to_status(ErrorCode error) {
    switch (error) {
        case ErrorCode::Ok: return CANDLECAST_OK;
        case ErrorCode::Parse: return CANDLECAST_ERR_PARSE;
        case ErrorCode::Io: return CANDLECAST_ERR_IO;
        case ErrorCode::Range: return CANDLECAST_ERR_RANGE;
        case ErrorCode::Timeout: return CANDLECAST_ERR_TIMEOUT;
        case ErrorCode::Proto: return CANDLECAST_ERR_PROTO;
        case ErrorCode::NoMem: return CANDLECAST_ERR_NOMEM;
        case ErrorCode::Invalid: return CANDLECAST_ERR_INVALID;
        case ErrorCode::NotFound: return CANDLECAST_ERR_NOT_FOUND;
        case ErrorCode::Quota: return CANDLECAST_ERR_QUOTA;
        case ErrorCode::Unavailable: return CANDLECAST_ERR_UNAVAILABLE;
        default: return CANDLECAST_ERR_INVALID;
    }
}

inline const char* error_name(ErrorCode error) {
    return candlecast_status_name(to_status(error));
}

struct Error {
    ErrorCode code = ErrorCode::Ok;
    std::string message;
};

inline Error make_error(ErrorCode code, std::string message) {
    return Error{code, std::move(message)};
}

template <typename T>
class Expected {
public:
    Expected(const T& value) : value_(value) {}
    Expected(T&& value) : value_(std::move(value)) {}
    Expected(ErrorCode error) : value_(std::nullopt), error_{error, error_name(error)} {}
    Expected(Error error) : value_(std::nullopt), error_(std::move(error)) {}

    [[nodiscard]] bool has_value() const { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const { return has_value(); }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    [[nodiscard]] ErrorCode error() const { return error_.code; }
    const std::string& message() const { return error_.message; }
    const Error& error_info() const { return error_; }

private:
    std::optional<T> value_;
    Error error_;
};

// Result of an operation with no payload.
class Status {
public:
    Status() = default;
    Status(ErrorCode error) : error_{error, error == ErrorCode::Ok ? std::string() : error_name(error)} {}
    Status(Error error) : error_(std::move(error)) {}

    static Status ok() { return Status(); }

    [[nodiscard]] bool is_ok() const { return error_.code == ErrorCode::Ok; }
    [[nodiscard]] explicit operator bool() const { return is_ok(); }
    [[nodiscard]] ErrorCode error() const { return error_.code; }
    const std::string& message() const { return error_.message; }
    const Error& error_info() const { return error_; }

private:
    Error error_;
};

} // namespace candlecast::core
