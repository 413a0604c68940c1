#pragma once

#include <string>
#include <utility>
#include <variant>

namespace webhunter {

enum class ErrorCode {
    STORE_UNAVAILABLE,
    CORRUPT_STORE,
    INVALID_ARGUMENT
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::STORE_UNAVAILABLE: return "StoreUnavailable";
        case ErrorCode::CORRUPT_STORE: return "CorruptStore";
        case ErrorCode::INVALID_ARGUMENT: return "InvalidArgument";
    }
    return "Unknown";
}

struct Error {
    ErrorCode code;
    std::string message;
};

template<typename T>
class Result {
private:
    std::variant<T, Error> value_;

public:
    explicit Result(T value) : value_(std::move(value)) {}
    explicit Result(Error error) : value_(std::move(error)) {}

    static Result<T> success(T value) {
        return Result<T>(std::move(value));
    }

    static Result<T> error(ErrorCode code, std::string message) {
        return Result<T>(Error{code, std::move(message)});
    }

    bool is_success() const {
        return std::holds_alternative<T>(value_);
    }

    bool is_error() const {
        return std::holds_alternative<Error>(value_);
    }

    const T& value() const {
        return std::get<T>(value_);
    }

    T& value() {
        return std::get<T>(value_);
    }

    const Error& error() const {
        return std::get<Error>(value_);
    }

    ErrorCode code() const {
        return error().code;
    }

    T value_or(T default_value) const {
        if (is_success()) {
            return value();
        }
        return default_value;
    }
};

// Result of an operation that yields no value
using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::success(std::monostate{});
}

} // namespace webhunter
