#pragma once
#include <string>
#include <utility>
#include <variant>
#include <vector>

enum class ErrorKind {
    NotFound,
    Access,
    OutOfRange,
    IO,
    MemoryPressure,
    Cancelled,
    InvalidArgument
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Access: return "access";
        case ErrorKind::OutOfRange: return "out_of_range";
        case ErrorKind::IO: return "io";
        case ErrorKind::MemoryPressure: return "memory_pressure";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::InvalidArgument: return "invalid_argument";
    }
    return "unknown";
}

struct Error {
    ErrorKind kind;
    std::string message;

    // Transient failures worth one fallback attempt.
    bool retryable() const {
        return kind == ErrorKind::IO || kind == ErrorKind::MemoryPressure;
    }
};

inline Error make_error(ErrorKind kind, std::string message) {
    return Error{kind, std::move(message)};
}

// Either a value or an Error. Core operations return this instead of throwing.
template <typename T>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}
    Result(Error error) : storage_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(storage_); }
    explicit operator bool() const { return ok(); }

    T& value() { return std::get<T>(storage_); }
    const T& value() const { return std::get<T>(storage_); }
    T take() { return std::move(std::get<T>(storage_)); }

    const Error& error() const { return std::get<Error>(storage_); }

private:
    std::variant<T, Error> storage_;
};

template <>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)), failed_(true) {}

    bool ok() const { return !failed_; }
    explicit operator bool() const { return ok(); }
    const Error& error() const { return error_; }

private:
    Error error_{ErrorKind::IO, std::string()};
    bool failed_ = false;
};

// An error after recovery was exhausted, shaped for presentation to the user.
struct RecoverableError {
    Error error;
    std::string title;
    std::string message;
    std::vector<std::string> suggestedActions;
    bool canRetry = true;
    bool canIgnore = true;
};
