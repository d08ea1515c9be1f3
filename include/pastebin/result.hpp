#pragma once

#include <variant>
#include <string>
#include <stdexcept>
#include <utility>

namespace pastebin {

// Error codes for the paste store
enum class ErrorCode {
    OK = 0,
    NOT_FOUND,
    VALIDATION_ERROR,   // Input failed a precondition (e.g. empty content)
    CONFLICT,           // Paste id collided with an existing row
    IO_ERROR,
    CORRUPTION,
    INVALID_ARGUMENT,
    BUFFER_POOL_FULL,
    STORE_NOT_OPEN,     // Store must be opened before operations
    INTERNAL_ERROR
};

// Error with code and message
class Error {
public:
    Error() : code_(ErrorCode::OK) {}
    Error(ErrorCode code, std::string message = "")
        : code_(code), message_(std::move(message)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    bool ok() const { return code_ == ErrorCode::OK; }
    explicit operator bool() const { return !ok(); }

    // Infrastructure failures, as opposed to caller-visible outcomes
    // (validation, not found, conflict).
    bool is_storage_error() const {
        switch (code_) {
            case ErrorCode::IO_ERROR:
            case ErrorCode::CORRUPTION:
            case ErrorCode::INVALID_ARGUMENT:
            case ErrorCode::BUFFER_POOL_FULL:
            case ErrorCode::STORE_NOT_OPEN:
            case ErrorCode::INTERNAL_ERROR:
                return true;
            default:
                return false;
        }
    }

    std::string to_string() const {
        if (message_.empty()) {
            return std::string(error_code_name(code_));
        }
        return std::string(error_code_name(code_)) + ": " + message_;
    }

    static const char* error_code_name(ErrorCode code) {
        switch (code) {
            case ErrorCode::OK: return "OK";
            case ErrorCode::NOT_FOUND: return "NOT_FOUND";
            case ErrorCode::VALIDATION_ERROR: return "VALIDATION_ERROR";
            case ErrorCode::CONFLICT: return "CONFLICT";
            case ErrorCode::IO_ERROR: return "IO_ERROR";
            case ErrorCode::CORRUPTION: return "CORRUPTION";
            case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
            case ErrorCode::BUFFER_POOL_FULL: return "BUFFER_POOL_FULL";
            case ErrorCode::STORE_NOT_OPEN: return "STORE_NOT_OPEN";
            case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
            default: return "UNKNOWN";
        }
    }

private:
    ErrorCode code_;
    std::string message_;
};

// Result type for operations that can fail.
// Holds either a value or an Error, never both.
template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}

    Result(Error error) : data_(std::move(error)) {}
    Result(ErrorCode code, std::string message = "")
        : data_(Error(code, std::move(message))) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    // Access value (throws if error)
    T& value() & {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::get<T>(data_);
    }

    const T& value() const& {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::move(std::get<T>(data_));
    }

    T value_or(T default_value) const {
        if (ok()) {
            return std::get<T>(data_);
        }
        return default_value;
    }

    // Access error (throws if success)
    const Error& error() const {
        if (ok()) {
            throw std::logic_error("Result has no error");
        }
        return std::get<Error>(data_);
    }

    ErrorCode error_code() const {
        if (ok()) {
            return ErrorCode::OK;
        }
        return error().code();
    }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }

private:
    std::variant<T, Error> data_;
};

// Specialization for void results
template<>
class Result<void> {
public:
    Result() : error_() {}
    Result(Error error) : error_(std::move(error)) {}
    Result(ErrorCode code, std::string message = "")
        : error_(Error(code, std::move(message))) {}

    bool ok() const { return error_.ok(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return error_; }
    ErrorCode error_code() const { return error_.code(); }

    void value() const {
        if (!ok()) {
            throw std::runtime_error(error_.to_string());
        }
    }

private:
    Error error_;
};

inline Result<void> Ok() { return Result<void>(); }

}  // namespace pastebin
