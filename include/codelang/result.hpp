#pragma once

#include <variant>
#include <string>
#include <stdexcept>
#include <utility>

namespace codelang {

// Error codes for classification and model loading
enum class ErrorCode {
    OK = 0,
    EMPTY_INPUT,        // Text produced no tokens
    MALFORMED_MODEL,    // Model asset failed to parse or validate
    UNKNOWN_LABEL,      // Label id missing from the label table
    NOT_FOUND,
    IO_ERROR,
    INVALID_ARGUMENT
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

    std::string to_string() const {
        if (message_.empty()) {
            return std::string(error_code_name(code_));
        }
        return std::string(error_code_name(code_)) + ": " + message_;
    }

    static const char* error_code_name(ErrorCode code) {
        switch (code) {
            case ErrorCode::OK: return "OK";
            case ErrorCode::EMPTY_INPUT: return "EMPTY_INPUT";
            case ErrorCode::MALFORMED_MODEL: return "MALFORMED_MODEL";
            case ErrorCode::UNKNOWN_LABEL: return "UNKNOWN_LABEL";
            case ErrorCode::NOT_FOUND: return "NOT_FOUND";
            case ErrorCode::IO_ERROR: return "IO_ERROR";
            case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
            default: return "UNKNOWN";
        }
    }

private:
    ErrorCode code_;
    std::string message_;
};

// Result type for operations that can fail
// Similar to Rust's Result<T, E> or C++23's std::expected
template<typename T>
class Result {
public:
    // Success constructor
    Result(T value) : data_(std::move(value)) {}

    // Error constructor
    Result(Error error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }

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

private:
    std::variant<T, Error> data_;
};

// Specialization for void results
template<>
class Result<void> {
public:
    Result() : error_() {}
    Result(Error error) : error_(std::move(error)) {}

    bool ok() const { return error_.ok(); }

    const Error& error() const { return error_; }
    ErrorCode error_code() const { return error_.code(); }

private:
    Error error_;
};

inline Result<void> Ok() { return Result<void>(); }

}  // namespace codelang
