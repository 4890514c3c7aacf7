#pragma once

#include "cryptorand/common.hpp"
#include <stdexcept>
#include <string>
#include <variant>
#include <optional>

namespace cryptorand {

// Error codes for structured error handling
enum class ErrorCode {
    // Generic errors
    Success = 0,
    Unknown,
    InvalidArgument,
    OutOfRange,

    // Entropy errors
    CryptoInitFailed,
    EntropySourceFailed,

    // Configuration errors
    ConfigParseFailed,
    ConfigInvalidValue,
    ConfigIoFailed
};

// Convert error code to string
const char* error_code_to_string(ErrorCode code);

// Error class with structured information
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string details)
        : code_(code), message_(std::move(message)), details_(std::move(details)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& details() const { return details_; }

    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
    std::string details_;
};

// Result type for recoverable failures reported as values
template<typename T>
class Result {
public:
    static Result Ok(T value) {
        return Result(std::move(value));
    }

    static Result Err(Error error) {
        return Result(std::move(error));
    }

    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    bool is_ok() const { return std::holds_alternative<T>(value_); }
    bool is_err() const { return std::holds_alternative<Error>(value_); }

    // Get the value (throws if error)
    const T& value() const {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    // Get the error (throws if ok)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return std::get<Error>(value_);
    }

    T value_or(T default_value) const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return default_value;
    }

    std::optional<T> ok() const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return std::nullopt;
    }

private:
    explicit Result(T value) : value_(std::move(value)) {}
    explicit Result(Error error) : value_(std::move(error)) {}

    std::variant<T, Error> value_;
};

// Specialized Result<void> for operations that don't return a value
template<>
class Result<void> {
public:
    static Result Ok() {
        return Result(true);
    }

    static Result Err(Error error) {
        return Result(std::move(error));
    }

    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    bool is_ok() const { return !error_.has_value(); }
    bool is_err() const { return error_.has_value(); }

    const Error& error() const {
        if (!error_) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return *error_;
    }

private:
    explicit Result(bool) : error_(std::nullopt) {}
    explicit Result(Error error) : error_(std::move(error)) {}

    std::optional<Error> error_;
};

// Custom exception classes
class CryptorandException : public std::runtime_error {
public:
    CryptorandException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class ArgumentException : public CryptorandException {
public:
    ArgumentException(ErrorCode code, const std::string& message)
        : CryptorandException(code, "Argument error: " + message) {}
};

class CryptoException : public CryptorandException {
public:
    CryptoException(ErrorCode code, const std::string& message)
        : CryptorandException(code, "Crypto error: " + message) {}
};

class ConfigException : public CryptorandException {
public:
    ConfigException(ErrorCode code, const std::string& message)
        : CryptorandException(code, "Config error: " + message) {}
};

} // namespace cryptorand
