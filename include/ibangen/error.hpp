#pragma once

#include "ibangen/common.hpp"
#include <stdexcept>
#include <string>
#include <variant>
#include <optional>
#include <utility>

namespace ibangen {

// Error codes for structured error handling
enum class ErrorCode {
    // Generic errors
    Success = 0,
    Unknown,
    InvalidArgument,

    // Generation errors
    UnsupportedCountry,
    InvalidCharacter,
    InternalGenerationFault,
    RangeError,

    // Entropy errors
    EntropySourceFailed,
    CryptoInitFailed,

    // Country table errors
    InvalidProfile,
    InvalidFormat,
    ConfigLoadFailed
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

    /**
     * Country code the failure relates to, if known
     */
    const std::optional<std::string>& country_code() const { return country_code_; }

    Error& with_country(std::string country_code) {
        country_code_ = std::move(country_code);
        return *this;
    }

    Error& with_details(std::string details) {
        details_ = std::move(details);
        return *this;
    }

    /**
     * True for engine defects, false for problems the caller can fix
     * by changing its input.
     */
    bool is_internal() const;

    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
    std::string details_;
    std::optional<std::string> country_code_;
};

// Thrown when a failed Result is unwrapped
class IbanException : public std::runtime_error {
public:
    explicit IbanException(Error error)
        : std::runtime_error(error.to_string()), error_(std::move(error)) {}

    ErrorCode code() const { return error_.code(); }
    const Error& error() const { return error_; }

private:
    Error error_;
};

// Result type for error handling (similar to Rust's Result<T, E>)
template<typename T>
class Result {
public:
    // Success constructor
    static Result Ok(T value) {
        return Result(std::move(value));
    }

    // Error constructor
    static Result Err(Error error) {
        return Result(std::move(error));
    }

    // Error constructor with code and message
    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    // Check if result contains a value
    bool is_ok() const { return std::holds_alternative<T>(value_); }
    bool is_err() const { return std::holds_alternative<Error>(value_); }

    // Get the value (throws IbanException if error)
    T& value() {
        if (is_err()) {
            throw IbanException(std::get<Error>(value_));
        }
        return std::get<T>(value_);
    }

    const T& value() const {
        if (is_err()) {
            throw IbanException(std::get<Error>(value_));
        }
        return std::get<T>(value_);
    }

    // Get the error (throws if ok)
    const Error& error() const {
        if (is_ok()) {
            throw std::logic_error("Called error() on ok Result");
        }
        return std::get<Error>(value_);
    }

    // Get value or default
    T value_or(T default_value) const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return default_value;
    }

    // Convert to optional
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
            throw std::logic_error("Called error() on ok Result");
        }
        return *error_;
    }

    void unwrap() const {
        if (is_err()) {
            throw IbanException(*error_);
        }
    }

private:
    explicit Result(bool) : error_(std::nullopt) {}
    explicit Result(Error error) : error_(std::move(error)) {}

    std::optional<Error> error_;
};

// Propagate the error of a Result<void> expression
#define IBANGEN_TRY(ResultType, expr) \
    do { \
        auto ibangen_try_result = (expr); \
        if (ibangen_try_result.is_err()) { \
            return ResultType::Err(ibangen_try_result.error()); \
        } \
    } while (0)

} // namespace ibangen
