/**
 * @file error.hpp
 * @brief Error codes and result type for encode/decode operations
 *
 * Every encode or decode call returns a Result<T>. Errors are terminal for
 * the call that produced them and are propagated to the caller unchanged.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace varserde {

// ============================================================================
// Error Types
// ============================================================================

enum class ErrorCode {
    TypeMismatch,
    UnsupportedType,
    InvalidTag,
    LengthMismatch,
    ExpectedChar,
    IntegerOverflow,
    ValidationFailure,
    ParseFailure,
    Custom
};

// Convert error code to string
constexpr const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::TypeMismatch:       return "Type mismatch";
        case ErrorCode::UnsupportedType:    return "Unsupported type";
        case ErrorCode::InvalidTag:         return "Invalid enum tag";
        case ErrorCode::LengthMismatch:     return "Length mismatch";
        case ErrorCode::ExpectedChar:       return "Expected single character";
        case ErrorCode::IntegerOverflow:    return "Integer overflow";
        case ErrorCode::ValidationFailure:  return "Validation failure";
        case ErrorCode::ParseFailure:       return "Parse failure";
        case ErrorCode::Custom:             return "Custom error";
    }
    return "Unknown error";
}

struct Error {
    ErrorCode code;
    std::string message;

    static Error type_mismatch(std::string_view expected, std::string_view actual) {
        return {ErrorCode::TypeMismatch,
                "Type mismatch: Expected '" + std::string(expected) + "', got '" + std::string(actual) + "'"};
    }

    static Error str_mismatch(std::string_view actual) {
        return {ErrorCode::TypeMismatch,
                "Type mismatch: Expected 's', 'o', or 'g', got '" + std::string(actual) + "'"};
    }

    static Error invalid_tag(std::string_view actual) {
        return {ErrorCode::InvalidTag, "Invalid enum tag type: '" + std::string(actual) + "'"};
    }

    static Error unsupported_type(std::string_view actual) {
        return {ErrorCode::UnsupportedType, "Type not supported: '" + std::string(actual) + "'"};
    }

    static Error expected_char(std::string_view actual) {
        return {ErrorCode::ExpectedChar,
                "Type mismatch: Expected string with length 1, got '" + std::string(actual) + "'"};
    }

    static Error length_mismatch(std::size_t actual, std::size_t expected) {
        return {ErrorCode::LengthMismatch,
                "Struct/tuple length mismatch: Expected " + std::to_string(expected) +
                ", got " + std::to_string(actual)};
    }

    static Error overflow(std::string_view target) {
        return {ErrorCode::IntegerOverflow,
                "Integer out of range for target type '" + std::string(target) + "'"};
    }

    static Error custom(std::string message) {
        return {ErrorCode::Custom, std::move(message)};
    }
};

// ============================================================================
// Result Type (value or Error)
// ============================================================================

template<typename T>
class Result {
private:
    std::optional<T> value_;
    std::optional<Error> error_;

public:
    // Success constructor
    Result(T value) : value_(std::move(value)), error_(std::nullopt) {}

    // Error constructor
    Result(Error error) : value_(std::nullopt), error_(std::move(error)) {}

    // Check if result contains a value
    explicit operator bool() const { return value_.has_value(); }
    bool has_value() const { return value_.has_value(); }

    // Access the value
    T& operator*() & { return *value_; }
    const T& operator*() const & { return *value_; }
    T&& operator*() && { return std::move(*value_); }

    T* operator->() { return &(*value_); }
    const T* operator->() const { return &(*value_); }

    T& value() & { return *value_; }
    const T& value() const & { return *value_; }
    T&& value() && { return std::move(*value_); }

    // Access the error
    const Error& error() const & { return *error_; }
    Error&& error() && { return std::move(*error_); }
};

// Specialization for void
template<>
class Result<void> {
private:
    std::optional<Error> error_;

public:
    // Success constructor
    Result() : error_(std::nullopt) {}

    // Error constructor
    Result(Error error) : error_(std::move(error)) {}

    // Static factory methods
    static Result<void> ok() { return Result<void>(); }
    static Result<void> fail(Error err) { return Result<void>(std::move(err)); }

    // Check if result is success
    explicit operator bool() const { return !error_.has_value(); }
    bool has_value() const { return !error_.has_value(); }

    // Access the error
    const Error& error() const { return *error_; }
};

} // namespace varserde
