#pragma once

#include "core/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace docgate {

/**
 * @brief Error categories for recoverable failures
 */
enum class ErrorCategory {
    NONE,
    NOT_FOUND,
    IO_ERROR,
    PARSE_ERROR,
    VALIDATION_ERROR,
    INTERNAL_ERROR
};

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

// ============================================================================
// Exceptions
// ============================================================================

class DocgateError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Primary document could not be resolved or read.
class DocumentNotFound : public DocgateError {
public:
    explicit DocumentNotFound(std::string path)
        : DocgateError("Primary document not found or invalid: " + path),
          path_(std::move(path)) {}

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/// Metadata failed validation while fail-on-validation-error is set.
class MetadataValidationError : public DocgateError {
public:
    using DocgateError::DocgateError;
};

/**
 * @brief Hard block raised by the pre-distribution gate.
 *
 * Distinct from every other failure so callers can tell "blocked for
 * security reasons" apart from transient errors. Carries the complete
 * validation result.
 */
class SecurityException : public DocgateError {
public:
    SecurityException(const std::string& message, ValidationResult result)
        : DocgateError(message), result_(std::move(result)) {}

    [[nodiscard]] const ValidationResult& result() const noexcept { return result_; }

private:
    ValidationResult result_;
};

} // namespace docgate
