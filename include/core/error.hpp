#pragma once

#include <optional>
#include <string>
#include <utility>

namespace anonproxy {

/**
 * @brief Error categories for the engine
 *
 * MAPPING_NOT_FOUND and SIGNATURE_INVALID are kept distinct so callers and
 * logs can tell an expired mapping from a tampered one.
 */
enum class ErrorCategory {
    NONE,
    INVALID_INPUT,
    MAPPING_NOT_FOUND,
    SIGNATURE_INVALID,
    BACKEND_UNAVAILABLE,
    CONFIGURATION_ERROR,
    LIFECYCLE_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline constexpr const char* error_category_to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::NONE:                return "none";
        case ErrorCategory::INVALID_INPUT:       return "invalid_input";
        case ErrorCategory::MAPPING_NOT_FOUND:   return "mapping_not_found";
        case ErrorCategory::SIGNATURE_INVALID:   return "signature_invalid";
        case ErrorCategory::BACKEND_UNAVAILABLE: return "backend_unavailable";
        case ErrorCategory::CONFIGURATION_ERROR: return "configuration_error";
        case ErrorCategory::LIFECYCLE_ERROR:     return "lifecycle_error";
        case ErrorCategory::INTERNAL_ERROR:      return "internal_error";
    }
    return "internal_error";
}

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

    // Re-wrap another result's error under this value type
    template<typename U>
    static Result error_from(const Result<U>& other) {
        return error(other.error_category(), other.error_message());
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

} // namespace anonproxy
