#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace aegis {

/**
 * @brief Error categories for the detection pipeline
 */
enum class ErrorCategory {
    NONE,
    INPUT_TOO_LONG,
    CLASSIFIER_UNAVAILABLE,
    CONFIG_INVALID,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::NONE:                   return "none";
        case ErrorCategory::INPUT_TOO_LONG:         return "input_too_long";
        case ErrorCategory::CLASSIFIER_UNAVAILABLE: return "classifier_unavailable";
        case ErrorCategory::CONFIG_INVALID:         return "config_invalid";
        case ErrorCategory::INTERNAL_ERROR:         return "internal_error";
        default:                                    return "unknown";
    }
}

/**
 * @brief Thrown at startup when a rule set or weighting policy cannot be built.
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
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

} // namespace aegis
