#pragma once
#include <string>
#include <variant>

namespace hearth::core::errors {

    // 1. Typed error categories, one per failure class the pipeline handles
    enum class ErrorCategory {
        Input,          // E.g., bad CLI flag or out-of-range setting
        Validation,     // E.g., malformed tool arguments, artifact failing egress checks
        Execution,      // E.g., tool fault, process spawn failure
        Configuration,  // Fatal: never recovered locally
        Security,       // E.g., path escaping the artifact root; always fail closed
        Internal        // E.g., I/O failure inside hearth itself
    };

    struct HearthError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. A Result holds either a value of type T or a HearthError.
    template <typename T>
    using Result = std::variant<T, HearthError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<HearthError>(result);
    }

    template <typename T>
    const HearthError& get_error(const Result<T>& result) {
        return std::get<HearthError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline bool is_fatal(const HearthError& error) {
        return error.category == ErrorCategory::Configuration;
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:         return "input";
            case ErrorCategory::Validation:    return "validation";
            case ErrorCategory::Execution:     return "execution";
            case ErrorCategory::Configuration: return "configuration";
            case ErrorCategory::Security:      return "security";
            case ErrorCategory::Internal:      return "internal";
            default: return "unknown";
        }
    }

} // namespace hearth::core::errors
