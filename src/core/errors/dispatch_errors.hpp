#pragma once
#include <string>
#include <variant>

namespace cidispatch::core::errors {

    // Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., bad CLI flag or unreadable config file
        Schema,     // E.g., unknown tool name or mistyped argument
        Execution,  // E.g., an analyzer binary could not be started
        Policy,     // E.g., a path escapes the workspace root
        Internal    // E.g., pipe/fork failure or registry misuse
    };

    struct DispatchError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";  // What the caller can do about it
    };

    // A Result holds either a value of type T or a DispatchError.
    template <typename T>
    using Result = std::variant<T, DispatchError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<DispatchError>(result);
    }

    template <typename T>
    const DispatchError& get_error(const Result<T>& result) {
        return std::get<DispatchError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Schema:    return "schema";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Policy:    return "policy";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace cidispatch::core::errors
