#pragma once
#include <string>
#include <variant>

namespace ael::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,       // E.g., a CLI flag or a missing workflow input
        Validation,  // E.g., a workflow with a dependency cycle
        Execution,   // E.g., a tool returned failure or a step raised fail()
        Sandbox,     // E.g., inline code imported a denied module
        Registry,    // E.g., a tool source could not be reached
        Policy,      // E.g., a path outside the granted directory
        Internal     // E.g., pipe creation failed
    };

    // The standardized error payload. `code` is the stable kind callers
    // switch on; `message` is the human-readable detail.
    struct AelError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Propagation strategy: a Result holds either a value or an AelError.
    template <typename T>
    using Result = std::variant<T, AelError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<AelError>(result);
    }

    template <typename T>
    const AelError& get_error(const Result<T>& result) {
        return std::get<AelError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:
                return "input";
            case ErrorCategory::Validation:
                return "validation";
            case ErrorCategory::Execution:
                return "execution";
            case ErrorCategory::Sandbox:
                return "sandbox";
            case ErrorCategory::Registry:
                return "registry";
            case ErrorCategory::Policy:
                return "policy";
            case ErrorCategory::Internal:
                return "internal";
            default:
                return "unknown";
        }
    }

} // namespace ael::core::errors
