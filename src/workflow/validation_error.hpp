#pragma once

#include <optional>
#include <string>
#include "core/errors/ael_errors.hpp"

namespace ael::workflow {

enum class ValidationErrorKind {
    EmptyWorkflow,
    BadSyntax,
    UnknownTool,
    UnknownDependency,
    CyclicDependency
};

inline std::string to_code(const ValidationErrorKind kind) {
    switch (kind) {
        case ValidationErrorKind::EmptyWorkflow:
            return "empty_workflow";
        case ValidationErrorKind::BadSyntax:
            return "bad_syntax";
        case ValidationErrorKind::UnknownTool:
            return "unknown_tool";
        case ValidationErrorKind::UnknownDependency:
            return "unknown_dependency";
        case ValidationErrorKind::CyclicDependency:
            return "cyclic_dependency";
        default:
            return "unknown";
    }
}

inline core::errors::AelError make_validation_error(const ValidationErrorKind kind,
                                                    const std::string& message,
                                                    const std::string& hint = "") {
    return core::errors::AelError{core::errors::ErrorCategory::Validation, message,
                                  to_code(kind), hint};
}

// Maps an error back to its validation kind; nullopt for any other error.
inline std::optional<ValidationErrorKind> validation_kind(const core::errors::AelError& error) {
    if (error.category != core::errors::ErrorCategory::Validation) {
        return std::nullopt;
    }
    for (const auto kind : {ValidationErrorKind::EmptyWorkflow, ValidationErrorKind::BadSyntax,
                            ValidationErrorKind::UnknownTool,
                            ValidationErrorKind::UnknownDependency,
                            ValidationErrorKind::CyclicDependency}) {
        if (error.code == to_code(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

}  // namespace ael::workflow
