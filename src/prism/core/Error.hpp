#pragma once
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace Prism {

struct EvalError {
    enum class Code {
        TypeMismatch = 0,
        UndefinedVariable,
        DivisionByZero,
        IntegerOverflow,
        ValueTooLarge
    };

    EvalError(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

struct SandboxError {
    enum class Code {
        PathRejected = 0,
        FileTooLarge,
        MemoryExceeded
    };

    SandboxError(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

// An action that fails leaves the committed state untouched. For Evaluation
// failures `cause` holds the evaluator error and `target` the variable whose
// expression failed. Sandbox failures (the working copy outgrew its memory
// allowance) are fatal to the runtime.
struct ActionError {
    enum class Code {
        UnknownAction = 0,
        UnknownVariable,
        Evaluation,
        Sandbox
    };

    ActionError(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    ActionError(SandboxError error, std::string target)
        : code(Code::Sandbox), message(error.message), sandbox(std::move(error)), target(std::move(target)) {}

    static auto evaluation(EvalError cause, std::string target) -> ActionError {
        ActionError error{Code::Evaluation, {}};
        error.message = "evaluation of '" + target + "' failed";
        error.cause   = std::move(cause);
        error.target  = std::move(target);
        return error;
    }

    Code                        code;
    std::optional<std::string>  message;
    std::optional<EvalError>    cause;
    std::optional<SandboxError> sandbox;
    std::string                 target;
};

struct LoadError {
    enum class Code {
        Syntax = 0,
        MissingDirective,
        DuplicateVariable,
        DuplicateAction,
        UnresolvedIdentifier,
        UnknownNodeKind,
        Sandbox,
        Io
    };

    LoadError(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    LoadError(SandboxError error)
        : code(Code::Sandbox), message(error.message), sandbox(std::move(error)) {}

    Code                        code;
    std::optional<std::string>  message;
    std::optional<SandboxError> sandbox;
    std::size_t                 line   = 0;
    std::size_t                 column = 0;
};

template <typename T>
using EvalResult = std::expected<T, EvalError>;

template <typename T>
using ActionResult = std::expected<T, ActionError>;

template <typename T>
using LoadResult = std::expected<T, LoadError>;

template <typename T>
using SandboxResult = std::expected<T, SandboxError>;

[[nodiscard]] inline auto errorCodeToString(EvalError::Code code) -> std::string_view {
    switch (code) {
    case EvalError::Code::TypeMismatch:
        return "type_mismatch";
    case EvalError::Code::UndefinedVariable:
        return "undefined_variable";
    case EvalError::Code::DivisionByZero:
        return "division_by_zero";
    case EvalError::Code::IntegerOverflow:
        return "integer_overflow";
    case EvalError::Code::ValueTooLarge:
        return "value_too_large";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto errorCodeToString(SandboxError::Code code) -> std::string_view {
    switch (code) {
    case SandboxError::Code::PathRejected:
        return "path_rejected";
    case SandboxError::Code::FileTooLarge:
        return "file_too_large";
    case SandboxError::Code::MemoryExceeded:
        return "memory_exceeded";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto errorCodeToString(ActionError::Code code) -> std::string_view {
    switch (code) {
    case ActionError::Code::UnknownAction:
        return "unknown_action";
    case ActionError::Code::UnknownVariable:
        return "unknown_variable";
    case ActionError::Code::Evaluation:
        return "evaluation";
    case ActionError::Code::Sandbox:
        return "sandbox";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto errorCodeToString(LoadError::Code code) -> std::string_view {
    switch (code) {
    case LoadError::Code::Syntax:
        return "syntax";
    case LoadError::Code::MissingDirective:
        return "missing_directive";
    case LoadError::Code::DuplicateVariable:
        return "duplicate_variable";
    case LoadError::Code::DuplicateAction:
        return "duplicate_action";
    case LoadError::Code::UnresolvedIdentifier:
        return "unresolved_identifier";
    case LoadError::Code::UnknownNodeKind:
        return "unknown_node_kind";
    case LoadError::Code::Sandbox:
        return "sandbox";
    case LoadError::Code::Io:
        return "io";
    }
    return "unknown_error";
}

namespace detail {
inline auto labelWithMessage(std::string_view label, std::optional<std::string> const& message) -> std::string {
    if (message && !message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(message->data(), message->size());
        return description;
    }
    return std::string{label};
}
} // namespace detail

[[nodiscard]] inline auto describeError(EvalError const& error) -> std::string {
    return detail::labelWithMessage(errorCodeToString(error.code), error.message);
}

[[nodiscard]] inline auto describeError(SandboxError const& error) -> std::string {
    return detail::labelWithMessage(errorCodeToString(error.code), error.message);
}

[[nodiscard]] inline auto describeError(ActionError const& error) -> std::string {
    if (error.sandbox) {
        return "sandbox:" + describeError(*error.sandbox);
    }
    auto description = detail::labelWithMessage(errorCodeToString(error.code), error.message);
    if (error.cause) {
        description.append(" (");
        description.append(describeError(*error.cause));
        description.push_back(')');
    }
    return description;
}

[[nodiscard]] inline auto describeError(LoadError const& error) -> std::string {
    if (error.sandbox) {
        return "sandbox:" + describeError(*error.sandbox);
    }
    auto description = detail::labelWithMessage(errorCodeToString(error.code), error.message);
    if (error.line > 0) {
        description.append(" at ");
        description.append(std::to_string(error.line));
        description.push_back(':');
        description.append(std::to_string(error.column));
    }
    return description;
}

} // namespace Prism
