#pragma once
#include <string>
#include <variant>

namespace runner::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,          // E.g., oversized code, malformed JSON body, bad CLI flag
        Authorization,  // E.g., caller sent a missing or wrong API key
        Configuration,  // E.g., server started without an API key secret
        Policy,         // E.g., staged file name escapes the workspace
        Execution,      // E.g., subprocess could not be observed
        Internal        // E.g., workspace directory could not be created
    };

    // The standardized error payload
    struct RunnerError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the caller
        };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a RunnerError.
    template <typename T>
    using Result = std::variant<T, RunnerError>;

    // --- Helpers to work with std::variant ---

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<RunnerError>(result);
    }

    template <typename T>
    const RunnerError& get_error(const Result<T>& result) {
        return std::get<RunnerError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    // Mutable access so move-only values (e.g. a Workspace) can be taken out.
    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Authorization: return "authorization";
            case ErrorCategory::Configuration: return "configuration";
            case ErrorCategory::Policy: return "policy";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace runner::core::errors
