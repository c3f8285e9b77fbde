#pragma once
#include <string>
#include <variant>

namespace toolpilot::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,          // E.g., bad CLI flag or missing working directory
        Configuration,  // E.g., API_KEY not set, duplicate tool name
        NotFound,       // E.g., unknown tool, executable not on PATH
        Execution,      // E.g., a tool failed while running
        Timeout,        // E.g., child process exceeded its wall-clock budget
        Provider,       // E.g., model endpoint unreachable or returned garbage
        Policy,         // E.g., tool needs a permission that is not granted
        Internal        // E.g., pipe/fork failure
    };

    // The standardized error payload
    struct AgentError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Propagation strategy: a Result holds either a value of type T, OR an AgentError.
    template <typename T>
    using Result = std::variant<T, AgentError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<AgentError>(result);
    }

    template <typename T>
    const AgentError& get_error(const Result<T>& result) {
        return std::get<AgentError>(result);
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
            case ErrorCategory::Input:         return "input";
            case ErrorCategory::Configuration: return "configuration";
            case ErrorCategory::NotFound:      return "not_found";
            case ErrorCategory::Execution:     return "execution";
            case ErrorCategory::Timeout:       return "timeout";
            case ErrorCategory::Provider:      return "provider";
            case ErrorCategory::Policy:        return "policy";
            case ErrorCategory::Internal:      return "internal";
            default: return "unknown";
        }
    }

    // "[code] message" form used in log lines
    inline std::string describe(const AgentError& error) {
        return "[" + error.code + "] " + error.message;
    }

} // namespace toolpilot::core::errors
