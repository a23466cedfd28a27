#pragma once
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace a2a::core::errors {

    // 1. Typed error categories, one per failure the protocol can report
    enum class ErrorCategory {
        Parse,              // Request body is not valid JSON
        InvalidRequest,     // Envelope is not a JSON-RPC 2.0 request
        MethodNotFound,     // No handler registered for the method
        InvalidParams,      // Missing or malformed request field
        TaskNotFound,       // No task with the given id
        InvalidTransition,  // State machine denied the transition
        TaskNotCancelable,  // Cancel attempted on a terminal task
        SkillNotFound,      // Skill id is not registered
        Execution,          // A skill body reported a failure
        Internal            // Unexpected failure inside the service
    };

    // JSON-RPC 2.0 and A2A error codes
    namespace codes {
        constexpr int kParseError = -32700;
        constexpr int kInvalidRequest = -32600;
        constexpr int kMethodNotFound = -32601;
        constexpr int kInvalidParams = -32602;
        constexpr int kInternalError = -32603;

        constexpr int kTaskNotFound = -32001;
        constexpr int kTaskNotCancelable = -32002;
        constexpr int kUnsupportedOperation = -32004;
    } // namespace codes

    // The standardized error payload
    struct A2AError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
        nlohmann::json data = nullptr;  // Extra context for the wire, null when absent
    };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR an A2AError.
    template <typename T>
    using Result = std::variant<T, A2AError>;

    // Used by operations that only report success or failure.
    struct Ok {};

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<A2AError>(result);
    }

    template <typename T>
    const A2AError& get_error(const Result<T>& result) {
        return std::get<A2AError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline int rpc_error_code(const A2AError& error) {
        switch (error.category) {
            case ErrorCategory::Parse:
                return codes::kParseError;
            case ErrorCategory::InvalidRequest:
                return codes::kInvalidRequest;
            case ErrorCategory::MethodNotFound:
                return codes::kMethodNotFound;
            case ErrorCategory::InvalidParams:
                return codes::kInvalidParams;
            case ErrorCategory::TaskNotFound:
                return codes::kTaskNotFound;
            case ErrorCategory::TaskNotCancelable:
                return codes::kTaskNotCancelable;
            case ErrorCategory::InvalidTransition:
            case ErrorCategory::SkillNotFound:
                return codes::kUnsupportedOperation;
            case ErrorCategory::Execution:
            case ErrorCategory::Internal:
            default:
                return codes::kInternalError;
        }
    }

    // Cancel-on-terminal is still a denied transition.
    inline bool is_transition_error(const A2AError& error) {
        return error.category == ErrorCategory::InvalidTransition ||
               error.category == ErrorCategory::TaskNotCancelable;
    }

    // {code, message, data?} as carried in a JSON-RPC error envelope
    inline nlohmann::json error_to_json(const A2AError& error) {
        nlohmann::json payload;
        payload["code"] = rpc_error_code(error);
        payload["message"] = error.message;
        if (!error.data.is_null()) {
            payload["data"] = error.data;
        }
        return payload;
    }

    // --- Constructors for the errors raised across the service ---

    inline A2AError invalid_params(const std::string& message,
                                   const std::string& field = "") {
        A2AError error{ErrorCategory::InvalidParams, message, "invalid_params"};
        if (!field.empty()) {
            error.data = {{"field", field}};
        }
        return error;
    }

    inline A2AError task_not_found(const std::string& task_id) {
        return A2AError{ErrorCategory::TaskNotFound, "Task not found: " + task_id,
                        "task_not_found", "", {{"taskId", task_id}}};
    }

    inline A2AError skill_not_found(const std::string& skill_id) {
        return A2AError{ErrorCategory::SkillNotFound, "Skill not found: " + skill_id,
                        "skill_not_found", "", {{"skillId", skill_id}}};
    }

    inline A2AError internal_error(const std::string& message) {
        return A2AError{ErrorCategory::Internal, message, "internal_error"};
    }

} // namespace a2a::core::errors
