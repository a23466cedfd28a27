#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/a2a_errors.hpp"

namespace a2a::protocol {

inline constexpr const char* kJsonRpcVersion = "2.0";

// A2A JSON-RPC method names
namespace methods {
inline constexpr const char* kTasksSend = "tasks/send";
inline constexpr const char* kTasksSendSubscribe = "tasks/sendSubscribe";
inline constexpr const char* kTasksGet = "tasks/get";
inline constexpr const char* kTasksCancel = "tasks/cancel";
}  // namespace methods

// The request id is echoed as-is when it is a string or number, otherwise null.
inline nlohmann::json request_id_of(const nlohmann::json& request) {
    if (request.is_object()) {
        const auto it = request.find("id");
        if (it != request.end() && (it->is_string() || it->is_number())) {
            return *it;
        }
    }
    return nullptr;
}

inline nlohmann::json make_success_response(const nlohmann::json& id,
                                            nlohmann::json result) {
    return {{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", std::move(result)}};
}

inline nlohmann::json make_error_response(const nlohmann::json& id,
                                          const core::errors::A2AError& error) {
    return {{"jsonrpc", kJsonRpcVersion},
            {"id", id},
            {"error", core::errors::error_to_json(error)}};
}

}  // namespace a2a::protocol
