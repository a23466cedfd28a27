#include "server/rpc_router.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/rpc_contract.hpp"

namespace a2a::server {

using core::errors::A2AError;
using core::errors::ErrorCategory;
using nlohmann::json;

void JsonRpcRouter::register_method(const std::string& method, MethodHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[method] = std::move(handler);
}

bool JsonRpcRouter::unregister_method(const std::string& method) {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.erase(method) > 0;
}

bool JsonRpcRouter::has_method(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.find(method) != handlers_.end();
}

std::vector<std::string> JsonRpcRouter::methods() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& entry : handlers_) {
        names.push_back(entry.first);
    }
    return names;
}

json JsonRpcRouter::handle(const json& request) const {
    const json id = protocol::request_id_of(request);

    const bool has_version = request.is_object() && request.contains("jsonrpc") &&
                             request.at("jsonrpc") == protocol::kJsonRpcVersion;
    if (!has_version) {
        return protocol::make_error_response(
            id, A2AError{ErrorCategory::InvalidRequest, "Invalid JSON-RPC version",
                         "invalid_request"});
    }

    const auto method_it = request.find("method");
    if (method_it == request.end() || !method_it->is_string()) {
        return protocol::make_error_response(
            id, A2AError{ErrorCategory::InvalidRequest, "Method must be a string",
                         "invalid_request"});
    }
    const std::string method = method_it->get<std::string>();

    MethodHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(method);
        if (it != handlers_.end()) {
            handler = it->second;
        }
    }
    if (!handler) {
        return protocol::make_error_response(
            id, A2AError{ErrorCategory::MethodNotFound, "Method not found: " + method,
                         "method_not_found"});
    }

    const auto params_it = request.find("params");
    const json params = params_it != request.end() ? *params_it : json();

    try {
        auto result = handler(params);
        if (core::errors::is_error(result)) {
            const auto& err = core::errors::get_error(result);
            A2A_LOG_DEBUG("JsonRpcRouter: " + method + " failed [" + err.code + "]: " +
                          err.message);
            return protocol::make_error_response(id, err);
        }
        return protocol::make_success_response(id, std::move(core::errors::get_value(result)));
    } catch (const std::exception& e) {
        A2A_LOG_ERROR("JsonRpcRouter: " + method + " threw: " + e.what());
        return protocol::make_error_response(id, core::errors::internal_error(e.what()));
    } catch (...) {
        A2A_LOG_ERROR("JsonRpcRouter: " + method + " threw a non-standard exception");
        return protocol::make_error_response(id, core::errors::internal_error("Unknown error"));
    }
}

std::vector<json> JsonRpcRouter::handle_batch(const std::vector<json>& requests) const {
    std::vector<json> responses(requests.size());
    for (std::size_t start = 0; start < requests.size(); start += kMaxConcurrentRequests) {
        const std::size_t end = std::min(requests.size(), start + kMaxConcurrentRequests);

        std::vector<std::pair<std::size_t, std::future<json>>> pending;
        pending.reserve(end - start);
        for (std::size_t i = start; i < end; ++i) {
            try {
                pending.emplace_back(i, std::async(std::launch::async, [this, &requests, i]() {
                                         return handle(requests[i]);
                                     }));
            } catch (const std::system_error& e) {
                A2A_LOG_WARN(std::string("JsonRpcRouter: no thread for batch request, running inline: ") +
                             e.what());
                responses[i] = handle(requests[i]);
            }
        }

        for (auto& entry : pending) {
            responses[entry.first] = entry.second.get();
        }
    }
    return responses;
}

}  // namespace a2a::server
