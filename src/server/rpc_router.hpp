#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/a2a_errors.hpp"

namespace a2a::server {

using MethodHandler =
    std::function<core::errors::Result<nlohmann::json>(const nlohmann::json& params)>;

// Maps JSON-RPC method names to handlers. Failures never leave the router:
// they come back as error envelopes.
class JsonRpcRouter {
public:
    // Upper bound on batch requests running at the same time.
    static constexpr std::size_t kMaxConcurrentRequests = 8;

    void register_method(const std::string& method, MethodHandler handler);
    bool unregister_method(const std::string& method);
    bool has_method(const std::string& method) const;
    std::vector<std::string> methods() const;

    nlohmann::json handle(const nlohmann::json& request) const;

    // Requests run concurrently in windows of kMaxConcurrentRequests;
    // responses come back in request order.
    std::vector<nlohmann::json> handle_batch(
        const std::vector<nlohmann::json>& requests) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, MethodHandler> handlers_;
};

}  // namespace a2a::server
