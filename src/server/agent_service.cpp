#include "server/agent_service.hpp"

#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "protocol/rpc_contract.hpp"
#include "server/agent_card.hpp"

namespace a2a::server {

using core::errors::A2AError;
using core::errors::ErrorCategory;
using nlohmann::json;

AgentService::AgentService(core::config::ServiceConfig config)
    : config_(std::move(config)),
      invoker_(registry_),
      handlers_(store_, invoker_),
      streaming_(store_, invoker_) {
    handlers_.register_with(router_);
}

json AgentService::agent_card() const {
    return generate_agent_card(config_.agent, registry_, config_.base_url);
}

bool AgentService::is_streaming_request(const json& request) {
    if (!request.is_object()) {
        return false;
    }
    const auto method = request.find("method");
    return method != request.end() && method->is_string() &&
           *method == protocol::methods::kTasksSendSubscribe;
}

json AgentService::handle(const json& request) const {
    if (!request.is_array()) {
        return router_.handle(request);
    }

    const std::vector<json> requests = request.get<std::vector<json>>();
    A2A_LOG_DEBUG("AgentService: dispatching batch of " + std::to_string(requests.size()));
    return json(router_.handle_batch(requests));
}

void AgentService::handle_streaming(const json& request, EventSink& sink) {
    const auto version = request.find("jsonrpc");
    const auto params = request.find("params");
    if (version == request.end() || *version != protocol::kJsonRpcVersion) {
        sink.write_error(core::errors::codes::kInvalidRequest, "Invalid JSON-RPC version");
        sink.close();
        return;
    }
    streaming_.send_subscribe(params != request.end() ? *params : json(), sink);
}

std::string AgentService::handle_body(const std::string& body) const {
    const json request = json::parse(body, nullptr, false);
    if (request.is_discarded()) {
        return parse_error_response().dump();
    }
    return handle(request).dump();
}

json AgentService::parse_error_response() {
    return protocol::make_error_response(
        nullptr, A2AError{ErrorCategory::Parse, "Parse error", "parse_error"});
}

}  // namespace a2a::server
