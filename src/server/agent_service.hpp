#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/config/service_config.hpp"
#include "server/event_sink.hpp"
#include "server/rpc_router.hpp"
#include "server/streaming_handler.hpp"
#include "server/task_handlers.hpp"
#include "skills/skill_invoker.hpp"
#include "skills/skill_registry.hpp"
#include "task/task_store.hpp"

namespace a2a::server {

// Transport-independent entry point: owns the task store, the skills and the
// router, and routes each parsed request to the unary or streaming path.
class AgentService {
public:
    explicit AgentService(core::config::ServiceConfig config = {});

    AgentService(const AgentService&) = delete;
    AgentService& operator=(const AgentService&) = delete;

    skills::SkillRegistry& skills() { return registry_; }
    task::TaskStore& tasks() { return store_; }
    const JsonRpcRouter& router() const { return router_; }
    const core::config::ServiceConfig& config() const { return config_; }

    nlohmann::json agent_card() const;

    // True for a single tasks/sendSubscribe request.
    static bool is_streaming_request(const nlohmann::json& request);

    // Single request or batch (array). A streaming method inside a batch is
    // answered with MethodNotFound.
    nlohmann::json handle(const nlohmann::json& request) const;

    void handle_streaming(const nlohmann::json& request, EventSink& sink);

    // Parses a unary request body and returns the serialized response.
    std::string handle_body(const std::string& body) const;

    static nlohmann::json parse_error_response();

private:
    core::config::ServiceConfig config_;
    task::TaskStore store_;
    skills::SkillRegistry registry_;
    skills::SkillInvoker invoker_;
    TaskHandlers handlers_;
    StreamingHandler streaming_;
    JsonRpcRouter router_;
};

}  // namespace a2a::server
