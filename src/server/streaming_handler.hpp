#pragma once

#include <nlohmann/json.hpp>
#include "server/event_sink.hpp"
#include "server/task_handlers.hpp"
#include "skills/skill_invoker.hpp"
#include "task/task_store.hpp"

namespace a2a::server {

// tasks/sendSubscribe: same lifecycle as tasks/send, reported as ordered
// status and artifact events. The sink is closed exactly once on every path.
class StreamingHandler {
public:
    StreamingHandler(task::TaskStore& store, const skills::SkillInvoker& invoker);

    void send_subscribe(const nlohmann::json& params, EventSink& sink);
    void send_subscribe(const SendParams& params, EventSink& sink);

private:
    void run(const SendParams& params, EventSink& sink);
    void finish_failed(const SendParams& params, const core::errors::A2AError& error,
                       EventSink& sink);

    task::TaskStore& store_;
    const skills::SkillInvoker& invoker_;
};

}  // namespace a2a::server
