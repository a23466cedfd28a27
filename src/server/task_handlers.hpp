#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/a2a_errors.hpp"
#include "protocol/task_contract.hpp"
#include "server/rpc_router.hpp"
#include "skills/skill_invoker.hpp"
#include "task/task_store.hpp"

namespace a2a::server {

// tasks/send and tasks/sendSubscribe
struct SendParams {
    std::string id;
    std::optional<std::string> context_id;
    protocol::Message message;
    std::string skill_id;
    std::optional<nlohmann::json> metadata;  // Request metadata, skillId included
};

// tasks/get
struct GetParams {
    std::string id;
    std::optional<std::size_t> history_length;
};

// tasks/cancel
struct CancelParams {
    std::string id;
};

core::errors::Result<SendParams> parse_send_params(const nlohmann::json& params);
core::errors::Result<GetParams> parse_get_params(const nlohmann::json& params);
core::errors::Result<CancelParams> parse_cancel_params(const nlohmann::json& params);

// Gets or creates the task, records the inbound message and moves it to
// working. Fails without touching the store when the task cannot start work.
core::errors::Result<protocol::Task> begin_task_turn(task::TaskStore& store,
                                                     const SendParams& params);

// Agent message recorded on a failed task: "Error: <message>".
protocol::Message make_failure_message(const core::errors::A2AError& error);

class TaskHandlers {
public:
    TaskHandlers(task::TaskStore& store, const skills::SkillInvoker& invoker);

    // Runs the skill to completion; streamed output is drained and joined.
    core::errors::Result<protocol::Task> send(const SendParams& params);
    core::errors::Result<protocol::Task> get(const GetParams& params) const;
    core::errors::Result<protocol::Task> cancel(const CancelParams& params);

    // tasks/send, tasks/get and tasks/cancel
    void register_with(JsonRpcRouter& router);

private:
    task::TaskStore& store_;
    const skills::SkillInvoker& invoker_;
};

}  // namespace a2a::server
