#include "server/task_handlers.hpp"

#include <cstdint>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/json_codec.hpp"
#include "protocol/rpc_contract.hpp"
#include "protocol/validation.hpp"

namespace a2a::server {

using core::errors::A2AError;
using core::errors::ErrorCategory;
using core::errors::invalid_params;
using core::errors::Result;
using nlohmann::json;
using protocol::Message;
using protocol::Role;
using protocol::Task;

namespace {

Result<std::string> require_task_id(const json& params) {
    if (!params.is_object()) {
        return invalid_params("Params must be an object", "params");
    }
    const auto it = params.find("id");
    if (it == params.end() || it->is_null()) {
        return invalid_params("Missing required parameter: id", "id");
    }
    auto checked = protocol::validate_task_id(*it, "id");
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }
    return it->get<std::string>();
}

// Concatenation of every chunk, in order.
Result<std::string> drain(skills::ChunkStream& stream) {
    std::string collected;
    while (true) {
        auto chunk = stream.next();
        if (core::errors::is_error(chunk)) {
            return core::errors::get_error(chunk);
        }
        const auto& value = core::errors::get_value(chunk);
        if (!value.has_value()) {
            return collected;
        }
        collected += value.value();
    }
}

}  // namespace

Result<SendParams> parse_send_params(const json& params) {
    auto id = require_task_id(params);
    if (core::errors::is_error(id)) {
        return core::errors::get_error(id);
    }

    SendParams parsed;
    parsed.id = core::errors::get_value(id);

    const auto context_it = params.find("contextId");
    if (context_it != params.end() && !context_it->is_null()) {
        if (!context_it->is_string()) {
            return invalid_params("contextId must be a string", "contextId");
        }
        parsed.context_id = context_it->get<std::string>();
    }

    const auto message_it = params.find("message");
    if (message_it == params.end() || message_it->is_null()) {
        return invalid_params("Missing required parameter: message", "message");
    }
    auto message = protocol::parse_message(*message_it);
    if (core::errors::is_error(message)) {
        return core::errors::get_error(message);
    }
    parsed.message = std::move(core::errors::get_value(message));

    const auto metadata_it = params.find("metadata");
    if (metadata_it != params.end() && metadata_it->is_object()) {
        parsed.metadata = *metadata_it;
        const auto skill_it = metadata_it->find("skillId");
        if (skill_it != metadata_it->end() && skill_it->is_string()) {
            parsed.skill_id = skill_it->get<std::string>();
        }
    }
    if (parsed.skill_id.empty()) {
        return invalid_params(
            "Missing required metadata.skillId - explicit skill routing required",
            "metadata.skillId");
    }
    return parsed;
}

Result<GetParams> parse_get_params(const json& params) {
    auto id = require_task_id(params);
    if (core::errors::is_error(id)) {
        return core::errors::get_error(id);
    }

    GetParams parsed;
    parsed.id = core::errors::get_value(id);

    const auto length_it = params.find("historyLength");
    if (length_it != params.end() && !length_it->is_null()) {
        const bool non_negative =
            length_it->is_number_unsigned() ||
            (length_it->is_number_integer() && length_it->get<std::int64_t>() >= 0);
        if (!non_negative) {
            return invalid_params("historyLength must be a non-negative integer",
                                  "historyLength");
        }
        parsed.history_length = length_it->get<std::size_t>();
    }
    return parsed;
}

Result<CancelParams> parse_cancel_params(const json& params) {
    auto id = require_task_id(params);
    if (core::errors::is_error(id)) {
        return core::errors::get_error(id);
    }
    return CancelParams{core::errors::get_value(id)};
}

Result<Task> begin_task_turn(task::TaskStore& store, const SendParams& params) {
    return store.begin_turn(
        task::CreateTaskOptions{params.id, params.context_id, params.metadata},
        params.message);
}

Message make_failure_message(const A2AError& error) {
    return protocol::make_text_message(Role::Agent, "Error: " + error.message);
}

TaskHandlers::TaskHandlers(task::TaskStore& store, const skills::SkillInvoker& invoker)
    : store_(store), invoker_(invoker) {}

Result<Task> TaskHandlers::send(const SendParams& params) {
    if (!invoker_.has_skill(params.skill_id)) {
        return invalid_params("Unknown skill: " + params.skill_id, "metadata.skillId");
    }

    auto started = begin_task_turn(store_, params);
    if (core::errors::is_error(started)) {
        return core::errors::get_error(started);
    }
    const Task& task = core::errors::get_value(started);

    auto outcome = [&]() -> Result<std::string> {
        auto invoked = invoker_.invoke(params.skill_id, params.message, task);
        if (core::errors::is_error(invoked)) {
            return core::errors::get_error(invoked);
        }
        auto& result = core::errors::get_value(invoked);
        if (auto* text = std::get_if<std::string>(&result)) {
            return std::move(*text);
        }
        return drain(std::get<skills::ChunkStream>(result));
    }();

    if (core::errors::is_error(outcome)) {
        const auto& err = core::errors::get_error(outcome);
        A2A_LOG_WARN("TaskHandlers: skill " + params.skill_id + " failed for task " +
                     params.id + ": " + err.message);
        auto failed = store_.set_failed(params.id, make_failure_message(err));
        if (core::errors::is_error(failed)) {
            A2A_LOG_ERROR("TaskHandlers: unable to mark task " + params.id +
                          " failed: " + core::errors::get_error(failed).message);
        }
        return err;
    }

    Message response = protocol::make_text_message(Role::Agent, core::errors::get_value(outcome));
    auto completed = store_.set_completed(params.id, response);
    if (core::errors::is_error(completed)) {
        return core::errors::get_error(completed);
    }
    return store_.append_history(params.id, std::move(response));
}

Result<Task> TaskHandlers::get(const GetParams& params) const {
    auto found = store_.get_or_fail(params.id);
    if (core::errors::is_error(found) || !params.history_length.has_value()) {
        return found;
    }

    Task task = std::move(core::errors::get_value(found));
    const std::size_t keep = params.history_length.value();
    if (task.history.size() > keep) {
        task.history.erase(task.history.begin(),
                           task.history.end() - static_cast<std::ptrdiff_t>(keep));
    }
    return task;
}

Result<Task> TaskHandlers::cancel(const CancelParams& params) {
    auto canceled = store_.set_canceled(params.id);
    if (!core::errors::is_error(canceled)) {
        return canceled;
    }

    auto error = core::errors::get_error(canceled);
    if (error.category == ErrorCategory::InvalidTransition) {
        const std::string state = error.data.value("from", std::string("unknown"));
        error.category = ErrorCategory::TaskNotCancelable;
        error.code = "task_not_cancelable";
        error.message = "Task \"" + params.id + "\" is not cancelable in state: " + state;
        error.data = {{"taskId", params.id}, {"currentState", state}};
    }
    return error;
}

void TaskHandlers::register_with(JsonRpcRouter& router) {
    router.register_method(protocol::methods::kTasksSend,
                           [this](const json& params) -> Result<json> {
                               auto parsed = parse_send_params(params);
                               if (core::errors::is_error(parsed)) {
                                   return core::errors::get_error(parsed);
                               }
                               auto task = send(core::errors::get_value(parsed));
                               if (core::errors::is_error(task)) {
                                   return core::errors::get_error(task);
                               }
                               return protocol::task_to_json(core::errors::get_value(task));
                           });

    router.register_method(protocol::methods::kTasksGet,
                           [this](const json& params) -> Result<json> {
                               auto parsed = parse_get_params(params);
                               if (core::errors::is_error(parsed)) {
                                   return core::errors::get_error(parsed);
                               }
                               auto task = get(core::errors::get_value(parsed));
                               if (core::errors::is_error(task)) {
                                   return core::errors::get_error(task);
                               }
                               return protocol::task_to_json(core::errors::get_value(task));
                           });

    router.register_method(protocol::methods::kTasksCancel,
                           [this](const json& params) -> Result<json> {
                               auto parsed = parse_cancel_params(params);
                               if (core::errors::is_error(parsed)) {
                                   return core::errors::get_error(parsed);
                               }
                               auto task = cancel(core::errors::get_value(parsed));
                               if (core::errors::is_error(task)) {
                                   return core::errors::get_error(task);
                               }
                               return protocol::task_to_json(core::errors::get_value(task));
                           });
}

}  // namespace a2a::server
