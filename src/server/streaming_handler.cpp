#include "server/streaming_handler.hpp"

#include <string>
#include <utility>
#include "core/logging/logger.hpp"

namespace a2a::server {

using core::errors::A2AError;
using core::errors::Result;
using protocol::Artifact;
using protocol::Message;
using protocol::Part;
using protocol::Role;
using protocol::Task;
using protocol::TextPart;

namespace {

// Closes the sink when the exchange ends, whichever way it ends.
class SinkCloser {
public:
    explicit SinkCloser(EventSink& sink) : sink_(sink) {}
    ~SinkCloser() { sink_.close(); }
    SinkCloser(const SinkCloser&) = delete;
    SinkCloser& operator=(const SinkCloser&) = delete;

private:
    EventSink& sink_;
};

Artifact text_artifact(std::string text, std::optional<bool> append, bool last_chunk) {
    Artifact artifact;
    artifact.parts.emplace_back(TextPart{std::move(text), std::nullopt});
    artifact.index = 0;
    artifact.append = append;
    artifact.last_chunk = last_chunk;
    return artifact;
}

void write_error(EventSink& sink, const A2AError& error) {
    sink.write_error(core::errors::rpc_error_code(error), error.message, error.data);
}

}  // namespace

StreamingHandler::StreamingHandler(task::TaskStore& store,
                                   const skills::SkillInvoker& invoker)
    : store_(store), invoker_(invoker) {}

void StreamingHandler::send_subscribe(const nlohmann::json& params, EventSink& sink) {
    SinkCloser closer(sink);
    auto parsed = parse_send_params(params);
    if (core::errors::is_error(parsed)) {
        write_error(sink, core::errors::get_error(parsed));
        return;
    }
    run(core::errors::get_value(parsed), sink);
}

void StreamingHandler::send_subscribe(const SendParams& params, EventSink& sink) {
    SinkCloser closer(sink);
    run(params, sink);
}

void StreamingHandler::run(const SendParams& params, EventSink& sink) {
    if (!invoker_.has_skill(params.skill_id)) {
        write_error(sink, A2AError{core::errors::ErrorCategory::InvalidParams,
                                   "Unknown skill: " + params.skill_id, "invalid_params",
                                   "", {{"skillId", params.skill_id}}});
        return;
    }

    auto started = begin_task_turn(store_, params);
    if (core::errors::is_error(started)) {
        write_error(sink, core::errors::get_error(started));
        return;
    }
    const Task& task = core::errors::get_value(started);
    sink.write_status(params.id, task.status, false);

    auto invoked = invoker_.invoke(params.skill_id, params.message, task);
    if (core::errors::is_error(invoked)) {
        finish_failed(params, core::errors::get_error(invoked), sink);
        return;
    }

    auto& result = core::errors::get_value(invoked);
    auto stored = [&]() -> Result<Task> {
        if (auto* text = std::get_if<std::string>(&result)) {
            Artifact artifact = text_artifact(std::move(*text), std::nullopt, true);
            sink.write_artifact(params.id, artifact);
            return store_.add_artifact(params.id, std::move(artifact));
        }

        auto& stream = std::get<skills::ChunkStream>(result);
        std::string collected;
        std::size_t chunk_count = 0;
        while (sink.is_open()) {
            auto chunk = stream.next();
            if (core::errors::is_error(chunk)) {
                return core::errors::get_error(chunk);
            }
            const auto& value = core::errors::get_value(chunk);
            if (!value.has_value()) {
                break;
            }
            collected += value.value();
            sink.write_artifact(params.id, text_artifact(value.value(), chunk_count > 0, false));
            ++chunk_count;
        }
        if (!sink.is_open()) {
            A2A_LOG_INFO("StreamingHandler: client left task " + params.id + " after " +
                         std::to_string(chunk_count) + " chunks");
        }

        sink.write_artifact(params.id, text_artifact("", true, true));
        return store_.add_artifact(params.id,
                                   text_artifact(std::move(collected), std::nullopt, true));
    }();

    if (core::errors::is_error(stored)) {
        finish_failed(params, core::errors::get_error(stored), sink);
        return;
    }

    const Task& with_artifact = core::errors::get_value(stored);
    Message response;
    response.role = Role::Agent;
    if (!with_artifact.artifacts.empty()) {
        response.parts = with_artifact.artifacts.front().parts;
    } else {
        response.parts.emplace_back(TextPart{"", std::nullopt});
    }

    auto completed = store_.set_completed(params.id, response);
    if (core::errors::is_error(completed)) {
        A2A_LOG_WARN("StreamingHandler: unable to complete task " + params.id + ": " +
                     core::errors::get_error(completed).message);
    } else {
        auto appended = store_.append_history(params.id, std::move(response));
        if (core::errors::is_error(appended)) {
            A2A_LOG_WARN("StreamingHandler: unable to record response for task " +
                         params.id + ": " + core::errors::get_error(appended).message);
        }
    }

    auto current = store_.get_or_fail(params.id);
    if (core::errors::is_error(current)) {
        write_error(sink, core::errors::get_error(current));
        return;
    }
    sink.write_status(params.id, core::errors::get_value(current).status, true);
}

void StreamingHandler::finish_failed(const SendParams& params, const A2AError& error,
                                     EventSink& sink) {
    A2A_LOG_WARN("StreamingHandler: skill " + params.skill_id + " failed for task " +
                 params.id + ": " + error.message);
    auto failed = store_.set_failed(params.id, make_failure_message(error));
    if (core::errors::is_error(failed)) {
        A2A_LOG_ERROR("StreamingHandler: unable to mark task " + params.id +
                      " failed: " + core::errors::get_error(failed).message);
    }

    auto current = store_.get_or_fail(params.id);
    if (core::errors::is_error(current)) {
        write_error(sink, core::errors::get_error(current));
        return;
    }
    sink.write_status(params.id, core::errors::get_value(current).status, true);
}

}  // namespace a2a::server
