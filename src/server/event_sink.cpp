#include "server/event_sink.hpp"

#include <utility>
#include "core/errors/a2a_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/json_codec.hpp"
#include "protocol/rpc_contract.hpp"

namespace a2a::server {

using nlohmann::json;

JsonRpcEventSink::JsonRpcEventSink(json request_id)
    : request_id_(std::move(request_id)) {}

void JsonRpcEventSink::write_status(const std::string& task_id,
                                    const protocol::TaskStatus& status,
                                    const bool final_event) {
    json event;
    event["id"] = task_id;
    event["status"] = protocol::status_to_json(status);
    event["final"] = final_event;
    deliver(protocol::make_success_response(request_id_, std::move(event)));
}

void JsonRpcEventSink::write_artifact(const std::string& task_id,
                                      const protocol::Artifact& artifact) {
    json event;
    event["id"] = task_id;
    event["artifact"] = protocol::artifact_to_json(artifact);
    deliver(protocol::make_success_response(request_id_, std::move(event)));
}

void JsonRpcEventSink::write_error(const int code, const std::string& message,
                                   const json& data) {
    json error;
    error["code"] = code;
    error["message"] = message;
    if (!data.is_null()) {
        error["data"] = data;
    }
    deliver({{"jsonrpc", protocol::kJsonRpcVersion},
             {"id", request_id_},
             {"error", std::move(error)}});
}

bool JsonRpcEventSink::is_open() const {
    return !closed_.load();
}

void JsonRpcEventSink::close() {
    if (ended_.exchange(true)) {
        return;
    }
    std::lock_guard<std::mutex> lock(write_mutex_);
    closed_.store(true);
    on_close();
}

void JsonRpcEventSink::deliver(const json& envelope) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (closed_.load()) {
        return;
    }
    if (!emit(envelope)) {
        A2A_LOG_WARN("EventSink: transport closed while writing event");
        closed_.store(true);
    }
}

SseEventSink::SseEventSink(Writer writer, json request_id, Closer closer)
    : JsonRpcEventSink(std::move(request_id)),
      writer_(std::move(writer)),
      closer_(std::move(closer)) {}

std::string SseEventSink::format_frame(const std::uint64_t event_id, const json& data) {
    return "id: sse-evt-" + std::to_string(event_id) + "\n" +
           "event: message\n" +
           "data: " + data.dump() + "\n\n";
}

bool SseEventSink::emit(const json& envelope) {
    if (!writer_) {
        return false;
    }
    return writer_(format_frame(++event_id_, envelope));
}

void SseEventSink::on_close() {
    if (closer_) {
        closer_();
    }
}

JsonLinesEventSink::JsonLinesEventSink(std::ostream& out, json request_id)
    : JsonRpcEventSink(std::move(request_id)), out_(out) {}

bool JsonLinesEventSink::emit(const json& envelope) {
    out_ << envelope.dump() << "\n";
    out_.flush();
    return out_.good();
}

}  // namespace a2a::server
