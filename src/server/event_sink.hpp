#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include "protocol/task_contract.hpp"

namespace a2a::server {

// Destination for the ordered events of one streaming exchange.
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void write_status(const std::string& task_id,
                              const protocol::TaskStatus& status,
                              bool final_event) = 0;
    virtual void write_artifact(const std::string& task_id,
                                const protocol::Artifact& artifact) = 0;
    virtual void write_error(int code, const std::string& message,
                             const nlohmann::json& data = nullptr) = 0;
    virtual bool is_open() const = 0;
    virtual void close() = 0;
};

// Wraps every event in a JSON-RPC envelope carrying the request id.
// Writes after close are dropped and close is idempotent.
class JsonRpcEventSink : public EventSink {
public:
    explicit JsonRpcEventSink(nlohmann::json request_id);

    void write_status(const std::string& task_id, const protocol::TaskStatus& status,
                      bool final_event) override;
    void write_artifact(const std::string& task_id,
                        const protocol::Artifact& artifact) override;
    void write_error(int code, const std::string& message,
                     const nlohmann::json& data = nullptr) override;
    bool is_open() const override;
    void close() override;

    const nlohmann::json& request_id() const { return request_id_; }

protected:
    // Returns false when the transport is gone; the sink then closes.
    virtual bool emit(const nlohmann::json& envelope) = 0;
    virtual void on_close() {}

private:
    void deliver(const nlohmann::json& envelope);

    nlohmann::json request_id_;
    std::atomic_bool closed_{false};  // No further writes
    std::atomic_bool ended_{false};   // close() has run
    std::mutex write_mutex_;
};

// Server-Sent Events framing: "id: sse-evt-N", "event: message", "data: <json>".
class SseEventSink : public JsonRpcEventSink {
public:
    using Writer = std::function<bool(const std::string&)>;
    using Closer = std::function<void()>;

    SseEventSink(Writer writer, nlohmann::json request_id, Closer closer = nullptr);

    static std::string format_frame(std::uint64_t event_id, const nlohmann::json& data);

protected:
    bool emit(const nlohmann::json& envelope) override;
    void on_close() override;

private:
    Writer writer_;
    Closer closer_;
    std::uint64_t event_id_ = 0;
};

// One envelope per line, as used by the stdio transport.
class JsonLinesEventSink : public JsonRpcEventSink {
public:
    JsonLinesEventSink(std::ostream& out, nlohmann::json request_id);

protected:
    bool emit(const nlohmann::json& envelope) override;

private:
    std::ostream& out_;
};

}  // namespace a2a::server
