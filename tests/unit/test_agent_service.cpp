#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/service_config.hpp"
#include "server/agent_card.hpp"
#include "server/agent_service.hpp"
#include "skills/builtin_skills.hpp"
#include "unit/test_support.hpp"

namespace {

using a2a::core::config::ServiceConfig;
using a2a::protocol::TaskState;
using a2a::server::AgentService;
using a2a::testing::RecordingEventSink;
using Kind = a2a::testing::RecordingEventSink::Kind;
using nlohmann::json;

ServiceConfig test_config() {
    ServiceConfig config;
    config.base_url = "https://agent.test";
    config.agent.name = "Test Agent";
    config.stream_chunk_delay_ms = 0;
    return config;
}

json send_request(const json& id, const std::string& method, const std::string& task_id,
                  const std::string& skill, const std::string& text) {
    return {{"jsonrpc", "2.0"},
            {"id", id},
            {"method", method},
            {"params",
             {{"id", task_id},
              {"message", {{"role", "user"}, {"parts", {{{"type", "text"}, {"text", text}}}}}},
              {"metadata", {{"skillId", skill}}}}}};
}

class AgentServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        a2a::skills::register_builtin_skills(service_.skills(),
                                             a2a::skills::BuiltinSkillOptions{0});
    }

    AgentService service_{test_config()};
};

TEST_F(AgentServiceTest, AgentCardListsSkillsAndStreaming) {
    const json card = service_.agent_card();
    EXPECT_EQ(card["name"], "Test Agent");
    EXPECT_EQ(card["url"], "https://agent.test");
    EXPECT_EQ(card["protocolVersion"], a2a::server::kProtocolVersion);
    EXPECT_EQ(card["capabilities"]["streaming"], true);
    ASSERT_EQ(card["skills"].size(), 4u);
    EXPECT_EQ(card["skills"][0]["id"], "greet");
    EXPECT_EQ(card["skills"][2]["id"], "count");
}

TEST_F(AgentServiceTest, CardWithoutStreamingSkills) {
    AgentService bare(test_config());
    const json card = bare.agent_card();
    EXPECT_EQ(card["capabilities"]["streaming"], false);
    EXPECT_TRUE(card["skills"].empty());
}

TEST_F(AgentServiceTest, SendThenGetThenCancel) {
    const json sent = service_.handle(send_request(1, "tasks/send", "t1", "echo", "hi"));
    ASSERT_TRUE(sent.contains("result")) << sent.dump();
    EXPECT_EQ(sent["result"]["status"]["state"], "completed");
    EXPECT_EQ(sent["result"]["status"]["message"]["parts"][0]["text"], "You said: hi");

    const json got = service_.handle(
        {{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tasks/get"},
         {"params", {{"id", "t1"}, {"historyLength", 1}}}});
    ASSERT_EQ(got["result"]["history"].size(), 1u);
    EXPECT_EQ(got["result"]["history"][0]["role"], "agent");

    const json canceled = service_.handle(
        {{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tasks/cancel"}, {"params", {{"id", "t1"}}}});
    EXPECT_EQ(canceled["error"]["code"], -32002);
    EXPECT_EQ(canceled["error"]["data"]["currentState"], "completed");
}

TEST_F(AgentServiceTest, NonStandardThrowStaysInsideDispatcher) {
    a2a::skills::SkillDescriptor bad;
    bad.id = "bad";
    bad.name = "Bad";
    bad.handler = [](const a2a::skills::SkillArgs&)
        -> a2a::core::errors::Result<a2a::skills::SkillResult> { throw 42; };
    service_.skills().register_skill(bad);

    json response;
    EXPECT_NO_THROW(response = service_.handle(send_request(1, "tasks/send", "t1", "bad", "x")));
    EXPECT_EQ(response["error"]["code"], -32603);
    EXPECT_EQ(response["error"]["message"], "Unknown error");

    const auto task = service_.tasks().get("t1");
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->status.state, TaskState::Failed);
}

TEST_F(AgentServiceTest, MissingSkillIdIsInvalidParams) {
    json request = send_request("r", "tasks/send", "t1", "echo", "hi");
    request["params"].erase("metadata");
    const json response = service_.handle(request);
    EXPECT_EQ(response["error"]["code"], -32602);
    EXPECT_EQ(response["error"]["data"]["field"], "metadata.skillId");
}

TEST_F(AgentServiceTest, BatchAnswersInOrderAndRejectsStreaming) {
    json batch = json::array();
    batch.push_back(send_request(1, "tasks/send", "a", "greet", "Ada"));
    batch.push_back(send_request(2, "tasks/sendSubscribe", "b", "count", "2"));
    batch.push_back({{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tasks/get"},
                     {"params", {{"id", "missing"}}}});

    const json responses = service_.handle(batch);
    ASSERT_TRUE(responses.is_array());
    ASSERT_EQ(responses.size(), 3u);
    EXPECT_EQ(responses[0]["id"], 1);
    EXPECT_EQ(responses[0]["result"]["status"]["state"], "completed");
    EXPECT_EQ(responses[1]["error"]["code"], -32601);
    EXPECT_EQ(responses[2]["error"]["code"], -32001);
}

TEST_F(AgentServiceTest, EmptyBatchYieldsEmptyArray) {
    const json responses = service_.handle(json::array());
    ASSERT_TRUE(responses.is_array());
    EXPECT_TRUE(responses.empty());
}

TEST_F(AgentServiceTest, UnparsableBodyIsParseError) {
    const json response = json::parse(service_.handle_body("{not json"));
    EXPECT_EQ(response["error"]["code"], -32700);
    EXPECT_TRUE(response["id"].is_null());
}

TEST_F(AgentServiceTest, DetectsStreamingRequests) {
    EXPECT_TRUE(AgentService::is_streaming_request(
        send_request(1, "tasks/sendSubscribe", "t", "count", "1")));
    EXPECT_FALSE(AgentService::is_streaming_request(
        send_request(1, "tasks/send", "t", "count", "1")));
    EXPECT_FALSE(AgentService::is_streaming_request(json::array()));
}

TEST_F(AgentServiceTest, StreamingCountEndsCompleted) {
    RecordingEventSink sink;
    service_.handle_streaming(send_request(9, "tasks/sendSubscribe", "s1", "count", "2"), sink);

    // header, two numbers, footer and the closing empty chunk
    EXPECT_EQ(sink.of_kind(Kind::Artifact).size(), 5u);
    EXPECT_EQ(sink.events.back().status.state, TaskState::Completed);
    EXPECT_TRUE(sink.events.back().final_event);
    EXPECT_EQ(sink.close_count, 1);

    const auto task = service_.tasks().get("s1");
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(a2a::testing::first_text(task->artifacts[0].parts),
              "Starting to count to 2...\n1... 2... \nDone counting to 2!");
}

TEST_F(AgentServiceTest, StreamingRejectsWrongVersion) {
    json request = send_request(9, "tasks/sendSubscribe", "s1", "count", "2");
    request["jsonrpc"] = "1.0";
    RecordingEventSink sink;
    service_.handle_streaming(request, sink);

    ASSERT_EQ(sink.events.size(), 1u);
    EXPECT_EQ(sink.events[0].code, -32600);
    EXPECT_EQ(sink.close_count, 1);
    EXPECT_FALSE(service_.tasks().has("s1"));
}

}  // namespace
