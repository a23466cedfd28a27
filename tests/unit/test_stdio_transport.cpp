#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "app/stdio_transport.hpp"
#include "server/agent_service.hpp"
#include "skills/builtin_skills.hpp"

namespace {

using a2a::server::AgentService;
using nlohmann::json;

std::vector<json> read_lines(const std::string& text) {
    std::vector<json> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(json::parse(line));
    }
    return lines;
}

TEST(StdioTransportTest, AnswersEachLineAndSkipsBlanks) {
    AgentService service;
    a2a::skills::register_builtin_skills(service.skills(), a2a::skills::BuiltinSkillOptions{0});

    std::istringstream in(
        R"({"jsonrpc":"2.0","id":1,"method":"tasks/send","params":{"id":"t1","message":{"role":"user","parts":[{"type":"text","text":"Bo"}]},"metadata":{"skillId":"greet"}}})"
        "\n\n"
        "garbage\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tasks/get","params":{"id":"t1"}})"
        "\n");
    std::ostringstream out;

    EXPECT_EQ(a2a::app::serve_stdio(service, in, out), 3u);

    const auto lines = read_lines(out.str());
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0]["result"]["status"]["message"]["parts"][0]["text"],
              "Hello, Bo! Welcome to the A2A protocol.");
    EXPECT_EQ(lines[1]["error"]["code"], -32700);
    EXPECT_EQ(lines[2]["id"], 2);
    EXPECT_EQ(lines[2]["result"]["history"].size(), 2u);
}

TEST(StdioTransportTest, StreamsOneLinePerEvent) {
    AgentService service;
    a2a::skills::register_builtin_skills(service.skills(), a2a::skills::BuiltinSkillOptions{0});

    std::istringstream in(
        R"({"jsonrpc":"2.0","id":"s","method":"tasks/sendSubscribe","params":{"id":"t1","message":{"role":"user","parts":[{"type":"text","text":"1"}]},"metadata":{"skillId":"count"}}})"
        "\n");
    std::ostringstream out;
    a2a::app::serve_stdio(service, in, out);

    const auto lines = read_lines(out.str());
    // working status, header, "1... ", footer, closing chunk, final status
    ASSERT_EQ(lines.size(), 6u);
    for (const auto& line : lines) {
        EXPECT_EQ(line["id"], "s");
    }
    EXPECT_EQ(lines.front()["result"]["status"]["state"], "working");
    EXPECT_EQ(lines[1]["result"]["artifact"]["append"], false);
    EXPECT_EQ(lines[4]["result"]["artifact"]["lastChunk"], true);
    EXPECT_EQ(lines.back()["result"]["final"], true);
    EXPECT_EQ(lines.back()["result"]["status"]["state"], "completed");
}

}  // namespace
