#include "skills/builtin_skills.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace a2a::skills {

using core::errors::Result;

namespace {

constexpr int kDefaultCount = 5;
constexpr int kMaxCount = 100;

// Leading integer of the input, or the default when there is none.
int parse_count(const std::string& input) {
    int value = 0;
    const char* begin = input.data();
    const char* end = input.data() + input.size();
    while (begin != end && (*begin == ' ' || *begin == '\t' || *begin == '\n')) {
        ++begin;
    }
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr == begin || value == 0) {
        return kDefaultCount;
    }
    return std::clamp(value, 1, kMaxCount);
}

struct CountState {
    int target = kDefaultCount;
    int emitted = 0;  // 0 = header pending, 1..target = numbers, target+1 = footer
    std::uint32_t delay_ms = 0;
};

ChunkStream make_count_stream(const int target, const std::uint32_t delay_ms) {
    auto state = std::make_shared<CountState>();
    state->target = target;
    state->delay_ms = delay_ms;

    return ChunkStream([state]() -> Result<std::optional<std::string>> {
        if (state->emitted == 0) {
            ++state->emitted;
            return std::optional<std::string>{"Starting to count to " +
                                              std::to_string(state->target) + "...\n"};
        }
        if (state->emitted <= state->target) {
            if (state->delay_ms > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(state->delay_ms));
            }
            const int current = state->emitted++;
            return std::optional<std::string>{std::to_string(current) + "... "};
        }
        if (state->emitted == state->target + 1) {
            ++state->emitted;
            return std::optional<std::string>{"\nDone counting to " +
                                              std::to_string(state->target) + "!"};
        }
        return std::optional<std::string>{};
    });
}

}  // namespace

void register_builtin_skills(SkillRegistry& registry, const BuiltinSkillOptions& options) {
    SkillDescriptor greet;
    greet.id = "greet";
    greet.name = "Greet";
    greet.description = "Greet the user by name";
    greet.tags = {"greeting", "hello"};
    greet.examples = {"Hello, World!", "Hi there!"};
    greet.params = {text_param()};
    greet.handler = [](const SkillArgs& args) -> Result<SkillResult> {
        return immediate("Hello, " + args.text(0) + "! Welcome to the A2A protocol.");
    };
    registry.register_skill(std::move(greet));

    SkillDescriptor echo;
    echo.id = "echo";
    echo.name = "Echo";
    echo.description = "Echo back the input message";
    echo.tags = {"utility"};
    echo.params = {text_param()};
    echo.handler = [](const SkillArgs& args) -> Result<SkillResult> {
        return immediate("You said: " + args.text(0));
    };
    registry.register_skill(std::move(echo));

    SkillDescriptor count;
    count.id = "count";
    count.name = "Count";
    count.description = "Count to a number with streaming output";
    count.tags = {"demo", "streaming"};
    count.streaming = true;
    count.params = {text_param()};
    const std::uint32_t delay_ms = options.count_delay_ms;
    count.handler = [delay_ms](const SkillArgs& args) -> Result<SkillResult> {
        return streamed(make_count_stream(parse_count(args.text(0)), delay_ms));
    };
    registry.register_skill(std::move(count));

    SkillDescriptor info;
    info.id = "info";
    info.name = "Info";
    info.description = "Get information about this agent";
    info.tags = {"utility", "info"};
    info.handler = [](const SkillArgs&) -> Result<SkillResult> {
        return immediate(
            "a2akit agent\n"
            "\n"
            "Available skills:\n"
            "- greet: Greet the user by name\n"
            "- echo: Echo back the input\n"
            "- count: Count to a number (streaming)\n"
            "- info: Show this information");
    };
    registry.register_skill(std::move(info));
}

}  // namespace a2a::skills
