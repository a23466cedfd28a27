#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "app/stdio_transport.hpp"
#include "core/errors/a2a_errors.hpp"
#include "core/logging/logger.hpp"
#include "server/agent_service.hpp"
#include "skills/builtin_skills.hpp"

int main(int argc, char* argv[]) {
    // 1. Parse CLI input and return normalized input errors
    auto parsed = a2a::app::cli::parse_and_validate(argc, argv);
    if (a2a::core::errors::is_error(parsed)) {
        const auto& err = a2a::core::errors::get_error(parsed);
        A2A_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            A2A_LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& options = a2a::core::errors::get_value(parsed);

    // 2. Configure the global logger
    auto& logger = a2a::core::logging::Logger::get();
    logger.set_session_tag(options.config.agent.name);
    if (options.config.verbose) {
        logger.set_min_level(a2a::core::logging::LogLevel::DEBUG);
    }

    // 3. Wire the service and its skills
    a2a::server::AgentService service(options.config);
    a2a::skills::BuiltinSkillOptions skill_options;
    skill_options.count_delay_ms = options.config.stream_chunk_delay_ms;
    a2a::skills::register_builtin_skills(service.skills(), skill_options);

    if (options.command == a2a::app::cli::Command::Card) {
        std::cout << service.agent_card().dump(2) << std::endl;
        return 0;
    }

    A2A_LOG_INFO("Serving JSON-RPC on stdio with " +
                 std::to_string(service.skills().skill_count()) + " skills");
    const auto served = a2a::app::serve_stdio(service, std::cin, std::cout);
    A2A_LOG_INFO("Input closed after " + std::to_string(served) + " requests; " +
                 std::to_string(service.tasks().size()) + " tasks tracked");
    return 0;
}
