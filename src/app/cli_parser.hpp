#pragma once
#include "core/config/service_config.hpp"
#include "core/errors/a2a_errors.hpp"

namespace a2a::app::cli {

    enum class Command {
        Serve,  // JSON-RPC over stdin/stdout
        Card    // Print the agent card and exit
    };

    struct CliOptions {
        Command command = Command::Serve;
        a2a::core::config::ServiceConfig config;
    };

    a2a::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);
}
