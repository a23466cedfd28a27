#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace a2a::app::cli {

    using namespace a2a::core::errors;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> base_url;
        std::optional<std::string> name;
        std::optional<std::string> chunk_delay_ms;
        bool verbose = false;
    };

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return A2AError{ErrorCategory::InvalidParams, "No command provided.", "missing_command", "Usage: a2akit_agent serve|card [options]"};
        }

        CliOptions options;
        std::string command = argv[1];
        if (command == "serve") {
            options.command = Command::Serve;
        } else if (command == "card") {
            options.command = Command::Card;
        } else {
            return A2AError{ErrorCategory::InvalidParams, "Unknown command: " + command, "unknown_command", "Supported commands are 'serve' and 'card'."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--base-url") {
                if (i + 1 < args.size()) raw.base_url = args[++i];
                else return A2AError{ErrorCategory::InvalidParams, "Missing value for --base-url", "missing_value"};
            } else if (args[i] == "--name") {
                if (i + 1 < args.size()) raw.name = args[++i];
                else return A2AError{ErrorCategory::InvalidParams, "Missing value for --name", "missing_value"};
            } else if (args[i] == "--chunk-delay-ms") {
                if (i + 1 < args.size()) raw.chunk_delay_ms = args[++i];
                else return A2AError{ErrorCategory::InvalidParams, "Missing value for --chunk-delay-ms", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return A2AError{ErrorCategory::InvalidParams, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        auto& config = options.config;
        config.verbose = raw.verbose;

        if (raw.base_url) {
            if (raw.base_url->rfind("http://", 0) != 0 && raw.base_url->rfind("https://", 0) != 0) {
                return A2AError{ErrorCategory::InvalidParams, "Invalid --base-url", "invalid_url", "Use an http:// or https:// URL."};
            }
            config.base_url = raw.base_url.value();
        }

        if (raw.name) {
            if (raw.name->empty()) {
                return A2AError{ErrorCategory::InvalidParams, "--name cannot be empty", "missing_value"};
            }
            config.agent.name = raw.name.value();
        }

        // Exception-free integer parsing
        if (raw.chunk_delay_ms) {
            uint32_t delay = 0;
            const char* begin = raw.chunk_delay_ms->data();
            const char* end = raw.chunk_delay_ms->data() + raw.chunk_delay_ms->size();
            auto [ptr, ec] = std::from_chars(begin, end, delay);
            if (ec != std::errc() || ptr != end) {
                return A2AError{ErrorCategory::InvalidParams, "Invalid number for --chunk-delay-ms", "invalid_integer", "Provide a non-negative integer."};
            }
            if (delay > 10000) {
                return A2AError{ErrorCategory::InvalidParams, "--chunk-delay-ms out of bounds", "bounds_error", "Must be between 0 and 10000."};
            }
            config.stream_chunk_delay_ms = delay;
        }

        return options;
    }

} // namespace a2a::app::cli
