#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace a2a::core::config {

    struct ProviderInfo {
        std::string organization;
        std::string url;
    };

    // Describes the agent for discovery; skills are listed from the registry.
    struct AgentInfo {
        std::string name = "a2akit Agent";
        std::string description = "An A2A agent exposing skills over JSON-RPC";
        std::string version = "1.0.0";
        std::optional<ProviderInfo> provider;
        std::optional<std::string> documentation_url;
        std::vector<std::string> default_input_modes = {"text"};
        std::vector<std::string> default_output_modes = {"text"};
    };

    struct ServiceConfig {
        std::string base_url = "http://localhost:3000";
        AgentInfo agent;
        bool verbose = false;
        std::uint32_t stream_chunk_delay_ms = 300;  // Pause between streamed demo chunks
    };

} // namespace a2a::core::config
