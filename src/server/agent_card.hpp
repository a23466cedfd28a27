#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/config/service_config.hpp"
#include "skills/skill_registry.hpp"

namespace a2a::server {

inline constexpr const char* kProtocolVersion = "0.3.0";

// Discovery document served at /.well-known/agent.json.
nlohmann::json generate_agent_card(const core::config::AgentInfo& agent,
                                   const skills::SkillRegistry& registry,
                                   const std::string& base_url);

}  // namespace a2a::server
