#include "server/agent_card.hpp"

namespace a2a::server {

using nlohmann::json;

namespace {

json skill_to_json(const skills::SkillDescriptor& skill) {
    json payload;
    payload["id"] = skill.id;
    payload["name"] = skill.name;
    payload["description"] = skill.description;
    payload["tags"] = skill.tags;
    if (!skill.examples.empty()) {
        payload["examples"] = skill.examples;
    }
    if (!skill.input_modes.empty()) {
        payload["inputModes"] = skill.input_modes;
    }
    if (!skill.output_modes.empty()) {
        payload["outputModes"] = skill.output_modes;
    }
    return payload;
}

}  // namespace

json generate_agent_card(const core::config::AgentInfo& agent,
                         const skills::SkillRegistry& registry,
                         const std::string& base_url) {
    const auto skills = registry.skills();
    bool streaming = false;
    json skill_list = json::array();
    for (const auto& skill : skills) {
        streaming = streaming || skill.streaming;
        skill_list.push_back(skill_to_json(skill));
    }

    json card;
    card["name"] = agent.name;
    card["description"] = agent.description;
    card["url"] = base_url;
    card["version"] = agent.version;
    card["protocolVersion"] = kProtocolVersion;
    if (agent.provider.has_value()) {
        card["provider"] = {{"organization", agent.provider->organization},
                            {"url", agent.provider->url}};
    }
    if (agent.documentation_url.has_value()) {
        card["documentationUrl"] = agent.documentation_url.value();
    }
    card["defaultInputModes"] = agent.default_input_modes;
    card["defaultOutputModes"] = agent.default_output_modes;
    card["capabilities"] = {{"streaming", streaming},
                            {"pushNotifications", false},
                            {"stateTransitionHistory", false}};
    card["skills"] = std::move(skill_list);
    return card;
}

}  // namespace a2a::server
