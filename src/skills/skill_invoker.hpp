#pragma once

#include <optional>
#include <string>
#include <vector>
#include "core/errors/a2a_errors.hpp"
#include "protocol/task_contract.hpp"
#include "skills/skill_contract.hpp"
#include "skills/skill_registry.hpp"

namespace a2a::skills {

class SkillInvoker {
public:
    explicit SkillInvoker(const SkillRegistry& registry);

    bool has_skill(const std::string& skill_id) const;
    bool is_streaming(const std::string& skill_id) const;
    std::optional<SkillDescriptor> describe(const std::string& skill_id) const;

    // SkillNotFound for unknown ids; otherwise whatever the skill reports.
    // Anything thrown by the skill becomes an Internal error; what() is kept
    // for std::exception, anything else reports "Unknown error".
    core::errors::Result<SkillResult> invoke(const std::string& skill_id,
                                             const protocol::Message& message,
                                             const protocol::Task& task) const;

    // Without declared bindings the first text part ("" if none) is the sole argument.
    static SkillArgs extract_args(const std::vector<ParamBinding>& params,
                                  const protocol::Message& message,
                                  const protocol::Task& task);

    static std::string extract_text(const protocol::Message& message,
                                    std::optional<std::size_t> part_index = std::nullopt);
    static std::optional<protocol::FileContent> extract_file(
        const protocol::Message& message,
        std::optional<std::size_t> part_index = std::nullopt);
    static std::optional<nlohmann::json> extract_data(
        const protocol::Message& message,
        std::optional<std::size_t> part_index = std::nullopt);

private:
    const SkillRegistry& registry_;
};

}  // namespace a2a::skills
