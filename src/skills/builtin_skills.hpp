#pragma once

#include <cstdint>
#include "skills/skill_registry.hpp"

namespace a2a::skills {

struct BuiltinSkillOptions {
    std::uint32_t count_delay_ms = 300;  // Pause before each streamed count chunk
};

// greet, echo, count (streaming) and info.
void register_builtin_skills(SkillRegistry& registry,
                             const BuiltinSkillOptions& options = {});

}  // namespace a2a::skills
