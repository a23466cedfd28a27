#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "skills/skill_contract.hpp"

namespace a2a::skills {

// Thread-safe lookup of registered skills, in registration order.
class SkillRegistry {
public:
    SkillRegistry() = default;
    SkillRegistry(const SkillRegistry&) = delete;
    SkillRegistry& operator=(const SkillRegistry&) = delete;

    // Replaces any skill already registered under the same id.
    void register_skill(SkillDescriptor descriptor);
    bool unregister_skill(const std::string& skill_id);

    bool has_skill(const std::string& skill_id) const;
    bool is_streaming(const std::string& skill_id) const;
    std::optional<SkillDescriptor> describe(const std::string& skill_id) const;

    std::vector<std::string> skill_ids() const;
    std::vector<SkillDescriptor> skills() const;
    std::size_t skill_count() const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, SkillDescriptor> skills_;
    std::vector<std::string> order_;
};

}  // namespace a2a::skills
