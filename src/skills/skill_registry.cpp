#include "skills/skill_registry.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"

namespace a2a::skills {

void SkillRegistry::register_skill(SkillDescriptor descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string skill_id = descriptor.id;
    auto it = skills_.find(skill_id);
    if (it != skills_.end()) {
        A2A_LOG_WARN("SkillRegistry: replacing skill " + skill_id);
        it->second = std::move(descriptor);
        return;
    }
    skills_.emplace(skill_id, std::move(descriptor));
    order_.push_back(skill_id);
    A2A_LOG_DEBUG("SkillRegistry: registered skill " + skill_id);
}

bool SkillRegistry::unregister_skill(const std::string& skill_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (skills_.erase(skill_id) == 0) {
        return false;
    }
    order_.erase(std::remove(order_.begin(), order_.end(), skill_id), order_.end());
    return true;
}

bool SkillRegistry::has_skill(const std::string& skill_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return skills_.find(skill_id) != skills_.end();
}

bool SkillRegistry::is_streaming(const std::string& skill_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = skills_.find(skill_id);
    return it != skills_.end() && it->second.streaming;
}

std::optional<SkillDescriptor> SkillRegistry::describe(const std::string& skill_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = skills_.find(skill_id);
    if (it == skills_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> SkillRegistry::skill_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

std::vector<SkillDescriptor> SkillRegistry::skills() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SkillDescriptor> result;
    result.reserve(order_.size());
    for (const auto& skill_id : order_) {
        result.push_back(skills_.at(skill_id));
    }
    return result;
}

std::size_t SkillRegistry::skill_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return skills_.size();
}

void SkillRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    skills_.clear();
    order_.clear();
}

}  // namespace a2a::skills
