#include "skills/skill_invoker.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"

namespace a2a::skills {

using protocol::DataPart;
using protocol::FileContent;
using protocol::FilePart;
using protocol::Message;
using protocol::Part;
using protocol::Task;
using protocol::TextPart;

namespace {

// The part at part_index when given, otherwise the first part of type P.
template <typename P>
const P* find_part(const Message& message, const std::optional<std::size_t> part_index) {
    if (part_index.has_value()) {
        if (part_index.value() >= message.parts.size()) {
            return nullptr;
        }
        return std::get_if<P>(&message.parts[part_index.value()]);
    }
    for (const auto& part : message.parts) {
        if (const auto* match = std::get_if<P>(&part)) {
            return match;
        }
    }
    return nullptr;
}

}  // namespace

SkillInvoker::SkillInvoker(const SkillRegistry& registry) : registry_(registry) {}

bool SkillInvoker::has_skill(const std::string& skill_id) const {
    return registry_.has_skill(skill_id);
}

bool SkillInvoker::is_streaming(const std::string& skill_id) const {
    return registry_.is_streaming(skill_id);
}

std::optional<SkillDescriptor> SkillInvoker::describe(const std::string& skill_id) const {
    return registry_.describe(skill_id);
}

core::errors::Result<SkillResult> SkillInvoker::invoke(const std::string& skill_id,
                                                       const Message& message,
                                                       const Task& task) const {
    auto skill = registry_.describe(skill_id);
    if (!skill.has_value()) {
        return core::errors::skill_not_found(skill_id);
    }
    if (!skill->handler) {
        return core::errors::internal_error("Skill \"" + skill_id + "\" has no handler");
    }

    const SkillArgs args = extract_args(skill->params, message, task);
    A2A_LOG_DEBUG("SkillInvoker: invoking skill " + skill_id + " for task " + task.id);
    try {
        return skill->handler(args);
    } catch (const std::exception& e) {
        A2A_LOG_ERROR("SkillInvoker: skill " + skill_id + " threw: " + e.what());
        return core::errors::internal_error(e.what());
    } catch (...) {
        A2A_LOG_ERROR("SkillInvoker: skill " + skill_id + " threw a non-standard exception");
        return core::errors::internal_error("Unknown error");
    }
}

SkillArgs SkillInvoker::extract_args(const std::vector<ParamBinding>& params,
                                     const Message& message, const Task& task) {
    std::vector<SkillArg> values;
    if (params.empty()) {
        values.emplace_back(std::in_place_type<std::string>, extract_text(message));
        return SkillArgs(std::move(values));
    }

    values.reserve(params.size());
    for (const auto& param : params) {
        switch (param.kind) {
            case ParamKind::Text:
                values.emplace_back(std::in_place_type<std::string>,
                                    extract_text(message, param.part_index));
                break;
            case ParamKind::File:
                values.emplace_back(std::in_place_type<std::optional<FileContent>>,
                                    extract_file(message, param.part_index));
                break;
            case ParamKind::Data:
                values.emplace_back(std::in_place_type<std::optional<nlohmann::json>>,
                                    extract_data(message, param.part_index));
                break;
            case ParamKind::Message:
                values.emplace_back(std::in_place_type<Message>, message);
                break;
            case ParamKind::Task:
                values.emplace_back(std::in_place_type<Task>, task);
                break;
            case ParamKind::Parts:
                values.emplace_back(std::in_place_type<std::vector<Part>>, message.parts);
                break;
        }
    }
    return SkillArgs(std::move(values));
}

std::string SkillInvoker::extract_text(const Message& message,
                                       const std::optional<std::size_t> part_index) {
    const auto* part = find_part<TextPart>(message, part_index);
    return part != nullptr ? part->text : std::string();
}

std::optional<FileContent> SkillInvoker::extract_file(
    const Message& message, const std::optional<std::size_t> part_index) {
    const auto* part = find_part<FilePart>(message, part_index);
    if (part == nullptr) {
        return std::nullopt;
    }
    return part->file;
}

std::optional<nlohmann::json> SkillInvoker::extract_data(
    const Message& message, const std::optional<std::size_t> part_index) {
    const auto* part = find_part<DataPart>(message, part_index);
    if (part == nullptr) {
        return std::nullopt;
    }
    return part->data;
}

}  // namespace a2a::skills
