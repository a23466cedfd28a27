#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/a2a_errors.hpp"
#include "protocol/task_contract.hpp"

namespace a2a::skills {

// What a declared skill parameter is bound to in the inbound request.
enum class ParamKind {
    Text,     // First text part, or the part at part_index; "" when absent
    File,     // First file part, or the part at part_index; nullopt when absent
    Data,     // First data part, or the part at part_index; nullopt when absent
    Message,  // The whole inbound message
    Task,     // The task the skill runs within
    Parts     // All parts of the inbound message
};

struct ParamBinding {
    ParamKind kind = ParamKind::Text;
    std::optional<std::size_t> part_index;
};

inline ParamBinding text_param(std::optional<std::size_t> part_index = std::nullopt) {
    return ParamBinding{ParamKind::Text, part_index};
}
inline ParamBinding file_param(std::optional<std::size_t> part_index = std::nullopt) {
    return ParamBinding{ParamKind::File, part_index};
}
inline ParamBinding data_param(std::optional<std::size_t> part_index = std::nullopt) {
    return ParamBinding{ParamKind::Data, part_index};
}
inline ParamBinding message_param() { return ParamBinding{ParamKind::Message, std::nullopt}; }
inline ParamBinding task_param() { return ParamBinding{ParamKind::Task, std::nullopt}; }
inline ParamBinding parts_param() { return ParamBinding{ParamKind::Parts, std::nullopt}; }

using SkillArg = std::variant<std::string,
                              std::optional<protocol::FileContent>,
                              std::optional<nlohmann::json>,
                              protocol::Message,
                              protocol::Task,
                              std::vector<protocol::Part>>;

// Extracted call arguments, one per declared binding and in declaration order.
class SkillArgs {
public:
    SkillArgs() = default;
    explicit SkillArgs(std::vector<SkillArg> values) : values_(std::move(values)) {}

    std::size_t size() const { return values_.size(); }
    const SkillArg& at(std::size_t i) const { return values_.at(i); }

    const std::string& text(std::size_t i) const { return std::get<std::string>(at(i)); }
    const std::optional<protocol::FileContent>& file(std::size_t i) const {
        return std::get<std::optional<protocol::FileContent>>(at(i));
    }
    const std::optional<nlohmann::json>& data(std::size_t i) const {
        return std::get<std::optional<nlohmann::json>>(at(i));
    }
    const protocol::Message& message(std::size_t i) const {
        return std::get<protocol::Message>(at(i));
    }
    const protocol::Task& task(std::size_t i) const { return std::get<protocol::Task>(at(i)); }
    const std::vector<protocol::Part>& parts(std::size_t i) const {
        return std::get<std::vector<protocol::Part>>(at(i));
    }

private:
    std::vector<SkillArg> values_;
};

// A lazy, finite sequence of output chunks. Consumed once: there is no rewind.
class ChunkStream {
public:
    // Yields the next chunk, or nullopt once the producer is done.
    using NextFn = std::function<core::errors::Result<std::optional<std::string>>()>;

    explicit ChunkStream(NextFn next);

    ChunkStream(ChunkStream&&) = default;
    ChunkStream& operator=(ChunkStream&&) = default;
    ChunkStream(const ChunkStream&) = delete;
    ChunkStream& operator=(const ChunkStream&) = delete;

    static ChunkStream from_chunks(std::vector<std::string> chunks);

    // An exception escaping the producer ends the stream with an Internal error.
    core::errors::Result<std::optional<std::string>> next();
    bool exhausted() const { return done_; }

private:
    NextFn next_;
    bool done_ = false;
};

// A skill decides per call whether it answers at once or streams.
using SkillResult = std::variant<std::string, ChunkStream>;

inline SkillResult immediate(std::string text) { return SkillResult{std::move(text)}; }
inline SkillResult streamed(ChunkStream stream) { return SkillResult{std::move(stream)}; }

using SkillHandler = std::function<core::errors::Result<SkillResult>(const SkillArgs&)>;

struct SkillDescriptor {
    std::string id;
    std::string name;
    std::string description;
    std::vector<std::string> tags;
    std::vector<std::string> examples;
    std::vector<std::string> input_modes;
    std::vector<std::string> output_modes;
    bool streaming = false;  // Advertised only; the handler picks the result shape
    std::vector<ParamBinding> params;
    SkillHandler handler;
};

}  // namespace a2a::skills
