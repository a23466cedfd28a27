#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace a2a::protocol {

enum class TaskState {
    Submitted,
    Working,
    InputRequired,
    Completed,
    Canceled,
    Failed,
    Unknown
};

enum class Role {
    User,
    Agent
};

// Exactly one of bytes (base64) or uri is set on a valid file.
struct FileContent {
    std::optional<std::string> name;
    std::optional<std::string> mime_type;
    std::optional<std::string> bytes;
    std::optional<std::string> uri;
};

struct TextPart {
    std::string text;
    std::optional<nlohmann::json> metadata;
};

struct FilePart {
    FileContent file;
    std::optional<nlohmann::json> metadata;
};

// data is a JSON object or array
struct DataPart {
    nlohmann::json data;
    std::optional<nlohmann::json> metadata;
};

using Part = std::variant<TextPart, FilePart, DataPart>;

struct Message {
    Role role = Role::User;
    std::vector<Part> parts;
    std::optional<std::string> message_id;
    std::optional<nlohmann::json> metadata;
};

struct TaskStatus {
    TaskState state = TaskState::Submitted;
    std::optional<Message> message;
    std::string timestamp;
};

// Streaming results accumulate per index through append/last_chunk.
struct Artifact {
    std::optional<std::string> artifact_id;
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::vector<Part> parts;
    std::optional<std::size_t> index;
    std::optional<bool> append;
    std::optional<bool> last_chunk;
    std::optional<nlohmann::json> metadata;
};

struct Task {
    std::string id;
    std::optional<std::string> context_id;
    TaskStatus status;
    std::vector<Message> history;
    std::vector<Artifact> artifacts;
    std::optional<nlohmann::json> metadata;
};

inline std::string to_string(const TaskState state) {
    switch (state) {
        case TaskState::Submitted:
            return "submitted";
        case TaskState::Working:
            return "working";
        case TaskState::InputRequired:
            return "input-required";
        case TaskState::Completed:
            return "completed";
        case TaskState::Canceled:
            return "canceled";
        case TaskState::Failed:
            return "failed";
        case TaskState::Unknown:
        default:
            return "unknown";
    }
}

inline std::optional<TaskState> task_state_from_string(const std::string& value) {
    if (value == "submitted") return TaskState::Submitted;
    if (value == "working") return TaskState::Working;
    if (value == "input-required") return TaskState::InputRequired;
    if (value == "completed") return TaskState::Completed;
    if (value == "canceled") return TaskState::Canceled;
    if (value == "failed") return TaskState::Failed;
    if (value == "unknown") return TaskState::Unknown;
    return std::nullopt;
}

inline std::string to_string(const Role role) {
    return role == Role::Agent ? "agent" : "user";
}

inline Message make_text_message(Role role, std::string text) {
    Message message;
    message.role = role;
    message.parts.emplace_back(TextPart{std::move(text), std::nullopt});
    return message;
}

}  // namespace a2a::protocol
