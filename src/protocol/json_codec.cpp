#include "protocol/json_codec.hpp"

#include <type_traits>
#include "protocol/validation.hpp"

namespace a2a::protocol {

using core::errors::Result;
using nlohmann::json;

namespace {

void put_optional(json& target, const char* key,
                  const std::optional<std::string>& value) {
    if (value.has_value()) {
        target[key] = value.value();
    }
}

void put_optional(json& target, const char* key,
                  const std::optional<json>& value) {
    if (value.has_value()) {
        target[key] = value.value();
    }
}

std::optional<std::string> optional_string(const json& source, const char* key) {
    const auto it = source.find(key);
    if (it == source.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::optional<json> optional_metadata(const json& source) {
    const auto it = source.find("metadata");
    if (it == source.end() || it->is_null()) {
        return std::nullopt;
    }
    return *it;
}

}  // namespace

json file_to_json(const FileContent& file) {
    json payload = json::object();
    put_optional(payload, "name", file.name);
    put_optional(payload, "mimeType", file.mime_type);
    put_optional(payload, "bytes", file.bytes);
    put_optional(payload, "uri", file.uri);
    return payload;
}

json part_to_json(const Part& part) {
    return std::visit(
        [](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            json payload;
            if constexpr (std::is_same_v<T, TextPart>) {
                payload["type"] = "text";
                payload["text"] = value.text;
            } else if constexpr (std::is_same_v<T, FilePart>) {
                payload["type"] = "file";
                payload["file"] = file_to_json(value.file);
            } else {
                payload["type"] = "data";
                payload["data"] = value.data;
            }
            put_optional(payload, "metadata", value.metadata);
            return payload;
        },
        part);
}

json message_to_json(const Message& message) {
    json payload;
    payload["role"] = to_string(message.role);
    payload["parts"] = json::array();
    for (const auto& part : message.parts) {
        payload["parts"].push_back(part_to_json(part));
    }
    put_optional(payload, "messageId", message.message_id);
    put_optional(payload, "metadata", message.metadata);
    return payload;
}

json status_to_json(const TaskStatus& status) {
    json payload;
    payload["state"] = to_string(status.state);
    if (status.message.has_value()) {
        payload["message"] = message_to_json(status.message.value());
    }
    payload["timestamp"] = status.timestamp;
    return payload;
}

json artifact_to_json(const Artifact& artifact) {
    json payload;
    put_optional(payload, "artifactId", artifact.artifact_id);
    put_optional(payload, "name", artifact.name);
    put_optional(payload, "description", artifact.description);
    payload["parts"] = json::array();
    for (const auto& part : artifact.parts) {
        payload["parts"].push_back(part_to_json(part));
    }
    if (artifact.index.has_value()) {
        payload["index"] = artifact.index.value();
    }
    if (artifact.append.has_value()) {
        payload["append"] = artifact.append.value();
    }
    if (artifact.last_chunk.has_value()) {
        payload["lastChunk"] = artifact.last_chunk.value();
    }
    put_optional(payload, "metadata", artifact.metadata);
    return payload;
}

json task_to_json(const Task& task) {
    json payload;
    payload["id"] = task.id;
    put_optional(payload, "contextId", task.context_id);
    payload["status"] = status_to_json(task.status);
    payload["history"] = json::array();
    for (const auto& message : task.history) {
        payload["history"].push_back(message_to_json(message));
    }
    payload["artifacts"] = json::array();
    for (const auto& artifact : task.artifacts) {
        payload["artifacts"].push_back(artifact_to_json(artifact));
    }
    put_optional(payload, "metadata", task.metadata);
    return payload;
}

Result<Part> parse_part(const json& value, const std::string& path) {
    auto checked = validate_part(value, path);
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }

    const std::string kind = value.at("type").get<std::string>();
    if (kind == "text") {
        return Part{TextPart{value.at("text").get<std::string>(),
                             optional_metadata(value)}};
    }
    if (kind == "file") {
        const json& file = value.at("file");
        FileContent content;
        content.name = optional_string(file, "name");
        content.mime_type = optional_string(file, "mimeType");
        content.bytes = optional_string(file, "bytes");
        content.uri = optional_string(file, "uri");
        return Part{FilePart{std::move(content), optional_metadata(value)}};
    }
    return Part{DataPart{value.at("data"), optional_metadata(value)}};
}

Result<Message> parse_message(const json& value, const std::string& path) {
    auto checked = validate_message(value, path);
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }

    Message message;
    message.role = value.at("role") == "agent" ? Role::Agent : Role::User;
    message.message_id = optional_string(value, "messageId");
    message.metadata = optional_metadata(value);

    const json& parts = value.at("parts");
    for (std::size_t i = 0; i < parts.size(); ++i) {
        auto part = parse_part(parts.at(i), path + ".parts[" + std::to_string(i) + "]");
        if (core::errors::is_error(part)) {
            return core::errors::get_error(part);
        }
        message.parts.push_back(std::move(core::errors::get_value(part)));
    }
    return message;
}

}  // namespace a2a::protocol
