#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/a2a_errors.hpp"
#include "protocol/task_contract.hpp"

namespace a2a::protocol {

// Wire encoding: camelCase keys, optional fields omitted when unset.
nlohmann::json file_to_json(const FileContent& file);
nlohmann::json part_to_json(const Part& part);
nlohmann::json message_to_json(const Message& message);
nlohmann::json status_to_json(const TaskStatus& status);
nlohmann::json artifact_to_json(const Artifact& artifact);
nlohmann::json task_to_json(const Task& task);

// Decoding validates structure first; see protocol/validation.hpp.
core::errors::Result<Part> parse_part(const nlohmann::json& value,
                                      const std::string& path = "part");
core::errors::Result<Message> parse_message(const nlohmann::json& value,
                                            const std::string& path = "message");

}  // namespace a2a::protocol
