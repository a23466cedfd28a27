#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/a2a_errors.hpp"

namespace a2a::protocol {

// Structural checks on inbound JSON. Failures are InvalidParams errors whose
// data.field names the offending JSON path.

core::errors::Result<core::errors::Ok> validate_message(
    const nlohmann::json& value, const std::string& path = "message");

core::errors::Result<core::errors::Ok> validate_part(
    const nlohmann::json& value, const std::string& path = "part");

core::errors::Result<core::errors::Ok> validate_file_content(
    const nlohmann::json& value, const std::string& path = "file");

core::errors::Result<core::errors::Ok> validate_task_id(
    const nlohmann::json& value, const std::string& field = "id");

bool is_valid_message(const nlohmann::json& value);
bool is_valid_part(const nlohmann::json& value);

}  // namespace a2a::protocol
