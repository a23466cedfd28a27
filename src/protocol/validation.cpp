#include "protocol/validation.hpp"

namespace a2a::protocol {

using core::errors::invalid_params;
using core::errors::Ok;
using core::errors::Result;
using nlohmann::json;

Result<Ok> validate_message(const json& value, const std::string& path) {
    if (!value.is_object()) {
        return invalid_params("Message must be an object", path);
    }

    const auto role = value.find("role");
    if (role == value.end() || !role->is_string() ||
        (*role != "user" && *role != "agent")) {
        return invalid_params("Message role must be \"user\" or \"agent\"",
                              path + ".role");
    }

    const auto parts = value.find("parts");
    if (parts == value.end() || !parts->is_array() || parts->empty()) {
        return invalid_params("Message must have at least one part",
                              path + ".parts");
    }

    for (std::size_t i = 0; i < parts->size(); ++i) {
        auto checked = validate_part(parts->at(i),
                                     path + ".parts[" + std::to_string(i) + "]");
        if (core::errors::is_error(checked)) {
            return checked;
        }
    }
    return Ok{};
}

Result<Ok> validate_part(const json& value, const std::string& path) {
    if (!value.is_object()) {
        return invalid_params("Part must be an object", path);
    }

    const auto type = value.find("type");
    if (type == value.end() || !type->is_string()) {
        return invalid_params("Part type must be \"text\", \"file\", or \"data\"",
                              path + ".type");
    }

    const std::string kind = type->get<std::string>();
    if (kind == "text") {
        const auto text = value.find("text");
        if (text == value.end() || !text->is_string()) {
            return invalid_params("TextPart must have a text string", path + ".text");
        }
        return Ok{};
    }

    if (kind == "file") {
        const auto file = value.find("file");
        if (file == value.end() || !file->is_object()) {
            return invalid_params("FilePart must have a file object", path + ".file");
        }
        return validate_file_content(*file, path + ".file");
    }

    if (kind == "data") {
        const auto data = value.find("data");
        if (data == value.end() || data->is_null()) {
            return invalid_params("DataPart must have data", path + ".data");
        }
        if (!data->is_object() && !data->is_array()) {
            return invalid_params("DataPart data must be an object or array",
                                  path + ".data");
        }
        return Ok{};
    }

    return invalid_params("Part type must be \"text\", \"file\", or \"data\"",
                          path + ".type");
}

Result<Ok> validate_file_content(const json& value, const std::string& path) {
    if (!value.is_object()) {
        return invalid_params("FileContent must be an object", path);
    }

    const auto bytes = value.find("bytes");
    const auto uri = value.find("uri");
    const bool has_bytes = bytes != value.end() && bytes->is_string();
    const bool has_uri = uri != value.end() && uri->is_string();

    if (!has_bytes && !has_uri) {
        return invalid_params("FileContent must have either bytes or uri", path);
    }
    if (has_bytes && has_uri) {
        return invalid_params("FileContent cannot have both bytes and uri", path);
    }
    return Ok{};
}

Result<Ok> validate_task_id(const json& value, const std::string& field) {
    if (!value.is_string() || value.get_ref<const std::string&>().empty()) {
        return invalid_params("Task ID must be a non-empty string", field);
    }
    return Ok{};
}

bool is_valid_message(const json& value) {
    return !core::errors::is_error(validate_message(value));
}

bool is_valid_part(const json& value) {
    return !core::errors::is_error(validate_part(value));
}

}  // namespace a2a::protocol
