// LoadJson.hpp - JSON loading and validation helpers
#pragma once

#include <nlohmann/json_fwd.hpp>
#include <filesystem>
#include <initializer_list>
#include <string>

namespace fo::json {

/**
 * Parse a JSON file.
 * @throws fo::IOError if the file is missing or unreadable
 * @throws fo::ConfigurationError if the content is not valid JSON
 */
nlohmann::json load_json_file(const std::filesystem::path& path);

/**
 * Ensure all required fields exist in a JSON object.
 * @throws fo::ConfigurationError naming the first missing field
 */
void require_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> fields,
    const std::string& context);

// Ensure json is an object; context is used in the error message.
void require_object(const nlohmann::json& json, const std::string& context);

} // namespace fo::json
