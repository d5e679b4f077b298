#include "fo/core/util/LoadJson.hpp"

#include "fo/core/util/Errors.hpp"

#include <nlohmann/json.hpp>
#include <fstream>

namespace fo::json {

nlohmann::json load_json_file(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path)) {
        throw IOError("JSON file not found: " + path.string());
    }
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open JSON file: " + path.string());
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError("Invalid JSON in " + path.string() + ": " + e.what());
    }
}

void require_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> fields,
    const std::string& context)
{
    for (const char* field : fields) {
        if (!json.contains(field)) {
            throw ConfigurationError(context + " missing required field: " + field);
        }
    }
}

void require_object(const nlohmann::json& json, const std::string& context)
{
    if (!json.is_object()) {
        throw ConfigurationError(context + " must be a JSON object");
    }
}

} // namespace fo::json
