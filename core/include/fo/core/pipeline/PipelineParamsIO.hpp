#pragma once

#include <filesystem>

#include <nlohmann/json_fwd.hpp>

namespace fo {
struct PipelineParams;
}

namespace fo::params {
PipelineParams parseFromJson(const nlohmann::json& j);
nlohmann::json toJson(const PipelineParams& p);
void applyJsonOverlay(PipelineParams& base, const nlohmann::json& overlay);
PipelineParams loadFromFile(const std::filesystem::path& path);
}  // namespace fo::params
