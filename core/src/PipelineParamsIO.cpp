#include "fo/core/pipeline/PipelineParamsIO.hpp"
#include "fo/core/pipeline/PipelineParams.hpp"

#include "fo/core/util/Errors.hpp"
#include "fo/core/util/LoadJson.hpp"

#include <nlohmann/json.hpp>

namespace fo::params {

PipelineParams parseFromJson(const nlohmann::json& j)
{
    PipelineParams p;
    applyJsonOverlay(p, j);
    return p;
}

nlohmann::json toJson(const PipelineParams& p)
{
    nlohmann::json j;

    j["scales_um"] = p.scales_um;
    if (p.scale_step_um > 0.0) {
        j["scale_min_um"] = p.scale_min_um;
        j["scale_max_um"] = p.scale_max_um;
        j["scale_step_um"] = p.scale_step_um;
    }

    j["alpha"] = p.alpha;
    j["beta"] = p.beta;
    j["gamma"] = p.gamma;
    j["polarity"] = polarityToString(p.polarity);
    j["kernel_truncate"] = p.kernel_truncate;
    j["intensity_max"] = p.intensity_max;
    if (p.psf_fwhm_um) {
        j["psf_fwhm_um"] = *p.psf_fwhm_um;
    }

    j["noise_floor"] = p.noise_floor;

    j["tile_core"] = p.tile_core;
    j["halo"] = p.halo;
    j["memory_budget_mb"] = p.memory_budget_mb;

    j["odf_blocks"] = p.odf_blocks;
    if (!p.odf_res_um.empty()) {
        j["odf_res_um"] = p.odf_res_um;
    }
    j["odf_bins"] = p.odf_bins;
    j["sh_degree"] = p.sh_degree;
    j["odf_min_fill"] = p.odf_min_fill;
    j["odf_energy_factor"] = p.odf_energy_factor;

    j["workers"] = p.workers;
    j["batch_size"] = p.batch_size;
    j["retry_limit"] = p.retry_limit;

    if (p.spacing_um) {
        j["spacing_um"] = *p.spacing_um;
    }
    return j;
}

void applyJsonOverlay(PipelineParams& base, const nlohmann::json& overlay)
{
    fo::json::require_object(overlay, "pipeline parameters");

    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const auto& key = it.key();
        const auto& val = it.value();

        try {
            if (key == "scales_um") base.scales_um = val.get<std::vector<double>>();
            else if (key == "scale_min_um") base.scale_min_um = val.get<double>();
            else if (key == "scale_max_um") base.scale_max_um = val.get<double>();
            else if (key == "scale_step_um") base.scale_step_um = val.get<double>();
            else if (key == "alpha") base.alpha = val.get<double>();
            else if (key == "beta") base.beta = val.get<double>();
            else if (key == "gamma") base.gamma = val.is_null() ? -1.0 : val.get<double>();
            else if (key == "polarity") base.polarity = polarityFromString(val.get<std::string>());
            else if (key == "kernel_truncate") base.kernel_truncate = val.get<double>();
            else if (key == "intensity_max") base.intensity_max = val.is_null() ? 0.0 : val.get<double>();
            else if (key == "psf_fwhm_um") {
                if (val.is_null()) base.psf_fwhm_um.reset();
                else base.psf_fwhm_um = val.get<std::array<double, 3>>();
            }
            else if (key == "noise_floor") base.noise_floor = val.get<double>();
            else if (key == "tile_core") base.tile_core = val.get<std::size_t>();
            else if (key == "halo") base.halo = val.get<int>();
            else if (key == "memory_budget_mb") base.memory_budget_mb = val.get<double>();
            else if (key == "odf_blocks") {
                if (val.is_number()) base.odf_blocks = {val.get<std::size_t>()};
                else base.odf_blocks = val.get<std::vector<std::size_t>>();
            }
            else if (key == "odf_res_um") {
                if (val.is_null()) base.odf_res_um.clear();
                else if (val.is_number()) base.odf_res_um = {val.get<double>()};
                else base.odf_res_um = val.get<std::vector<double>>();
            }
            else if (key == "odf_bins") base.odf_bins = val.get<int>();
            else if (key == "sh_degree") base.sh_degree = val.get<int>();
            else if (key == "odf_min_fill") base.odf_min_fill = val.get<double>();
            else if (key == "odf_energy_factor") base.odf_energy_factor = val.get<double>();
            else if (key == "workers") base.workers = val.get<int>();
            else if (key == "batch_size") base.batch_size = val.get<std::size_t>();
            else if (key == "retry_limit") base.retry_limit = val.get<int>();
            else if (key == "spacing_um") {
                if (val.is_null()) base.spacing_um.reset();
                else base.spacing_um = val.get<std::array<double, 3>>();
            }
            else {
                throw ConfigurationError("unknown pipeline parameter '" + key + "'");
            }
        } catch (const nlohmann::json::exception& e) {
            throw ConfigurationError("pipeline parameter '" + key + "': " + e.what());
        }
    }
}

PipelineParams loadFromFile(const std::filesystem::path& path)
{
    auto j = fo::json::load_json_file(path);
    return parseFromJson(j);
}

}  // namespace fo::params
