#include "fo/core/pipeline/PipelineParams.hpp"

#include "fo/core/util/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <set>
#include <sstream>

namespace fo {

std::vector<double> resolvedScales(const PipelineParams& p)
{
    if (std::isnan(p.scale_step_um)) {
        throw ConfigurationError("scale_step_um must be finite");
    }
    if (p.scale_step_um <= 0.0) {
        return p.scales_um;
    }
    if (!std::isfinite(p.scale_step_um) || !std::isfinite(p.scale_min_um) ||
        !std::isfinite(p.scale_max_um)) {
        throw ConfigurationError("scale range bounds and step must be finite");
    }
    if (!(p.scale_min_um > 0.0) || p.scale_max_um < p.scale_min_um) {
        throw ConfigurationError("scale range requires 0 < scale_min_um <= scale_max_um");
    }
    const double steps = std::floor((p.scale_max_um - p.scale_min_um) / p.scale_step_um + 1e-9);
    if (!(steps < static_cast<double>(kMaxScales))) {
        throw ConfigurationError("scale range yields more than " + std::to_string(kMaxScales) +
                                 " scales");
    }
    std::vector<double> scales;
    const auto n = static_cast<std::size_t>(steps) + 1;
    for (std::size_t i = 0; i < n; ++i) {
        scales.push_back(p.scale_min_um + static_cast<double>(i) * p.scale_step_um);
    }
    return scales;
}

std::vector<OdfResolution> resolvedOdfResolutions(const PipelineParams& p,
                                                  const std::array<double, 3>& spacingUm)
{
    std::vector<OdfResolution> out;
    std::set<std::string> labels;
    const bool multi = (p.odf_res_um.empty() ? p.odf_blocks.size() : p.odf_res_um.size()) > 1;

    auto add = [&](OdfResolution r, const std::string& label) {
        r.label = multi ? label : std::string();
        if (!labels.insert(label).second) {
            throw ConfigurationError("duplicate ODF resolution " + label);
        }
        out.push_back(std::move(r));
    };

    if (p.odf_res_um.empty()) {
        for (std::size_t b : p.odf_blocks) {
            add({{b, b, b}, {}}, std::to_string(b) + "vx");
        }
        return out;
    }
    for (double res : p.odf_res_um) {
        OdfResolution r;
        for (int a = 0; a < 3; ++a) {
            r.blockShape[a] = static_cast<std::size_t>(std::max(1.0, std::round(res / spacingUm[a])));
        }
        std::ostringstream oss;
        oss << res << "um";
        add(r, oss.str());
    }
    return out;
}

std::size_t odfAlignment(const std::vector<OdfResolution>& resolutions)
{
    std::size_t l = 1;
    for (const auto& r : resolutions) {
        for (std::size_t b : r.blockShape) l = std::lcm(l, b);
    }
    return l;
}

void validate(const PipelineParams& p)
{
    auto scales = resolvedScales(p);
    if (scales.empty()) {
        throw ConfigurationError("at least one scale is required");
    }
    if (scales.size() > kMaxScales) {
        throw ConfigurationError("at most " + std::to_string(kMaxScales) + " scales are supported");
    }
    for (std::size_t i = 0; i < scales.size(); ++i) {
        if (!(scales[i] > 0.0) || !std::isfinite(scales[i])) {
            throw ConfigurationError("scales must be positive, got " + std::to_string(scales[i]));
        }
        if (i > 0 && !(scales[i] > scales[i - 1])) {
            throw ConfigurationError("scales must be strictly increasing");
        }
    }
    if (!(p.alpha > 0.0) || !(p.beta > 0.0)) {
        throw ConfigurationError("alpha and beta must be positive");
    }
    if (!std::isfinite(p.gamma)) {
        throw ConfigurationError("gamma must be finite");
    }
    if (!std::isfinite(p.intensity_max)) {
        throw ConfigurationError("intensity_max must be finite");
    }
    if (p.psf_fwhm_um) {
        for (double f : *p.psf_fwhm_um) {
            if (!(f > 0.0) || !std::isfinite(f)) {
                throw ConfigurationError("psf_fwhm_um values must be positive");
            }
        }
    }
    if (!(p.kernel_truncate >= 1.0)) {
        throw ConfigurationError("kernel_truncate must be >= 1");
    }
    if (!(p.noise_floor >= 0.0)) {
        throw ConfigurationError("noise_floor must be >= 0");
    }
    if (p.odf_res_um.empty()) {
        if (p.odf_blocks.empty()) {
            throw ConfigurationError("at least one ODF block size is required");
        }
        std::size_t align = 1;
        for (std::size_t b : p.odf_blocks) {
            if (b == 0) {
                throw ConfigurationError("odf_blocks must be positive");
            }
            align = std::lcm(align, b);
        }
        if (p.tile_core != 0 && p.tile_core % align != 0) {
            throw ConfigurationError("tile_core (" + std::to_string(p.tile_core) +
                                     ") must be a multiple of the ODF block size (" +
                                     std::to_string(align) + ")");
        }
    } else {
        for (double r : p.odf_res_um) {
            if (!(r > 0.0) || !std::isfinite(r)) {
                throw ConfigurationError("odf_res_um values must be positive");
            }
        }
    }
    if (!(p.odf_min_fill >= 0.0 && p.odf_min_fill < 1.0)) {
        throw ConfigurationError("odf_min_fill must be in [0, 1)");
    }
    if (!(p.odf_energy_factor >= 0.0) || !std::isfinite(p.odf_energy_factor)) {
        throw ConfigurationError("odf_energy_factor must be >= 0");
    }
    if (p.halo < -1) {
        throw ConfigurationError("halo must be -1 (auto) or >= 0");
    }
    if (!(p.memory_budget_mb > 0.0)) {
        throw ConfigurationError("memory_budget_mb must be positive");
    }
    if (p.odf_bins < 1) {
        throw ConfigurationError("odf_bins must be >= 1");
    }
    if (p.sh_degree < 0 || p.sh_degree > 10 || p.sh_degree % 2 != 0) {
        throw ConfigurationError("sh_degree must be even and in [0, 10]");
    }
    if (p.workers < 0) {
        throw ConfigurationError("workers must be >= 0");
    }
    if (p.retry_limit < 0) {
        throw ConfigurationError("retry_limit must be >= 0");
    }
    if (p.spacing_um) {
        for (double s : *p.spacing_um) {
            if (!(s > 0.0) || !std::isfinite(s)) {
                throw ConfigurationError("voxel spacing must be positive");
            }
        }
    }
}

std::string polarityToString(FiberPolarity p)
{
    return p == FiberPolarity::Bright ? "bright" : "dark";
}

FiberPolarity polarityFromString(const std::string& s)
{
    if (s == "bright") return FiberPolarity::Bright;
    if (s == "dark") return FiberPolarity::Dark;
    throw ConfigurationError("unknown fiber polarity '" + s + "' (expected bright or dark)");
}

}  // namespace fo
