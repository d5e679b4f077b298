#include "fo/core/synth/Phantom.hpp"

#include "fo/core/util/Errors.hpp"
#include "fo/core/util/LoadJson.hpp"

#include <algorithm>
#include <cmath>
#include <random>

#include <nlohmann/json.hpp>

namespace fo {

namespace {

// Distance in micrometers from p to the segment [a, b]; coordinates in voxels.
double segmentDistanceUm(const cv::Vec3d& p, const cv::Vec3d& a, const cv::Vec3d& b,
                         const std::array<double, 3>& sp)
{
    const cv::Vec3d scale(sp[0], sp[1], sp[2]);
    const cv::Vec3d pa = (p - a).mul(scale);
    const cv::Vec3d ba = (b - a).mul(scale);
    const double len2 = ba.dot(ba);
    const double t = len2 > 0.0 ? std::clamp(pa.dot(ba) / len2, 0.0, 1.0) : 0.0;
    return cv::norm(pa - t * ba);
}

cv::Vec3d vec3(const nlohmann::json& j, const char* what)
{
    const auto a = j.get<std::array<double, 3>>();
    if (!std::isfinite(a[0]) || !std::isfinite(a[1]) || !std::isfinite(a[2])) {
        throw ConfigurationError(std::string("phantom ") + what + " must be finite");
    }
    return {a[0], a[1], a[2]};
}

}  // namespace

xt::xarray<float> renderPhantom(const PhantomSpec& spec)
{
    const auto& s = spec.shape;
    if (s[0] == 0 || s[1] == 0 || s[2] == 0) {
        throw ConfigurationError("phantom shape must be non-empty");
    }
    const double range = dtypeNominalRange(spec.dtype);
    xt::xarray<float> vol = xt::xarray<float>::from_shape({s[0], s[1], s[2]});
    std::fill(vol.begin(), vol.end(), static_cast<float>(spec.background * range));

    #pragma omp parallel for collapse(2) schedule(static)
    for (int z = 0; z < static_cast<int>(s[0]); ++z) {
        for (int y = 0; y < static_cast<int>(s[1]); ++y) {
            for (std::size_t x = 0; x < s[2]; ++x) {
                const cv::Vec3d p(z, y, static_cast<double>(x));
                double v = spec.background;
                for (const auto& f : spec.fibers) {
                    const double d = segmentDistanceUm(p, f.start, f.end, spec.spacing);
                    const double r = f.radiusUm;
                    v = std::max(v, spec.background + f.intensity * std::exp(-d * d / (2.0 * r * r)));
                }
                vol(z, y, x) = static_cast<float>(v * range);
            }
        }
    }

    if (spec.noiseSigma > 0.0) {
        std::mt19937 rng(spec.seed);
        std::normal_distribution<float> noise(0.0f, static_cast<float>(spec.noiseSigma * range));
        for (auto& v : vol) v += noise(rng);
    }
    const auto hi = static_cast<float>(range);
    if (spec.dtype != Dtype::Float32) {
        for (auto& v : vol) v = std::clamp(std::round(v), 0.0f, hi);
    } else {
        for (auto& v : vol) v = std::clamp(v, 0.0f, hi);
    }
    return vol;
}

PhantomSpec phantomFromJson(const nlohmann::json& j)
{
    fo::json::require_object(j, "phantom");
    fo::json::require_fields(j, {"shape", "fibers"}, "phantom");

    PhantomSpec spec;
    try {
        spec.shape = j["shape"].get<Shape3>();
        if (j.contains("spacing_um")) spec.spacing = j["spacing_um"].get<std::array<double, 3>>();
        if (j.contains("dtype")) {
            spec.dtype = dtypeFromString(j["dtype"].get<std::string>());
            if (spec.dtype == Dtype::Unknown) {
                throw ConfigurationError("phantom dtype must be |u1, <u2 or <f4");
            }
        }
        spec.background = j.value("background", spec.background);
        spec.noiseSigma = j.value("noise_sigma", spec.noiseSigma);
        spec.seed = j.value("seed", spec.seed);

        for (const auto& f : j["fibers"]) {
            fo::json::require_fields(f, {"start", "end", "radius_um"}, "phantom fiber");
            FiberSegment seg;
            seg.start = vec3(f["start"], "fiber start");
            seg.end = vec3(f["end"], "fiber end");
            seg.radiusUm = f["radius_um"].get<double>();
            seg.intensity = f.value("intensity", seg.intensity);
            if (!(seg.radiusUm > 0.0)) {
                throw ConfigurationError("phantom fiber radius_um must be positive");
            }
            spec.fibers.push_back(seg);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("phantom: ") + e.what());
    }
    return spec;
}

}  // namespace fo
