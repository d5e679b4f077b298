#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include <nlohmann/json_fwd.hpp>
#include <opencv2/core.hpp>
#include <xtensor/containers/xarray.hpp>

#include "fo/core/types/Box.hpp"
#include "fo/core/types/Dtype.hpp"

namespace fo {

/// Straight fiber with a Gaussian cross-section. Endpoints in voxels (z, y, x).
struct FiberSegment {
    cv::Vec3d start;
    cv::Vec3d end;
    double radiusUm = 2.0;
    double intensity = 1.0;   ///< Peak, as a fraction of the dtype range
};

struct PhantomSpec {
    Shape3 shape{64, 64, 64};
    std::array<double, 3> spacing{1.0, 1.0, 1.0};
    Dtype dtype = Dtype::Float32;
    double background = 0.0;  ///< Fraction of the dtype range
    double noiseSigma = 0.0;  ///< Gaussian noise, fraction of the dtype range
    std::uint32_t seed = 0;
    std::vector<FiberSegment> fibers;
};

/**
 * @brief Render a synthetic fiber volume.
 *
 * Overlapping fibers combine with max. Values are scaled to the dtype's
 * nominal range and clamped to it; integer types are also rounded.
 */
xt::xarray<float> renderPhantom(const PhantomSpec& spec);

/**
 * @brief Parse a phantom description.
 *
 * Required: "shape" [z, y, x] and "fibers", a list of objects with
 * "start", "end" and "radius_um". Optional: "spacing_um", "dtype",
 * "background", "noise_sigma", "seed", per-fiber "intensity".
 *
 * @throws fo::ConfigurationError on missing or invalid fields
 */
PhantomSpec phantomFromJson(const nlohmann::json& j);

}  // namespace fo
