#include "fo/core/orientation/OrientationEstimator.hpp"

#include "fo/core/filter/SymmetricEigen.hpp"
#include "fo/core/util/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace fo {

xt::xtensor<int, 3> selectScales(const ScaleSpace& space, double noiseFloor)
{
    const auto& core = space.core;
    auto index = xt::xtensor<int, 3>::from_shape({core.extent[0], core.extent[1], core.extent[2]});

    for (std::size_t z = 0; z < core.extent[0]; ++z) {
        for (std::size_t y = 0; y < core.extent[1]; ++y) {
            for (std::size_t x = 0; x < core.extent[2]; ++x) {
                float best = -std::numeric_limits<float>::infinity();
                int bestIdx = -1;
                for (std::size_t s = 0; s < space.levels.size(); ++s) {
                    const float r = space.levels[s].response(
                        core.offset[0] + z, core.offset[1] + y, core.offset[2] + x);
                    if (r > best) {
                        best = r;
                        bestIdx = static_cast<int>(s);
                    }
                }
                index(z, y, x) = (best > noiseFloor) ? bestIdx : -1;
            }
        }
    }
    return index;
}

float eigenCoherence(const std::array<double, 3>& lambda)
{
    const double a1 = std::abs(lambda[0]);
    const double a2 = std::abs(lambda[1]);
    if (!(a2 > 0.0)) return 0.0f;
    return static_cast<float>(std::clamp((a2 - a1) / a2, 0.0, 1.0));
}

float fractionalAnisotropy(const std::array<double, 3>& lambda)
{
    const double norm2 = lambda[0] * lambda[0] + lambda[1] * lambda[1] + lambda[2] * lambda[2];
    if (!(norm2 > 0.0)) return 0.0f;
    const double mean = (lambda[0] + lambda[1] + lambda[2]) / 3.0;
    double dev2 = 0.0;
    for (double l : lambda) dev2 += (l - mean) * (l - mean);
    const double fa = std::sqrt(1.5 * dev2 / norm2);
    return static_cast<float>(std::clamp(fa, 0.0, 1.0));
}

OrientationField estimateOrientation(const ScaleSpace& space, double noiseFloor)
{
    const auto& core = space.core;
    const std::array<std::size_t, 3> shp{core.extent[0], core.extent[1], core.extent[2]};

    OrientationField field;
    field.shape = core.extent;
    field.vectors = xt::xtensor<float, 4>::from_shape({shp[0], shp[1], shp[2], std::size_t(3)});
    field.coherence = xt::xtensor<float, 3>::from_shape(shp);
    field.anisotropy = xt::xtensor<float, 3>::from_shape(shp);
    field.response = xt::xtensor<float, 3>::from_shape(shp);
    field.scale = xt::xtensor<float, 3>::from_shape(shp);
    field.valid = xt::xtensor<std::uint8_t, 3>::from_shape(shp);
    field.scaleHistogram.assign(space.levels.size(), 0);

    const auto selected = selectScales(space, noiseFloor);

    for (std::size_t z = 0; z < shp[0]; ++z) {
        for (std::size_t y = 0; y < shp[1]; ++y) {
            for (std::size_t x = 0; x < shp[2]; ++x) {
                const int s = selected(z, y, x);
                if (s < 0) {
                    for (int c = 0; c < 3; ++c) field.vectors(z, y, x, c) = 0.0f;
                    field.coherence(z, y, x) = 0.0f;
                    field.anisotropy(z, y, x) = 0.0f;
                    field.response(z, y, x) = 0.0f;
                    field.scale(z, y, x) = 0.0f;
                    field.valid(z, y, x) = 0;
                    continue;
                }

                const auto& level = space.levels[static_cast<std::size_t>(s)];
                const auto eig = decomposeHessian(&level.hessian(z, y, x, 0));
                const auto& axis = eig.vectors[0];
                const cv::Vec3f v = canonicalOrientation(
                    cv::Vec3f(static_cast<float>(axis[0]), static_cast<float>(axis[1]),
                              static_cast<float>(axis[2])));

                for (int c = 0; c < 3; ++c) field.vectors(z, y, x, c) = v[c];
                field.coherence(z, y, x) = eigenCoherence(eig.values);
                field.anisotropy(z, y, x) = fractionalAnisotropy(eig.values);
                field.response(z, y, x) = level.response(
                    core.offset[0] + z, core.offset[1] + y, core.offset[2] + x);
                field.scale(z, y, x) = static_cast<float>(level.sigmaUm);
                field.valid(z, y, x) = 1;
                ++field.validVoxels;
                ++field.scaleHistogram[static_cast<std::size_t>(s)];
            }
        }
    }
    return field;
}

OrientationField orientationFromVectors(const xt::xtensor<float, 4>& vectors, double noiseFloor)
{
    if (vectors.shape()[3] != 3) {
        throw ShapeMismatchError("fiber vectors need 3 channels, got " +
                                 std::to_string(vectors.shape()[3]));
    }
    const std::array<std::size_t, 3> shp{vectors.shape()[0], vectors.shape()[1], vectors.shape()[2]};

    OrientationField field;
    field.shape = {shp[0], shp[1], shp[2]};
    field.vectors = xt::xtensor<float, 4>::from_shape({shp[0], shp[1], shp[2], std::size_t(3)});
    field.coherence = xt::xtensor<float, 3>::from_shape(shp);
    field.anisotropy = xt::xtensor<float, 3>::from_shape(shp);
    field.response = xt::xtensor<float, 3>::from_shape(shp);
    field.scale = xt::xtensor<float, 3>::from_shape(shp);
    field.valid = xt::xtensor<std::uint8_t, 3>::from_shape(shp);
    std::fill(field.anisotropy.begin(), field.anisotropy.end(), 0.0f);
    std::fill(field.scale.begin(), field.scale.end(), 0.0f);

    for (std::size_t z = 0; z < shp[0]; ++z) {
        for (std::size_t y = 0; y < shp[1]; ++y) {
            for (std::size_t x = 0; x < shp[2]; ++x) {
                const cv::Vec3f v(vectors(z, y, x, 0), vectors(z, y, x, 1), vectors(z, y, x, 2));
                const bool finite = std::isfinite(v[0]) && std::isfinite(v[1]) && std::isfinite(v[2]);
                const double n = finite ? cv::norm(v) : 0.0;
                if (!finite || !(n > noiseFloor)) {
                    if (!finite) ++field.nonFiniteVoxels;
                    for (int c = 0; c < 3; ++c) field.vectors(z, y, x, c) = 0.0f;
                    field.coherence(z, y, x) = 0.0f;
                    field.response(z, y, x) = 0.0f;
                    field.valid(z, y, x) = 0;
                    continue;
                }
                const cv::Vec3f u = canonicalOrientation(v * static_cast<float>(1.0 / n));
                for (int c = 0; c < 3; ++c) field.vectors(z, y, x, c) = u[c];
                field.coherence(z, y, x) = static_cast<float>(std::min(n, 1.0));
                field.response(z, y, x) = static_cast<float>(n);
                field.valid(z, y, x) = 1;
                ++field.validVoxels;
            }
        }
    }
    return field;
}

}  // namespace fo
