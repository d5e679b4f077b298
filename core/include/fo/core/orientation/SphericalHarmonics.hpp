#pragma once

#include <cstddef>
#include <vector>

#include <opencv2/core.hpp>

namespace fo {

/**
 * @brief Real, orthonormal spherical harmonics of even degree.
 *
 * Coefficients are ordered by degree l = 0, 2, ..., maxDegree and, within
 * a degree, by order m = -l..l. Odd degrees are omitted since fiber
 * orientations are antipodally symmetric. Angles follow the ZYX layout:
 * theta is measured from the Z axis, phi = atan2(y, x).
 */
class SphericalHarmonics {
public:
    explicit SphericalHarmonics(int maxDegree);

    int maxDegree() const { return maxDegree_; }
    std::size_t numCoefficients() const { return count_; }

    static std::size_t coefficientCount(int maxDegree);

    /// Evaluate all basis functions at unit direction v; out gets numCoefficients values.
    void evaluate(const cv::Vec3f& v, float* out) const;

private:
    int maxDegree_;
    std::size_t count_;
};

}  // namespace fo
