#include "fo/core/orientation/SphericalHarmonics.hpp"

#include "fo/core/util/Errors.hpp"

#include <boost/math/special_functions/spherical_harmonic.hpp>

#include <algorithm>
#include <cmath>

namespace fo {

SphericalHarmonics::SphericalHarmonics(int maxDegree)
    : maxDegree_(maxDegree), count_(0)
{
    if (maxDegree < 0 || maxDegree % 2 != 0) {
        throw ConfigurationError("spherical harmonic degree must be even and non-negative");
    }
    count_ = coefficientCount(maxDegree);
}

std::size_t SphericalHarmonics::coefficientCount(int maxDegree)
{
    const auto half = static_cast<std::size_t>(maxDegree / 2);
    return (half + 1) * (2 * half + 1);
}

void SphericalHarmonics::evaluate(const cv::Vec3f& v, float* out) const
{
    const double n = cv::norm(v);
    const double theta = n > 0.0 ? std::acos(std::clamp(v[0] / n, -1.0, 1.0)) : 0.0;
    const double phi = std::atan2(static_cast<double>(v[1]), static_cast<double>(v[2]));

    std::size_t k = 0;
    for (int l = 0; l <= maxDegree_; l += 2) {
        const auto ul = static_cast<unsigned>(l);
        for (int m = -l; m <= l; ++m) {
            double y;
            if (m == 0) {
                y = boost::math::spherical_harmonic_r(ul, 0, theta, phi);
            } else if (m > 0) {
                y = M_SQRT2 * boost::math::spherical_harmonic_r(ul, m, theta, phi);
            } else {
                y = M_SQRT2 * boost::math::spherical_harmonic_i(ul, -m, theta, phi);
            }
            out[k++] = static_cast<float>(y);
        }
    }
}

}  // namespace fo
