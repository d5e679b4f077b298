#include "fo/core/orientation/DirectionBins.hpp"

#include "fo/core/util/Errors.hpp"

#include <algorithm>
#include <cmath>

namespace fo {

DirectionBins::DirectionBins(int count)
{
    if (count < 1) {
        throw ConfigurationError("direction bin count must be >= 1");
    }
    const double golden = M_PI * (3.0 - std::sqrt(5.0));
    dirs_.reserve(static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) {
        const double z = 1.0 - (i + 0.5) / count;
        const double r = std::sqrt(std::max(0.0, 1.0 - z * z));
        const double phi = golden * i;
        dirs_.emplace_back(static_cast<float>(z), static_cast<float>(r * std::sin(phi)),
                           static_cast<float>(r * std::cos(phi)));
    }
}

std::size_t DirectionBins::nearest(const cv::Vec3f& v) const
{
    std::size_t best = 0;
    float bestDot = -1.0f;
    for (std::size_t i = 0; i < dirs_.size(); ++i) {
        const float d = std::abs(dirs_[i].dot(v));
        if (d > bestDot) {
            bestDot = d;
            best = i;
        }
    }
    return best;
}

}  // namespace fo
