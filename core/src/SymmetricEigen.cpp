#include "fo/core/filter/SymmetricEigen.hpp"

#include <algorithm>
#include <cmath>

namespace fo {

SymmetricEigen decomposeSymmetric(const cv::Matx33d& m)
{
    cv::Vec3d evals;
    cv::Matx33d evecs;
    cv::eigen(m, evals, evecs);

    std::array<int, 3> order{0, 1, 2};
    std::stable_sort(order.begin(), order.end(), [&](int a, int b) {
        return std::abs(evals[a]) < std::abs(evals[b]);
    });

    SymmetricEigen out;
    for (int i = 0; i < 3; ++i) {
        const int k = order[i];
        out.values[i] = evals[k];
        cv::Vec3d v(evecs(k, 0), evecs(k, 1), evecs(k, 2));
        const double n = cv::norm(v);
        out.vectors[i] = n > 0.0 ? v / n : v;
    }
    return out;
}

SymmetricEigen decomposeHessian(const float* h)
{
    const cv::Matx33d m(h[0], h[1], h[2],
                        h[1], h[3], h[4],
                        h[2], h[4], h[5]);
    return decomposeSymmetric(m);
}

cv::Vec3f canonicalOrientation(const cv::Vec3f& v)
{
    bool flip = false;
    if (v[0] != 0.0f) {
        flip = v[0] < 0.0f;
    } else if (v[1] != 0.0f) {
        flip = v[1] < 0.0f;
    } else {
        flip = v[2] < 0.0f;
    }
    cv::Vec3f out = flip ? cv::Vec3f(-v[0], -v[1], -v[2]) : v;
    // collapse -0.0 so both representatives are bitwise identical
    for (int i = 0; i < 3; ++i) {
        if (out[i] == 0.0f) out[i] = 0.0f;
    }
    return out;
}

}  // namespace fo
