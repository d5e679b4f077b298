#pragma once

#include <array>

#include <opencv2/core.hpp>

namespace fo {

/**
 * @brief Eigen-decomposition of a real symmetric 3x3 matrix.
 *
 * Eigenpairs are ordered by ascending eigenvalue magnitude,
 * |values[0]| <= |values[1]| <= |values[2]|. Equal magnitudes keep the
 * order produced by the solver (descending signed value), so the result
 * is deterministic for a given input.
 */
struct SymmetricEigen {
    std::array<double, 3> values{0.0, 0.0, 0.0};
    std::array<cv::Vec3d, 3> vectors;  ///< Unit eigenvectors, ZYX components
};

SymmetricEigen decomposeSymmetric(const cv::Matx33d& m);

/// Hessian stored as six components: zz, zy, zx, yy, yx, xx.
SymmetricEigen decomposeHessian(const float* h);

/**
 * @brief Map an orientation to its representative on the upper hemisphere.
 *
 * v and -v are the same orientation. The representative has z > 0; on the
 * z == 0 equator y > 0; on the y axis circle x > 0. canonicalOrientation(v)
 * and canonicalOrientation(-v) compare equal bit for bit.
 */
cv::Vec3f canonicalOrientation(const cv::Vec3f& v);

}  // namespace fo
