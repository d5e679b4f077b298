#pragma once

#include <cstddef>
#include <vector>

#include <opencv2/core.hpp>

namespace fo {

/**
 * @brief Fixed set of orientation bins covering the upper hemisphere.
 *
 * Bin centers follow a Fibonacci lattice on z > 0 (ZYX components).
 * Since orientations are axial, v and -v fall into the same bin.
 */
class DirectionBins {
public:
    explicit DirectionBins(int count);

    std::size_t size() const { return dirs_.size(); }
    const std::vector<cv::Vec3f>& directions() const { return dirs_; }

    /// Bin with the largest |cos| to v; ties resolve to the lower index.
    std::size_t nearest(const cv::Vec3f& v) const;

private:
    std::vector<cv::Vec3f> dirs_;
};

}  // namespace fo
