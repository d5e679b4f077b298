#pragma once

#include <array>
#include <cstddef>
#include <vector>

#include "fo/core/types/Box.hpp"
#include "fo/core/types/Dtype.hpp"

namespace fo {

/**
 * @brief Immutable description of an opened volume or output map.
 *
 * Shape is ZYX, optionally followed by one channel axis (ZYXC).
 * Spacing is the physical voxel size in micrometers, ZYX order.
 */
struct VolumeInfo {
    std::vector<std::size_t> shape;
    Dtype dtype = Dtype::Float32;
    std::array<double, 3> spacing{1.0, 1.0, 1.0};

    std::size_t rank() const { return shape.size(); }
    std::size_t channels() const { return shape.size() > 3 ? shape[3] : 1; }
    Shape3 spatialShape() const
    {
        return {shape.size() > 0 ? shape[0] : 0, shape.size() > 1 ? shape[1] : 0,
                shape.size() > 2 ? shape[2] : 0};
    }
};

}  // namespace fo
