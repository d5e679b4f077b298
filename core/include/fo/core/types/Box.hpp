#pragma once

#include <array>
#include <cstddef>
#include <ostream>
#include <vector>

namespace fo {

/// ZYX extent or coordinate of a 3D grid.
using Shape3 = std::array<std::size_t, 3>;

/**
 * @brief Axis-aligned box on the voxel grid, half-open [offset, offset+extent).
 */
struct Box3 {
    Shape3 offset{0, 0, 0};
    Shape3 extent{0, 0, 0};

    std::size_t voxels() const { return extent[0] * extent[1] * extent[2]; }
    bool empty() const { return voxels() == 0; }

    Shape3 end() const
    {
        return {offset[0] + extent[0], offset[1] + extent[1], offset[2] + extent[2]};
    }

    bool contains(const Box3& other) const
    {
        for (int a = 0; a < 3; ++a) {
            if (other.offset[a] < offset[a] || other.offset[a] + other.extent[a] > offset[a] + extent[a])
                return false;
        }
        return true;
    }

    std::vector<std::size_t> offsetVec() const { return {offset[0], offset[1], offset[2]}; }
    std::vector<std::size_t> extentVec() const { return {extent[0], extent[1], extent[2]}; }

    bool operator==(const Box3&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const Box3& b)
{
    return os << "[" << b.offset[0] << "," << b.offset[1] << "," << b.offset[2] << " +"
              << b.extent[0] << "x" << b.extent[1] << "x" << b.extent[2] << "]";
}

}  // namespace fo
