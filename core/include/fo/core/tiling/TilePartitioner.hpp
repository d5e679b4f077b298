#pragma once

#include <array>
#include <cstddef>
#include <vector>

#include "fo/core/types/Box.hpp"

namespace fo {

/**
 * @brief One unit of work: a core region plus the halo-extended read window.
 *
 * Cores of all tiles are disjoint and cover the volume. The halo window
 * extends the core by the halo on each side, clipped at volume bounds.
 */
struct Tile {
    std::size_t id = 0;
    Box3 core;
    Box3 halo;

    /// Core region in the coordinates of the halo window.
    Box3 coreInHalo() const
    {
        return {{core.offset[0] - halo.offset[0], core.offset[1] - halo.offset[1],
                 core.offset[2] - halo.offset[2]},
                core.extent};
    }
};

struct PartitionRequest {
    Shape3 volumeShape{0, 0, 0};
    Shape3 supportRadius{0, 0, 0};   ///< Filter support per axis (voxels)
    std::size_t numScales = 1;
    std::size_t blockSize = 16;      ///< Core sizes are multiples of this
    std::size_t requestedCore = 0;   ///< 0 = largest core that fits the budget
    int requestedHalo = -1;          ///< -1 = use supportRadius
    double memoryBudgetBytes = 2048.0 * 1024.0 * 1024.0;
    int workers = 1;                 ///< Tiles resident at the same time
};

struct TilingPlan {
    Shape3 volumeShape{0, 0, 0};
    Shape3 coreSize{0, 0, 0};
    Shape3 halo{0, 0, 0};
    Shape3 gridShape{0, 0, 0};       ///< Tiles per axis
    std::size_t peakTileBytes = 0;
    std::vector<Tile> tiles;
};

/// Working-set estimate for one tile, in bytes.
std::size_t estimateTileBytes(const Shape3& haloExtent, const Shape3& coreExtent,
                              std::size_t numScales);

/**
 * @brief Split a volume into tiles with halos.
 *
 * Tiles are numbered in ZYX raster order of their cores.
 *
 * @throws fo::ConfigurationError if the volume is empty, the halo is
 *         smaller than the filter support, the core size is not a
 *         multiple of the block size, or no tile fits the memory budget
 */
TilingPlan partitionVolume(const PartitionRequest& req);

}  // namespace fo
