#pragma once

#include <cstddef>
#include <vector>

#include "fo/core/orientation/DirectionBins.hpp"
#include "fo/core/orientation/OrientationEstimator.hpp"
#include "fo/core/orientation/SphericalHarmonics.hpp"
#include "fo/core/types/Box.hpp"

namespace fo {

struct AggregatorParams {
    Shape3 blockShape{16, 16, 16};
    int bins = 64;
    int shDegree = 6;
    double minFill = 0.5;       ///< Blocks filling at most this fraction of a full block are empty
    double energyFactor = 1.0;  ///< Blocks need energy >= energyFactor * sqrt(voxels)
};

/// Orientation distribution summary of one block.
struct OdfBlock {
    Shape3 index{0, 0, 0};        ///< Global block coordinate
    std::vector<float> histogram; ///< Sums to 1 unless empty
    std::vector<float> sh;        ///< Coherence-weighted mean of the SH basis
    double energy = 0.0;          ///< Sum of coherence
    double quality = 0.0;         ///< Mean coherence
    std::size_t count = 0;        ///< Contributing voxels
    bool empty = true;            ///< No usable distribution; histogram and sh are zero
};

/// Blocks produced from one tile core, ZYX raster order.
struct OdfBlockGrid {
    Shape3 firstBlock{0, 0, 0};
    Shape3 gridShape{0, 0, 0};
    std::vector<OdfBlock> blocks;

    const OdfBlock& at(std::size_t z, std::size_t y, std::size_t x) const
    {
        return blocks[(z * gridShape[1] + y) * gridShape[2] + x];
    }
};

/**
 * @brief Bins voxel orientations of a tile core into block descriptors.
 *
 * Each non-null voxel contributes its coherence as weight to the nearest
 * direction bin and to the spherical harmonic projection. Voxels inside a
 * block are visited in ZYX order regardless of the tile layout, so block
 * results do not depend on how the volume was partitioned.
 *
 * A block is empty when it has no contributing voxels, zero energy, covers
 * at most minFill of a full block (volume edges), or its energy is below
 * energyFactor * sqrt(block voxels). Empty blocks keep their count, energy
 * and quality but carry a zero distribution.
 */
class OrientationAggregator {
public:
    explicit OrientationAggregator(AggregatorParams params);

    const Shape3& blockShape() const { return params_.blockShape; }
    const DirectionBins& bins() const { return bins_; }
    const SphericalHarmonics& harmonics() const { return sh_; }

    /// Number of blocks per axis covering a volume (edge blocks may be partial).
    Shape3 blockGridShape(const Shape3& volumeShape) const;

    /**
     * @brief Aggregate the field of the core starting at coreOffset.
     * @param volumeShape Full volume shape; a full block is clipped to it
     * @throws ShapeMismatchError if coreOffset is not block-aligned
     */
    OdfBlockGrid aggregate(const OrientationField& field, const Shape3& coreOffset,
                           const Shape3& volumeShape) const;

private:
    AggregatorParams params_;
    DirectionBins bins_;
    SphericalHarmonics sh_;
};

}  // namespace fo
