#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <xtensor/containers/xtensor.hpp>

#include "fo/core/filter/FrangiFilterBank.hpp"
#include "fo/core/types/Box.hpp"

namespace fo {

/**
 * @brief Per-voxel orientation results for a tile's core region.
 *
 * Null voxels (no response above the noise floor) have a zero vector and
 * zero in every scalar map.
 */
struct OrientationField {
    Shape3 shape{0, 0, 0};
    xt::xtensor<float, 4> vectors;       ///< Z x Y x X x 3, canonical unit vectors (z, y, x)
    xt::xtensor<float, 3> coherence;     ///< (|l2| - |l1|) / |l2|
    xt::xtensor<float, 3> anisotropy;    ///< Fractional anisotropy of the eigenvalues
    xt::xtensor<float, 3> response;      ///< Tubularity at the selected scale
    xt::xtensor<float, 3> scale;         ///< Selected scale (um)
    xt::xtensor<std::uint8_t, 3> valid;
    std::size_t validVoxels = 0;
    std::size_t nonFiniteVoxels = 0;          ///< Rejected non-finite input vectors
    std::vector<std::size_t> scaleHistogram;  ///< Voxels per selected scale index
};

/**
 * @brief Pick, per core voxel, the scale with the strongest response.
 *
 * Ties go to the smaller scale. Voxels whose best response is not above
 * noiseFloor get index -1.
 */
xt::xtensor<int, 3> selectScales(const ScaleSpace& space, double noiseFloor);

/// Coherence of a magnitude-sorted eigenvalue triple, in [0, 1].
float eigenCoherence(const std::array<double, 3>& lambda);

/// Fractional anisotropy of an eigenvalue triple, in [0, 1].
float fractionalAnisotropy(const std::array<double, 3>& lambda);

/**
 * @brief Scale selection followed by orientation and coherence estimation.
 *
 * The orientation is the eigenvector of the smallest-magnitude eigenvalue
 * of the Hessian at the selected scale (the fiber axis), canonicalized to
 * the upper hemisphere.
 */
OrientationField estimateOrientation(const ScaleSpace& space, double noiseFloor);

/**
 * @brief Orientation field from precomputed fiber vectors (Z x Y x X x 3).
 *
 * A voxel is valid when its vector is finite with norm above noiseFloor.
 * The orientation is the canonicalized unit vector, the coherence is the
 * norm clamped to [0, 1] and the response is the norm. Scale and
 * anisotropy are zero.
 */
OrientationField orientationFromVectors(const xt::xtensor<float, 4>& vectors, double noiseFloor);

}  // namespace fo
