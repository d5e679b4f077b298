#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <xtensor/containers/xtensor.hpp>

#include "fo/core/pipeline/PipelineParams.hpp"
#include "fo/core/types/Box.hpp"

namespace fo {

// ============================================================================
// Frangi tubularity filter bank
// ============================================================================

/**
 * @brief Parameters of the Frangi vesselness measure
 *
 * Frangi et al. "Multiscale vessel enhancement filtering", MICCAI 1998.
 */
struct FrangiParams {
    double alpha = 0.001;    ///< Sensitivity to the plate/line ratio RA
    double beta = 1.0;       ///< Sensitivity to the blob/line ratio RB
    double gamma = 0.5;      ///< Structureness threshold, must be > 0
    FiberPolarity polarity = FiberPolarity::Bright;
    double truncate = 4.0;   ///< Gaussian kernel support in sigmas
    double intensityMax = 0.0;  ///< Inputs outside [0, intensityMax] are masked; <= 0 disables
    std::array<double, 3> psfSigmaUm{0.0, 0.0, 0.0};  ///< Extra blur per axis, added in quadrature
};

/// Response and core-region Hessian of one scale.
struct ScaleLevel {
    double sigmaUm = 0.0;
    std::array<double, 3> sigmaPx{0.0, 0.0, 0.0};
    xt::xtensor<float, 3> response;  ///< Same shape as the halo window
    xt::xtensor<float, 4> hessian;   ///< Core shape x 6: zz, zy, zx, yy, yx, xx
};

/// Per-tile multiscale responses. Ephemeral; dropped after scale selection.
struct ScaleSpace {
    Box3 core;                       ///< Core region inside the halo window
    std::vector<ScaleLevel> levels;  ///< Ascending scale
    std::size_t nonFiniteVoxels = 0; ///< Non-finite input voxels in the core
    std::size_t outOfRangeVoxels = 0; ///< Core voxels outside [0, intensityMax]
};

/**
 * @brief Frangi vesselness of one voxel
 * @param lambda Eigenvalues sorted by ascending magnitude
 * @return Response in [0, 1]; 0 when the sign pattern does not match the polarity
 */
double frangiResponse(const std::array<double, 3>& lambda, const FrangiParams& params);

/**
 * @brief Per-axis Gaussian sigma (um) that blurs every axis up to the
 * widest point spread function.
 * @param fwhmUm PSF full width at half maximum, ZYX
 */
std::array<double, 3> psfCorrectionSigma(const std::array<double, 3>& fwhmUm);

class FrangiFilterBank {
public:
    /**
     * @param scalesUm Candidate fiber scales in micrometers, strictly increasing
     * @param spacingUm Voxel spacing ZYX in micrometers
     * @throws fo::ConfigurationError on invalid scales, spacing or parameters
     */
    FrangiFilterBank(FrangiParams params, std::vector<double> scalesUm,
                     std::array<double, 3> spacingUm);

    const FrangiParams& params() const { return params_; }
    const std::vector<double>& scales() const { return scalesUm_; }

    /// Sigma of a scale along each axis, in voxels, including PSF correction.
    std::array<double, 3> sigmaPx(std::size_t scaleIndex) const;

    /// Voxels of context needed per axis for exact responses at the largest scale.
    Shape3 supportRadius() const;

    /**
     * @brief Filter one halo window
     *
     * Non-finite input voxels are replaced by zero before smoothing, and
     * out-of-range voxels are clamped to [0, intensityMax]. Both get a zero
     * response at every scale and are counted when they lie in the core.
     *
     * @param window Tile data including halo (ZYX)
     * @param core Core region inside the window
     */
    ScaleSpace apply(const xt::xtensor<float, 3>& window, const Box3& core) const;

private:
    FrangiParams params_;
    std::vector<double> scalesUm_;
    std::array<double, 3> spacingUm_;
};

}  // namespace fo
