#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "fo/core/types/Box.hpp"

namespace fo {

enum class FiberPolarity { Bright, Dark };

/// Upper bound on the number of filter scales in one run.
inline constexpr std::size_t kMaxScales = 64;

struct PipelineParams {
    // === Scales (micrometers) ===
    std::vector<double> scales_um{1.25};  // explicit list, strictly increasing
    double scale_min_um = 0.0;            // range form, used when scale_step_um > 0
    double scale_max_um = 0.0;
    double scale_step_um = 0.0;

    // === Frangi tubularity ===
    double alpha = 0.001;                 // plate vs line sensitivity
    double beta = 1.0;                    // blob vs line sensitivity
    double gamma = -1.0;                  // structureness; <= 0 = auto (half the intensity max)
    FiberPolarity polarity = FiberPolarity::Bright;
    double kernel_truncate = 4.0;         // Gaussian support in sigmas
    double intensity_max = 0.0;           // valid input range is [0, max]; <= 0 = dtype range
    std::optional<std::array<double, 3>> psf_fwhm_um;  // ZYX; equalizes axial blur when set

    // === Orientation ===
    double noise_floor = 1e-3;            // responses not above this are null

    // === Tiling ===
    std::size_t tile_core = 0;            // voxels per side; 0 = auto from memory budget
    int halo = -1;                        // voxels; -1 = filter support radius
    double memory_budget_mb = 2048.0;     // shared by all in-flight tiles

    // === ODF ===
    std::vector<std::size_t> odf_blocks{16};  // voxels per block side, one map set each
    std::vector<double> odf_res_um;       // block sides in um; replaces odf_blocks when set
    int odf_bins = 64;                    // hemisphere direction bins
    int sh_degree = 6;                    // even, 0..10
    double odf_min_fill = 0.5;            // edge blocks at or below this fraction are empty
    double odf_energy_factor = 1.0;       // blocks need energy >= factor * sqrt(voxels)

    // === Execution ===
    int workers = 0;                      // 0 = all hardware threads
    std::size_t batch_size = 0;           // 0 = 2 x workers
    int retry_limit = 2;                  // extra attempts per tile

    std::optional<std::array<double, 3>> spacing_um;  // overrides stored voxel size
};

/// One ODF map set: block shape in voxels and the suffix of its map names.
struct OdfResolution {
    Shape3 blockShape{16, 16, 16};
    std::string label;                    ///< Empty when the run has a single resolution
};

/// Scales in micrometers after expanding the range form.
std::vector<double> resolvedScales(const PipelineParams& p);

/**
 * @brief ODF resolutions of a run for the given voxel spacing.
 *
 * Micrometer sizes become max(1, round(size / spacing)) voxels per axis.
 * @throws fo::ConfigurationError on duplicate resolutions
 */
std::vector<OdfResolution> resolvedOdfResolutions(const PipelineParams& p,
                                                  const std::array<double, 3>& spacingUm);

/// Least common multiple of all block sides; tile cores are multiples of it.
std::size_t odfAlignment(const std::vector<OdfResolution>& resolutions);

/// Throws fo::ConfigurationError describing the first invalid parameter.
void validate(const PipelineParams& p);

std::string polarityToString(FiberPolarity p);
FiberPolarity polarityFromString(const std::string& s);

}  // namespace fo
