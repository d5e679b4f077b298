#pragma once

#include <vector>

#include <xtensor/containers/xtensor.hpp>

namespace fo {

/// Kernel half-width for a Gaussian of the given sigma: ceil(truncate * sigma).
int kernelRadius(double sigma, double truncate);

/// Sampled Gaussian, normalized to unit sum.
std::vector<float> gaussianKernel1D(double sigma, double truncate);

/// First derivative of a Gaussian; exact on linear ramps.
std::vector<float> gaussianDerivKernel1D(double sigma, double truncate);

/// Second derivative of a Gaussian; zero-sum and exact on quadratics.
std::vector<float> gaussianDeriv2Kernel1D(double sigma, double truncate);

/**
 * @brief Convolve a ZYX volume with a 1D kernel along one axis.
 *
 * Samples outside the volume are clamped to the nearest edge voxel.
 *
 * @param axis 0 = Z, 1 = Y, 2 = X
 */
void convolveAxis(const xt::xtensor<float, 3>& in, xt::xtensor<float, 3>& out,
                  const std::vector<float>& kernel, int axis);

}  // namespace fo
