#include "fo/core/filter/GaussianKernels.hpp"

#include <algorithm>
#include <cmath>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace fo {

int kernelRadius(double sigma, double truncate)
{
    if (sigma <= 0.0) [[unlikely]] return 0;
    return std::max(1, static_cast<int>(std::ceil(truncate * sigma)));
}

std::vector<float> gaussianKernel1D(double sigma, double truncate)
{
    if (sigma <= 0.0) [[unlikely]] return {1.0f};
    const int radius = kernelRadius(sigma, truncate);
    std::vector<double> k(2 * radius + 1);
    double sum = 0.0;
    for (int i = -radius; i <= radius; ++i) {
        k[i + radius] = std::exp(-0.5 * i * i / (sigma * sigma));
        sum += k[i + radius];
    }
    std::vector<float> out(k.size());
    for (std::size_t i = 0; i < k.size(); ++i) out[i] = static_cast<float>(k[i] / sum);
    return out;
}

std::vector<float> gaussianDerivKernel1D(double sigma, double truncate)
{
    if (sigma <= 0.0) [[unlikely]] return {0.0f};
    const auto g = gaussianKernel1D(sigma, truncate);
    const int radius = static_cast<int>(g.size()) / 2;
    const double s2 = sigma * sigma;

    std::vector<double> k(g.size());
    double moment = 0.0;
    for (int i = -radius; i <= radius; ++i) {
        k[i + radius] = -i / s2 * g[i + radius];
        moment += i * k[i + radius];
    }
    // convolution of f(x) = x must give 1: sum_j j k(j) = -1
    std::vector<float> out(k.size());
    for (std::size_t i = 0; i < k.size(); ++i) out[i] = static_cast<float>(-k[i] / moment);
    return out;
}

std::vector<float> gaussianDeriv2Kernel1D(double sigma, double truncate)
{
    if (sigma <= 0.0) [[unlikely]] return {0.0f};
    const auto g = gaussianKernel1D(sigma, truncate);
    const int radius = static_cast<int>(g.size()) / 2;
    const double s2 = sigma * sigma;

    std::vector<double> k(g.size());
    double mean = 0.0;
    for (int i = -radius; i <= radius; ++i) {
        k[i + radius] = (i * i / (s2 * s2) - 1.0 / s2) * g[i + radius];
        mean += k[i + radius];
    }
    mean /= static_cast<double>(k.size());

    double moment = 0.0;
    for (int i = -radius; i <= radius; ++i) {
        k[i + radius] -= mean;
        moment += 0.5 * i * i * k[i + radius];
    }
    std::vector<float> out(k.size());
    for (std::size_t i = 0; i < k.size(); ++i) out[i] = static_cast<float>(k[i] / moment);
    return out;
}

void convolveAxis(const xt::xtensor<float, 3>& in, xt::xtensor<float, 3>& out,
                  const std::vector<float>& kernel, int axis)
{
    const int sz = static_cast<int>(in.shape()[0]);
    const int sy = static_cast<int>(in.shape()[1]);
    const int sx = static_cast<int>(in.shape()[2]);
    const int radius = static_cast<int>(kernel.size()) / 2;
    const int n[3] = {sz, sy, sx};
    const int len = n[axis];

    if (out.shape() != in.shape()) {
        out = xt::xtensor<float, 3>::from_shape(in.shape());
    }

    auto ci = [](int v, int max) { return std::max(0, std::min(max - 1, v)); };

    #pragma omp parallel for collapse(2) schedule(static)
    for (int z = 0; z < sz; ++z) {
        for (int y = 0; y < sy; ++y) {
            for (int x = 0; x < sx; ++x) {
                const int pos[3] = {z, y, x};
                const int p = pos[axis];
                float acc = 0.0f;
                for (int j = -radius; j <= radius; ++j) {
                    const int q = ci(p - j, len);
                    float v;
                    if (axis == 0) v = in(q, y, x);
                    else if (axis == 1) v = in(z, q, x);
                    else v = in(z, y, q);
                    acc += v * kernel[j + radius];
                }
                out(z, y, x) = acc;
            }
        }
    }
}

}  // namespace fo
