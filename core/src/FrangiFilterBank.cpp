#include "fo/core/filter/FrangiFilterBank.hpp"

#include "fo/core/filter/GaussianKernels.hpp"
#include "fo/core/filter/SymmetricEigen.hpp"
#include "fo/core/util/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace fo {

using Volume3f = xt::xtensor<float, 3>;

namespace {

Volume3f pass(const Volume3f& src, const std::vector<float>& kernel, int axis)
{
    Volume3f out;
    convolveAxis(src, out, kernel, axis);
    return out;
}

}  // namespace

double frangiResponse(const std::array<double, 3>& lambda, const FrangiParams& params)
{
    const double l1 = lambda[0];
    const double l2 = lambda[1];
    const double l3 = lambda[2];

    if (params.polarity == FiberPolarity::Bright) {
        if (l2 >= 0.0 || l3 >= 0.0) return 0.0;
    } else {
        if (l2 <= 0.0 || l3 <= 0.0) return 0.0;
    }

    const double a1 = std::abs(l1);
    const double a2 = std::abs(l2);
    const double a3 = std::abs(l3);

    const double ra = a2 / a3;
    const double rb = a1 / std::sqrt(a2 * a3);
    const double s2 = l1 * l1 + l2 * l2 + l3 * l3;

    const double plate = 1.0 - std::exp(-(ra * ra) / (2.0 * params.alpha * params.alpha));
    const double blob = std::exp(-(rb * rb) / (2.0 * params.beta * params.beta));
    const double structure = 1.0 - std::exp(-s2 / (2.0 * params.gamma * params.gamma));

    const double v = plate * blob * structure;
    return std::isfinite(v) ? v : 0.0;
}

std::array<double, 3> psfCorrectionSigma(const std::array<double, 3>& fwhmUm)
{
    const double widest = std::max({fwhmUm[0], fwhmUm[1], fwhmUm[2]});
    const double fwhmToSigma = 2.0 * std::sqrt(2.0 * std::log(2.0));
    std::array<double, 3> sigma{};
    for (int a = 0; a < 3; ++a) {
        sigma[a] = std::sqrt(std::max(0.0, widest * widest - fwhmUm[a] * fwhmUm[a])) / fwhmToSigma;
    }
    return sigma;
}

FrangiFilterBank::FrangiFilterBank(FrangiParams params, std::vector<double> scalesUm,
                                   std::array<double, 3> spacingUm)
    : params_(params), scalesUm_(std::move(scalesUm)), spacingUm_(spacingUm)
{
    if (scalesUm_.empty()) {
        throw ConfigurationError("filter bank needs at least one scale");
    }
    for (std::size_t i = 0; i < scalesUm_.size(); ++i) {
        if (!(scalesUm_[i] > 0.0) || (i > 0 && !(scalesUm_[i] > scalesUm_[i - 1]))) {
            throw ConfigurationError("filter scales must be positive and strictly increasing");
        }
    }
    for (double s : spacingUm_) {
        if (!(s > 0.0) || !std::isfinite(s)) {
            throw ConfigurationError("voxel spacing must be positive");
        }
    }
    if (!(params_.alpha > 0.0) || !(params_.beta > 0.0) || !(params_.gamma > 0.0)) {
        throw ConfigurationError("Frangi alpha, beta and gamma must be positive");
    }
    if (!(params_.truncate >= 1.0)) {
        throw ConfigurationError("kernel truncation must be >= 1 sigma");
    }
    for (double c : params_.psfSigmaUm) {
        if (!(c >= 0.0) || !std::isfinite(c)) {
            throw ConfigurationError("PSF correction sigma must be >= 0");
        }
    }
}

std::array<double, 3> FrangiFilterBank::sigmaPx(std::size_t scaleIndex) const
{
    const double s = scalesUm_.at(scaleIndex);
    std::array<double, 3> px{};
    for (int a = 0; a < 3; ++a) {
        const double c = params_.psfSigmaUm[a];
        px[a] = std::sqrt(s * s + c * c) / spacingUm_[a];
    }
    return px;
}

Shape3 FrangiFilterBank::supportRadius() const
{
    const auto sig = sigmaPx(scalesUm_.size() - 1);
    Shape3 r{};
    for (int a = 0; a < 3; ++a) {
        r[a] = static_cast<std::size_t>(kernelRadius(sig[a], params_.truncate));
    }
    return r;
}

ScaleSpace FrangiFilterBank::apply(const Volume3f& window, const Box3& core) const
{
    const Shape3 shape{window.shape()[0], window.shape()[1], window.shape()[2]};
    const Box3 whole{{0, 0, 0}, shape};
    if (!whole.contains(core)) {
        throw ShapeMismatchError("FrangiFilterBank::apply: core region lies outside the window");
    }

    ScaleSpace space;
    space.core = core;

    // Sanitize: non-finite voxels contribute zero intensity, out-of-range
    // voxels saturate. Both are masked (1 = non-finite, 2 = out of range).
    Volume3f img = window;
    xt::xtensor<std::uint8_t, 3> bad = xt::xtensor<std::uint8_t, 3>::from_shape(window.shape());
    const bool checkRange = params_.intensityMax > 0.0;
    const auto hi = static_cast<float>(params_.intensityMax);
    for (std::size_t z = 0; z < shape[0]; ++z) {
        for (std::size_t y = 0; y < shape[1]; ++y) {
            for (std::size_t x = 0; x < shape[2]; ++x) {
                float& v = img(z, y, x);
                std::uint8_t flag = 0;
                if (!std::isfinite(v)) {
                    flag = 1;
                    v = 0.0f;
                } else if (checkRange && (v < 0.0f || v > hi)) {
                    flag = 2;
                    v = std::clamp(v, 0.0f, hi);
                }
                bad(z, y, x) = flag;
                if (flag != 0 &&
                    z >= core.offset[0] && z < core.offset[0] + core.extent[0] &&
                    y >= core.offset[1] && y < core.offset[1] + core.extent[1] &&
                    x >= core.offset[2] && x < core.offset[2] + core.extent[2]) {
                    if (flag == 1) ++space.nonFiniteVoxels;
                    else ++space.outOfRangeVoxels;
                }
            }
        }
    }

    for (std::size_t si = 0; si < scalesUm_.size(); ++si) {
        ScaleLevel level;
        level.sigmaUm = scalesUm_[si];
        level.sigmaPx = sigmaPx(si);

        std::array<std::vector<float>, 3> g, d1, d2;
        for (int a = 0; a < 3; ++a) {
            g[a] = gaussianKernel1D(level.sigmaPx[a], params_.truncate);
            d1[a] = gaussianDerivKernel1D(level.sigmaPx[a], params_.truncate);
            d2[a] = gaussianDeriv2Kernel1D(level.sigmaPx[a], params_.truncate);
        }

        // Separable second derivatives: X pass, then Y, then Z.
        std::array<Volume3f, 6> h;
        {
            Volume3f sx = pass(img, g[2], 2);
            Volume3f sxsy = pass(sx, g[1], 1);
            h[0] = pass(sxsy, d2[0], 0);                  // zz
            sxsy = Volume3f();
            Volume3f sxdy = pass(sx, d1[1], 1);
            h[1] = pass(sxdy, d1[0], 0);                  // zy
            sxdy = Volume3f();
            Volume3f sxd2y = pass(sx, d2[1], 1);
            h[3] = pass(sxd2y, g[0], 0);                  // yy
        }
        {
            Volume3f dx = pass(img, d1[2], 2);
            Volume3f dxsy = pass(dx, g[1], 1);
            h[2] = pass(dxsy, d1[0], 0);                  // zx
            dxsy = Volume3f();
            Volume3f dxdy = pass(dx, d1[1], 1);
            h[4] = pass(dxdy, g[0], 0);                   // yx
        }
        {
            Volume3f d2x = pass(img, d2[2], 2);
            Volume3f d2xsy = pass(d2x, g[1], 1);
            h[5] = pass(d2xsy, g[0], 0);                  // xx
        }

        // Scale normalization to physical units: sigma_um^2 / (s_a * s_b).
        // The PSF correction widens the kernels but not the normalization.
        const double s2 = level.sigmaUm * level.sigmaUm;
        const auto& sp = spacingUm_;
        const std::array<float, 6> norm{
            static_cast<float>(s2 / (sp[0] * sp[0])), static_cast<float>(s2 / (sp[0] * sp[1])),
            static_cast<float>(s2 / (sp[0] * sp[2])), static_cast<float>(s2 / (sp[1] * sp[1])),
            static_cast<float>(s2 / (sp[1] * sp[2])), static_cast<float>(s2 / (sp[2] * sp[2]))};

        level.response = Volume3f::from_shape(window.shape());
        level.hessian = xt::xtensor<float, 4>::from_shape(
            {core.extent[0], core.extent[1], core.extent[2], std::size_t(6)});

        const int sz = static_cast<int>(shape[0]);
        const int sy = static_cast<int>(shape[1]);
        const int sx = static_cast<int>(shape[2]);

        #pragma omp parallel for collapse(2) schedule(static)
        for (int z = 0; z < sz; ++z) {
            for (int y = 0; y < sy; ++y) {
                for (int x = 0; x < sx; ++x) {
                    float hv[6];
                    bool finite = !bad(z, y, x);
                    for (int c = 0; c < 6; ++c) {
                        hv[c] = h[c](z, y, x) * norm[c];
                        finite = finite && std::isfinite(hv[c]);
                    }

                    float resp = 0.0f;
                    if (finite) {
                        const auto eig = decomposeHessian(hv);
                        resp = static_cast<float>(frangiResponse(eig.values, params_));
                    } else {
                        std::fill(hv, hv + 6, 0.0f);
                    }
                    level.response(z, y, x) = resp;

                    const auto uz = static_cast<std::size_t>(z);
                    const auto uy = static_cast<std::size_t>(y);
                    const auto ux = static_cast<std::size_t>(x);
                    if (uz >= core.offset[0] && uz < core.offset[0] + core.extent[0] &&
                        uy >= core.offset[1] && uy < core.offset[1] + core.extent[1] &&
                        ux >= core.offset[2] && ux < core.offset[2] + core.extent[2]) {
                        for (int c = 0; c < 6; ++c) {
                            level.hessian(uz - core.offset[0], uy - core.offset[1],
                                          ux - core.offset[2], c) = hv[c];
                        }
                    }
                }
            }
        }

        space.levels.push_back(std::move(level));
    }

    return space;
}

}  // namespace fo
