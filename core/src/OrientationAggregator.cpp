#include "fo/core/orientation/OrientationAggregator.hpp"

#include "fo/core/util/Errors.hpp"

#include <algorithm>
#include <cmath>

namespace fo {

OrientationAggregator::OrientationAggregator(AggregatorParams params)
    : params_(params), bins_(params.bins), sh_(params.shDegree)
{
    for (std::size_t b : params_.blockShape) {
        if (b == 0) {
            throw ConfigurationError("ODF block size must be positive");
        }
    }
    if (!(params_.minFill >= 0.0 && params_.minFill < 1.0)) {
        throw ConfigurationError("ODF minimum fill must be in [0, 1)");
    }
    if (!(params_.energyFactor >= 0.0)) {
        throw ConfigurationError("ODF energy factor must be >= 0");
    }
}

Shape3 OrientationAggregator::blockGridShape(const Shape3& volumeShape) const
{
    const Shape3& b = params_.blockShape;
    return {(volumeShape[0] + b[0] - 1) / b[0], (volumeShape[1] + b[1] - 1) / b[1],
            (volumeShape[2] + b[2] - 1) / b[2]};
}

OdfBlockGrid OrientationAggregator::aggregate(const OrientationField& field, const Shape3& coreOffset,
                                              const Shape3& volumeShape) const
{
    const Shape3& b = params_.blockShape;
    for (int a = 0; a < 3; ++a) {
        if (coreOffset[a] % b[a] != 0) {
            throw ShapeMismatchError("core offset is not aligned to the ODF block size");
        }
    }

    // A full block, unless the volume itself is thinner than one.
    const double fullVoxels = static_cast<double>(std::min(b[0], volumeShape[0])) *
                              static_cast<double>(std::min(b[1], volumeShape[1])) *
                              static_cast<double>(std::min(b[2], volumeShape[2]));

    OdfBlockGrid grid;
    grid.gridShape = blockGridShape(field.shape);
    grid.firstBlock = {coreOffset[0] / b[0], coreOffset[1] / b[1], coreOffset[2] / b[2]};
    grid.blocks.reserve(grid.gridShape[0] * grid.gridShape[1] * grid.gridShape[2]);

    const std::size_t nbins = bins_.size();
    const std::size_t ncoeff = sh_.numCoefficients();
    std::vector<double> hist(nbins);
    std::vector<double> coeff(ncoeff);
    std::vector<float> basis(ncoeff);

    for (std::size_t bz = 0; bz < grid.gridShape[0]; ++bz) {
        for (std::size_t by = 0; by < grid.gridShape[1]; ++by) {
            for (std::size_t bx = 0; bx < grid.gridShape[2]; ++bx) {
                std::fill(hist.begin(), hist.end(), 0.0);
                std::fill(coeff.begin(), coeff.end(), 0.0);
                OdfBlock block;
                block.index = {grid.firstBlock[0] + bz, grid.firstBlock[1] + by, grid.firstBlock[2] + bx};

                const std::size_t z0 = bz * b[0], y0 = by * b[1], x0 = bx * b[2];
                const std::size_t z1 = std::min(field.shape[0], z0 + b[0]);
                const std::size_t y1 = std::min(field.shape[1], y0 + b[1]);
                const std::size_t x1 = std::min(field.shape[2], x0 + b[2]);
                for (std::size_t z = z0; z < z1; ++z) {
                    for (std::size_t y = y0; y < y1; ++y) {
                        for (std::size_t x = x0; x < x1; ++x) {
                            if (!field.valid(z, y, x)) continue;
                            const cv::Vec3f v(field.vectors(z, y, x, 0), field.vectors(z, y, x, 1),
                                              field.vectors(z, y, x, 2));
                            const double w = field.coherence(z, y, x);
                            ++block.count;
                            block.energy += w;
                            hist[bins_.nearest(v)] += w;
                            sh_.evaluate(v, basis.data());
                            for (std::size_t k = 0; k < ncoeff; ++k) {
                                coeff[k] += w * basis[k];
                            }
                        }
                    }
                }

                block.histogram.assign(nbins, 0.0f);
                block.sh.assign(ncoeff, 0.0f);
                if (block.count > 0) {
                    block.quality = block.energy / static_cast<double>(block.count);
                }

                const double voxels = static_cast<double>((z1 - z0) * (y1 - y0) * (x1 - x0));
                const bool sparse = voxels / fullVoxels <= params_.minFill;
                const bool weak = block.energy < params_.energyFactor * std::sqrt(voxels);
                block.empty = block.count == 0 || !(block.energy > 0.0) || sparse || weak;
                if (!block.empty) {
                    for (std::size_t i = 0; i < nbins; ++i) {
                        block.histogram[i] = static_cast<float>(hist[i] / block.energy);
                    }
                    for (std::size_t k = 0; k < ncoeff; ++k) {
                        block.sh[k] = static_cast<float>(coeff[k] / block.energy);
                    }
                }
                grid.blocks.push_back(std::move(block));
            }
        }
    }
    return grid;
}

}  // namespace fo
