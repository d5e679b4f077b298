#include "fo/core/tiling/TilePartitioner.hpp"

#include "fo/core/util/Errors.hpp"

#include <algorithm>
#include <sstream>

namespace fo {

namespace {

// Largest (worst-case) tile for a given core size: a full core with
// halo on both sides, clipped to the volume.
std::size_t worstTileBytes(const PartitionRequest& req, const Shape3& halo, std::size_t core)
{
    Shape3 coreExt{}, haloExt{};
    for (int a = 0; a < 3; ++a) {
        coreExt[a] = std::min(core, req.volumeShape[a]);
        haloExt[a] = std::min(coreExt[a] + 2 * halo[a], req.volumeShape[a]);
    }
    return estimateTileBytes(haloExt, coreExt, req.numScales);
}

}  // namespace

std::size_t estimateTileBytes(const Shape3& haloExtent, const Shape3& coreExtent,
                              std::size_t numScales)
{
    const std::size_t haloVoxels = haloExtent[0] * haloExtent[1] * haloExtent[2];
    const std::size_t coreVoxels = coreExtent[0] * coreExtent[1] * coreExtent[2];
    // input, separable pass buffers and six Hessian components, plus
    // one response volume per scale
    const std::size_t perHaloVoxel = 48 + 4 * numScales;
    // six Hessian components per scale, orientation outputs
    const std::size_t perCoreVoxel = 24 * numScales + 40;
    return haloVoxels * perHaloVoxel + coreVoxels * perCoreVoxel;
}

TilingPlan partitionVolume(const PartitionRequest& req)
{
    const auto& vs = req.volumeShape;
    if (vs[0] == 0 || vs[1] == 0 || vs[2] == 0) {
        throw ConfigurationError("cannot partition an empty volume");
    }
    if (req.blockSize == 0) {
        throw ConfigurationError("block size must be positive");
    }
    if (req.workers < 1) {
        throw ConfigurationError("partitioning requires at least one worker");
    }

    TilingPlan plan;
    plan.volumeShape = vs;

    for (int a = 0; a < 3; ++a) {
        if (req.requestedHalo >= 0) {
            if (static_cast<std::size_t>(req.requestedHalo) < req.supportRadius[a]) {
                std::ostringstream oss;
                oss << "halo " << req.requestedHalo << " is smaller than the filter support radius "
                    << req.supportRadius[a] << " on axis " << a;
                throw ConfigurationError(oss.str());
            }
            plan.halo[a] = static_cast<std::size_t>(req.requestedHalo);
        } else {
            plan.halo[a] = req.supportRadius[a];
        }
    }

    const double perWorker = req.memoryBudgetBytes / static_cast<double>(req.workers);
    std::size_t core = 0;

    if (req.requestedCore > 0) {
        if (req.requestedCore % req.blockSize != 0) {
            throw ConfigurationError("tile core " + std::to_string(req.requestedCore) +
                                     " is not a multiple of the block size " +
                                     std::to_string(req.blockSize));
        }
        core = req.requestedCore;
        const auto bytes = worstTileBytes(req, plan.halo, core);
        if (static_cast<double>(bytes) > perWorker) {
            std::ostringstream oss;
            oss << "tile core " << core << " with halo " << plan.halo[0] << "/" << plan.halo[1]
                << "/" << plan.halo[2] << " needs " << bytes / (1024 * 1024)
                << " MB per worker, budget allows " << static_cast<std::size_t>(perWorker / (1024 * 1024))
                << " MB";
            throw ConfigurationError(oss.str());
        }
    } else {
        const std::size_t maxDim = std::max({vs[0], vs[1], vs[2]});
        std::size_t candidate = (maxDim + req.blockSize - 1) / req.blockSize * req.blockSize;
        while (candidate >= req.blockSize) {
            if (static_cast<double>(worstTileBytes(req, plan.halo, candidate)) <= perWorker) {
                core = candidate;
                break;
            }
            candidate -= req.blockSize;
        }
        if (core == 0) {
            throw ConfigurationError(
                "memory budget too small: even a " + std::to_string(req.blockSize) +
                "-voxel core with its halo does not fit");
        }
    }

    for (int a = 0; a < 3; ++a) {
        plan.coreSize[a] = std::min(core, vs[a]);
        plan.gridShape[a] = (vs[a] + core - 1) / core;
    }
    plan.peakTileBytes = worstTileBytes(req, plan.halo, core);

    plan.tiles.reserve(plan.gridShape[0] * plan.gridShape[1] * plan.gridShape[2]);
    std::size_t id = 0;
    for (std::size_t tz = 0; tz < plan.gridShape[0]; ++tz) {
        for (std::size_t ty = 0; ty < plan.gridShape[1]; ++ty) {
            for (std::size_t tx = 0; tx < plan.gridShape[2]; ++tx) {
                const Shape3 t{tz, ty, tx};
                Tile tile;
                tile.id = id++;
                for (int a = 0; a < 3; ++a) {
                    const std::size_t c0 = t[a] * core;
                    const std::size_t c1 = std::min(c0 + core, vs[a]);
                    const std::size_t h0 = c0 >= plan.halo[a] ? c0 - plan.halo[a] : 0;
                    const std::size_t h1 = std::min(c1 + plan.halo[a], vs[a]);
                    tile.core.offset[a] = c0;
                    tile.core.extent[a] = c1 - c0;
                    tile.halo.offset[a] = h0;
                    tile.halo.extent[a] = h1 - h0;
                }
                plan.tiles.push_back(tile);
            }
        }
    }

    return plan;
}

}  // namespace fo
