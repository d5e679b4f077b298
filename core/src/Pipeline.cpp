#include "fo/core/pipeline/Pipeline.hpp"

#include "fo/core/filter/FrangiFilterBank.hpp"
#include "fo/core/orientation/OrientationAggregator.hpp"
#include "fo/core/pipeline/OutputMaps.hpp"
#include "fo/core/pipeline/PipelineParamsIO.hpp"
#include "fo/core/tiling/TilePartitioner.hpp"
#include "fo/core/util/Errors.hpp"
#include "fo/core/util/Logging.hpp"

#include <algorithm>
#include <chrono>

#include <nlohmann/json.hpp>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace fo {

namespace {

struct OdfSetup {
    std::vector<OdfResolution> resolutions;
    std::vector<OrientationAggregator> aggregators;
    std::size_t alignment = 1;
};

OdfSetup makeOdfSetup(const PipelineParams& params, const std::array<double, 3>& spacing)
{
    OdfSetup odf;
    odf.resolutions = resolvedOdfResolutions(params, spacing);
    odf.alignment = odfAlignment(odf.resolutions);
    for (const auto& r : odf.resolutions) {
        AggregatorParams ap;
        ap.blockShape = r.blockShape;
        ap.bins = params.odf_bins;
        ap.shDegree = params.sh_degree;
        ap.minFill = params.odf_min_fill;
        ap.energyFactor = params.odf_energy_factor;
        odf.aggregators.emplace_back(ap);
    }
    return odf;
}

TilingPlan planTiles(const Shape3& volumeShape, const Shape3& supportRadius, std::size_t numScales,
                     int halo, const OdfSetup& odf, const PipelineParams& params, int workers)
{
    PartitionRequest req;
    req.volumeShape = volumeShape;
    req.supportRadius = supportRadius;
    req.numScales = numScales;
    req.blockSize = odf.alignment;
    req.requestedCore = params.tile_core;
    req.requestedHalo = halo;
    req.memoryBudgetBytes = params.memory_budget_mb * 1024.0 * 1024.0;
    req.workers = workers;
    return partitionVolume(req);
}

void logPlan(const TilingPlan& plan)
{
    Logger()->info("tiling: {} tiles ({}x{}x{}), core {}x{}x{}, halo {}x{}x{}, ~{} MB per tile",
                   plan.tiles.size(), plan.gridShape[0], plan.gridShape[1], plan.gridShape[2],
                   plan.coreSize[0], plan.coreSize[1], plan.coreSize[2], plan.halo[0], plan.halo[1],
                   plan.halo[2], plan.peakTileBytes / (1024 * 1024));
}

OutputLayout makeLayout(const Shape3& volumeShape, const std::array<double, 3>& spacing,
                        const OdfSetup& odf, bool voxelMaps)
{
    OutputLayout layout;
    layout.volumeShape = volumeShape;
    layout.spacing = spacing;
    layout.voxelMaps = voxelMaps;
    for (std::size_t i = 0; i < odf.resolutions.size(); ++i) {
        const auto& agg = odf.aggregators[i];
        layout.layers.push_back({odf.resolutions[i].label, agg.blockShape(),
                                 agg.blockGridShape(volumeShape)});
    }
    const auto& first = odf.aggregators.front();
    layout.bins = first.bins().size();
    layout.shCoefficients = first.harmonics().numCoefficients();
    return layout;
}

nlohmann::json odfAttributes(const PipelineParams& params, const OdfSetup& odf,
                             const std::array<double, 3>& spacing)
{
    nlohmann::json attrs;
    attrs["parameters"] = params::toJson(params);
    attrs["voxel_size_um"] = spacing;
    auto layers = nlohmann::json::array();
    for (const auto& r : odf.resolutions) {
        layers.push_back({{"label", r.label}, {"block_shape", r.blockShape}});
    }
    attrs["odf_resolutions"] = std::move(layers);
    attrs["bin_directions"] = nlohmann::json::array();
    for (const auto& d : odf.aggregators.front().bins().directions()) {
        attrs["bin_directions"].push_back({d[0], d[1], d[2]});
    }
    attrs["sh_degree"] = params.sh_degree;
    return attrs;
}

SchedulerOptions schedulerOptions(const PipelineParams& params, int workers,
                                  const std::atomic<bool>* cancel)
{
    SchedulerOptions opts;
    opts.workers = workers;
    opts.batchSize = params.batch_size;
    opts.retryLimit = params.retry_limit;
    opts.noiseFloor = params.noise_floor;
    opts.cancel = cancel;
    return opts;
}

// Runs the scheduler and publishes maps and documents. On any failure the
// target is discarded before the exception propagates.
template <typename MakeScheduler>
RunSummary runAndPublish(OutputTarget& target, const OutputLayout& layout, const TilingPlan& plan,
                         int workers, nlohmann::json attrs, MakeScheduler&& makeScheduler)
{
    const auto t0 = std::chrono::steady_clock::now();
    RunSummary summary;
    try {
        OutputMaps outputs(target, layout);
        TileScheduler scheduler = makeScheduler(outputs);
        summary = scheduler.run(plan.tiles);

        attrs["maps"] = outputs.names();
        target.addDocument("attributes", attrs);

        auto report = toJson(summary);
        report["tiling"] = {{"tiles", plan.tiles.size()},
                            {"core", plan.coreSize},
                            {"halo", plan.halo},
                            {"grid", plan.gridShape},
                            {"peak_tile_bytes", plan.peakTileBytes}};
        report["workers"] = workers;
        report["elapsed_s"] =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        target.addDocument("run_report", report);

        target.commit();
    } catch (...) {
        try {
            target.discard();
        } catch (const std::exception& e) {
            Logger()->error("discarding staged outputs failed: {}", e.what());
        }
        throw;
    }
    return summary;
}

}  // namespace

double resolveIntensityMax(const PipelineParams& params, Dtype dtype)
{
    if (params.intensity_max > 0.0) return params.intensity_max;
    return dtypeNominalRange(dtype);
}

double resolveGamma(const PipelineParams& params, Dtype dtype)
{
    if (params.gamma > 0.0) return params.gamma;
    return 0.5 * resolveIntensityMax(params, dtype);
}

int resolveWorkers(const PipelineParams& params)
{
    if (params.workers > 0) return params.workers;
#ifdef _OPENMP
    return std::max(1, omp_get_max_threads());
#else
    return 1;
#endif
}

nlohmann::json toJson(const RunSummary& summary)
{
    nlohmann::json j;
    j["merged_tiles"] = summary.mergedTiles;
    j["batches"] = summary.batches;
    j["valid_voxels"] = summary.validVoxels;
    j["non_finite_voxels"] = summary.nonFiniteVoxels;
    j["out_of_range_voxels"] = summary.outOfRangeVoxels;
    j["fiber_energy"] = summary.fiberEnergy;
    j["scale_counts"] = summary.scaleCounts;

    auto tiles = nlohmann::json::array();
    for (const auto& r : summary.tiles) {
        nlohmann::json t;
        t["id"] = r.tileId;
        t["state"] = toString(r.state);
        t["retries"] = r.retries;
        t["valid_voxels"] = r.validVoxels;
        t["non_finite_voxels"] = r.nonFiniteVoxels;
        t["out_of_range_voxels"] = r.outOfRangeVoxels;
        t["fiber_energy"] = r.fiberEnergy;
        if (!r.lastError.empty()) t["last_error"] = r.lastError;
        tiles.push_back(std::move(t));
    }
    j["tiles"] = std::move(tiles);

    auto warnings = nlohmann::json::array();
    for (const auto& w : summary.warnings) {
        warnings.push_back({{"tile", w.tileId}, {"non_finite_voxels", w.nonFiniteVoxels},
                            {"out_of_range_voxels", w.outOfRangeVoxels}, {"message", w.message}});
    }
    j["warnings"] = std::move(warnings);
    return j;
}

RunSummary runPipeline(
    const VolumeAccessor& source,
    OutputTarget& target,
    const PipelineParams& params,
    const std::atomic<bool>* cancel)
{
    validate(params);

    const VolumeInfo& info = source.info();
    if (info.rank() != 3) {
        throw ConfigurationError("input volume must be single-channel 3D, got rank " +
                                 std::to_string(info.rank()));
    }
    const auto spacing = params.spacing_um.value_or(info.spacing);
    const auto scales = resolvedScales(params);
    const int workers = resolveWorkers(params);

    FrangiParams fp;
    fp.alpha = params.alpha;
    fp.beta = params.beta;
    fp.gamma = resolveGamma(params, info.dtype);
    fp.polarity = params.polarity;
    fp.truncate = params.kernel_truncate;
    fp.intensityMax = resolveIntensityMax(params, info.dtype);
    if (params.psf_fwhm_um) {
        fp.psfSigmaUm = psfCorrectionSigma(*params.psf_fwhm_um);
    }
    const FrangiFilterBank bank(fp, scales, spacing);

    const OdfSetup odf = makeOdfSetup(params, spacing);
    const TilingPlan plan =
        planTiles(info.spatialShape(), bank.supportRadius(), scales.size(), params.halo, odf,
                  params, workers);

    Logger()->info("volume {}x{}x{} {} spacing {},{},{} um", info.shape[0], info.shape[1],
                   info.shape[2], dtypeToString(info.dtype), spacing[0], spacing[1], spacing[2]);
    Logger()->info("{} scale(s), gamma {}, intensity max {}, {} worker(s)", scales.size(), fp.gamma,
                   fp.intensityMax, workers);
    if (params.psf_fwhm_um) {
        Logger()->info("PSF correction sigma {},{},{} um", fp.psfSigmaUm[0], fp.psfSigmaUm[1],
                       fp.psfSigmaUm[2]);
    }
    logPlan(plan);

    nlohmann::json attrs = odfAttributes(params, odf, spacing);
    attrs["gamma_used"] = fp.gamma;
    attrs["intensity_max_used"] = fp.intensityMax;
    attrs["scales_um"] = scales;
    attrs["psf_sigma_um"] = fp.psfSigmaUm;

    const OutputLayout layout = makeLayout(info.spatialShape(), spacing, odf, true);
    auto summary = runAndPublish(target, layout, plan, workers, std::move(attrs), [&](OutputMaps& outputs) {
        return TileScheduler(source, outputs, bank, odf.aggregators,
                             schedulerOptions(params, workers, cancel));
    });

    Logger()->info("merged {} tiles, {} valid voxels, {} warning(s)", summary.mergedTiles,
                   summary.validVoxels, summary.warnings.size());
    return summary;
}

RunSummary runOdfFromVectors(
    const VolumeAccessor& source,
    OutputTarget& target,
    const PipelineParams& params,
    const std::atomic<bool>* cancel)
{
    validate(params);

    const VolumeInfo& info = source.info();
    if (info.rank() != 4 || info.shape[3] != 3) {
        throw ConfigurationError("fiber vector volume must be Z x Y x X x 3, got rank " +
                                 std::to_string(info.rank()));
    }
    const auto spacing = params.spacing_um.value_or(info.spacing);
    const int workers = resolveWorkers(params);

    const OdfSetup odf = makeOdfSetup(params, spacing);
    // Vectors need no context, so tiles are read without a halo.
    const TilingPlan plan = planTiles(info.spatialShape(), {0, 0, 0}, 0, 0, odf, params, workers);

    Logger()->info("fiber vectors {}x{}x{} spacing {},{},{} um, {} worker(s)", info.shape[0],
                   info.shape[1], info.shape[2], spacing[0], spacing[1], spacing[2], workers);
    logPlan(plan);

    nlohmann::json attrs = odfAttributes(params, odf, spacing);
    attrs["input"] = "fiber_vectors";

    const OutputLayout layout = makeLayout(info.spatialShape(), spacing, odf, false);
    auto summary = runAndPublish(target, layout, plan, workers, std::move(attrs), [&](OutputMaps& outputs) {
        return TileScheduler(source, outputs, odf.aggregators,
                             schedulerOptions(params, workers, cancel));
    });

    Logger()->info("merged {} tiles, {} valid vectors, {} warning(s)", summary.mergedTiles,
                   summary.validVoxels, summary.warnings.size());
    return summary;
}

}  // namespace fo
