#pragma once

#include <atomic>

#include <nlohmann/json_fwd.hpp>

#include "fo/core/io/OutputTarget.hpp"
#include "fo/core/io/VolumeAccessor.hpp"
#include "fo/core/pipeline/PipelineParams.hpp"
#include "fo/core/pipeline/TileScheduler.hpp"

namespace fo {

/**
 * @brief Run the full enhancement and orientation pipeline.
 *
 * Tiles the source, processes every tile, and publishes the output maps
 * plus the "attributes" and "run_report" documents by committing target.
 * On any failure the target is discarded before the exception propagates.
 *
 * @param source Single-channel 3D volume
 * @param cancel Optional flag; raising it stops dispatching new tiles
 * @throws ConfigurationError on invalid parameters or an unsupported source
 * @throws PipelineError if a tile fails permanently
 * @throws PipelineCancelled if cancel was raised before all tiles merged
 */
RunSummary runPipeline(
    const VolumeAccessor& source,
    OutputTarget& target,
    const PipelineParams& params,
    const std::atomic<bool>* cancel = nullptr);

/**
 * @brief Block-level ODFs from a precomputed fiber vector volume.
 *
 * Skips filtering and orientation estimation; vectors are binned as they
 * are. Publishes the ODF maps of every resolution plus the "attributes"
 * and "run_report" documents. Filter parameters are ignored.
 *
 * @param source Z x Y x X x 3 float volume of fiber vectors (z, y, x)
 * @throws ConfigurationError on invalid parameters or an unsupported source
 * @throws PipelineError if a tile fails permanently
 * @throws PipelineCancelled if cancel was raised before all tiles merged
 */
RunSummary runOdfFromVectors(
    const VolumeAccessor& source,
    OutputTarget& target,
    const PipelineParams& params,
    const std::atomic<bool>* cancel = nullptr);

/// Upper end of the valid intensity range for a source dtype.
double resolveIntensityMax(const PipelineParams& params, Dtype dtype);

/// Structureness gamma actually used for a source dtype (half the intensity max when auto).
double resolveGamma(const PipelineParams& params, Dtype dtype);

/// Worker count actually used (resolves 0 to the hardware thread count).
int resolveWorkers(const PipelineParams& params);

nlohmann::json toJson(const RunSummary& summary);

}  // namespace fo
