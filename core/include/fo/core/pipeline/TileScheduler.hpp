#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

#include "fo/core/filter/FrangiFilterBank.hpp"
#include "fo/core/io/VolumeAccessor.hpp"
#include "fo/core/orientation/OrientationAggregator.hpp"
#include "fo/core/pipeline/OutputMaps.hpp"
#include "fo/core/tiling/TilePartitioner.hpp"
#include "fo/core/util/Errors.hpp"

namespace fo {

enum class TileState {
    Pending,
    Loaded,
    Filtered,
    OrientationComputed,
    Aggregated,
    Merged,
    FailedLoad,
    FailedCompute
};

std::string toString(TileState s);

struct TileRecord {
    std::size_t tileId = 0;
    TileState state = TileState::Pending;
    int retries = 0;                 ///< Attempts beyond the first
    std::string lastError;
    std::size_t nonFiniteVoxels = 0;
    std::size_t outOfRangeVoxels = 0;
    std::size_t validVoxels = 0;
    double fiberEnergy = 0.0;        ///< Sum of coherence over valid voxels
};

struct RunSummary {
    std::vector<TileRecord> tiles;   ///< Sorted by tile id
    std::vector<DataQualityWarning> warnings;
    std::vector<std::size_t> scaleCounts;  ///< Voxels selected per scale
    std::size_t mergedTiles = 0;
    std::size_t batches = 0;
    std::size_t validVoxels = 0;
    std::size_t nonFiniteVoxels = 0;
    std::size_t outOfRangeVoxels = 0;
    double fiberEnergy = 0.0;
};

struct SchedulerOptions {
    int workers = 1;
    std::size_t batchSize = 0;       ///< 0 = 2 x workers
    int retryLimit = 2;
    double noiseFloor = 1e-3;
    const std::atomic<bool>* cancel = nullptr;
};

/**
 * @brief Runs tiles through load, filter, orientation and aggregation, and
 * merges the results into the output maps.
 *
 * Tiles are dispatched in batches to an OpenMP team, one tile per thread.
 * All storage calls share one critical section. Failed tiles are retried
 * up to retryLimit times; once a tile is out of attempts no further batch
 * is dispatched and run() throws PipelineError.
 *
 * Each aggregator produces the block grid of one ODF layer of outputs.
 */
class TileScheduler {
public:
    TileScheduler(const VolumeAccessor& source, OutputMaps& outputs, const FrangiFilterBank& bank,
                  const std::vector<OrientationAggregator>& aggregators, SchedulerOptions options);

    /// Source holds fiber vectors (Z x Y x X x 3); tiles skip filtering.
    TileScheduler(const VolumeAccessor& source, OutputMaps& outputs,
                  const std::vector<OrientationAggregator>& aggregators, SchedulerOptions options);

    /**
     * @brief Process tiles in the given dispatch order.
     * @throws PipelineError if any tile fails permanently
     * @throws PipelineCancelled if the cancel flag was raised
     */
    RunSummary run(const std::vector<Tile>& tiles);

private:
    struct Outcome {
        TileRecord record;
        std::vector<std::size_t> scaleHistogram;
        bool dispatched = false;
        bool fatal = false;
    };

    Outcome process(const Tile& tile);
    bool cancelled() const;

    const VolumeAccessor& source_;
    OutputMaps& outputs_;
    const FrangiFilterBank* bank_;
    const std::vector<OrientationAggregator>& aggregators_;
    SchedulerOptions options_;
};

}  // namespace fo
