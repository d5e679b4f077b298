#include "fo/core/pipeline/TileScheduler.hpp"

#include "fo/core/orientation/OrientationEstimator.hpp"
#include "fo/core/util/Logging.hpp"

#include <algorithm>
#include <exception>
#include <sstream>
#include <utility>

#include <xtensor/containers/xtensor.hpp>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace fo {

namespace {

// Storage handles are not thread-safe. Exceptions must not leave an
// OpenMP structured block, so they are carried out and rethrown.
template <typename Fn>
void serializedIO(Fn&& fn)
{
    std::exception_ptr err;
#pragma omp critical(fo_volume_io)
    {
        try {
            fn();
        } catch (...) {
            err = std::current_exception();
        }
    }
    if (err) std::rethrow_exception(err);
}

std::string shapeString(const std::vector<std::size_t>& s)
{
    std::ostringstream oss;
    for (std::size_t i = 0; i < s.size(); ++i) oss << (i ? "x" : "") << s[i];
    return oss.str();
}

}  // namespace

std::string toString(TileState s)
{
    switch (s) {
        case TileState::Pending: return "Pending";
        case TileState::Loaded: return "Loaded";
        case TileState::Filtered: return "Filtered";
        case TileState::OrientationComputed: return "OrientationComputed";
        case TileState::Aggregated: return "Aggregated";
        case TileState::Merged: return "Merged";
        case TileState::FailedLoad: return "FailedLoad";
        case TileState::FailedCompute: return "FailedCompute";
    }
    return "Unknown";
}

TileScheduler::TileScheduler(const VolumeAccessor& source, OutputMaps& outputs,
                             const FrangiFilterBank& bank,
                             const std::vector<OrientationAggregator>& aggregators,
                             SchedulerOptions options)
    : TileScheduler(source, outputs, aggregators, options)
{
    bank_ = &bank;
}

TileScheduler::TileScheduler(const VolumeAccessor& source, OutputMaps& outputs,
                             const std::vector<OrientationAggregator>& aggregators,
                             SchedulerOptions options)
    : source_(source), outputs_(outputs), bank_(nullptr), aggregators_(aggregators), options_(options)
{
    if (aggregators_.empty()) {
        throw ConfigurationError("scheduler needs at least one ODF aggregator");
    }
    if (options_.workers < 1) {
        throw ConfigurationError("scheduler needs at least one worker");
    }
    if (options_.retryLimit < 0) {
        throw ConfigurationError("retry limit must be >= 0");
    }
    if (options_.batchSize == 0) {
        options_.batchSize = 2 * static_cast<std::size_t>(options_.workers);
    }
}

bool TileScheduler::cancelled() const
{
    return options_.cancel != nullptr && options_.cancel->load();
}

TileScheduler::Outcome TileScheduler::process(const Tile& tile)
{
    Outcome out;
    out.dispatched = true;
    TileRecord& rec = out.record;
    rec.tileId = tile.id;

    for (int attempt = 0; attempt <= options_.retryLimit; ++attempt) {
        rec.retries = attempt;
        rec.state = TileState::Pending;
        try {
            xt::xarray<float> raw;
            serializedIO([&] { raw = source_.readBox(tile.halo); });
            std::vector<std::size_t> expected = tile.halo.extentVec();
            if (!bank_) expected.push_back(3);
            const std::vector<std::size_t> got(raw.shape().begin(), raw.shape().end());
            if (got != expected) {
                throw ShapeMismatchError("tile " + std::to_string(tile.id) + ": read " +
                                         shapeString(got) + ", expected " + shapeString(expected));
            }

            OrientationField field;
            if (bank_) {
                xt::xtensor<float, 3> window = raw;
                raw = xt::xarray<float>();
                rec.state = TileState::Loaded;
                Logger()->debug("tile {} loaded {}", tile.id, tile.halo);

                ScaleSpace space = bank_->apply(window, tile.coreInHalo());
                rec.state = TileState::Filtered;

                field = estimateOrientation(space, options_.noiseFloor);
                rec.nonFiniteVoxels = space.nonFiniteVoxels;
                rec.outOfRangeVoxels = space.outOfRangeVoxels;
            } else {
                xt::xtensor<float, 4> vectors = raw;
                raw = xt::xarray<float>();
                rec.state = TileState::Loaded;
                Logger()->debug("tile {} loaded {} (vectors)", tile.id, tile.halo);

                field = orientationFromVectors(vectors, options_.noiseFloor);
                rec.nonFiniteVoxels = field.nonFiniteVoxels;
            }
            rec.state = TileState::OrientationComputed;

            std::vector<OdfBlockGrid> blocks;
            blocks.reserve(aggregators_.size());
            for (const auto& agg : aggregators_) {
                blocks.push_back(agg.aggregate(field, tile.core.offset, source_.info().spatialShape()));
            }
            rec.state = TileState::Aggregated;

            serializedIO([&] { outputs_.writeTile(tile.core, field, blocks); });
            rec.state = TileState::Merged;

            rec.validVoxels = field.validVoxels;
            rec.fiberEnergy = 0.0;
            for (float c : field.coherence) rec.fiberEnergy += c;
            rec.lastError.clear();
            out.scaleHistogram = std::move(field.scaleHistogram);
            Logger()->debug("tile {} merged ({} valid voxels)", tile.id, rec.validVoxels);
            return out;
        } catch (const ShapeMismatchError& e) {
            rec.state = rec.state == TileState::Pending ? TileState::FailedLoad : TileState::FailedCompute;
            rec.lastError = e.what();
            out.fatal = true;
            Logger()->error("tile {} {}: {}", tile.id, toString(rec.state), rec.lastError);
            return out;
        } catch (const std::exception& e) {
            rec.state = rec.state == TileState::Pending ? TileState::FailedLoad : TileState::FailedCompute;
            rec.lastError = e.what();
            if (attempt < options_.retryLimit) {
                Logger()->warn("tile {} {} (attempt {}/{}): {}; retrying", tile.id, toString(rec.state),
                               attempt + 1, options_.retryLimit + 1, rec.lastError);
            }
        }
    }

    out.fatal = true;
    Logger()->error("tile {} {} after {} attempt(s): {}", tile.id, toString(rec.state),
                    rec.retries + 1, rec.lastError);
    return out;
}

RunSummary TileScheduler::run(const std::vector<Tile>& tiles)
{
    RunSummary summary;
    summary.scaleCounts.assign(bank_ ? bank_->scales().size() : 0, 0);

    std::vector<Outcome> outcomes(tiles.size());
    for (std::size_t i = 0; i < tiles.size(); ++i) outcomes[i].record.tileId = tiles[i].id;

    std::atomic<bool> abort{false};
    const std::size_t batch = options_.batchSize;

    for (std::size_t start = 0; start < tiles.size(); start += batch) {
        if (abort.load() || cancelled()) break;
        const std::size_t end = std::min(tiles.size(), start + batch);
        ++summary.batches;
        Logger()->info("batch {}: tiles {}..{} of {}", summary.batches, start + 1, end, tiles.size());

        const auto first = static_cast<long>(start);
        const auto last = static_cast<long>(end);
#pragma omp parallel for schedule(dynamic) num_threads(options_.workers)
        for (long i = first; i < last; ++i) {
            if (abort.load() || cancelled()) continue;
            outcomes[i] = process(tiles[i]);
            if (outcomes[i].fatal) abort.store(true);
        }
    }

    std::sort(outcomes.begin(), outcomes.end(),
              [](const Outcome& a, const Outcome& b) { return a.record.tileId < b.record.tileId; });

    std::vector<TileFailure> failures;
    for (auto& o : outcomes) {
        const TileRecord& r = o.record;
        if (o.fatal) {
            failures.push_back({r.tileId, toString(r.state), r.retries + 1, r.lastError});
        }
        if (r.state == TileState::Merged) {
            ++summary.mergedTiles;
            summary.validVoxels += r.validVoxels;
            summary.nonFiniteVoxels += r.nonFiniteVoxels;
            summary.outOfRangeVoxels += r.outOfRangeVoxels;
            summary.fiberEnergy += r.fiberEnergy;
            for (std::size_t s = 0; s < o.scaleHistogram.size() && s < summary.scaleCounts.size(); ++s) {
                summary.scaleCounts[s] += o.scaleHistogram[s];
            }
            if (r.nonFiniteVoxels > 0 || r.outOfRangeVoxels > 0) {
                DataQualityWarning w;
                w.tileId = r.tileId;
                w.nonFiniteVoxels = r.nonFiniteVoxels;
                w.outOfRangeVoxels = r.outOfRangeVoxels;
                std::ostringstream oss;
                if (r.nonFiniteVoxels > 0) oss << r.nonFiniteVoxels << " non-finite";
                if (r.nonFiniteVoxels > 0 && r.outOfRangeVoxels > 0) oss << " and ";
                if (r.outOfRangeVoxels > 0) oss << r.outOfRangeVoxels << " out-of-range";
                oss << " voxel(s) in core; response set to zero";
                w.message = oss.str();
                Logger()->warn("tile {}: {}", w.tileId, w.message);
                summary.warnings.push_back(std::move(w));
            }
        }
        summary.tiles.push_back(r);
    }

    if (!failures.empty()) {
        throw PipelineError(std::move(failures));
    }
    if (summary.mergedTiles < tiles.size()) {
        throw PipelineCancelled(summary.mergedTiles, tiles.size());
    }
    return summary;
}

}  // namespace fo
