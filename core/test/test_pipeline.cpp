#include "test.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstring>
#include <limits>
#include <map>
#include <memory>
#include <string>

#include "fo/core/filter/FrangiFilterBank.hpp"
#include "fo/core/io/MemoryVolume.hpp"
#include "fo/core/io/OutputTarget.hpp"
#include "fo/core/orientation/DirectionBins.hpp"
#include "fo/core/orientation/OrientationAggregator.hpp"
#include "fo/core/pipeline/OutputMaps.hpp"
#include "fo/core/pipeline/Pipeline.hpp"
#include "fo/core/pipeline/TileScheduler.hpp"
#include "fo/core/synth/Phantom.hpp"
#include "fo/core/tiling/TilePartitioner.hpp"
#include "fo/core/util/Errors.hpp"
#include "fo/core/util/Logging.hpp"

using namespace fo;

namespace {

// Tube along x through (12, 12), centered in row (1, 1) of 8-voxel blocks.
xt::xarray<float> tubeVolume(std::size_t n)
{
    PhantomSpec spec;
    spec.shape = {n, n, n};
    spec.fibers.push_back({{12.0, 12.0, 0.0}, {12.0, 12.0, static_cast<double>(n - 1)}, 2.0, 0.8});
    return renderPhantom(spec);
}

PipelineParams smallParams()
{
    PipelineParams p;
    p.scales_um = {2.0};
    p.tile_core = 16;
    p.odf_blocks = {8};
    p.odf_bins = 16;
    p.sh_degree = 4;
    p.workers = 2;
    return p;
}

bool sameMaps(const MemoryOutputTarget& a, const MemoryOutputTarget& b)
{
    if (a.names() != b.names()) return false;
    for (const auto& name : a.names()) {
        const auto& x = a.map(name).data();
        const auto& y = b.map(name).data();
        if (x.shape() != y.shape()) return false;
        if (std::memcmp(x.data(), y.data(), x.size() * sizeof(float)) != 0) {
            std::fprintf(stderr, "    map '%s' differs\n", name.c_str());
            return false;
        }
    }
    return true;
}

// Fails every read whose offset is the volume origin, `failures` times.
class FlakyVolume : public VolumeAccessor {
public:
    FlakyVolume(const VolumeAccessor& inner, int failures) : inner_(inner), remaining_(failures) {}

    const VolumeInfo& info() const override { return inner_.info(); }

    xt::xarray<float> readRegion(const std::vector<std::size_t>& offset,
                                 const std::vector<std::size_t>& extent) const override
    {
        if (offset == std::vector<std::size_t>{0, 0, 0} && remaining_ > 0) {
            --remaining_;
            throw IOError("simulated read failure");
        }
        return inner_.readRegion(offset, extent);
    }

    void writeRegion(const std::vector<std::size_t>&, const xt::xarray<float>&) override
    {
        throw IOError("read-only");
    }
    void close() override {}
    bool isOpen() const override { return true; }

private:
    const VolumeAccessor& inner_;
    mutable int remaining_;
};

// Returns a wrong-shaped block for the tile at the origin.
class TruncatingVolume : public FlakyVolume {
public:
    explicit TruncatingVolume(const VolumeAccessor& inner) : FlakyVolume(inner, 0), inner_(inner) {}

    xt::xarray<float> readRegion(const std::vector<std::size_t>& offset,
                                 const std::vector<std::size_t>& extent) const override
    {
        if (offset == std::vector<std::size_t>{0, 0, 0}) {
            return inner_.readRegion(offset, {1, 1, 1});
        }
        return inner_.readRegion(offset, extent);
    }

private:
    const VolumeAccessor& inner_;
};

// Raises the cancel flag on its first read.
class CancellingVolume : public FlakyVolume {
public:
    CancellingVolume(const VolumeAccessor& inner, std::atomic<bool>& flag)
        : FlakyVolume(inner, 0), inner_(inner), flag_(flag) {}

    xt::xarray<float> readRegion(const std::vector<std::size_t>& offset,
                                 const std::vector<std::size_t>& extent) const override
    {
        flag_.store(true);
        return inner_.readRegion(offset, extent);
    }

private:
    const VolumeAccessor& inner_;
    std::atomic<bool>& flag_;
};

// Map whose writes fail a number of times before reaching the real map.
class FlakyWriter : public VolumeAccessor {
public:
    FlakyWriter(VolumeAccessor& inner, int failures) : inner_(inner), remaining_(failures) {}

    const VolumeInfo& info() const override { return inner_.info(); }
    xt::xarray<float> readRegion(const std::vector<std::size_t>& offset,
                                 const std::vector<std::size_t>& extent) const override
    {
        return inner_.readRegion(offset, extent);
    }
    void writeRegion(const std::vector<std::size_t>& offset, const xt::xarray<float>& data) override
    {
        if (remaining_ > 0) {
            --remaining_;
            throw IOError("simulated write failure");
        }
        inner_.writeRegion(offset, data);
    }
    void close() override { inner_.close(); }
    bool isOpen() const override { return inner_.isOpen(); }

private:
    VolumeAccessor& inner_;
    int remaining_;
};

// Memory target whose coherence map fails its first writes.
class FlakyTarget : public OutputTarget {
public:
    explicit FlakyTarget(int failures) : failures_(failures) {}

    VolumeAccessor& createMap(const std::string& name, const VolumeInfo& info) override
    {
        VolumeAccessor& real = inner.createMap(name, info);
        if (name != maps::Coherence) return real;
        writer_ = std::make_unique<FlakyWriter>(real, failures_);
        return *writer_;
    }
    void addDocument(const std::string& name, const nlohmann::json& doc) override
    {
        inner.addDocument(name, doc);
    }
    void commit() override { inner.commit(); }
    void discard() override { inner.discard(); }
    bool committed() const override { return inner.committed(); }

    MemoryOutputTarget inner;

private:
    int failures_;
    std::unique_ptr<FlakyWriter> writer_;
};

}  // namespace

// --- scenarios ---------------------------------------------------------------

TEST(Pipeline, StraightTubeGivesAxialOrientation)
{
    MemoryVolume src(tubeVolume(32));
    MemoryOutputTarget out;
    auto summary = runPipeline(src, out, smallParams());

    ASSERT_TRUE(out.committed());
    EXPECT_EQ(summary.mergedTiles, std::size_t(8));
    EXPECT_GT(summary.validVoxels, std::size_t(0));

    const auto& orient = out.map(maps::Orientation).data();
    const auto& coh = out.map(maps::Coherence).data();
    const double cosTol = std::cos(3.0 * M_PI / 180.0);
    for (std::size_t x = 0; x < 32; ++x) {
        EXPECT_GT(std::abs(orient(12, 12, x, 2)), cosTol);
        EXPECT_GT(coh(12, 12, x), 0.9f);
    }
    EXPECT_FLOAT_EQ(out.map(maps::Scale).data()(12, 12, 16), 2.0f);

    const auto& empty = out.map(maps::BlockEmpty).data();
    EXPECT_FLOAT_EQ(empty(1, 1, 0), 0.0f);
    EXPECT_FLOAT_EQ(empty(0, 0, 0), 1.0f);
    EXPECT_GT(out.map(maps::BlockQuality).data()(1, 1, 1), 0.0f);
    EXPECT_GT(out.map(maps::BlockCount).data()(1, 1, 1), 0.0f);
    EXPECT_GT(out.map(maps::BlockEnergy).data()(1, 1, 1), std::sqrt(512.0f));
    EXPECT_EQ(out.map(maps::Odf).data().shape()[3], std::size_t(16));
    EXPECT_EQ(out.map(maps::OdfSh).data().shape()[3], std::size_t(15));

    const auto& report = out.document("run_report");
    EXPECT_EQ(report["merged_tiles"].get<std::size_t>(), std::size_t(8));
    EXPECT_FLOAT_EQ(out.document("attributes")["gamma_used"].get<double>(), 0.5);
}

TEST(Pipeline, UniformVolumeIsNullEverywhere)
{
    xt::xarray<float> flat = xt::xarray<float>::from_shape({24, 24, 24});
    std::fill(flat.begin(), flat.end(), 0.5f);
    MemoryVolume src(flat);
    MemoryOutputTarget out;
    auto summary = runPipeline(src, out, smallParams());

    EXPECT_EQ(summary.validVoxels, std::size_t(0));
    EXPECT_FLOAT_EQ(summary.fiberEnergy, 0.0);
    for (float v : out.map(maps::Orientation).data()) EXPECT_FLOAT_EQ(v, 0.0f);
    for (float v : out.map(maps::Coherence).data()) EXPECT_FLOAT_EQ(v, 0.0f);
    for (float v : out.map(maps::BlockEmpty).data()) EXPECT_FLOAT_EQ(v, 1.0f);
    for (float v : out.map(maps::Odf).data()) EXPECT_FLOAT_EQ(v, 0.0f);
}

TEST(Pipeline, NonFiniteVoxelsWarnAndComplete)
{
    auto vol = tubeVolume(32);
    vol(5, 5, 5) = std::numeric_limits<float>::quiet_NaN();
    vol(12, 12, 20) = std::numeric_limits<float>::infinity();
    MemoryVolume src(vol);
    MemoryOutputTarget out;
    auto summary = runPipeline(src, out, smallParams());

    EXPECT_TRUE(out.committed());
    ASSERT_EQ(summary.warnings.size(), std::size_t(2));
    EXPECT_EQ(summary.warnings[0].tileId, std::size_t(0));
    EXPECT_EQ(summary.warnings[1].tileId, std::size_t(1));
    EXPECT_EQ(summary.nonFiniteVoxels, std::size_t(2));
    EXPECT_EQ(summary.outOfRangeVoxels, std::size_t(0));
    EXPECT_FLOAT_EQ(out.map(maps::Response).data()(5, 5, 5), 0.0f);
    EXPECT_FLOAT_EQ(out.map(maps::Response).data()(12, 12, 20), 0.0f);
    EXPECT_FLOAT_EQ(out.map(maps::Coherence).data()(12, 12, 20), 0.0f);
    EXPECT_EQ(out.document("run_report")["warnings"].size(), std::size_t(2));
}

TEST(Pipeline, OutOfRangeVoxelsWarnAndAreNull)
{
    // float32 data that was never normalized to [0, 1]
    auto vol = tubeVolume(32);
    for (auto& v : vol) v *= 250.0f;
    MemoryVolume src(vol);
    MemoryOutputTarget out;
    auto summary = runPipeline(src, out, smallParams());

    EXPECT_TRUE(out.committed());
    EXPECT_GT(summary.outOfRangeVoxels, std::size_t(0));
    EXPECT_EQ(summary.nonFiniteVoxels, std::size_t(0));
    ASSERT_FALSE(summary.warnings.empty());
    EXPECT_EQ(summary.warnings[0].tileId, std::size_t(0));
    EXPECT_GT(summary.warnings[0].outOfRangeVoxels, std::size_t(0));
    EXPECT_NE(summary.warnings[0].message.find("out-of-range"), std::string::npos);
    for (std::size_t x = 0; x < 32; ++x) {
        EXPECT_FLOAT_EQ(out.map(maps::Response).data()(12, 12, x), 0.0f);
        EXPECT_FLOAT_EQ(out.map(maps::Coherence).data()(12, 12, x), 0.0f);
    }
    EXPECT_GT(out.document("run_report")["out_of_range_voxels"].get<std::size_t>(), std::size_t(0));

    auto p = smallParams();
    p.intensity_max = 255.0;
    MemoryOutputTarget scaled;
    auto ok = runPipeline(src, scaled, p);
    EXPECT_TRUE(ok.warnings.empty());
    EXPECT_EQ(ok.outOfRangeVoxels, std::size_t(0));
    EXPECT_FLOAT_EQ(scaled.document("attributes")["gamma_used"].get<double>(), 127.5);
    EXPECT_GT(std::abs(scaled.map(maps::Orientation).data()(12, 12, 16, 2)), std::cos(3.0 * M_PI / 180.0));
    EXPECT_GT(scaled.map(maps::Coherence).data()(12, 12, 16), 0.9f);
}

TEST(Pipeline, SparseEdgeBlocksAreEmpty)
{
    // 20 voxels per axis: the last block column holds 4 of 8 voxels
    MemoryVolume src(tubeVolume(20));
    MemoryOutputTarget out;
    runPipeline(src, out, smallParams());

    const auto& empty = out.map(maps::BlockEmpty).data();
    EXPECT_FLOAT_EQ(empty(1, 1, 1), 0.0f);
    EXPECT_FLOAT_EQ(empty(1, 1, 2), 1.0f);
    EXPECT_GT(out.map(maps::BlockCount).data()(1, 1, 2), 0.0f);
    for (std::size_t i = 0; i < 16; ++i) EXPECT_FLOAT_EQ(out.map(maps::Odf).data()(1, 1, 2, i), 0.0f);

    auto p = smallParams();
    p.odf_min_fill = 0.25;
    MemoryOutputTarget lenient;
    runPipeline(src, lenient, p);
    EXPECT_FLOAT_EQ(lenient.map(maps::BlockEmpty).data()(1, 1, 2), 0.0f);

    p.odf_energy_factor = 1e6;
    MemoryOutputTarget strict;
    auto summary = runPipeline(src, strict, p);
    for (float v : strict.map(maps::BlockEmpty).data()) EXPECT_FLOAT_EQ(v, 1.0f);
    EXPECT_GT(summary.fiberEnergy, 0.0);
}

// --- ODF resolutions ---------------------------------------------------------

TEST(Pipeline, SeveralBlockSizesGiveOneMapSetEach)
{
    MemoryVolume src(tubeVolume(32));
    auto p = smallParams();
    p.odf_blocks = {8, 16};
    MemoryOutputTarget out;
    runPipeline(src, out, p);

    EXPECT_FALSE(out.has(maps::Odf));
    const auto& fine = out.map("block_count_8vx").data();
    const auto& coarse = out.map("block_count_16vx").data();
    EXPECT_EQ(out.map("odf_8vx").data().shape()[0], std::size_t(4));
    EXPECT_EQ(out.map("odf_16vx").data().shape()[0], std::size_t(2));
    EXPECT_TRUE(out.has("odf_sh_16vx"));
    EXPECT_TRUE(out.has("block_empty_16vx"));

    float sum = 0.0f;
    for (std::size_t z = 0; z < 2; ++z)
        for (std::size_t y = 0; y < 2; ++y)
            for (std::size_t x = 0; x < 2; ++x) sum += fine(z, y, x);
    EXPECT_FLOAT_EQ(coarse(0, 0, 0), sum);
    EXPECT_FLOAT_EQ(out.map("block_empty_16vx").data()(0, 0, 0), 0.0f);
    EXPECT_EQ(out.document("attributes")["odf_resolutions"].size(), std::size_t(2));

    MemoryOutputTarget single;
    runPipeline(src, single, smallParams());
    const auto& a = out.map(maps::Orientation).data();
    const auto& b = single.map(maps::Orientation).data();
    EXPECT_EQ(std::memcmp(a.data(), b.data(), a.size() * sizeof(float)), 0);
}

TEST(Pipeline, MicrometerBlocksFollowSpacing)
{
    MemoryVolume src(tubeVolume(32));
    auto p = smallParams();
    p.spacing_um = std::array<double, 3>{2.0, 1.0, 1.0};
    p.odf_res_um = {16.0};
    MemoryOutputTarget out;
    runPipeline(src, out, p);

    const auto& odf = out.map(maps::Odf).data();
    EXPECT_EQ(odf.shape()[0], std::size_t(4));
    EXPECT_EQ(odf.shape()[1], std::size_t(2));
    EXPECT_EQ(odf.shape()[2], std::size_t(2));
    const auto shape = out.document("attributes")["odf_resolutions"][0]["block_shape"];
    EXPECT_EQ(shape.get<std::vector<std::size_t>>(), (std::vector<std::size_t>{8, 16, 16}));

    p.odf_res_um = {16.0, 32.0};
    MemoryOutputTarget misaligned;
    EXPECT_THROW(runPipeline(src, misaligned, p), ConfigurationError);

    p.tile_core = 32;
    MemoryOutputTarget both;
    runPipeline(src, both, p);
    EXPECT_TRUE(both.has("odf_16um"));
    EXPECT_TRUE(both.has("odf_32um"));
}

// --- fiber vector input ------------------------------------------------------

TEST(Pipeline, FiberVectorsGiveOdfsOnly)
{
    xt::xarray<float> vecs = xt::xarray<float>::from_shape({16, 16, 16, 3});
    for (std::size_t z = 0; z < 16; ++z)
        for (std::size_t y = 0; y < 16; ++y)
            for (std::size_t x = 0; x < 16; ++x) {
                vecs(z, y, x, 0) = 0.0f;
                vecs(z, y, x, 1) = 0.0f;
                vecs(z, y, x, 2) = -0.8f;
            }
    vecs(3, 3, 3, 2) = std::numeric_limits<float>::quiet_NaN();
    MemoryVolume src(vecs);
    auto p = smallParams();
    p.tile_core = 8;
    MemoryOutputTarget out;
    auto summary = runOdfFromVectors(src, out, p);

    EXPECT_EQ(summary.mergedTiles, std::size_t(8));
    EXPECT_FALSE(out.has(maps::Orientation));
    EXPECT_FALSE(out.has(maps::Response));
    EXPECT_EQ(out.names().size(), std::size_t(6));
    ASSERT_EQ(summary.warnings.size(), std::size_t(1));
    EXPECT_EQ(summary.warnings[0].tileId, std::size_t(0));
    EXPECT_EQ(summary.warnings[0].nonFiniteVoxels, std::size_t(1));

    DirectionBins bins(p.odf_bins);
    const std::size_t peak = bins.nearest(cv::Vec3f(0.0f, 0.0f, 1.0f));
    EXPECT_NEAR(out.map(maps::Odf).data()(1, 1, 1, peak), 1.0, 1e-6);
    EXPECT_FLOAT_EQ(out.map(maps::BlockCount).data()(0, 0, 0), 511.0f);
    EXPECT_NEAR(out.map(maps::BlockEnergy).data()(1, 1, 1), 0.8 * 512, 1e-3);
    for (float e : out.map(maps::BlockEmpty).data()) EXPECT_FLOAT_EQ(e, 0.0f);
    EXPECT_EQ(out.document("attributes")["input"].get<std::string>(), std::string("fiber_vectors"));

    MemoryVolume scalar(tubeVolume(16));
    MemoryOutputTarget rejected;
    EXPECT_THROW(runOdfFromVectors(scalar, rejected, p), ConfigurationError);
    EXPECT_FALSE(rejected.committed());
}

TEST(Pipeline, WorkerCountDoesNotChangeMaps)
{
    MemoryVolume src(tubeVolume(32));
    auto p = smallParams();
    p.workers = 1;
    MemoryOutputTarget one;
    runPipeline(src, one, p);

    p.workers = 4;
    MemoryOutputTarget four;
    runPipeline(src, four, p);
    EXPECT_TRUE(sameMaps(one, four));
}

TEST(Pipeline, ManyBatchesMatchSingleTile)
{
    MemoryVolume src(tubeVolume(32));
    auto p = smallParams();
    p.tile_core = 8;
    p.batch_size = 4;
    MemoryOutputTarget tiled;
    auto summary = runPipeline(src, tiled, p);
    EXPECT_EQ(summary.mergedTiles, std::size_t(64));
    EXPECT_EQ(summary.batches, std::size_t(16));

    p.tile_core = 32;
    MemoryOutputTarget whole;
    runPipeline(src, whole, p);
    EXPECT_TRUE(sameMaps(tiled, whole));
}

// --- determinism -------------------------------------------------------------

TEST(Pipeline, DispatchOrderDoesNotMatter)
{
    MemoryVolume src(tubeVolume(32));
    const auto p = smallParams();
    MemoryOutputTarget forward;
    runPipeline(src, forward, p);

    FrangiParams fp;
    fp.gamma = resolveGamma(p, src.info().dtype);
    fp.intensityMax = resolveIntensityMax(p, src.info().dtype);
    FrangiFilterBank bank(fp, p.scales_um, src.info().spacing);
    AggregatorParams ap;
    ap.blockShape = {8, 8, 8};
    ap.bins = p.odf_bins;
    ap.shDegree = p.sh_degree;
    const std::vector<OrientationAggregator> aggs{OrientationAggregator(ap)};

    PartitionRequest req;
    req.volumeShape = src.info().spatialShape();
    req.supportRadius = bank.supportRadius();
    req.blockSize = 8;
    req.requestedCore = p.tile_core;
    auto plan = partitionVolume(req);
    std::reverse(plan.tiles.begin(), plan.tiles.end());
    std::swap(plan.tiles[1], plan.tiles[5]);

    OutputLayout layout;
    layout.volumeShape = req.volumeShape;
    layout.layers.push_back({"", ap.blockShape, aggs[0].blockGridShape(req.volumeShape)});
    layout.bins = aggs[0].bins().size();
    layout.shCoefficients = aggs[0].harmonics().numCoefficients();

    MemoryOutputTarget shuffled;
    {
        OutputMaps maps(shuffled, layout);
        SchedulerOptions opts;
        opts.workers = 3;
        opts.noiseFloor = p.noise_floor;
        TileScheduler scheduler(src, maps, bank, aggs, opts);
        auto summary = scheduler.run(plan.tiles);
        ASSERT_EQ(summary.tiles.size(), std::size_t(8));
        for (std::size_t i = 0; i < summary.tiles.size(); ++i) {
            EXPECT_EQ(summary.tiles[i].tileId, i);
            EXPECT_EQ(summary.tiles[i].state, TileState::Merged);
        }
    }
    shuffled.commit();
    EXPECT_TRUE(sameMaps(forward, shuffled));
}

TEST(Pipeline, RerunIsIdempotent)
{
    MemoryVolume src(tubeVolume(24));
    MemoryOutputTarget a, b;
    auto sa = runPipeline(src, a, smallParams());
    auto sb = runPipeline(src, b, smallParams());
    EXPECT_TRUE(sameMaps(a, b));
    EXPECT_EQ(sa.validVoxels, sb.validVoxels);
    EXPECT_FLOAT_EQ(sa.fiberEnergy, sb.fiberEnergy);
}

// --- failures and retries ----------------------------------------------------

TEST(Pipeline, TransientLoadFailuresAreRetried)
{
    MemoryVolume base(tubeVolume(32));
    FlakyVolume flaky(base, 2);
    MemoryOutputTarget out;
    auto summary = runPipeline(flaky, out, smallParams());

    EXPECT_TRUE(out.committed());
    EXPECT_EQ(summary.tiles[0].retries, 2);
    EXPECT_EQ(summary.tiles[1].retries, 0);
    EXPECT_EQ(summary.tiles[0].state, TileState::Merged);

    MemoryOutputTarget clean;
    runPipeline(base, clean, smallParams());
    EXPECT_TRUE(sameMaps(out, clean));
}

TEST(Pipeline, ExhaustedRetriesPublishNothing)
{
    MemoryVolume base(tubeVolume(32));
    FlakyVolume flaky(base, 1000);
    MemoryOutputTarget out;
    bool thrown = false;
    try {
        runPipeline(flaky, out, smallParams());
    } catch (const PipelineError& e) {
        thrown = true;
        ASSERT_EQ(e.failures().size(), std::size_t(1));
        EXPECT_EQ(e.failures()[0].tileId, std::size_t(0));
        EXPECT_EQ(e.failures()[0].state, std::string("FailedLoad"));
        EXPECT_EQ(e.failures()[0].attempts, 3);
    }
    EXPECT_TRUE(thrown);
    EXPECT_FALSE(out.committed());
    EXPECT_FALSE(out.has(maps::Orientation));
    EXPECT_TRUE(out.names().empty());
}

TEST(Pipeline, ShapeMismatchIsNotRetried)
{
    MemoryVolume base(tubeVolume(32));
    TruncatingVolume bad(base);
    MemoryOutputTarget out;
    bool thrown = false;
    try {
        runPipeline(bad, out, smallParams());
    } catch (const PipelineError& e) {
        thrown = true;
        ASSERT_EQ(e.failures().size(), std::size_t(1));
        EXPECT_EQ(e.failures()[0].attempts, 1);
    }
    EXPECT_TRUE(thrown);
    EXPECT_FALSE(out.committed());
}

TEST(Pipeline, MergeFailuresAreComputeFailures)
{
    MemoryVolume base(tubeVolume(32));
    auto p = smallParams();
    p.workers = 1;

    FlakyTarget recovers(1);
    auto summary = runPipeline(base, recovers, p);
    EXPECT_TRUE(recovers.committed());
    EXPECT_EQ(summary.tiles[0].retries, 1);

    FlakyTarget fails(100);
    bool thrown = false;
    try {
        runPipeline(base, fails, p);
    } catch (const PipelineError& e) {
        thrown = true;
        ASSERT_EQ(e.failures().size(), std::size_t(1));
        EXPECT_EQ(e.failures()[0].state, std::string("FailedCompute"));
    }
    EXPECT_TRUE(thrown);
    EXPECT_FALSE(fails.committed());
}

// --- cancellation ------------------------------------------------------------

TEST(Pipeline, CancelledBeforeStartPublishesNothing)
{
    MemoryVolume src(tubeVolume(32));
    MemoryOutputTarget out;
    std::atomic<bool> cancel{true};
    EXPECT_THROW(runPipeline(src, out, smallParams(), &cancel), PipelineCancelled);
    EXPECT_FALSE(out.committed());
}

TEST(Pipeline, InFlightTileFinishesAfterCancel)
{
    MemoryVolume base(tubeVolume(32));
    std::atomic<bool> cancel{false};
    CancellingVolume src(base, cancel);
    auto p = smallParams();
    p.workers = 1;
    p.batch_size = 2;
    MemoryOutputTarget out;

    std::string message;
    try {
        runPipeline(src, out, p, &cancel);
    } catch (const PipelineCancelled& e) {
        message = e.what();
    }
    EXPECT_NE(message.find("after 1 of 8"), std::string::npos);
    EXPECT_FALSE(out.committed());
}

// --- configuration -----------------------------------------------------------

TEST(Pipeline, InvalidConfigurationFailsBeforeAnyTile)
{
    MemoryVolume base(tubeVolume(16));
    FlakyVolume src(base, 1000);
    auto p = smallParams();
    p.tile_core = 12;
    MemoryOutputTarget out;
    EXPECT_THROW(runPipeline(src, out, p), ConfigurationError);

    xt::xarray<float> multi = xt::xarray<float>::from_shape({8, 8, 8, 2});
    MemoryVolume channels(multi);
    EXPECT_THROW(runPipeline(channels, out, smallParams()), ConfigurationError);
    EXPECT_FALSE(out.committed());
}

TEST(Pipeline, AutoGammaFollowsDtype)
{
    PipelineParams p;
    EXPECT_FLOAT_EQ(resolveGamma(p, Dtype::UInt8), 127.5);
    EXPECT_FLOAT_EQ(resolveGamma(p, Dtype::UInt16), 32767.5);
    EXPECT_FLOAT_EQ(resolveGamma(p, Dtype::Float32), 0.5);
    p.intensity_max = 255.0;
    EXPECT_FLOAT_EQ(resolveIntensityMax(p, Dtype::Float32), 255.0);
    EXPECT_FLOAT_EQ(resolveGamma(p, Dtype::Float32), 127.5);
    p.gamma = 3.0;
    EXPECT_FLOAT_EQ(resolveGamma(p, Dtype::UInt8), 3.0);
}
