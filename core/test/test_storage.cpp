#include "test.hpp"

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

#include <nlohmann/json.hpp>

#include "fo/core/io/MemoryVolume.hpp"
#include "fo/core/io/OutputTarget.hpp"
#include "fo/core/io/ZarrVolume.hpp"
#include "fo/core/pipeline/OutputMaps.hpp"
#include "fo/core/pipeline/Pipeline.hpp"
#include "fo/core/synth/Phantom.hpp"
#include "fo/core/util/Errors.hpp"

namespace fs = std::filesystem;
using namespace fo;

namespace {

struct TmpDir {
    fs::path path;
    TmpDir()
    {
        std::random_device rd;
        path = fs::temp_directory_path() / ("fo_test_" + std::to_string(rd()));
        fs::create_directories(path);
    }
    ~TmpDir()
    {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

VolumeInfo info3(std::size_t n, Dtype dtype)
{
    VolumeInfo info;
    info.shape = {n, n, n};
    info.dtype = dtype;
    return info;
}

nlohmann::json readJson(const fs::path& p)
{
    std::ifstream f(p);
    return nlohmann::json::parse(f);
}

}  // namespace

// --- ZarrVolume --------------------------------------------------------------

TEST(ZarrVolume, WriteReopenRead)
{
    TmpDir tmp;
    auto info = info3(20, Dtype::Float32);
    info.spacing = {2.0, 0.5, 0.5};
    {
        auto vol = ZarrVolume::create(tmp.path / "vol", info, {8, 8, 8});
        xt::xarray<float> block = xt::xarray<float>::from_shape({4, 10, 12});
        float v = 0.0f;
        for (auto& x : block) x = v++;
        vol->writeRegion({6, 3, 5}, block);
    }

    auto vol = ZarrVolume::open(tmp.path / "vol");
    EXPECT_EQ(vol->info().shape.size(), std::size_t(3));
    EXPECT_EQ(vol->info().shape[0], std::size_t(20));
    EXPECT_FLOAT_EQ(vol->info().spacing[0], 2.0);
    EXPECT_FLOAT_EQ(vol->info().spacing[2], 0.5);

    auto back = vol->readRegion({6, 3, 5}, {4, 10, 12});
    EXPECT_FLOAT_EQ(back(0, 0, 0), 0.0f);
    EXPECT_FLOAT_EQ(back(3, 9, 11), 479.0f);
    EXPECT_FLOAT_EQ(back(1, 2, 3), 120.0f + 24.0f + 3.0f);

    // Untouched chunks read as fill value.
    auto corner = vol->readRegion({0, 0, 0}, {2, 2, 2});
    for (float x : corner) EXPECT_FLOAT_EQ(x, 0.0f);
}

TEST(ZarrVolume, SpacingOverrideWins)
{
    TmpDir tmp;
    ZarrVolume::create(tmp.path / "vol", info3(8, Dtype::UInt8), {8, 8, 8});
    auto vol = ZarrVolume::open(tmp.path / "vol", std::array<double, 3>{3.0, 3.0, 3.0});
    EXPECT_FLOAT_EQ(vol->info().spacing[1], 3.0);
}

TEST(ZarrVolume, IntegerStoresQuantize)
{
    TmpDir tmp;
    auto vol = ZarrVolume::create(tmp.path / "u8", info3(4, Dtype::UInt8), {4, 4, 4});
    xt::xarray<float> block = xt::xarray<float>::from_shape({1, 1, 3});
    block(0, 0, 0) = 12.6f;
    block(0, 0, 1) = -5.0f;
    block(0, 0, 2) = 300.0f;
    vol->writeRegion({0, 0, 0}, block);
    auto back = vol->readRegion({0, 0, 0}, {1, 1, 3});
    EXPECT_FLOAT_EQ(back(0, 0, 0), 13.0f);
    EXPECT_FLOAT_EQ(back(0, 0, 1), 0.0f);
    EXPECT_FLOAT_EQ(back(0, 0, 2), 255.0f);
}

TEST(ZarrVolume, ChannelMaps)
{
    TmpDir tmp;
    VolumeInfo info = info3(6, Dtype::Float32);
    info.shape.push_back(3);
    auto vol = ZarrVolume::create(tmp.path / "vec", info, {4, 4, 4});
    EXPECT_EQ(vol->info().channels(), std::size_t(3));

    xt::xarray<float> block = xt::xarray<float>::from_shape({2, 2, 2, 3});
    for (std::size_t i = 0; i < block.size(); ++i) block.data()[i] = static_cast<float>(i % 3);
    vol->writeRegion({3, 3, 3}, block);

    auto back = vol->readRegion({3, 3, 3}, {2, 2, 2});
    ASSERT_EQ(back.dimension(), std::size_t(4));
    EXPECT_FLOAT_EQ(back(1, 1, 1, 2), 2.0f);
    EXPECT_FLOAT_EQ(back(0, 1, 0, 1), 1.0f);

    // A spatial-only write must cover every channel.
    xt::xarray<float> partial = xt::xarray<float>::from_shape({2, 2, 2, 2});
    EXPECT_THROW(vol->writeRegion({0, 0, 0}, partial), ShapeMismatchError);
}

TEST(ZarrVolume, Errors)
{
    TmpDir tmp;
    EXPECT_THROW(ZarrVolume::open(tmp.path / "missing"), IOError);

    auto vol = ZarrVolume::create(tmp.path / "vol", info3(8, Dtype::Float32), {4, 4, 4});
    EXPECT_THROW(vol->readRegion({6, 0, 0}, {4, 4, 4}), ShapeMismatchError);
    vol->close();
    EXPECT_FALSE(vol->isOpen());
    EXPECT_THROW(vol->readRegion({0, 0, 0}, {1, 1, 1}), IOError);
}

TEST(MemoryVolume, MatchesZarrSemantics)
{
    MemoryVolume mem(info3(8, Dtype::UInt16));
    xt::xarray<float> block = xt::xarray<float>::from_shape({1, 1, 1});
    block(0, 0, 0) = 70000.0f;
    mem.writeRegion({1, 1, 1}, block);
    EXPECT_FLOAT_EQ(mem.readRegion({1, 1, 1}, {1, 1, 1})(0, 0, 0), 65535.0f);
    EXPECT_THROW(mem.readRegion({0, 0, 7}, {1, 1, 2}), ShapeMismatchError);
    mem.close();
    EXPECT_THROW(mem.readRegion({0, 0, 0}, {1, 1, 1}), IOError);
}

// --- output targets ----------------------------------------------------------

TEST(ZarrOutputTarget, CommitPublishesAtomically)
{
    TmpDir tmp;
    const fs::path root = tmp.path / "out.zarr";
    {
        ZarrOutputTarget target(root);
        auto& map = target.createMap("response", info3(4, Dtype::Float32));
        xt::xarray<float> block = xt::xarray<float>::from_shape({4, 4, 4});
        std::fill(block.begin(), block.end(), 0.25f);
        map.writeRegion({0, 0, 0}, block);
        target.addDocument("run_report", {{"merged_tiles", 1}});
        target.addDocument("attributes", {{"gamma_used", 0.5}});

        EXPECT_FALSE(fs::exists(root));
        EXPECT_TRUE(fs::exists(target.stagingPath()));
        target.commit();
        EXPECT_TRUE(target.committed());
    }
    EXPECT_TRUE(fs::exists(root / ".zgroup"));
    EXPECT_FALSE(fs::exists(tmp.path / "out.zarr.staging"));
    EXPECT_EQ(readJson(root / "run_report.json")["merged_tiles"].get<int>(), 1);
    EXPECT_FLOAT_EQ(readJson(root / ".zattrs")["gamma_used"].get<double>(), 0.5);

    auto back = ZarrVolume::open(root / "response");
    EXPECT_FLOAT_EQ(back->readRegion({3, 3, 3}, {1, 1, 1})(0, 0, 0), 0.25f);
}

TEST(ZarrOutputTarget, DiscardLeavesNothing)
{
    TmpDir tmp;
    const fs::path root = tmp.path / "out.zarr";
    {
        ZarrOutputTarget target(root);
        target.createMap("coherence", info3(4, Dtype::Float32));
        target.discard();
    }
    EXPECT_FALSE(fs::exists(root));
    EXPECT_FALSE(fs::exists(tmp.path / "out.zarr.staging"));

    {
        ZarrOutputTarget abandoned(root);
        abandoned.createMap("coherence", info3(4, Dtype::Float32));
    }
    EXPECT_FALSE(fs::exists(tmp.path / "out.zarr.staging"));
}

TEST(ZarrOutputTarget, ExistingOutputNeedsOverwrite)
{
    TmpDir tmp;
    const fs::path root = tmp.path / "out.zarr";
    fs::create_directories(root);
    EXPECT_THROW(ZarrOutputTarget target(root), ConfigurationError);

    ZarrOutputTarget target(root, true);
    target.createMap("scale", info3(2, Dtype::Float32));
    target.commit();
    EXPECT_TRUE(fs::exists(root / "scale" / ".zarray"));
}

TEST(ZarrOutputTarget, OverwriteReplacesOldGroup)
{
    TmpDir tmp;
    const fs::path root = tmp.path / "out.zarr";
    fs::create_directories(root / "odf");
    std::ofstream(root / "odf" / "stale") << "old";

    ZarrOutputTarget target(root, true);
    target.createMap("scale", info3(2, Dtype::Float32));
    target.commit();

    EXPECT_TRUE(fs::exists(root / "scale" / ".zarray"));
    EXPECT_FALSE(fs::exists(root / "odf"));
    EXPECT_FALSE(fs::exists(tmp.path / "out.zarr.previous"));
    EXPECT_FALSE(fs::exists(tmp.path / "out.zarr.staging"));
}

TEST(ZarrOutputTarget, FailedPublishKeepsOldGroup)
{
    TmpDir tmp;
    const fs::path root = tmp.path / "out.zarr";
    fs::create_directories(root);
    std::ofstream(root / "marker") << "old";

    ZarrOutputTarget target(root, true);
    fs::remove_all(target.stagingPath());
    EXPECT_THROW(target.commit(), IOError);

    EXPECT_FALSE(target.committed());
    EXPECT_TRUE(fs::exists(root / "marker"));
    EXPECT_FALSE(fs::exists(tmp.path / "out.zarr.previous"));
}

TEST(MemoryOutputTarget, StagedMapsAreHidden)
{
    MemoryOutputTarget target;
    target.createMap("a", info3(2, Dtype::Float32));
    EXPECT_FALSE(target.has("a"));
    EXPECT_THROW(target.map("a"), IOError);
    target.commit();
    EXPECT_TRUE(target.has("a"));
    EXPECT_FALSE(target.map("a").isOpen());
    EXPECT_THROW(target.createMap("b", info3(2, Dtype::Float32)), IOError);
}

// --- end to end --------------------------------------------------------------

TEST(Storage, PipelineOnZarrVolumes)
{
    TmpDir tmp;
    PhantomSpec spec;
    spec.shape = {24, 24, 24};
    spec.dtype = Dtype::UInt8;
    spec.fibers.push_back({{12.0, 0.0, 12.0}, {12.0, 23.0, 12.0}, 2.0, 1.0});
    {
        VolumeInfo info = info3(24, Dtype::UInt8);
        auto vol = ZarrVolume::create(tmp.path / "in", info, {8, 8, 8});
        vol->writeRegion({0, 0, 0}, renderPhantom(spec));
    }

    auto source = ZarrVolume::open(tmp.path / "in");
    PipelineParams p;
    p.scales_um = {2.0};
    p.tile_core = 16;
    p.odf_blocks = {8};
    p.odf_bins = 16;
    p.sh_degree = 2;
    p.workers = 2;
    {
        ZarrOutputTarget target(tmp.path / "out.zarr", false, {8, 8, 8});
        auto summary = runPipeline(*source, target, p);
        EXPECT_EQ(summary.mergedTiles, std::size_t(8));
    }

    const auto attrs = readJson(tmp.path / "out.zarr" / ".zattrs");
    EXPECT_FLOAT_EQ(attrs["gamma_used"].get<double>(), 127.5);
    ASSERT_EQ(attrs["maps"].size(), std::size_t(11));
    for (const auto& name : attrs["maps"]) {
        EXPECT_TRUE(fs::exists(tmp.path / "out.zarr" / name.get<std::string>() / ".zarray"));
    }

    auto orient = ZarrVolume::open(tmp.path / "out.zarr" / maps::Orientation);
    auto v = orient->readRegion({12, 12, 12}, {1, 1, 1});
    EXPECT_GT(std::abs(v(0, 0, 0, 1)), 0.99f);

    auto empty = ZarrVolume::open(tmp.path / "out.zarr" / maps::BlockEmpty);
    EXPECT_EQ(empty->info().dtype, Dtype::UInt8);
    EXPECT_FLOAT_EQ(empty->readRegion({1, 1, 1}, {1, 1, 1})(0, 0, 0), 0.0f);
}
