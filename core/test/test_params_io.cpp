#include "test.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <random>
#include <vector>

#include <nlohmann/json.hpp>

#include "fo/core/pipeline/PipelineParams.hpp"
#include "fo/core/pipeline/PipelineParamsIO.hpp"
#include "fo/core/synth/Phantom.hpp"
#include "fo/core/util/Errors.hpp"

namespace fs = std::filesystem;
using namespace fo;

TEST(PipelineParams, DefaultsSurviveJson)
{
    PipelineParams p;
    auto back = params::parseFromJson(params::toJson(p));
    EXPECT_EQ(back.scales_um.size(), std::size_t(1));
    EXPECT_FLOAT_EQ(back.scales_um[0], 1.25);
    EXPECT_FLOAT_EQ(back.alpha, 0.001);
    EXPECT_FLOAT_EQ(back.gamma, -1.0);
    EXPECT_TRUE(back.polarity == FiberPolarity::Bright);
    EXPECT_EQ(back.odf_blocks, std::vector<std::size_t>{16});
    EXPECT_TRUE(back.odf_res_um.empty());
    EXPECT_FLOAT_EQ(back.odf_min_fill, 0.5);
    EXPECT_FLOAT_EQ(back.odf_energy_factor, 1.0);
    EXPECT_FLOAT_EQ(back.intensity_max, 0.0);
    EXPECT_FALSE(back.psf_fwhm_um.has_value());
    EXPECT_EQ(back.sh_degree, 6);
    EXPECT_EQ(back.retry_limit, 2);
    EXPECT_FALSE(back.spacing_um.has_value());
    EXPECT_NO_THROW(validate(back));
}

TEST(PipelineParams, OverlayOnlyTouchesNamedKeys)
{
    PipelineParams p;
    p.workers = 3;
    params::applyJsonOverlay(p, {{"scales_um", {1.0, 2.0}},
                                 {"polarity", "dark"},
                                 {"spacing_um", {2.0, 1.0, 1.0}},
                                 {"gamma", nullptr}});
    EXPECT_EQ(p.workers, 3);
    EXPECT_EQ(p.scales_um.size(), std::size_t(2));
    EXPECT_TRUE(p.polarity == FiberPolarity::Dark);
    ASSERT_TRUE(p.spacing_um.has_value());
    EXPECT_FLOAT_EQ((*p.spacing_um)[0], 2.0);
    EXPECT_FLOAT_EQ(p.gamma, -1.0);

    auto j = params::toJson(p);
    EXPECT_EQ(j["polarity"].get<std::string>(), std::string("dark"));
    EXPECT_EQ(j["spacing_um"].size(), std::size_t(3));
}

TEST(PipelineParams, BadJsonIsConfigurationError)
{
    PipelineParams p;
    EXPECT_THROW(params::applyJsonOverlay(p, {{"tile_size", 64}}), ConfigurationError);
    EXPECT_THROW(params::applyJsonOverlay(p, {{"alpha", "high"}}), ConfigurationError);
    EXPECT_THROW(params::applyJsonOverlay(p, {{"polarity", "grey"}}), ConfigurationError);
    EXPECT_THROW(params::applyJsonOverlay(p, nlohmann::json::array()), ConfigurationError);
}

TEST(PipelineParams, Validation)
{
    auto expectInvalid = [](auto mutate) {
        PipelineParams p;
        mutate(p);
        EXPECT_THROW(validate(p), ConfigurationError);
    };
    expectInvalid([](PipelineParams& p) { p.scales_um.clear(); });
    expectInvalid([](PipelineParams& p) { p.scales_um = {2.0, 1.0}; });
    expectInvalid([](PipelineParams& p) { p.scales_um = {0.0}; });
    expectInvalid([](PipelineParams& p) { p.alpha = 0.0; });
    expectInvalid([](PipelineParams& p) { p.kernel_truncate = 0.5; });
    expectInvalid([](PipelineParams& p) { p.tile_core = 24; });
    expectInvalid([](PipelineParams& p) { p.halo = -2; });
    expectInvalid([](PipelineParams& p) { p.odf_bins = 0; });
    expectInvalid([](PipelineParams& p) { p.sh_degree = 3; });
    expectInvalid([](PipelineParams& p) { p.sh_degree = 12; });
    expectInvalid([](PipelineParams& p) { p.retry_limit = -1; });
    expectInvalid([](PipelineParams& p) { p.spacing_um = std::array<double, 3>{1.0, 0.0, 1.0}; });
    expectInvalid([](PipelineParams& p) {
        p.scale_step_um = 0.5;
        p.scale_min_um = 3.0;
        p.scale_max_um = 1.0;
    });
    expectInvalid([](PipelineParams& p) { p.intensity_max = std::numeric_limits<double>::infinity(); });
    expectInvalid([](PipelineParams& p) { p.psf_fwhm_um = std::array<double, 3>{2.6, 0.0, 0.7}; });
    expectInvalid([](PipelineParams& p) { p.odf_blocks.clear(); });
    expectInvalid([](PipelineParams& p) { p.odf_blocks = {8, 0}; });
    expectInvalid([](PipelineParams& p) {
        p.odf_blocks = {16, 24};
        p.tile_core = 32;
    });
    expectInvalid([](PipelineParams& p) { p.odf_res_um = {25.0, -1.0}; });
    expectInvalid([](PipelineParams& p) { p.odf_min_fill = 1.0; });
    expectInvalid([](PipelineParams& p) { p.odf_min_fill = -0.1; });
    expectInvalid([](PipelineParams& p) { p.odf_energy_factor = std::nan(""); });
    expectInvalid([](PipelineParams& p) {
        p.scales_um.clear();
        for (int i = 1; i <= 65; ++i) p.scales_um.push_back(i);
    });

    PipelineParams ok;
    ok.odf_blocks = {16, 32};
    ok.tile_core = 64;
    EXPECT_NO_THROW(validate(ok));
}

TEST(PipelineParams, ScaleStepMustBeFinite)
{
    PipelineParams p;
    p.scale_min_um = 1.0;
    p.scale_max_um = 3.0;
    p.scale_step_um = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(resolvedScales(p), ConfigurationError);
    EXPECT_THROW(validate(p), ConfigurationError);

    p.scale_step_um = std::numeric_limits<double>::infinity();
    EXPECT_THROW(resolvedScales(p), ConfigurationError);

    p.scale_step_um = 0.5;
    p.scale_max_um = std::numeric_limits<double>::infinity();
    EXPECT_THROW(resolvedScales(p), ConfigurationError);
}

TEST(PipelineParams, ScaleRangeIsCapped)
{
    PipelineParams p;
    p.scale_min_um = 1.0;
    p.scale_max_um = 64.0;
    p.scale_step_um = 1.0;
    EXPECT_EQ(resolvedScales(p).size(), kMaxScales);

    p.scale_max_um = 65.0;
    EXPECT_THROW(resolvedScales(p), ConfigurationError);

    // a tiny step must fail fast instead of allocating a huge list
    p.scale_step_um = 1e-12;
    EXPECT_THROW(resolvedScales(p), ConfigurationError);
}

TEST(PipelineParams, OdfResolutions)
{
    PipelineParams p;
    auto single = resolvedOdfResolutions(p, {1.0, 1.0, 1.0});
    ASSERT_EQ(single.size(), std::size_t(1));
    EXPECT_TRUE(single[0].label.empty());
    EXPECT_EQ(single[0].blockShape[0], std::size_t(16));

    p.odf_blocks = {8, 16};
    auto both = resolvedOdfResolutions(p, {1.0, 1.0, 1.0});
    ASSERT_EQ(both.size(), std::size_t(2));
    EXPECT_EQ(both[0].label, std::string("8vx"));
    EXPECT_EQ(both[1].label, std::string("16vx"));
    EXPECT_EQ(odfAlignment(both), std::size_t(16));

    p.odf_blocks = {8, 8};
    EXPECT_THROW(resolvedOdfResolutions(p, {1.0, 1.0, 1.0}), ConfigurationError);

    p.odf_res_um = {16.0};
    auto um = resolvedOdfResolutions(p, {2.0, 1.0, 0.7});
    ASSERT_EQ(um.size(), std::size_t(1));
    EXPECT_EQ(um[0].blockShape[0], std::size_t(8));
    EXPECT_EQ(um[0].blockShape[1], std::size_t(16));
    EXPECT_EQ(um[0].blockShape[2], std::size_t(23));
    EXPECT_EQ(odfAlignment(um), std::size_t(368));

    p.odf_res_um = {0.2, 25.0};
    auto fine = resolvedOdfResolutions(p, {1.0, 1.0, 1.0});
    EXPECT_EQ(fine[0].blockShape[2], std::size_t(1));
    EXPECT_EQ(fine[1].label, std::string("25um"));
}

TEST(PipelineParams, NewKeysSurviveJson)
{
    PipelineParams p;
    params::applyJsonOverlay(p, {{"odf_blocks", 8},
                                 {"odf_res_um", {25.0, 50.0}},
                                 {"odf_min_fill", 0.25},
                                 {"odf_energy_factor", 2.0},
                                 {"intensity_max", 4095.0},
                                 {"psf_fwhm_um", {2.612, 0.692, 0.692}}});
    EXPECT_EQ(p.odf_blocks, std::vector<std::size_t>{8});
    ASSERT_EQ(p.odf_res_um.size(), std::size_t(2));
    ASSERT_TRUE(p.psf_fwhm_um.has_value());
    EXPECT_FLOAT_EQ((*p.psf_fwhm_um)[0], 2.612);

    auto back = params::parseFromJson(params::toJson(p));
    EXPECT_EQ(back.odf_res_um, p.odf_res_um);
    EXPECT_FLOAT_EQ(back.odf_min_fill, 0.25);
    EXPECT_FLOAT_EQ(back.odf_energy_factor, 2.0);
    EXPECT_FLOAT_EQ(back.intensity_max, 4095.0);
    ASSERT_TRUE(back.psf_fwhm_um.has_value());
    EXPECT_FLOAT_EQ((*back.psf_fwhm_um)[2], 0.692);

    params::applyJsonOverlay(p, {{"odf_res_um", nullptr}, {"psf_fwhm_um", nullptr}, {"intensity_max", nullptr}});
    EXPECT_TRUE(p.odf_res_um.empty());
    EXPECT_FALSE(p.psf_fwhm_um.has_value());
    EXPECT_FLOAT_EQ(p.intensity_max, 0.0);
    EXPECT_THROW(params::applyJsonOverlay(p, {{"odf_block", 8}}), ConfigurationError);
}

TEST(PipelineParams, ScaleRange)
{
    PipelineParams p;
    p.scale_min_um = 1.0;
    p.scale_max_um = 3.0;
    p.scale_step_um = 0.5;
    auto s = resolvedScales(p);
    ASSERT_EQ(s.size(), std::size_t(5));
    EXPECT_FLOAT_EQ(s[0], 1.0);
    EXPECT_FLOAT_EQ(s[4], 3.0);

    p.scale_step_um = 0.0;
    EXPECT_EQ(resolvedScales(p).size(), std::size_t(1));
}

TEST(PipelineParams, LoadFromFile)
{
    std::random_device rd;
    const fs::path path = fs::temp_directory_path() / ("fo_params_" + std::to_string(rd()) + ".json");
    {
        std::ofstream f(path);
        f << R"({"scales_um": [1.5, 3.0], "odf_bins": 32, "workers": 2})";
    }
    auto p = params::loadFromFile(path);
    EXPECT_EQ(p.odf_bins, 32);
    EXPECT_EQ(p.workers, 2);
    EXPECT_FLOAT_EQ(p.scales_um[1], 3.0);

    {
        std::ofstream f(path);
        f << "{ not json";
    }
    EXPECT_THROW(params::loadFromFile(path), ConfigurationError);
    fs::remove(path);
    EXPECT_THROW(params::loadFromFile(path), IOError);
}

TEST(Phantom, FromJson)
{
    auto j = nlohmann::json::parse(R"({
        "shape": [16, 20, 24],
        "dtype": "|u1",
        "seed": 7,
        "fibers": [{"start": [8, 10, 0], "end": [8, 10, 23], "radius_um": 1.5}]
    })");
    auto spec = phantomFromJson(j);
    EXPECT_EQ(spec.shape[2], std::size_t(24));
    EXPECT_TRUE(spec.dtype == Dtype::UInt8);
    ASSERT_EQ(spec.fibers.size(), std::size_t(1));
    EXPECT_FLOAT_EQ(spec.fibers[0].radiusUm, 1.5);
    EXPECT_FLOAT_EQ(spec.fibers[0].intensity, 1.0);

    auto vol = renderPhantom(spec);
    EXPECT_FLOAT_EQ(vol(8, 10, 12), 255.0f);
    EXPECT_FLOAT_EQ(vol(0, 0, 12), 0.0f);
}

TEST(Phantom, MissingFieldsAreRejected)
{
    EXPECT_THROW(phantomFromJson({{"fibers", nlohmann::json::array()}}), ConfigurationError);
    EXPECT_THROW(phantomFromJson(nlohmann::json::parse(
                     R"({"shape": [8, 8, 8], "fibers": [{"start": [0, 0, 0], "end": [1, 1, 1]}]})")),
                 ConfigurationError);
    EXPECT_THROW(phantomFromJson(nlohmann::json::parse(
                     R"({"shape": [8, 8, 8], "dtype": "<i8", "fibers": []})")),
                 ConfigurationError);
    EXPECT_THROW(phantomFromJson(nlohmann::json::parse(R"({"shape": "big", "fibers": []})")),
                 ConfigurationError);
}
