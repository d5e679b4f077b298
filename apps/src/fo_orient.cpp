/**
 * @file fo_orient.cpp
 * @brief Multiscale fiber enhancement and orientation analysis of a zarr volume
 *
 * Reads a 3D zarr v2 dataset, runs the tiled Frangi filter bank, estimates
 * per-voxel fiber orientation and aggregates block-level ODFs. Results are
 * written as a zarr group:
 *   orientation, coherence, fractional_anisotropy, response, scale,
 *   odf, odf_sh, block_energy, block_quality, block_count, block_empty,
 *   run_report.json
 * With several ODF resolutions the block maps carry a suffix, e.g.
 * odf_25um. With --vectors the input is a Z x Y x X x 3 fiber vector
 * dataset and only the block maps are written.
 *
 * The output group only appears once every tile has been merged.
 */

#include <boost/program_options.hpp>

#include <array>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fo/core/io/OutputTarget.hpp"
#include "fo/core/io/ZarrVolume.hpp"
#include "fo/core/pipeline/Pipeline.hpp"
#include "fo/core/pipeline/PipelineParams.hpp"
#include "fo/core/pipeline/PipelineParamsIO.hpp"
#include "fo/core/util/Errors.hpp"
#include "fo/core/util/Logging.hpp"

namespace po = boost::program_options;
namespace fs = std::filesystem;

namespace {

std::atomic<bool> g_cancel{false};

extern "C" void onSignal(int)
{
    g_cancel.store(true);
}

std::vector<double> parseList(const std::string& s, const char* what)
{
    std::vector<double> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        try {
            out.push_back(std::stod(item));
        } catch (const std::exception&) {
            throw fo::ConfigurationError(std::string("invalid value '") + item + "' in --" + what);
        }
    }
    return out;
}

struct Config {
    std::string inputPath;
    std::string outputPath;
    std::string configPath;
    std::string logFile;
    std::string logLevel = "info";
    std::size_t chunk = 64;
    bool overwrite = false;
    bool dumpConfig = false;
    bool vectors = false;
};

std::vector<std::size_t> parseSizes(const std::string& s, const char* what)
{
    std::vector<std::size_t> out;
    for (double v : parseList(s, what)) {
        if (!(v >= 1.0) || v != static_cast<double>(static_cast<std::size_t>(v))) {
            throw fo::ConfigurationError(std::string("--") + what + " needs positive integers");
        }
        out.push_back(static_cast<std::size_t>(v));
    }
    return out;
}

std::array<double, 3> parseTriple(const std::string& s, const char* what)
{
    const auto v = parseList(s, what);
    if (v.size() != 3) {
        throw fo::ConfigurationError(std::string("--") + what + " needs three values z,y,x");
    }
    return {v[0], v[1], v[2]};
}

}  // namespace

int main(int argc, char* argv[])
{
    Config cfg;

    po::options_description desc("fo_orient - fiber orientation analysis\n\nUsage");
    desc.add_options()
        ("help,h", "Show this help message")

        // Input/Output
        ("input,i", po::value<std::string>(&cfg.inputPath), "Input zarr dataset (3D, u1/u2/f4)")
        ("vectors", po::bool_switch(&cfg.vectors), "Input holds fiber vectors (ZYX x 3); compute ODFs only")
        ("output,o", po::value<std::string>(&cfg.outputPath), "Output zarr group")
        ("overwrite", po::bool_switch(&cfg.overwrite), "Replace an existing output group")
        ("chunk", po::value<std::size_t>(&cfg.chunk)->default_value(64), "Output chunk size per axis")
        ("config,c", po::value<std::string>(&cfg.configPath), "JSON parameter file; flags override it")
        ("dump-config", po::bool_switch(&cfg.dumpConfig), "Print the effective parameters and exit")

        // Scales
        ("scales", po::value<std::string>(), "Comma separated fiber scales in um, e.g. 1,2,4")
        ("scale-min", po::value<double>(), "Scale range start (um)")
        ("scale-max", po::value<double>(), "Scale range end (um)")
        ("scale-step", po::value<double>(), "Scale range step (um)")
        ("spacing", po::value<std::string>(), "Voxel size z,y,x in um (overrides .zattrs)")

        // Frangi
        ("alpha", po::value<double>(), "Plate sensitivity (default 0.001)")
        ("beta", po::value<double>(), "Blob sensitivity (default 1)")
        ("gamma", po::value<double>(), "Structureness; <= 0 means half the dtype range")
        ("polarity", po::value<std::string>(), "bright or dark fibers")
        ("truncate", po::value<double>(), "Gaussian kernel support in sigmas (default 4)")
        ("noise-floor", po::value<double>(), "Responses not above this are null (default 1e-3)")
        ("intensity-max", po::value<double>(), "Valid input range is [0, max] (default: dtype range)")
        ("psf-fwhm", po::value<std::string>(), "PSF FWHM z,y,x in um; blurs axes up to the widest")

        // Tiling and ODF
        ("tile-core", po::value<std::size_t>(), "Tile core size in voxels (0 = from memory budget)")
        ("halo", po::value<int>(), "Tile halo in voxels (-1 = filter support)")
        ("memory-mb", po::value<double>(), "Memory budget for all in-flight tiles")
        ("odf-blocks", po::value<std::string>(), "Comma separated ODF block sizes in voxels (default 16)")
        ("odf-res", po::value<std::string>(), "Comma separated ODF block sizes in um (replaces --odf-blocks)")
        ("odf-min-fill", po::value<double>(), "Edge blocks at or below this fill are empty (default 0.5)")
        ("odf-energy-factor", po::value<double>(), "Blocks need energy >= factor x sqrt(voxels) (default 1)")
        ("odf-bins", po::value<int>(), "Hemisphere direction bins (default 64)")
        ("sh-degree", po::value<int>(), "Even spherical harmonic degree 0..10 (default 6)")

        // Execution
        ("workers,j", po::value<int>(), "Worker threads (0 = all)")
        ("batch-size", po::value<std::size_t>(), "Tiles per dispatch batch (0 = 2 x workers)")
        ("retries", po::value<int>(), "Extra attempts per failing tile (default 2)")
        ("log-file", po::value<std::string>(&cfg.logFile), "Also append log output to this file")
        ("log-level", po::value<std::string>(&cfg.logLevel)->default_value("info"),
            "trace, debug, info, warn, error or critical")
    ;

    po::positional_options_description pos;
    pos.add("input", 1);
    pos.add("output", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(pos).run(), vm);

        if (vm.count("help") || argc < 2) {
            std::cout << desc << "\n";
            std::cout << "\nExamples:\n";
            std::cout << "  # Default single scale\n";
            std::cout << "  fo_orient brain.zarr brain_fibers.zarr\n\n";
            std::cout << "  # Three scales, 8 threads, parameters from a file\n";
            std::cout << "  fo_orient brain.zarr out.zarr --scales 1,2,4 -j 8 --config params.json\n\n";
            std::cout << "  # ODFs at 25 and 50 um from an existing orientation map\n";
            std::cout << "  fo_orient fibers.zarr/orientation odf.zarr --vectors --odf-res 25,50\n";
            return 0;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Use --help for usage information." << "\n";
        return 1;
    }

    if (!fo::SetLogLevel(cfg.logLevel)) {
        std::cerr << "Error: unknown log level '" << cfg.logLevel << "'\n";
        return 1;
    }

    fo::PipelineParams params;
    try {
        if (!cfg.logFile.empty()) {
            fo::AddLogFile(cfg.logFile);
        }
        if (!cfg.configPath.empty()) {
            params = fo::params::loadFromFile(cfg.configPath);
        }

        if (vm.count("scales")) {
            params.scales_um = parseList(vm["scales"].as<std::string>(), "scales");
            params.scale_step_um = 0.0;
        }
        if (vm.count("scale-min")) params.scale_min_um = vm["scale-min"].as<double>();
        if (vm.count("scale-max")) params.scale_max_um = vm["scale-max"].as<double>();
        if (vm.count("scale-step")) params.scale_step_um = vm["scale-step"].as<double>();
        if (vm.count("spacing")) params.spacing_um = parseTriple(vm["spacing"].as<std::string>(), "spacing");
        if (vm.count("alpha")) params.alpha = vm["alpha"].as<double>();
        if (vm.count("beta")) params.beta = vm["beta"].as<double>();
        if (vm.count("gamma")) params.gamma = vm["gamma"].as<double>();
        if (vm.count("polarity")) params.polarity = fo::polarityFromString(vm["polarity"].as<std::string>());
        if (vm.count("truncate")) params.kernel_truncate = vm["truncate"].as<double>();
        if (vm.count("noise-floor")) params.noise_floor = vm["noise-floor"].as<double>();
        if (vm.count("intensity-max")) params.intensity_max = vm["intensity-max"].as<double>();
        if (vm.count("psf-fwhm")) params.psf_fwhm_um = parseTriple(vm["psf-fwhm"].as<std::string>(), "psf-fwhm");
        if (vm.count("tile-core")) params.tile_core = vm["tile-core"].as<std::size_t>();
        if (vm.count("halo")) params.halo = vm["halo"].as<int>();
        if (vm.count("memory-mb")) params.memory_budget_mb = vm["memory-mb"].as<double>();
        if (vm.count("odf-blocks")) params.odf_blocks = parseSizes(vm["odf-blocks"].as<std::string>(), "odf-blocks");
        if (vm.count("odf-res")) params.odf_res_um = parseList(vm["odf-res"].as<std::string>(), "odf-res");
        if (vm.count("odf-min-fill")) params.odf_min_fill = vm["odf-min-fill"].as<double>();
        if (vm.count("odf-energy-factor")) params.odf_energy_factor = vm["odf-energy-factor"].as<double>();
        if (vm.count("odf-bins")) params.odf_bins = vm["odf-bins"].as<int>();
        if (vm.count("sh-degree")) params.sh_degree = vm["sh-degree"].as<int>();
        if (vm.count("workers")) params.workers = vm["workers"].as<int>();
        if (vm.count("batch-size")) params.batch_size = vm["batch-size"].as<std::size_t>();
        if (vm.count("retries")) params.retry_limit = vm["retries"].as<int>();

        fo::validate(params);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (cfg.dumpConfig) {
        std::cout << fo::params::toJson(params).dump(2) << "\n";
        return 0;
    }
    if (cfg.inputPath.empty() || cfg.outputPath.empty()) {
        std::cerr << "Error: input and output paths are required\n";
        return 1;
    }
    if (cfg.chunk == 0) {
        std::cerr << "Error: --chunk must be positive\n";
        return 1;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    try {
        auto source = fo::openVolume(cfg.inputPath, params.spacing_um);
        fo::ZarrOutputTarget target(cfg.outputPath, cfg.overwrite, {cfg.chunk, cfg.chunk, cfg.chunk});

        auto summary = cfg.vectors ? fo::runOdfFromVectors(*source, target, params, &g_cancel)
                                   : fo::runPipeline(*source, target, params, &g_cancel);
        source->close();

        fo::Logger()->info("done: {} tiles, {} valid voxels, fiber energy {}", summary.mergedTiles,
                           summary.validVoxels, summary.fiberEnergy);
        return 0;
    } catch (const fo::PipelineCancelled& e) {
        fo::Logger()->error("{}", e.what());
        return 130;
    } catch (const fo::PipelineError& e) {
        fo::Logger()->critical("{}", e.what());
        return 2;
    } catch (const std::exception& e) {
        fo::Logger()->critical("Error: {}", e.what());
        return 1;
    }
}
