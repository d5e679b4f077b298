/**
 * @file fo_phantom.cpp
 * @brief Write a synthetic fiber volume as a zarr v2 dataset
 *
 * Either renders the phantom described by a JSON file (see
 * fo::phantomFromJson) or a single straight tube through the volume
 * center along a given axis.
 */

#include <boost/program_options.hpp>

#include <array>
#include <iostream>
#include <string>

#include "fo/core/io/ZarrVolume.hpp"
#include "fo/core/synth/Phantom.hpp"
#include "fo/core/util/Errors.hpp"
#include "fo/core/util/LoadJson.hpp"
#include "fo/core/util/Logging.hpp"

namespace po = boost::program_options;

int main(int argc, char* argv[])
{
    std::string outputPath;
    std::string specPath;
    std::string dtype = "<f4";
    std::string axis = "x";
    std::size_t size = 64;
    double radius = 2.0;
    double spacing = 1.0;
    double noise = 0.0;
    std::size_t chunk = 64;

    po::options_description desc("fo_phantom - synthetic fiber volume generator\n\nUsage");
    desc.add_options()
        ("help,h", "Show this help message")
        ("output,o", po::value<std::string>(&outputPath)->required(), "Output zarr dataset")
        ("spec", po::value<std::string>(&specPath), "Phantom description (JSON)")
        ("size", po::value<std::size_t>(&size)->default_value(64), "Cube side in voxels")
        ("axis", po::value<std::string>(&axis)->default_value("x"), "Tube axis: z, y, x or diag")
        ("radius", po::value<double>(&radius)->default_value(2.0), "Tube radius (um)")
        ("spacing", po::value<double>(&spacing)->default_value(1.0), "Isotropic voxel size (um)")
        ("noise", po::value<double>(&noise)->default_value(0.0), "Noise sigma, fraction of range")
        ("dtype", po::value<std::string>(&dtype)->default_value("<f4"), "|u1, <u2 or <f4")
        ("chunk", po::value<std::size_t>(&chunk)->default_value(64), "Chunk size per axis")
    ;

    po::positional_options_description pos;
    pos.add("output", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(pos).run(), vm);
        if (vm.count("help") || argc < 2) {
            std::cout << desc << "\n";
            std::cout << "\nExamples:\n";
            std::cout << "  fo_phantom tube.zarr --size 96 --axis diag --radius 3\n";
            std::cout << "  fo_phantom crossing.zarr --spec crossing.json\n";
            return 0;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Use --help for usage information." << "\n";
        return 1;
    }

    try {
        fo::PhantomSpec spec;
        if (!specPath.empty()) {
            spec = fo::phantomFromJson(fo::json::load_json_file(specPath));
        } else {
            spec.shape = {size, size, size};
            spec.spacing = {spacing, spacing, spacing};
            spec.dtype = fo::dtypeFromString(dtype);
            spec.noiseSigma = noise;
            if (spec.dtype == fo::Dtype::Unknown) {
                throw fo::ConfigurationError("unsupported dtype " + dtype);
            }
            const double c = (static_cast<double>(size) - 1.0) / 2.0;
            const double hi = static_cast<double>(size) - 1.0;
            fo::FiberSegment f;
            f.radiusUm = radius;
            f.intensity = 0.8;
            if (axis == "z") {
                f.start = {0, c, c};
                f.end = {hi, c, c};
            } else if (axis == "y") {
                f.start = {c, 0, c};
                f.end = {c, hi, c};
            } else if (axis == "x") {
                f.start = {c, c, 0};
                f.end = {c, c, hi};
            } else if (axis == "diag") {
                f.start = {0, 0, 0};
                f.end = {hi, hi, hi};
            } else {
                throw fo::ConfigurationError("unknown axis '" + axis + "'");
            }
            spec.fibers.push_back(f);
        }

        fo::Logger()->info("rendering {}x{}x{} phantom with {} fiber(s)", spec.shape[0], spec.shape[1],
                           spec.shape[2], spec.fibers.size());
        auto data = fo::renderPhantom(spec);

        fo::VolumeInfo info;
        info.shape = {spec.shape[0], spec.shape[1], spec.shape[2]};
        info.dtype = spec.dtype;
        info.spacing = spec.spacing;
        auto vol = fo::ZarrVolume::create(outputPath, info, {chunk, chunk, chunk});
        vol->writeRegion({0, 0, 0}, data);
        vol->close();
        fo::Logger()->info("wrote {}", outputPath);
    } catch (const std::exception& e) {
        fo::Logger()->critical("Error: {}", e.what());
        return 1;
    }
    return 0;
}
