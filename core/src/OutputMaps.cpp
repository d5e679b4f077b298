#include "fo/core/pipeline/OutputMaps.hpp"

#include "fo/core/util/Errors.hpp"

#include <xtensor/containers/xarray.hpp>

namespace fo {

namespace {

VolumeInfo mapInfo(const Shape3& shape, std::size_t channels, Dtype dtype,
                   const std::array<double, 3>& spacing)
{
    VolumeInfo info;
    info.shape = {shape[0], shape[1], shape[2]};
    if (channels > 0) info.shape.push_back(channels);
    info.dtype = dtype;
    info.spacing = spacing;
    return info;
}

}  // namespace

std::string maps::blockMapName(const char* base, const std::string& label)
{
    return label.empty() ? std::string(base) : std::string(base) + "_" + label;
}

VolumeAccessor& OutputMaps::create(OutputTarget& target, const std::string& name, const VolumeInfo& info)
{
    names_.push_back(name);
    return target.createMap(name, info);
}

OutputMaps::OutputMaps(OutputTarget& target, const OutputLayout& layout) : layout_(layout)
{
    if (layout_.layers.empty()) {
        throw ConfigurationError("output layout needs at least one ODF resolution");
    }
    const Shape3& vol = layout_.volumeShape;
    const auto& sp = layout_.spacing;

    if (layout_.voxelMaps) {
        orientation_ = &create(target, maps::Orientation, mapInfo(vol, 3, Dtype::Float32, sp));
        coherence_ = &create(target, maps::Coherence, mapInfo(vol, 0, Dtype::Float32, sp));
        anisotropy_ = &create(target, maps::Anisotropy, mapInfo(vol, 0, Dtype::Float32, sp));
        response_ = &create(target, maps::Response, mapInfo(vol, 0, Dtype::Float32, sp));
        scale_ = &create(target, maps::Scale, mapInfo(vol, 0, Dtype::Float32, sp));
    }

    for (const auto& layer : layout_.layers) {
        const Shape3& grid = layer.blockGrid;
        const std::array<double, 3> bs{sp[0] * static_cast<double>(layer.blockShape[0]),
                                       sp[1] * static_cast<double>(layer.blockShape[1]),
                                       sp[2] * static_cast<double>(layer.blockShape[2])};
        auto name = [&](const char* base) { return maps::blockMapName(base, layer.label); };

        LayerMaps m;
        m.odf = &create(target, name(maps::Odf), mapInfo(grid, layout_.bins, Dtype::Float32, bs));
        m.odfSh = &create(target, name(maps::OdfSh),
                          mapInfo(grid, layout_.shCoefficients, Dtype::Float32, bs));
        m.energy = &create(target, name(maps::BlockEnergy), mapInfo(grid, 0, Dtype::Float32, bs));
        m.quality = &create(target, name(maps::BlockQuality), mapInfo(grid, 0, Dtype::Float32, bs));
        m.count = &create(target, name(maps::BlockCount), mapInfo(grid, 0, Dtype::Float32, bs));
        m.empty = &create(target, name(maps::BlockEmpty), mapInfo(grid, 0, Dtype::UInt8, bs));
        layers_.push_back(m);
    }
}

void OutputMaps::writeTile(const Box3& core, const OrientationField& field,
                           const std::vector<OdfBlockGrid>& blocks)
{
    if (blocks.size() != layers_.size()) {
        throw ShapeMismatchError("expected " + std::to_string(layers_.size()) +
                                 " ODF block grids, got " + std::to_string(blocks.size()));
    }
    if (layout_.voxelMaps) {
        const auto offset = core.offsetVec();
        orientation_->writeRegion(offset, xt::xarray<float>(field.vectors));
        coherence_->writeRegion(offset, xt::xarray<float>(field.coherence));
        anisotropy_->writeRegion(offset, xt::xarray<float>(field.anisotropy));
        response_->writeRegion(offset, xt::xarray<float>(field.response));
        scale_->writeRegion(offset, xt::xarray<float>(field.scale));
    }
    for (std::size_t i = 0; i < layers_.size(); ++i) {
        writeBlocks(layers_[i], blocks[i]);
    }
}

void OutputMaps::writeBlocks(const LayerMaps& dst, const OdfBlockGrid& blocks)
{
    const Shape3& g = blocks.gridShape;
    const std::size_t nb = layout_.bins;
    const std::size_t nc = layout_.shCoefficients;
    xt::xarray<float> odf = xt::xarray<float>::from_shape({g[0], g[1], g[2], nb});
    xt::xarray<float> sh = xt::xarray<float>::from_shape({g[0], g[1], g[2], nc});
    xt::xarray<float> energy = xt::xarray<float>::from_shape({g[0], g[1], g[2]});
    xt::xarray<float> quality = xt::xarray<float>::from_shape({g[0], g[1], g[2]});
    xt::xarray<float> count = xt::xarray<float>::from_shape({g[0], g[1], g[2]});
    xt::xarray<float> empty = xt::xarray<float>::from_shape({g[0], g[1], g[2]});

    for (std::size_t z = 0; z < g[0]; ++z) {
        for (std::size_t y = 0; y < g[1]; ++y) {
            for (std::size_t x = 0; x < g[2]; ++x) {
                const OdfBlock& blk = blocks.at(z, y, x);
                for (std::size_t i = 0; i < nb; ++i) odf(z, y, x, i) = blk.histogram[i];
                for (std::size_t k = 0; k < nc; ++k) sh(z, y, x, k) = blk.sh[k];
                energy(z, y, x) = static_cast<float>(blk.energy);
                quality(z, y, x) = static_cast<float>(blk.quality);
                count(z, y, x) = static_cast<float>(blk.count);
                empty(z, y, x) = blk.empty ? 1.0f : 0.0f;
            }
        }
    }

    const std::vector<std::size_t> blockOffset{blocks.firstBlock[0], blocks.firstBlock[1],
                                               blocks.firstBlock[2]};
    dst.odf->writeRegion(blockOffset, odf);
    dst.odfSh->writeRegion(blockOffset, sh);
    dst.energy->writeRegion(blockOffset, energy);
    dst.quality->writeRegion(blockOffset, quality);
    dst.count->writeRegion(blockOffset, count);
    dst.empty->writeRegion(blockOffset, empty);
}

}  // namespace fo
