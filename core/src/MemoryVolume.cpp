#include "fo/core/io/MemoryVolume.hpp"

#include "fo/core/util/Errors.hpp"

#include <algorithm>
#include <string>

#include <xtensor/views/xslice.hpp>
#include <xtensor/views/xstrided_view.hpp>

namespace fo {

namespace {

xt::xstrided_slice_vector regionSlices(
    const std::vector<std::size_t>& offset,
    const std::vector<std::size_t>& extent)
{
    xt::xstrided_slice_vector sv;
    for (std::size_t d = 0; d < offset.size(); ++d) {
        sv.push_back(xt::range(offset[d], offset[d] + extent[d]));
    }
    return sv;
}

}  // namespace

MemoryVolume::MemoryVolume(VolumeInfo info)
    : info_(std::move(info))
    , data_(std::make_shared<xt::xarray<float>>(xt::xarray<float>::from_shape(info_.shape)))
{
    if (info_.rank() < 3) {
        throw ShapeMismatchError("MemoryVolume: expected rank >= 3, got " +
                                 std::to_string(info_.rank()));
    }
    std::fill(data_->begin(), data_->end(), 0.0f);
}

MemoryVolume::MemoryVolume(xt::xarray<float> data, Dtype dtype, std::array<double, 3> spacing)
    : data_(std::make_shared<xt::xarray<float>>(std::move(data)))
{
    info_.shape.assign(data_->shape().begin(), data_->shape().end());
    info_.dtype = dtype;
    info_.spacing = spacing;
    if (info_.rank() < 3) {
        throw ShapeMismatchError("MemoryVolume: expected rank >= 3, got " +
                                 std::to_string(info_.rank()));
    }
}

void MemoryVolume::requireOpen(const char* context) const
{
    if (!open_) {
        throw IOError(std::string(context) + ": volume is closed");
    }
}

xt::xarray<float> MemoryVolume::readRegion(
    const std::vector<std::size_t>& offset,
    const std::vector<std::size_t>& extent) const
{
    requireOpen("MemoryVolume::readRegion");
    auto off = offset;
    auto ext = extent;
    normalizeRegion(info_, off, ext, "MemoryVolume::readRegion");

    xt::xarray<float> out = xt::strided_view(*data_, regionSlices(off, ext));
    return out;
}

void MemoryVolume::writeRegion(
    const std::vector<std::size_t>& offset,
    const xt::xarray<float>& data)
{
    requireOpen("MemoryVolume::writeRegion");
    auto off = offset;
    std::vector<std::size_t> ext(data.shape().begin(), data.shape().end());
    normalizeWriteRegion(info_, off, ext, "MemoryVolume::writeRegion");

    auto view = xt::strided_view(*data_, regionSlices(off, ext));
    if (info_.dtype == Dtype::Float32) {
        view = data;
    } else {
        xt::xarray<float> q = data;
        std::transform(q.begin(), q.end(), q.begin(),
                       [dt = info_.dtype](float v) { return quantizeToDtype(v, dt); });
        view = q;
    }
}

}  // namespace fo
