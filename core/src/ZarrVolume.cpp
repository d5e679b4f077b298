#include "fo/core/io/ZarrVolume.hpp"

#include "fo/core/util/Errors.hpp"
#include "fo/core/util/Logging.hpp"

#include <algorithm>
#include <type_traits>

namespace fo {

namespace {

template <typename T>
xt::xarray<float> readAs(
    const zarr::ZarrDataset& ds,
    const std::vector<std::size_t>& offset,
    const std::vector<std::size_t>& extent)
{
    xt::xarray<T> raw;
    ds.readSubarray(raw, offset, extent);
    if constexpr (std::is_same_v<T, float>) {
        return raw;
    } else {
        xt::xarray<float> out = xt::xarray<float>::from_shape(raw.shape());
        std::copy(raw.begin(), raw.end(), out.begin());
        return out;
    }
}

template <typename T>
void writeAs(
    zarr::ZarrDataset& ds,
    const std::vector<std::size_t>& offset,
    const xt::xarray<float>& data,
    Dtype dtype)
{
    if constexpr (std::is_same_v<T, float>) {
        ds.writeSubarray(data, offset);
    } else {
        xt::xarray<T> raw = xt::xarray<T>::from_shape(data.shape());
        std::transform(data.begin(), data.end(), raw.begin(),
                       [dtype](float v) { return static_cast<T>(quantizeToDtype(v, dtype)); });
        ds.writeSubarray(raw, offset);
    }
}

std::array<double, 3> spacingFromAttributes(const nlohmann::json& attrs)
{
    std::array<double, 3> spacing{1.0, 1.0, 1.0};
    auto it = attrs.find("voxel_size_um");
    if (it == attrs.end()) {
        return spacing;
    }
    if (!it->is_array() || it->size() != 3) {
        throw IOError("voxel_size_um must be an array [z, y, x]");
    }
    for (int a = 0; a < 3; ++a) {
        spacing[a] = (*it)[a].get<double>();
        if (!(spacing[a] > 0.0)) {
            throw IOError("voxel_size_um entries must be positive");
        }
    }
    return spacing;
}

}  // namespace

ZarrVolume::ZarrVolume(std::unique_ptr<zarr::ZarrDataset> ds, VolumeInfo info)
    : path_(ds->path()), ds_(std::move(ds)), info_(std::move(info))
{
}

std::unique_ptr<ZarrVolume> ZarrVolume::open(
    const std::filesystem::path& path,
    std::optional<std::array<double, 3>> spacing)
{
    auto ds = std::make_unique<zarr::ZarrDataset>(path);
    if (ds->ndim() < 3 || ds->ndim() > 4) {
        throw IOError("ZarrVolume: " + path.string() + " has rank " +
                      std::to_string(ds->ndim()) + ", expected 3 or 4");
    }

    VolumeInfo info;
    info.shape = ds->shape();
    info.dtype = ds->getDtype();
    try {
        info.spacing = spacing ? *spacing : spacingFromAttributes(ds->attributes());
    } catch (const nlohmann::json::exception& e) {
        throw IOError("ZarrVolume: bad attributes in " + path.string() + ": " + e.what());
    }

    Logger()->debug("opened {} shape {}x{}x{} dtype {}", path.string(), info.shape[0],
                    info.shape[1], info.shape[2], dtypeToString(info.dtype));
    return std::unique_ptr<ZarrVolume>(new ZarrVolume(std::move(ds), std::move(info)));
}

std::unique_ptr<ZarrVolume> ZarrVolume::create(
    const std::filesystem::path& path,
    const VolumeInfo& info,
    const std::vector<std::size_t>& chunks)
{
    std::vector<std::size_t> fullChunks(info.rank());
    for (std::size_t d = 0; d < info.rank(); ++d) {
        std::size_t c = d < chunks.size() ? chunks[d] : info.shape[d];
        fullChunks[d] = std::max<std::size_t>(1, std::min(c, info.shape[d]));
    }

    auto ds = std::make_unique<zarr::ZarrDataset>(path, info.shape, fullChunks, info.dtype);
    ds->setAttributes({{"voxel_size_um", info.spacing}});
    return std::unique_ptr<ZarrVolume>(new ZarrVolume(std::move(ds), info));
}

const zarr::ZarrDataset& ZarrVolume::dataset(const char* context) const
{
    if (!ds_) {
        throw IOError(std::string(context) + ": " + path_.string() + " is closed");
    }
    return *ds_;
}

xt::xarray<float> ZarrVolume::readRegion(
    const std::vector<std::size_t>& offset,
    const std::vector<std::size_t>& extent) const
{
    const auto& ds = dataset("ZarrVolume::readRegion");
    auto off = offset;
    auto ext = extent;
    normalizeRegion(info_, off, ext, "ZarrVolume::readRegion");

    switch (info_.dtype) {
        case Dtype::UInt8:
            return readAs<std::uint8_t>(ds, off, ext);
        case Dtype::UInt16:
            return readAs<std::uint16_t>(ds, off, ext);
        case Dtype::Float32:
            return readAs<float>(ds, off, ext);
        default:
            throw IOError("ZarrVolume::readRegion: unsupported dtype");
    }
}

void ZarrVolume::writeRegion(
    const std::vector<std::size_t>& offset,
    const xt::xarray<float>& data)
{
    dataset("ZarrVolume::writeRegion");
    auto off = offset;
    std::vector<std::size_t> ext(data.shape().begin(), data.shape().end());
    normalizeWriteRegion(info_, off, ext, "ZarrVolume::writeRegion");

    switch (info_.dtype) {
        case Dtype::UInt8:
            writeAs<std::uint8_t>(*ds_, off, data, info_.dtype);
            break;
        case Dtype::UInt16:
            writeAs<std::uint16_t>(*ds_, off, data, info_.dtype);
            break;
        case Dtype::Float32:
            writeAs<float>(*ds_, off, data, info_.dtype);
            break;
        default:
            throw IOError("ZarrVolume::writeRegion: unsupported dtype");
    }
}

std::unique_ptr<VolumeAccessor> openVolume(
    const std::filesystem::path& path,
    std::optional<std::array<double, 3>> spacing)
{
    return ZarrVolume::open(path, spacing);
}

}  // namespace fo
