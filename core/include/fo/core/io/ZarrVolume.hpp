#pragma once

#include <array>
#include <filesystem>
#include <memory>
#include <optional>

#include "fo/core/io/VolumeAccessor.hpp"
#include "fo/core/zarr/ZarrDataset.hpp"

namespace fo {

/**
 * @brief VolumeAccessor backed by a zarr v2 dataset on disk.
 *
 * Voxel spacing is read from the dataset's .zattrs key "voxel_size_um"
 * ([z, y, x] in micrometers) unless an override is given.
 */
class ZarrVolume : public VolumeAccessor {
public:
    /// Open an existing dataset. Throws fo::IOError.
    static std::unique_ptr<ZarrVolume> open(
        const std::filesystem::path& path,
        std::optional<std::array<double, 3>> spacing = std::nullopt);

    /// Create a new dataset. chunks may be spatial only; channels are not chunked.
    static std::unique_ptr<ZarrVolume> create(
        const std::filesystem::path& path,
        const VolumeInfo& info,
        const std::vector<std::size_t>& chunks);

    const VolumeInfo& info() const override { return info_; }

    xt::xarray<float> readRegion(
        const std::vector<std::size_t>& offset,
        const std::vector<std::size_t>& extent) const override;

    void writeRegion(
        const std::vector<std::size_t>& offset,
        const xt::xarray<float>& data) override;

    void close() override { ds_.reset(); }
    bool isOpen() const override { return ds_ != nullptr; }

    const std::filesystem::path& path() const { return path_; }

private:
    ZarrVolume(std::unique_ptr<zarr::ZarrDataset> ds, VolumeInfo info);

    const zarr::ZarrDataset& dataset(const char* context) const;

    std::filesystem::path path_;
    std::unique_ptr<zarr::ZarrDataset> ds_;
    VolumeInfo info_;
};

/// Convenience for the pipeline entry point.
std::unique_ptr<VolumeAccessor> openVolume(
    const std::filesystem::path& path,
    std::optional<std::array<double, 3>> spacing = std::nullopt);

}  // namespace fo
