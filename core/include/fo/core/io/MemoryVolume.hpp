#pragma once

#include <memory>

#include "fo/core/io/VolumeAccessor.hpp"

namespace fo {

/**
 * @brief Volume held entirely in memory.
 *
 * Used for synthetic volumes, tests and small runs. Values are kept as
 * float32; writes are quantized to the declared dtype so a MemoryVolume
 * holds what an on-disk store of the same dtype would.
 */
class MemoryVolume : public VolumeAccessor {
public:
    /// Zero-filled volume of the given shape.
    explicit MemoryVolume(VolumeInfo info);

    /// Wraps existing data; info.shape is taken from data.
    MemoryVolume(
        xt::xarray<float> data,
        Dtype dtype = Dtype::Float32,
        std::array<double, 3> spacing = {1.0, 1.0, 1.0});

    const VolumeInfo& info() const override { return info_; }

    xt::xarray<float> readRegion(
        const std::vector<std::size_t>& offset,
        const std::vector<std::size_t>& extent) const override;

    void writeRegion(
        const std::vector<std::size_t>& offset,
        const xt::xarray<float>& data) override;

    void close() override { open_ = false; }
    bool isOpen() const override { return open_; }

    const xt::xarray<float>& data() const { return *data_; }

private:
    void requireOpen(const char* context) const;

    VolumeInfo info_;
    std::shared_ptr<xt::xarray<float>> data_;
    bool open_ = true;
};

}  // namespace fo
