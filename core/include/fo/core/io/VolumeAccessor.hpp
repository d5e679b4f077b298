#pragma once

#include <cstddef>
#include <vector>

#include <xtensor/containers/xarray.hpp>

#include "fo/core/types/Box.hpp"
#include "fo/core/types/VolumeInfo.hpp"

namespace fo {

/**
 * @brief Read/write window over an out-of-core volume or output map.
 *
 * Regions are given on the spatial axes (ZYX). For maps with a channel
 * axis the offset/extent may also name the channel axis explicitly;
 * otherwise all channels are addressed. Values cross this interface as
 * float32 and are converted to the stored dtype on write.
 *
 * Implementations are not required to be thread-safe.
 */
class VolumeAccessor {
public:
    virtual ~VolumeAccessor() = default;

    virtual const VolumeInfo& info() const = 0;

    /**
     * @throws fo::IOError if the volume is closed or storage fails
     * @throws fo::ShapeMismatchError if the region is out of bounds
     */
    virtual xt::xarray<float> readRegion(
        const std::vector<std::size_t>& offset,
        const std::vector<std::size_t>& extent) const = 0;

    /**
     * @throws fo::IOError if the volume is closed or storage fails
     * @throws fo::ShapeMismatchError if data's rank, channel count or
     *         placement disagree with the declared shape
     */
    virtual void writeRegion(
        const std::vector<std::size_t>& offset,
        const xt::xarray<float>& data) = 0;

    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    xt::xarray<float> readBox(const Box3& box) const
    {
        return readRegion(box.offsetVec(), box.extentVec());
    }
};

// Expands a spatial (rank 3) region to the full rank of info and
// validates it. Throws fo::ShapeMismatchError.
void normalizeRegion(
    const VolumeInfo& info,
    std::vector<std::size_t>& offset,
    std::vector<std::size_t>& extent,
    const char* context);

// Validates a write of a block of the given shape. When offset names only
// the spatial axes, the block must cover every channel.
void normalizeWriteRegion(
    const VolumeInfo& info,
    std::vector<std::size_t>& offset,
    const std::vector<std::size_t>& blockShape,
    const char* context);

// Converts a float value to the value a store of the given dtype would keep.
float quantizeToDtype(float v, Dtype dtype);

}  // namespace fo
