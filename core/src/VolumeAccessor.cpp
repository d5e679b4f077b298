#include "fo/core/io/VolumeAccessor.hpp"

#include "fo/core/util/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace fo {

void normalizeRegion(
    const VolumeInfo& info,
    std::vector<std::size_t>& offset,
    std::vector<std::size_t>& extent,
    const char* context)
{
    const std::size_t rank = info.rank();
    if (offset.size() != extent.size()) {
        throw ShapeMismatchError(std::string(context) + ": offset and extent ranks differ");
    }
    if (offset.size() == 3 && rank > 3) {
        for (std::size_t d = 3; d < rank; ++d) {
            offset.push_back(0);
            extent.push_back(info.shape[d]);
        }
    }
    if (offset.size() != rank) {
        throw ShapeMismatchError(
            std::string(context) + ": region rank " + std::to_string(offset.size()) +
            " does not match volume rank " + std::to_string(rank));
    }
    for (std::size_t d = 0; d < rank; ++d) {
        if (offset[d] + extent[d] > info.shape[d]) {
            throw ShapeMismatchError(
                std::string(context) + ": region [" + std::to_string(offset[d]) + ", " +
                std::to_string(offset[d] + extent[d]) + ") exceeds axis " + std::to_string(d) +
                " of size " + std::to_string(info.shape[d]));
        }
    }
}

void normalizeWriteRegion(
    const VolumeInfo& info,
    std::vector<std::size_t>& offset,
    const std::vector<std::size_t>& blockShape,
    const char* context)
{
    if (blockShape.size() != info.rank()) {
        throw ShapeMismatchError(
            std::string(context) + ": data rank " + std::to_string(blockShape.size()) +
            " does not match volume rank " + std::to_string(info.rank()));
    }
    if (offset.size() == 3 && info.rank() > 3) {
        for (std::size_t d = 3; d < info.rank(); ++d) {
            if (blockShape[d] != info.shape[d]) {
                throw ShapeMismatchError(
                    std::string(context) + ": data has " + std::to_string(blockShape[d]) +
                    " channels, map declares " + std::to_string(info.shape[d]));
            }
            offset.push_back(0);
        }
    }
    auto extent = blockShape;
    normalizeRegion(info, offset, extent, context);
}

float quantizeToDtype(float v, Dtype dtype)
{
    switch (dtype) {
        case Dtype::UInt8:
            if (!std::isfinite(v)) return 0.0f;
            return std::clamp(std::round(v), 0.0f, 255.0f);
        case Dtype::UInt16:
            if (!std::isfinite(v)) return 0.0f;
            return std::clamp(std::round(v), 0.0f, 65535.0f);
        default:
            return v;
    }
}

}  // namespace fo
