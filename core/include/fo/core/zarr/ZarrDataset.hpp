#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <xtensor/containers/xarray.hpp>

#include "fo/core/types/Dtype.hpp"
#include "fo/core/zarr/BloscCodec.hpp"

namespace fo::zarr
{

/**
 * @brief Zarr v2 dataset reader/writer.
 *
 * Supports what the orientation pipeline stores:
 * - arrays of any rank (3D scalar maps, 4D ZYXC channel maps)
 * - blosc compression (or none)
 * - uint8, uint16 and float32, little endian, C order
 * - missing chunks read back as the fill value
 *
 * File layout:
 *   dataset_path/
 *     .zarray          - JSON metadata
 *     .zattrs          - optional user attributes
 *     0/0/0            - chunk files ('/' or '.' separated)
 *
 * All failures are reported as fo::IOError, region errors as
 * fo::ShapeMismatchError. Not thread-safe: writes do chunk
 * read-modify-write, so callers serialize access.
 */
class ZarrDataset
{
public:
    /**
     * @brief Open an existing dataset
     * @throws fo::IOError if the path or its .zarray is missing or invalid
     */
    explicit ZarrDataset(const std::filesystem::path& path);

    /**
     * @brief Create a new dataset (directory and .zarray are written)
     * @param shape Dataset shape, e.g. {z, y, x} or {z, y, x, c}
     * @param chunks Chunk shape, same rank as shape
     * @param compressor "blosc" or "" for raw chunks
     */
    ZarrDataset(
        const std::filesystem::path& path,
        const std::vector<std::size_t>& shape,
        const std::vector<std::size_t>& chunks,
        Dtype dtype,
        const std::string& compressor = "blosc",
        const nlohmann::json& compressorOpts = nlohmann::json::object());

    ~ZarrDataset() = default;

    ZarrDataset(const ZarrDataset&) = delete;
    ZarrDataset& operator=(const ZarrDataset&) = delete;
    ZarrDataset(ZarrDataset&&) noexcept = default;
    ZarrDataset& operator=(ZarrDataset&&) noexcept = default;

    const std::filesystem::path& path() const noexcept { return path_; }
    const std::vector<std::size_t>& shape() const noexcept { return shape_; }
    Dtype getDtype() const noexcept { return dtype_; }
    const std::vector<std::size_t>& chunkShape() const noexcept { return chunks_; }
    char dimensionSeparator() const noexcept { return dimSeparator_; }
    std::size_t ndim() const noexcept { return shape_.size(); }

    /** @brief Number of elements in a full chunk */
    std::size_t defaultChunkSize() const noexcept;

    /** @brief User attributes from .zattrs (empty object if absent) */
    nlohmann::json attributes() const;
    void setAttributes(const nlohmann::json& attrs) const;

    // --- Low-level chunk I/O ---

    /**
     * @brief Read a chunk from disk into a full-chunk buffer
     * @return False if the chunk does not exist
     */
    bool readChunk(const std::vector<std::size_t>& chunkId, void* buffer) const;

    void writeChunk(
        const std::vector<std::size_t>& chunkId,
        const void* buffer,
        std::size_t size);

    // --- High-level I/O ---

    /**
     * @brief Read the region [offset, offset+shape) into out
     * @tparam T Element type, must match the dataset dtype
     */
    template <typename T>
    void readSubarray(
        xt::xarray<T>& out,
        const std::vector<std::size_t>& offset,
        const std::vector<std::size_t>& shape) const;

    /**
     * @brief Write data at offset, merging with existing chunk contents
     * @tparam T Element type, must match the dataset dtype
     */
    template <typename T>
    void writeSubarray(
        const xt::xarray<T>& data,
        const std::vector<std::size_t>& offset);

private:
    std::filesystem::path path_;
    std::vector<std::size_t> shape_;
    std::vector<std::size_t> chunks_;
    Dtype dtype_ = Dtype::Unknown;
    char dimSeparator_ = '/';
    std::unique_ptr<BloscCodec> codec_;
    nlohmann::json fillValue_;

    std::filesystem::path chunkPath(const std::vector<std::size_t>& chunkId) const;
    void loadMetadata();
    void writeMetadata() const;
    void checkRegion(
        const std::vector<std::size_t>& offset,
        const std::vector<std::size_t>& shape,
        const char* what) const;

    template <typename T>
    void checkElementType(const char* what) const;

    template <typename T>
    T fillValueAs() const;
};

extern template void ZarrDataset::readSubarray(
    xt::xarray<std::uint8_t>&,
    const std::vector<std::size_t>&,
    const std::vector<std::size_t>&) const;
extern template void ZarrDataset::readSubarray(
    xt::xarray<std::uint16_t>&,
    const std::vector<std::size_t>&,
    const std::vector<std::size_t>&) const;
extern template void ZarrDataset::readSubarray(
    xt::xarray<float>&,
    const std::vector<std::size_t>&,
    const std::vector<std::size_t>&) const;

extern template void ZarrDataset::writeSubarray(
    const xt::xarray<std::uint8_t>&,
    const std::vector<std::size_t>&);
extern template void ZarrDataset::writeSubarray(
    const xt::xarray<std::uint16_t>&,
    const std::vector<std::size_t>&);
extern template void ZarrDataset::writeSubarray(
    const xt::xarray<float>&,
    const std::vector<std::size_t>&);

}  // namespace fo::zarr
