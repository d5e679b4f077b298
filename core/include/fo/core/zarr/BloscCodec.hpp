#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace fo::zarr
{

/**
 * @brief Blosc2 codec for zarr v2 chunks.
 *
 * Configuration follows the zarr v2 blosc compressor record:
 * {"id": "blosc", "cname": "zstd", "clevel": 1, "shuffle": 1, "blocksize": 0}
 */
class BloscCodec
{
public:
    BloscCodec();

    /**
     * @brief Construct from a zarr compressor record
     * @param config JSON object; missing keys keep defaults
     * @throws fo::IOError on an unknown compressor, shuffle or level
     */
    explicit BloscCodec(const nlohmann::json& config);

    /**
     * @brief Compress a buffer
     * @param typesize Element size in bytes, used by the shuffle filter
     * @throws fo::IOError if blosc reports an error
     */
    std::vector<std::uint8_t>
    compress(const void* src, std::size_t size, std::size_t typesize) const;

    /**
     * @brief Decompress a buffer into dst
     * @return Number of bytes written
     * @throws fo::IOError on corrupt input or when dst is too small
     */
    std::size_t decompress(
        const void* src,
        std::size_t srcSize,
        void* dst,
        std::size_t dstCapacity) const;

    const std::string& compressorName() const noexcept { return cname_; }
    int compressionLevel() const noexcept { return clevel_; }

    /** @brief Zarr v2 compressor record for .zarray */
    nlohmann::json toJson() const;

private:
    std::string cname_ = "zstd";
    int clevel_ = 1;
    int shuffle_ = 1;
    std::size_t blocksize_ = 0;

    static void initBlosc();
};

}  // namespace fo::zarr
