#include "fo/core/zarr/ZarrDataset.hpp"

#include "fo/core/util/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <limits>
#include <type_traits>

namespace fo::zarr
{

namespace
{

template <typename T>
constexpr Dtype dtypeOf()
{
    if constexpr (std::is_same_v<T, std::uint8_t>) return Dtype::UInt8;
    else if constexpr (std::is_same_v<T, std::uint16_t>) return Dtype::UInt16;
    else if constexpr (std::is_same_v<T, float>) return Dtype::Float32;
    else return Dtype::Unknown;
}

// Visit every index of the box [lo, hi) in C order.
template <typename F>
void forEachIndex(
    const std::vector<std::size_t>& lo,
    const std::vector<std::size_t>& hi,
    F&& fn)
{
    const std::size_t nd = lo.size();
    for (std::size_t d = 0; d < nd; ++d) {
        if (lo[d] >= hi[d]) return;
    }

    std::vector<std::size_t> idx = lo;
    while (true) {
        fn(idx);
        if (nd == 0) return;
        std::size_t d = nd;
        while (d > 0) {
            --d;
            if (++idx[d] < hi[d]) break;
            idx[d] = lo[d];
            if (d == 0) return;
        }
    }
}

std::vector<std::size_t> rowMajorStrides(const std::vector<std::size_t>& shape)
{
    std::vector<std::size_t> strides(shape.size(), 1);
    for (std::size_t d = shape.size(); d-- > 1;) {
        strides[d - 1] = strides[d] * shape[d];
    }
    return strides;
}

// Copy the global box [lo, hi) between two C-ordered buffers whose first
// element sits at srcOrigin / dstOrigin in global coordinates.
template <typename T>
void copyBox(
    const T* src,
    const std::vector<std::size_t>& srcShape,
    const std::vector<std::size_t>& srcOrigin,
    T* dst,
    const std::vector<std::size_t>& dstShape,
    const std::vector<std::size_t>& dstOrigin,
    const std::vector<std::size_t>& lo,
    const std::vector<std::size_t>& hi)
{
    const std::size_t nd = lo.size();
    const auto srcStrides = rowMajorStrides(srcShape);
    const auto dstStrides = rowMajorStrides(dstShape);
    const std::size_t run = hi[nd - 1] - lo[nd - 1];

    std::vector<std::size_t> outerLo(lo.begin(), lo.end() - 1);
    std::vector<std::size_t> outerHi(hi.begin(), hi.end() - 1);

    forEachIndex(outerLo, outerHi, [&](const std::vector<std::size_t>& idx) {
        std::size_t s = (lo[nd - 1] - srcOrigin[nd - 1]) * srcStrides[nd - 1];
        std::size_t t = (lo[nd - 1] - dstOrigin[nd - 1]) * dstStrides[nd - 1];
        for (std::size_t d = 0; d + 1 < nd; ++d) {
            s += (idx[d] - srcOrigin[d]) * srcStrides[d];
            t += (idx[d] - dstOrigin[d]) * dstStrides[d];
        }
        std::copy_n(src + s, run, dst + t);
    });
}

nlohmann::json readJsonFile(const std::filesystem::path& p)
{
    std::ifstream f(p);
    if (!f) {
        throw IOError("ZarrDataset: cannot open " + p.string());
    }
    try {
        return nlohmann::json::parse(f);
    } catch (const nlohmann::json::exception& e) {
        throw IOError("ZarrDataset: invalid JSON in " + p.string() + ": " + e.what());
    }
}

}  // namespace

// --- ZarrDataset implementation ---

ZarrDataset::ZarrDataset(const std::filesystem::path& path) : path_(path)
{
    if (!std::filesystem::is_directory(path_)) {
        throw IOError("ZarrDataset: path does not exist: " + path_.string());
    }
    loadMetadata();
}

ZarrDataset::ZarrDataset(
    const std::filesystem::path& path,
    const std::vector<std::size_t>& shape,
    const std::vector<std::size_t>& chunks,
    Dtype dtype,
    const std::string& compressor,
    const nlohmann::json& compressorOpts)
    : path_(path)
    , shape_(shape)
    , chunks_(chunks)
    , dtype_(dtype)
{
    if (shape_.empty() || shape_.size() != chunks_.size()) {
        throw ShapeMismatchError(
            "ZarrDataset: shape and chunks must have the same non-zero rank");
    }
    if (std::any_of(chunks_.begin(), chunks_.end(), [](std::size_t c) { return c == 0; })) {
        throw ShapeMismatchError("ZarrDataset: chunk extents must be positive");
    }
    if (dtype_ == Dtype::Unknown) {
        throw IOError("ZarrDataset: cannot create dataset with unknown dtype");
    }

    std::error_code ec;
    std::filesystem::create_directories(path_, ec);
    if (ec) {
        throw IOError("ZarrDataset: cannot create " + path_.string() + ": " + ec.message());
    }

    if (compressor == "blosc") {
        codec_ = std::make_unique<BloscCodec>(compressorOpts);
    }

    if (dtype_ == Dtype::Float32) {
        fillValue_ = 0.0;
    } else {
        fillValue_ = 0;
    }

    writeMetadata();
}

void ZarrDataset::loadMetadata()
{
    auto zarrayPath = path_ / ".zarray";
    if (!std::filesystem::exists(zarrayPath)) {
        throw IOError("ZarrDataset: no .zarray found at " + path_.string());
    }

    nlohmann::json meta = readJsonFile(zarrayPath);
    for (const char* key : {"shape", "chunks", "dtype"}) {
        if (!meta.contains(key)) {
            throw IOError(
                "ZarrDataset: " + zarrayPath.string() + " missing field '" + key + "'");
        }
    }

    try {
        shape_ = meta["shape"].get<std::vector<std::size_t>>();
        chunks_ = meta["chunks"].get<std::vector<std::size_t>>();
        dtype_ = dtypeFromString(meta["dtype"].get<std::string>());
    } catch (const nlohmann::json::exception& e) {
        throw IOError("ZarrDataset: malformed metadata in " + zarrayPath.string() + ": " + e.what());
    }

    if (dtype_ == Dtype::Unknown) {
        throw IOError(
            "ZarrDataset: unsupported dtype: " + meta["dtype"].dump());
    }
    if (shape_.empty() || shape_.size() != chunks_.size() ||
        std::any_of(chunks_.begin(), chunks_.end(), [](std::size_t c) { return c == 0; })) {
        throw IOError("ZarrDataset: inconsistent shape/chunks in " + zarrayPath.string());
    }
    if (meta.value("order", std::string("C")) != "C") {
        throw IOError("ZarrDataset: only C-ordered arrays are supported");
    }

    if (meta.contains("dimension_separator") && meta["dimension_separator"].is_string()) {
        auto sep = meta["dimension_separator"].get<std::string>();
        if (!sep.empty()) {
            dimSeparator_ = sep[0];
        }
    } else {
        dimSeparator_ = '.';
    }

    if (meta.contains("compressor") && !meta["compressor"].is_null()) {
        const auto& compMeta = meta["compressor"];
        if (compMeta.value("id", std::string()) != "blosc") {
            throw IOError("ZarrDataset: unsupported compressor " + compMeta.dump());
        }
        codec_ = std::make_unique<BloscCodec>(compMeta);
    }

    if (meta.contains("fill_value")) {
        fillValue_ = meta["fill_value"];
    }
}

void ZarrDataset::writeMetadata() const
{
    nlohmann::json meta;
    meta["zarr_format"] = 2;
    meta["shape"] = shape_;
    meta["chunks"] = chunks_;
    meta["dtype"] = dtypeToString(dtype_);
    meta["order"] = "C";
    meta["fill_value"] = fillValue_;
    meta["dimension_separator"] = std::string(1, dimSeparator_);
    meta["compressor"] = codec_ ? codec_->toJson() : nlohmann::json(nullptr);
    meta["filters"] = nullptr;

    std::ofstream f(path_ / ".zarray");
    f << meta.dump(2);
    if (!f) {
        throw IOError("ZarrDataset: cannot write metadata to " + path_.string());
    }
}

nlohmann::json ZarrDataset::attributes() const
{
    auto p = path_ / ".zattrs";
    if (!std::filesystem::exists(p)) {
        return nlohmann::json::object();
    }
    return readJsonFile(p);
}

void ZarrDataset::setAttributes(const nlohmann::json& attrs) const
{
    std::ofstream f(path_ / ".zattrs");
    f << attrs.dump(2);
    if (!f) {
        throw IOError("ZarrDataset: cannot write attributes to " + path_.string());
    }
}

std::size_t ZarrDataset::defaultChunkSize() const noexcept
{
    std::size_t size = 1;
    for (auto c : chunks_) {
        size *= c;
    }
    return size;
}

std::filesystem::path ZarrDataset::chunkPath(
    const std::vector<std::size_t>& chunkId) const
{
    std::string name;
    for (std::size_t i = 0; i < chunkId.size(); ++i) {
        if (i > 0) {
            name += dimSeparator_;
        }
        name += std::to_string(chunkId[i]);
    }
    return path_ / name;
}

bool ZarrDataset::readChunk(
    const std::vector<std::size_t>& chunkId, void* buffer) const
{
    auto cp = chunkPath(chunkId);

    std::ifstream f(cp, std::ios::binary);
    if (!f.is_open()) {
        return false;
    }

    f.seekg(0, std::ios::end);
    auto fileSize = f.tellg();
    f.seekg(0, std::ios::beg);
    if (fileSize < 0) {
        throw IOError("ZarrDataset: cannot stat chunk " + cp.string());
    }

    std::vector<std::uint8_t> compressed(static_cast<std::size_t>(fileSize));
    f.read(reinterpret_cast<char*>(compressed.data()), fileSize);
    if (!f) {
        throw IOError("ZarrDataset: short read on chunk " + cp.string());
    }

    const std::size_t chunkBytes = defaultChunkSize() * dtypeSize(dtype_);
    if (codec_) {
        std::size_t n = codec_->decompress(
            compressed.data(), compressed.size(), buffer, chunkBytes);
        if (n != chunkBytes) {
            throw IOError("ZarrDataset: chunk " + cp.string() + " decoded to " +
                          std::to_string(n) + " bytes, expected " + std::to_string(chunkBytes));
        }
    } else {
        if (compressed.size() != chunkBytes) {
            throw IOError("ZarrDataset: raw chunk " + cp.string() + " has wrong size");
        }
        std::memcpy(buffer, compressed.data(), compressed.size());
    }

    return true;
}

void ZarrDataset::writeChunk(
    const std::vector<std::size_t>& chunkId,
    const void* buffer,
    std::size_t size)
{
    auto cp = chunkPath(chunkId);
    std::error_code ec;
    std::filesystem::create_directories(cp.parent_path(), ec);
    if (ec) {
        throw IOError("ZarrDataset: cannot create " + cp.parent_path().string());
    }

    std::vector<std::uint8_t> output;
    if (codec_) {
        output = codec_->compress(buffer, size, dtypeSize(dtype_));
    } else {
        output.resize(size);
        std::memcpy(output.data(), buffer, size);
    }

    std::ofstream f(cp, std::ios::binary | std::ios::trunc);
    f.write(reinterpret_cast<const char*>(output.data()),
            static_cast<std::streamsize>(output.size()));
    if (!f) {
        throw IOError("ZarrDataset: failed writing chunk " + cp.string());
    }
}

void ZarrDataset::checkRegion(
    const std::vector<std::size_t>& offset,
    const std::vector<std::size_t>& shape,
    const char* what) const
{
    if (offset.size() != shape_.size() || shape.size() != shape_.size()) {
        throw ShapeMismatchError(
            std::string("ZarrDataset::") + what + ": rank " + std::to_string(shape.size()) +
            " does not match dataset rank " + std::to_string(shape_.size()));
    }
    for (std::size_t d = 0; d < shape_.size(); ++d) {
        if (offset[d] + shape[d] > shape_[d]) {
            throw ShapeMismatchError(
                std::string("ZarrDataset::") + what + ": region exceeds bounds on axis " +
                std::to_string(d));
        }
    }
}

template <typename T>
void ZarrDataset::checkElementType(const char* what) const
{
    if (dtypeOf<T>() != dtype_) {
        throw ShapeMismatchError(
            std::string("ZarrDataset::") + what + ": element type does not match dtype " +
            dtypeToString(dtype_));
    }
}

template <typename T>
T ZarrDataset::fillValueAs() const
{
    if (fillValue_.is_number()) {
        return static_cast<T>(fillValue_.get<double>());
    }
    if constexpr (std::is_floating_point_v<T>) {
        if (fillValue_.is_string() && fillValue_.get<std::string>() == "NaN") {
            return std::numeric_limits<T>::quiet_NaN();
        }
    }
    return T{0};
}

// --- Template implementations for readSubarray/writeSubarray ---

template <typename T>
void ZarrDataset::readSubarray(
    xt::xarray<T>& out,
    const std::vector<std::size_t>& offset,
    const std::vector<std::size_t>& reqShape) const
{
    checkElementType<T>("readSubarray");
    checkRegion(offset, reqShape, "readSubarray");

    out = xt::xarray<T>::from_shape(reqShape);
    std::fill(out.begin(), out.end(), fillValueAs<T>());

    const std::size_t nd = shape_.size();
    std::vector<std::size_t> startChunk(nd), endChunk(nd);
    for (std::size_t i = 0; i < nd; ++i) {
        startChunk[i] = offset[i] / chunks_[i];
        endChunk[i] = (offset[i] + reqShape[i] + chunks_[i] - 1) / chunks_[i];
    }

    std::vector<T> chunkBuffer(defaultChunkSize());
    std::vector<std::size_t> chunkOrigin(nd), lo(nd), hi(nd);

    forEachIndex(startChunk, endChunk, [&](const std::vector<std::size_t>& chunkId) {
        if (!readChunk(chunkId, chunkBuffer.data())) {
            return;
        }
        for (std::size_t d = 0; d < nd; ++d) {
            chunkOrigin[d] = chunkId[d] * chunks_[d];
            lo[d] = std::max(offset[d], chunkOrigin[d]);
            hi[d] = std::min(offset[d] + reqShape[d], chunkOrigin[d] + chunks_[d]);
        }
        copyBox(chunkBuffer.data(), chunks_, chunkOrigin,
                out.data(), reqShape, offset, lo, hi);
    });
}

template <typename T>
void ZarrDataset::writeSubarray(
    const xt::xarray<T>& data,
    const std::vector<std::size_t>& offset)
{
    std::vector<std::size_t> dataShape(data.shape().begin(), data.shape().end());
    checkElementType<T>("writeSubarray");
    checkRegion(offset, dataShape, "writeSubarray");

    const std::size_t nd = shape_.size();
    std::vector<std::size_t> startChunk(nd), endChunk(nd);
    for (std::size_t i = 0; i < nd; ++i) {
        startChunk[i] = offset[i] / chunks_[i];
        endChunk[i] = (offset[i] + dataShape[i] + chunks_[i] - 1) / chunks_[i];
    }

    std::vector<T> chunkBuffer(defaultChunkSize());
    std::vector<std::size_t> chunkOrigin(nd), lo(nd), hi(nd);

    forEachIndex(startChunk, endChunk, [&](const std::vector<std::size_t>& chunkId) {
        bool fullCover = true;
        for (std::size_t d = 0; d < nd; ++d) {
            chunkOrigin[d] = chunkId[d] * chunks_[d];
            lo[d] = std::max(offset[d], chunkOrigin[d]);
            hi[d] = std::min(offset[d] + dataShape[d], chunkOrigin[d] + chunks_[d]);
            if (lo[d] != chunkOrigin[d] || hi[d] != chunkOrigin[d] + chunks_[d]) {
                fullCover = false;
            }
        }

        if (fullCover || !readChunk(chunkId, chunkBuffer.data())) {
            std::fill(chunkBuffer.begin(), chunkBuffer.end(), fillValueAs<T>());
        }

        copyBox(data.data(), dataShape, offset,
                chunkBuffer.data(), chunks_, chunkOrigin, lo, hi);

        writeChunk(chunkId, chunkBuffer.data(), chunkBuffer.size() * sizeof(T));
    });
}

// Explicit instantiations
template void ZarrDataset::readSubarray(
    xt::xarray<std::uint8_t>&,
    const std::vector<std::size_t>&,
    const std::vector<std::size_t>&) const;
template void ZarrDataset::readSubarray(
    xt::xarray<std::uint16_t>&,
    const std::vector<std::size_t>&,
    const std::vector<std::size_t>&) const;
template void ZarrDataset::readSubarray(
    xt::xarray<float>&,
    const std::vector<std::size_t>&,
    const std::vector<std::size_t>&) const;

template void ZarrDataset::writeSubarray(
    const xt::xarray<std::uint8_t>&,
    const std::vector<std::size_t>&);
template void ZarrDataset::writeSubarray(
    const xt::xarray<std::uint16_t>&,
    const std::vector<std::size_t>&);
template void ZarrDataset::writeSubarray(
    const xt::xarray<float>&,
    const std::vector<std::size_t>&);

}  // namespace fo::zarr
