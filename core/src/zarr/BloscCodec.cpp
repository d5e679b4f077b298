#include "fo/core/zarr/BloscCodec.hpp"

#include "fo/core/util/Errors.hpp"

#include <blosc2.h>

#include <memory>
#include <mutex>

namespace fo::zarr
{

namespace
{

std::once_flag bloscInitFlag;

struct ContextDeleter {
    void operator()(blosc2_context* ctx) const { blosc2_free_ctx(ctx); }
};
using ContextPtr = std::unique_ptr<blosc2_context, ContextDeleter>;

// zarr writes shuffle as 0/1/2; some writers use the v3 names instead.
int parseShuffle(const nlohmann::json& v, int fallback)
{
    if (v.is_number_integer()) {
        const int s = v.get<int>();
        if (s < 0 || s > 2) throw IOError("BloscCodec: shuffle must be 0, 1 or 2");
        return s;
    }
    if (v.is_string()) {
        const auto s = v.get<std::string>();
        if (s == "noshuffle") return 0;
        if (s == "shuffle") return 1;
        if (s == "bitshuffle") return 2;
        throw IOError("BloscCodec: unknown shuffle '" + s + "'");
    }
    return fallback;
}

std::uint8_t shuffleFilter(int shuffle)
{
    switch (shuffle) {
        case 0: return BLOSC_NOSHUFFLE;
        case 2: return BLOSC_BITSHUFFLE;
        default: return BLOSC_SHUFFLE;
    }
}

}  // namespace

void BloscCodec::initBlosc()
{
    std::call_once(bloscInitFlag, [] { blosc2_init(); });
}

BloscCodec::BloscCodec()
{
    initBlosc();
}

BloscCodec::BloscCodec(const nlohmann::json& config) : BloscCodec()
{
    if (!config.is_object()) {
        throw IOError("BloscCodec: compressor record must be a JSON object");
    }
    try {
        cname_ = config.value("cname", cname_);
        clevel_ = config.value("clevel", clevel_);
        blocksize_ = config.value("blocksize", blocksize_);
        if (config.contains("shuffle")) {
            shuffle_ = parseShuffle(config["shuffle"], shuffle_);
        }
    } catch (const nlohmann::json::exception& e) {
        throw IOError(std::string("BloscCodec: bad compressor record: ") + e.what());
    }

    if (blosc2_compname_to_compcode(cname_.c_str()) < 0) {
        throw IOError("BloscCodec: unsupported compressor '" + cname_ + "'");
    }
    if (clevel_ < 0 || clevel_ > 9) {
        throw IOError("BloscCodec: clevel must be in [0, 9]");
    }
}

std::vector<std::uint8_t> BloscCodec::compress(
    const void* src, std::size_t size, std::size_t typesize) const
{
    blosc2_cparams cparams = BLOSC2_CPARAMS_DEFAULTS;
    cparams.typesize = static_cast<int32_t>(typesize);
    cparams.compcode = static_cast<uint8_t>(blosc2_compname_to_compcode(cname_.c_str()));
    cparams.clevel = static_cast<uint8_t>(clevel_);
    cparams.filters[BLOSC2_MAX_FILTERS - 1] = shuffleFilter(shuffle_);
    cparams.blocksize = static_cast<int32_t>(blocksize_);
    cparams.nthreads = 1;

    ContextPtr ctx(blosc2_create_cctx(cparams));
    if (!ctx) {
        throw IOError("BloscCodec::compress: cannot create blosc context");
    }

    std::vector<std::uint8_t> out(size + BLOSC2_MAX_OVERHEAD);
    const int n = blosc2_compress_ctx(ctx.get(), src, static_cast<int32_t>(size), out.data(),
                                      static_cast<int32_t>(out.size()));
    if (n < 0) {
        throw IOError("BloscCodec::compress: blosc error " + std::to_string(n));
    }
    out.resize(static_cast<std::size_t>(n));
    return out;
}

std::size_t BloscCodec::decompress(
    const void* src,
    std::size_t srcSize,
    void* dst,
    std::size_t dstCapacity) const
{
    if (srcSize < BLOSC_MIN_HEADER_LENGTH) {
        throw IOError("BloscCodec::decompress: truncated chunk");
    }

    int32_t nbytes = 0, cbytes = 0, blocksize = 0;
    if (blosc2_cbuffer_sizes(src, &nbytes, &cbytes, &blocksize) < 0 ||
        static_cast<std::size_t>(cbytes) > srcSize ||
        static_cast<std::size_t>(nbytes) > dstCapacity) {
        throw IOError("BloscCodec::decompress: corrupt chunk header");
    }

    blosc2_dparams dparams = BLOSC2_DPARAMS_DEFAULTS;
    dparams.nthreads = 1;
    ContextPtr ctx(blosc2_create_dctx(dparams));
    if (!ctx) {
        throw IOError("BloscCodec::decompress: cannot create blosc context");
    }

    const int n = blosc2_decompress_ctx(ctx.get(), src, static_cast<int32_t>(srcSize), dst,
                                        static_cast<int32_t>(dstCapacity));
    if (n < 0) {
        throw IOError("BloscCodec::decompress: blosc error " + std::to_string(n));
    }
    return static_cast<std::size_t>(n);
}

nlohmann::json BloscCodec::toJson() const
{
    return {{"id", "blosc"},
            {"cname", cname_},
            {"clevel", clevel_},
            {"shuffle", shuffle_},
            {"blocksize", blocksize_}};
}

}  // namespace fo::zarr
