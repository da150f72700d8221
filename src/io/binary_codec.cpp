#include "io/binary_codec.h"

#include <zstd.h>

#include <array>
#include <limits>
#include <memory>

namespace gridfill
{
namespace
{
constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// Largest payload a packed workbook may claim in its header.
constexpr std::uint64_t kMaxInflatedSize = 1ull << 30;

const std::array<std::int8_t, 256>& ReverseAlphabet()
{
    static const std::array<std::int8_t, 256> table = [] {
        std::array<std::int8_t, 256> t{};
        t.fill(-1);
        for (int i = 0; i < 64; ++i)
            t[(unsigned char)kAlphabet[i]] = (std::int8_t)i;
        return t;
    }();
    return table;
}

bool IsBlank(unsigned char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

struct CCtxDeleter
{
    void operator()(ZSTD_CCtx* c) const { ZSTD_freeCCtx(c); }
};
} // namespace

bool Base64Encode(const std::vector<std::uint8_t>& data, std::string& out)
{
    out.clear();
    out.reserve(((data.size() + 2) / 3) * 4);

    std::uint32_t acc = 0;
    int bits = 0;
    for (std::uint8_t byte : data)
    {
        acc = (acc << 8) | byte;
        bits += 8;
        while (bits >= 6)
        {
            bits -= 6;
            out.push_back(kAlphabet[(acc >> bits) & 0x3F]);
        }
    }
    if (bits > 0)
        out.push_back(kAlphabet[(acc << (6 - bits)) & 0x3F]);
    while (out.size() % 4 != 0)
        out.push_back('=');
    return true;
}

bool Base64Decode(std::string_view b64, std::vector<std::uint8_t>& out_bytes)
{
    out_bytes.clear();
    const std::array<std::int8_t, 256>& rev = ReverseAlphabet();

    std::uint32_t acc = 0;
    int bits = 0;
    std::size_t symbols = 0;
    std::size_t padding = 0;
    for (unsigned char c : b64)
    {
        if (IsBlank(c))
            continue;
        if (c == '=')
        {
            ++padding;
            continue;
        }
        // Data after padding, or an out-of-alphabet byte.
        if (padding > 0 || rev[c] < 0)
            return false;
        acc = (acc << 6) | (std::uint32_t)rev[c];
        bits += 6;
        ++symbols;
        if (bits >= 8)
        {
            bits -= 8;
            out_bytes.push_back((std::uint8_t)((acc >> bits) & 0xFF));
        }
    }

    if (padding > 2 || (symbols + padding) % 4 != 0)
    {
        out_bytes.clear();
        return false;
    }
    // A lone trailing symbol cannot carry a whole byte.
    if (symbols % 4 == 1)
    {
        out_bytes.clear();
        return false;
    }
    return true;
}

bool ZstdCompressBytes(const std::vector<std::uint8_t>& in, std::vector<std::uint8_t>& out, std::string& err)
{
    err.clear();
    out.clear();

    std::unique_ptr<ZSTD_CCtx, CCtxDeleter> cctx(ZSTD_createCCtx());
    if (!cctx)
    {
        err = "zstd: out of memory creating compression context.";
        return false;
    }

    const int level = ZSTD_CLEVEL_DEFAULT;
    ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_compressionLevel, level);
    ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_checksumFlag, 1);

    out.resize(ZSTD_compressBound(in.size()));
    const std::size_t n = ZSTD_compress2(cctx.get(), out.data(), out.size(), in.data(), in.size());
    if (ZSTD_isError(n))
    {
        err = std::string("zstd: compression failed: ") + ZSTD_getErrorName(n);
        out.clear();
        return false;
    }
    out.resize(n);
    return true;
}

bool ZstdDecompressBytesKnownSize(const std::vector<std::uint8_t>& in,
                                  std::uint64_t out_size,
                                  std::vector<std::uint8_t>& out,
                                  std::string& err)
{
    err.clear();
    out.clear();

    if (out_size > kMaxInflatedSize || out_size > (std::uint64_t)std::numeric_limits<std::size_t>::max())
    {
        err = "zstd: declared size " + std::to_string(out_size) + " exceeds the 1 GiB limit.";
        return false;
    }

    const unsigned long long framed = ZSTD_getFrameContentSize(in.data(), in.size());
    if (framed == ZSTD_CONTENTSIZE_ERROR)
    {
        err = "zstd: input is not a zstd frame.";
        return false;
    }
    if (framed != ZSTD_CONTENTSIZE_UNKNOWN && framed != out_size)
    {
        err = "zstd: frame holds " + std::to_string(framed) + " bytes, header declares " +
              std::to_string(out_size) + ".";
        return false;
    }

    out.resize((std::size_t)out_size);
    const std::size_t n = ZSTD_decompress(out.data(), out.size(), in.data(), in.size());
    if (ZSTD_isError(n) || n != out.size())
    {
        err = ZSTD_isError(n) ? std::string("zstd: decompression failed: ") + ZSTD_getErrorName(n)
                              : std::string("zstd: size mismatch after decompression.");
        out.clear();
        return false;
    }
    return true;
}
} // namespace gridfill
