#include "io/formats/packed_workbook.h"

#include "io/binary_codec.h"
#include "io/formats/workbook_json.h"

#include <nlohmann/json.hpp>

namespace gridfill
{
namespace formats::packed_workbook
{
namespace
{
using json = nlohmann::json;

constexpr unsigned char kMagic[4] = {'G', 'F', 'W', '1'};
constexpr std::uint32_t kVersion = 1;
constexpr std::size_t kHeaderSize = 16;

// Header fields are little-endian unsigned integers.
template <typename T>
void PutLittleEndian(std::vector<std::uint8_t>& out, T v)
{
    for (std::size_t i = 0; i < sizeof(T); ++i, v >>= 8)
        out.push_back((std::uint8_t)(v & 0xFF));
}

template <typename T>
bool GetLittleEndian(const std::vector<std::uint8_t>& in, std::size_t off, T& out)
{
    if (in.size() < off + sizeof(T))
        return false;
    T v = 0;
    for (std::size_t i = sizeof(T); i-- > 0;)
        v = (T)((v << 8) | in[off + i]);
    out = v;
    return true;
}
} // namespace

const std::vector<std::string_view>& Extensions()
{
    static const std::vector<std::string_view> exts = {"gfw"};
    return exts;
}

bool HasHeader(const std::vector<std::uint8_t>& bytes)
{
    return bytes.size() >= 4 && bytes[0] == kMagic[0] && bytes[1] == kMagic[1] && bytes[2] == kMagic[2] &&
           bytes[3] == kMagic[3];
}

bool EncodeBytes(const Workbook& wb, std::vector<std::uint8_t>& out, std::string& err)
{
    err.clear();
    out.clear();

    std::vector<std::uint8_t> cbor;
    try
    {
        cbor = json::to_cbor(workbook_json::ToJson(wb));
    }
    catch (const std::exception& e)
    {
        err = std::string("CBOR encode failed: ") + e.what();
        return false;
    }

    std::vector<std::uint8_t> compressed;
    if (!ZstdCompressBytes(cbor, compressed, err))
        return false;

    out.reserve(kHeaderSize + compressed.size());
    out.insert(out.end(), std::begin(kMagic), std::end(kMagic));
    PutLittleEndian(out, kVersion);
    PutLittleEndian(out, (std::uint64_t)cbor.size());
    out.insert(out.end(), compressed.begin(), compressed.end());
    return true;
}

bool DecodeBytes(const std::vector<std::uint8_t>& bytes, Workbook& out, std::string& err)
{
    err.clear();
    if (!HasHeader(bytes))
    {
        err = "Not a packed workbook (missing GFW1 header).";
        return false;
    }

    std::uint32_t ver = 0;
    std::uint64_t ulen = 0;
    if (!GetLittleEndian(bytes, 4, ver) || !GetLittleEndian(bytes, 8, ulen) || bytes.size() < kHeaderSize)
    {
        err = "Invalid packed workbook header (truncated).";
        return false;
    }
    if (ver != kVersion)
    {
        err = "Unsupported packed workbook version " + std::to_string(ver) + ".";
        return false;
    }

    const std::vector<std::uint8_t> comp(bytes.begin() + (std::ptrdiff_t)kHeaderSize, bytes.end());
    std::vector<std::uint8_t> cbor;
    if (!ZstdDecompressBytesKnownSize(comp, ulen, cbor, err))
        return false;

    json j;
    try
    {
        j = json::from_cbor(cbor);
    }
    catch (const std::exception& e)
    {
        err = std::string("CBOR decode failed: ") + e.what();
        return false;
    }
    return workbook_json::FromJson(j, out, err);
}
} // namespace formats::packed_workbook
} // namespace gridfill
