#include "io/image_loader.h"

#include <cctype>
#include <climits>
#include <cstring>

// Header probing only; this is the one translation unit that compiles stb_image.
#define STB_IMAGE_IMPLEMENTATION
#include <stb/stb_image.h>

namespace gridfill
{
namespace image_loader
{
namespace
{
static std::string SniffFormat(const std::vector<std::uint8_t>& b)
{
    static const std::uint8_t kPng[] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    if (b.size() >= sizeof(kPng) && std::memcmp(b.data(), kPng, sizeof(kPng)) == 0)
        return "PNG";
    if (b.size() >= 3 && b[0] == 0xFF && b[1] == 0xD8 && b[2] == 0xFF)
        return "JPEG";
    if (b.size() >= 6 && std::memcmp(b.data(), "GIF8", 4) == 0)
        return "GIF";
    if (b.size() >= 2 && b[0] == 'B' && b[1] == 'M')
        return "BMP";
    return std::string();
}

static const char* FailureReason()
{
    return stbi_failure_reason() ? stbi_failure_reason() : "unknown error";
}
} // namespace

bool ProbeImage(const std::vector<std::uint8_t>& bytes, ImageInfo& out, std::string& err)
{
    err.clear();
    out = ImageInfo{};

    if (bytes.empty())
    {
        err = "Image data is empty.";
        return false;
    }
    if (bytes.size() > (size_t)INT_MAX)
    {
        err = "Image data is too large.";
        return false;
    }

    out.format = SniffFormat(bytes);
    if (out.format.empty())
    {
        err = "Unrecognized image signature.";
        return false;
    }

    int w = 0;
    int h = 0;
    int channels = 0;
    if (!stbi_info_from_memory(bytes.data(), (int)bytes.size(), &w, &h, &channels))
    {
        err = std::string("Failed to read image header: ") + FailureReason();
        return false;
    }
    if (w <= 0 || h <= 0)
    {
        err = "Invalid image dimensions.";
        return false;
    }

    out.width = w;
    out.height = h;
    out.channels = channels;
    return true;
}

std::string CanonicalImageType(const std::string& type)
{
    std::string s;
    s.reserve(type.size());
    for (char c : type)
        s.push_back((char)std::toupper((unsigned char)c));
    if (s == "JPG")
        return "JPEG";
    return s;
}

bool ImageTypeMatches(const std::string& declared, const std::string& detected)
{
    return CanonicalImageType(declared) == CanonicalImageType(detected);
}
} // namespace image_loader
} // namespace gridfill
