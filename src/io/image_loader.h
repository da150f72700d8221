#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace gridfill
{
namespace image_loader
{
struct ImageInfo
{
    std::string format; // "PNG", "JPEG", "GIF", "BMP"; empty when the signature is unknown
    int width = 0;
    int height = 0;
    int channels = 0;
};

// Identifies an in-memory image by its signature and reads its dimensions with stb_image.
// Pixels are not decoded.
bool ProbeImage(const std::vector<std::uint8_t>& bytes, ImageInfo& out, std::string& err);

// "JPG" and "JPEG" name the same format; comparison ignores case.
std::string CanonicalImageType(const std::string& type);
bool ImageTypeMatches(const std::string& declared, const std::string& detected);
} // namespace image_loader
} // namespace gridfill
