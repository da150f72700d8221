#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace gridfill
{
// Helpers for binary payloads inside documents:
// - base64 for image bytes and Binary values in JSON
// - zstd for the packed workbook container
bool Base64Encode(const std::vector<std::uint8_t>& data, std::string& out);
bool Base64Decode(std::string_view b64, std::vector<std::uint8_t>& out_bytes);

bool ZstdCompressBytes(const std::vector<std::uint8_t>& in, std::vector<std::uint8_t>& out, std::string& err);
bool ZstdDecompressBytesKnownSize(const std::vector<std::uint8_t>& in,
                                  std::uint64_t out_size,
                                  std::vector<std::uint8_t>& out,
                                  std::string& err);
} // namespace gridfill
