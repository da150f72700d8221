#pragma once

#include "core/workbook.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Packed workbook container (*.gfw).
//
// Format:
//   4 bytes  magic: "GFW1"
//   4 bytes  version (LE): 1
//   8 bytes  uncompressed size (LE): CBOR byte length
//   ...      zstd-compressed CBOR of the workbook JSON document (see workbook_json.h)
namespace gridfill
{
namespace formats::packed_workbook
{
const std::vector<std::string_view>& Extensions(); // {"gfw"}

bool HasHeader(const std::vector<std::uint8_t>& bytes);

bool DecodeBytes(const std::vector<std::uint8_t>& bytes, Workbook& out, std::string& err);
bool EncodeBytes(const Workbook& wb, std::vector<std::uint8_t>& out, std::string& err);
} // namespace formats::packed_workbook
} // namespace gridfill
