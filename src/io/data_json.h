#pragma once

#include "core/value.h"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

// Fill data <-> nlohmann::json.
//
// Objects map to Mapping, arrays to Sequence, numbers to Number. Two tagged objects carry
// the non-JSON kinds:
//   {"$base64": "..."}                    -> Binary (CBOR byte strings are accepted too)
//   {"$hyperlink": "url", "label": "..."} -> Hyperlink
namespace gridfill
{
namespace data_json
{
using json = nlohmann::json;

json ToJson(const Value& v);
bool FromJson(const json& j, Value& out, std::string& err);

bool ParseText(std::string_view text, Value& out, std::string& err);
bool LoadFile(const std::string& path, Value& out, std::string& err);
} // namespace data_json
} // namespace gridfill
