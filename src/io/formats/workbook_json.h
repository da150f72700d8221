#pragma once

#include "core/workbook.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Workbook <-> nlohmann::json.
//
// Document sketch (references in A1 notation, rows 1-based in "rows"):
//   {
//     "schema_version": 1,
//     "recalculate_on_open": false,
//     "sheets": [{
//       "name": "Sheet1", "hidden": false,
//       "cells":   [{"ref": "B5", "value": 12, "formula": "SUM(B1:B4)", "style": 3, "comment": "..."}],
//       "merges":  ["A1:C1"],
//       "rows":    [{"index": 5, "height": 20.5, "auto_height": true}],
//       "columns": [{"name": "B", "width": 14}],
//       "images":  [{"range": "D2:E6", "type": "PNG", "width": 64, "height": 64,
//                    "scale_x": 1, "scale_y": 1, "data": "<base64>"}]
//     }]
//   }
// Shared by the .json adapter and the packed .gfw container.
namespace gridfill
{
namespace formats::workbook_json
{
using json = nlohmann::json;

static constexpr int kSchemaVersion = 1;

const std::vector<std::string_view>& Extensions(); // {"json"}

json ToJson(const Workbook& wb);
bool FromJson(const json& j, Workbook& out, std::string& err);

bool DecodeBytes(const std::vector<std::uint8_t>& bytes, Workbook& out, std::string& err);
bool EncodeBytes(const Workbook& wb, std::vector<std::uint8_t>& out, std::string& err);
} // namespace formats::workbook_json
} // namespace gridfill
