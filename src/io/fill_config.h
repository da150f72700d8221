#pragma once

#include "engine/fill_options.h"

#include <nlohmann/json.hpp>

#include <string>

// Fill options from a JSON config file:
//   {
//     "schema_version": 1,
//     "notation": {"begin": "${", "end": "}"},
//     "keep_template_sheet": false,
//     "hide_template_sheet": false,
//     "fail_fast": false,
//     "recalculate_on_open": false,
//     "default_formula_value": "0",
//     "log_diagnostics": false,
//     "clear_template_cells": true
//   }
// Missing, unknown and wrongly typed keys leave the corresponding option untouched.
// Cell listeners are code-only and never read or written here.
namespace gridfill
{
namespace fill_config
{
using json = nlohmann::json;

static constexpr int kSchemaVersion = 1;

// Applies the keys present in `j` on top of `inout`.
bool ApplyJson(const json& j, FillOptions& inout, std::string& err);
bool LoadFile(const std::string& path, FillOptions& inout, std::string& err);

json ToJson(const FillOptions& options);
} // namespace fill_config
} // namespace gridfill
