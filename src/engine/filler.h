#pragma once

#include "core/diagnostics.h"
#include "core/value.h"
#include "core/workbook.h"
#include "engine/fill_options.h"

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace gridfill
{
// Fills `tmpl` with `data` (a Mapping; Null counts as empty) into `out`.
// The template is never modified; `out` is only assigned on success.
FillResult FillWorkbook(const Workbook& tmpl, const Value& data, const FillOptions& options, Workbook& out);

// Reads the template through the adapter for its extension (or its content) and writes the
// result through the adapter for `output_path`'s extension.
FillResult FillToPath(const std::string& template_path,
                      const Value& data,
                      const std::string& output_path,
                      const FillOptions& options);

// In-memory documents. An empty `output_format` reuses the template's detected format.
FillResult FillToBytes(const std::vector<std::uint8_t>& template_bytes,
                       const Value& data,
                       const FillOptions& options,
                       std::vector<std::uint8_t>& out,
                       const std::string& output_format = std::string());

// Reads the template from `template_path` (format by extension, else by content) and returns
// the filled document as bytes instead of writing a file.
FillResult FillToBytes(const std::string& template_path,
                       const Value& data,
                       const FillOptions& options,
                       std::vector<std::uint8_t>& out,
                       const std::string& output_format = std::string());

// Streams carry the template's detected format in both directions.
FillResult FillStream(std::istream& in, std::ostream& out, const Value& data, const FillOptions& options);
} // namespace gridfill
