#pragma once

#include "core/workbook.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace gridfill
{
// Translates between a container format and the in-memory Workbook.
class IGridDocumentAdapter
{
public:
    virtual ~IGridDocumentAdapter() = default;

    virtual const char* Name() const = 0;
    // Lowercase extensions without the leading dot.
    virtual const std::vector<std::string_view>& Extensions() const = 0;

    virtual bool Decode(const std::vector<std::uint8_t>& bytes, Workbook& out, std::string& err) const = 0;
    virtual bool Encode(const Workbook& wb, std::vector<std::uint8_t>& out, std::string& err) const = 0;
};

// Registered adapters: "json" (.json) and "gfw" (.gfw). Adapters are stateless singletons.
const std::vector<const IGridDocumentAdapter*>& DocumentAdapters();
const IGridDocumentAdapter* FindAdapterByName(std::string_view name);
// By extension (case-insensitive). nullptr when no adapter claims it.
const IGridDocumentAdapter* FindAdapterForPath(const std::string& path);
// By content: the GFW1 magic, or a JSON object. nullptr when neither matches.
const IGridDocumentAdapter* DetectAdapter(const std::vector<std::uint8_t>& bytes);

bool ReadAllBytes(const std::string& path, std::vector<std::uint8_t>& out, std::string& err);
// Writes `path` through a temporary file and a rename.
bool WriteAllBytesAtomic(const std::string& path, const std::vector<std::uint8_t>& bytes, std::string& err);

// Extension first, content sniffing as the fallback.
bool ReadWorkbookFile(const std::string& path, Workbook& out, std::string& err);
// Chooses the adapter by extension; unknown extensions are an error.
bool WriteWorkbookFile(const std::string& path, const Workbook& wb, std::string& err);
} // namespace gridfill
