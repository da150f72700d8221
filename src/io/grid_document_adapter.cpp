#include "io/grid_document_adapter.h"

#include "io/formats/packed_workbook.h"
#include "io/formats/workbook_json.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace gridfill
{
namespace
{
namespace fs = std::filesystem;

class JsonWorkbookAdapter : public IGridDocumentAdapter
{
public:
    const char* Name() const override { return "json"; }
    const std::vector<std::string_view>& Extensions() const override { return formats::workbook_json::Extensions(); }
    bool Decode(const std::vector<std::uint8_t>& bytes, Workbook& out, std::string& err) const override
    {
        return formats::workbook_json::DecodeBytes(bytes, out, err);
    }
    bool Encode(const Workbook& wb, std::vector<std::uint8_t>& out, std::string& err) const override
    {
        return formats::workbook_json::EncodeBytes(wb, out, err);
    }
};

class PackedWorkbookAdapter : public IGridDocumentAdapter
{
public:
    const char* Name() const override { return "gfw"; }
    const std::vector<std::string_view>& Extensions() const override { return formats::packed_workbook::Extensions(); }
    bool Decode(const std::vector<std::uint8_t>& bytes, Workbook& out, std::string& err) const override
    {
        return formats::packed_workbook::DecodeBytes(bytes, out, err);
    }
    bool Encode(const Workbook& wb, std::vector<std::uint8_t>& out, std::string& err) const override
    {
        return formats::packed_workbook::EncodeBytes(wb, out, err);
    }
};

static std::string LowerExtension(const std::string& path)
{
    std::string ext = fs::path(path).extension().string();
    if (!ext.empty() && ext[0] == '.')
        ext.erase(0, 1);
    for (char& c : ext)
        c = (char)std::tolower((unsigned char)c);
    return ext;
}
} // namespace

const std::vector<const IGridDocumentAdapter*>& DocumentAdapters()
{
    static const JsonWorkbookAdapter json_adapter{};
    static const PackedWorkbookAdapter packed_adapter{};
    static const std::vector<const IGridDocumentAdapter*> adapters = {&json_adapter, &packed_adapter};
    return adapters;
}

const IGridDocumentAdapter* FindAdapterByName(std::string_view name)
{
    for (const IGridDocumentAdapter* a : DocumentAdapters())
        if (name == a->Name())
            return a;
    return nullptr;
}

const IGridDocumentAdapter* FindAdapterForPath(const std::string& path)
{
    const std::string ext = LowerExtension(path);
    if (ext.empty())
        return nullptr;
    for (const IGridDocumentAdapter* a : DocumentAdapters())
    {
        const auto& exts = a->Extensions();
        if (std::find(exts.begin(), exts.end(), ext) != exts.end())
            return a;
    }
    return nullptr;
}

const IGridDocumentAdapter* DetectAdapter(const std::vector<std::uint8_t>& bytes)
{
    if (formats::packed_workbook::HasHeader(bytes))
        return FindAdapterByName("gfw");

    // Skip a UTF-8 BOM and leading whitespace.
    std::size_t i = 0;
    if (bytes.size() >= 3 && bytes[0] == 0xEF && bytes[1] == 0xBB && bytes[2] == 0xBF)
        i = 3;
    while (i < bytes.size() && std::isspace((unsigned char)bytes[i]))
        ++i;
    if (i < bytes.size() && bytes[i] == '{')
        return FindAdapterByName("json");
    return nullptr;
}

bool ReadAllBytes(const std::string& path, std::vector<std::uint8_t>& out, std::string& err)
{
    err.clear();
    out.clear();
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        err = "Failed to open file for reading: " + path;
        return false;
    }
    in.seekg(0, std::ios::end);
    const std::streamoff sz = in.tellg();
    if (sz < 0)
    {
        err = "Failed to read file size: " + path;
        return false;
    }
    in.seekg(0, std::ios::beg);
    out.resize(static_cast<size_t>(sz));
    if (sz > 0)
        in.read(reinterpret_cast<char*>(out.data()), sz);
    if (!in && sz > 0)
    {
        err = "Failed to read file contents: " + path;
        out.clear();
        return false;
    }
    return true;
}

bool WriteAllBytesAtomic(const std::string& path, const std::vector<std::uint8_t>& bytes, std::string& err)
{
    err.clear();
    try
    {
        fs::path p(path);
        if (p.has_parent_path())
            fs::create_directories(p.parent_path());

        const std::string tmp = path + ".tmp";
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out)
            {
                err = "Failed to open file for writing: " + tmp;
                return false;
            }
            if (!bytes.empty())
                out.write(reinterpret_cast<const char*>(bytes.data()), (std::streamsize)bytes.size());
            out.close();
            if (!out)
            {
                err = "Failed to write file contents: " + tmp;
                return false;
            }
        }

        std::error_code ec;
        fs::rename(tmp, path, ec);
        if (ec)
        {
            err = std::string("Failed to replace file: ") + ec.message();
            std::error_code rm_ec;
            fs::remove(tmp, rm_ec);
            return false;
        }
        return true;
    }
    catch (const std::exception& e)
    {
        err = e.what();
        return false;
    }
}

bool ReadWorkbookFile(const std::string& path, Workbook& out, std::string& err)
{
    std::vector<std::uint8_t> bytes;
    if (!ReadAllBytes(path, bytes, err))
        return false;

    const IGridDocumentAdapter* adapter = FindAdapterForPath(path);
    if (!adapter)
        adapter = DetectAdapter(bytes);
    if (!adapter)
    {
        err = "Unrecognized workbook format: " + path;
        return false;
    }
    if (!adapter->Decode(bytes, out, err))
    {
        err = path + ": " + err;
        return false;
    }
    return true;
}

bool WriteWorkbookFile(const std::string& path, const Workbook& wb, std::string& err)
{
    err.clear();
    const IGridDocumentAdapter* adapter = FindAdapterForPath(path);
    if (!adapter)
    {
        err = "No workbook format for output path: " + path;
        return false;
    }
    std::vector<std::uint8_t> bytes;
    if (!adapter->Encode(wb, bytes, err))
        return false;
    return WriteAllBytesAtomic(path, bytes, err);
}
} // namespace gridfill
