#include "io/formats/workbook_json.h"

#include "core/cell_ref.h"
#include "io/binary_codec.h"
#include "io/data_json.h"

#include <algorithm>

namespace gridfill
{
namespace formats::workbook_json
{
const std::vector<std::string_view>& Extensions()
{
    static const std::vector<std::string_view> exts = {"json"};
    return exts;
}

namespace
{
static std::string FormatRange(const CellRange& r)
{
    return FormatCellRef(CellRef{std::string(), r.first_row, r.first_col}, false) + ":" +
           FormatCellRef(CellRef{std::string(), r.last_row, r.last_col}, false);
}

static bool ParseRange(const std::string& text, CellRange& out, std::string& err)
{
    const std::size_t colon = text.find(':');
    CellRef a;
    CellRef b;
    if (!ParseCellRef(text.substr(0, colon), a, err))
        return false;
    b = a;
    if (colon != std::string::npos && !ParseCellRef(text.substr(colon + 1), b, err))
        return false;
    out.first_row = std::min(a.row, b.row);
    out.first_col = std::min(a.col, b.col);
    out.last_row = std::max(a.row, b.row);
    out.last_col = std::max(a.col, b.col);
    return true;
}

static json SheetToJson(const Sheet& sheet)
{
    json js;
    js["name"] = sheet.Name();
    if (sheet.Hidden())
        js["hidden"] = true;

    json cells = json::array();
    for (const auto& kv : sheet.Cells())
    {
        const Cell& cell = kv.second;
        json jc;
        jc["ref"] = FormatCellRef(CellRef{std::string(), kv.first.row, kv.first.col}, false);
        if (!cell.value.IsNull())
            jc["value"] = data_json::ToJson(cell.value);
        if (!cell.formula.empty())
            jc["formula"] = cell.formula;
        if (cell.style_id != 0)
            jc["style"] = cell.style_id;
        if (!cell.comment.empty())
            jc["comment"] = cell.comment;
        cells.push_back(std::move(jc));
    }
    js["cells"] = std::move(cells);

    if (!sheet.Merges().empty())
    {
        json merges = json::array();
        for (const CellRange& m : sheet.Merges())
            merges.push_back(FormatRange(m));
        js["merges"] = std::move(merges);
    }

    // Height and auto-height share one entry per row.
    std::map<int, json> rows;
    for (const auto& kv : sheet.RowHeights())
        rows[kv.first]["height"] = kv.second;
    for (int r : sheet.AutoHeightRows())
        rows[r]["auto_height"] = true;
    if (!rows.empty())
    {
        json jrows = json::array();
        for (auto& kv : rows)
        {
            json& jr = kv.second;
            jr["index"] = kv.first + 1;
            jrows.push_back(std::move(jr));
        }
        js["rows"] = std::move(jrows);
    }

    if (!sheet.ColumnWidths().empty())
    {
        json cols = json::array();
        for (const auto& kv : sheet.ColumnWidths())
            cols.push_back(json{{"name", ColumnName(kv.first)}, {"width", kv.second}});
        js["columns"] = std::move(cols);
    }

    if (!sheet.Images().empty())
    {
        json images = json::array();
        for (const ImageAnchor& img : sheet.Images())
        {
            std::string b64;
            Base64Encode(img.bytes, b64);
            json ji;
            ji["range"] = FormatRange(img.range);
            ji["type"] = img.image_type;
            ji["width"] = img.pixel_width;
            ji["height"] = img.pixel_height;
            ji["scale_x"] = img.scale_x;
            ji["scale_y"] = img.scale_y;
            ji["data"] = std::move(b64);
            images.push_back(std::move(ji));
        }
        js["images"] = std::move(images);
    }
    return js;
}

static bool SheetFromJson(const json& js, Sheet& out, std::string& err)
{
    if (!js.is_object())
    {
        err = "sheet is not an object.";
        return false;
    }
    if (js.contains("hidden") && js["hidden"].is_boolean())
        out.SetHidden(js["hidden"].get<bool>());

    const std::string where = "sheet '" + out.Name() + "': ";
    if (js.contains("cells") && js["cells"].is_array())
    {
        for (const json& jc : js["cells"])
        {
            if (!jc.is_object() || !jc.contains("ref") || !jc["ref"].is_string())
            {
                err = where + "cell without 'ref'.";
                return false;
            }
            CellRef ref;
            if (!ParseCellRef(jc["ref"].get<std::string>(), ref, err))
            {
                err = where + err;
                return false;
            }
            Cell& cell = out.CellAt(ref.row, ref.col);
            if (jc.contains("value") && !data_json::FromJson(jc["value"], cell.value, err))
            {
                err = where + jc["ref"].get<std::string>() + ": " + err;
                return false;
            }
            if (jc.contains("formula") && jc["formula"].is_string())
                out.SetFormula(ref.row, ref.col, jc["formula"].get<std::string>());
            if (jc.contains("style") && jc["style"].is_number_integer())
                cell.style_id = jc["style"].get<int>();
            if (jc.contains("comment") && jc["comment"].is_string())
                cell.comment = jc["comment"].get<std::string>();
        }
    }

    if (js.contains("merges") && js["merges"].is_array())
    {
        for (const json& jm : js["merges"])
        {
            CellRange r;
            if (!jm.is_string() || !ParseRange(jm.get<std::string>(), r, err))
            {
                err = where + "invalid merge range.";
                return false;
            }
            out.AddMerge(r);
        }
    }

    if (js.contains("rows") && js["rows"].is_array())
    {
        for (const json& jr : js["rows"])
        {
            if (!jr.is_object() || !jr.contains("index") || !jr["index"].is_number_integer())
                continue;
            const int row = jr["index"].get<int>() - 1;
            if (row < 0)
                continue;
            if (jr.contains("height") && jr["height"].is_number())
                out.SetRowHeight(row, jr["height"].get<double>());
            if (jr.contains("auto_height") && jr["auto_height"].is_boolean() && jr["auto_height"].get<bool>())
                out.FlagAutoRowHeight(row);
        }
    }

    if (js.contains("columns") && js["columns"].is_array())
    {
        for (const json& jcol : js["columns"])
        {
            if (!jcol.is_object() || !jcol.contains("name") || !jcol["name"].is_string())
                continue;
            const int col = ColumnIndex(jcol["name"].get<std::string>());
            if (col >= 0 && jcol.contains("width") && jcol["width"].is_number())
                out.SetColumnWidth(col, jcol["width"].get<double>());
        }
    }

    if (js.contains("images") && js["images"].is_array())
    {
        for (const json& ji : js["images"])
        {
            ImageAnchor img;
            if (!ji.is_object() || !ji.contains("range") || !ji["range"].is_string() ||
                !ParseRange(ji["range"].get<std::string>(), img.range, err))
            {
                err = where + "image without a valid 'range'.";
                return false;
            }
            if (!ji.contains("data") || !ji["data"].is_string() || !Base64Decode(ji["data"].get<std::string>(), img.bytes))
            {
                err = where + "image 'data' is not valid base64.";
                return false;
            }
            if (ji.contains("type") && ji["type"].is_string())
                img.image_type = ji["type"].get<std::string>();
            if (ji.contains("width") && ji["width"].is_number_integer())
                img.pixel_width = ji["width"].get<int>();
            if (ji.contains("height") && ji["height"].is_number_integer())
                img.pixel_height = ji["height"].get<int>();
            if (ji.contains("scale_x") && ji["scale_x"].is_number())
                img.scale_x = ji["scale_x"].get<double>();
            if (ji.contains("scale_y") && ji["scale_y"].is_number())
                img.scale_y = ji["scale_y"].get<double>();
            out.AddImage(std::move(img));
        }
    }
    return true;
}
} // namespace

json ToJson(const Workbook& wb)
{
    json j;
    j["schema_version"] = kSchemaVersion;
    if (wb.RecalculateOnOpen())
        j["recalculate_on_open"] = true;
    json sheets = json::array();
    for (std::size_t i = 0; i < wb.SheetCount(); ++i)
        sheets.push_back(SheetToJson(wb.SheetAt(i)));
    j["sheets"] = std::move(sheets);
    return j;
}

bool FromJson(const json& j, Workbook& out, std::string& err)
{
    err.clear();
    out = Workbook{};
    try
    {
        if (!j.is_object())
        {
            err = "Workbook document is not a JSON object.";
            return false;
        }
        if (j.contains("schema_version") && j["schema_version"].is_number_integer() &&
            j["schema_version"].get<int>() > kSchemaVersion)
        {
            err = "Unsupported workbook schema_version " + std::to_string(j["schema_version"].get<int>()) + ".";
            return false;
        }
        if (!j.contains("sheets") || !j["sheets"].is_array())
        {
            err = "Workbook document has no 'sheets' array.";
            return false;
        }
        if (j.contains("recalculate_on_open") && j["recalculate_on_open"].is_boolean())
            out.SetRecalculateOnOpen(j["recalculate_on_open"].get<bool>());

        for (const json& js : j["sheets"])
        {
            if (!js.is_object() || !js.contains("name") || !js["name"].is_string())
            {
                err = "Sheet without a 'name'.";
                return false;
            }
            const std::string name = js["name"].get<std::string>();
            if (out.FindSheet(name))
            {
                err = "Duplicate sheet name '" + name + "'.";
                return false;
            }
            if (!SheetFromJson(js, out.AddSheet(name), err))
                return false;
        }
        return true;
    }
    catch (const std::exception& e)
    {
        err = std::string("Workbook document: ") + e.what();
        return false;
    }
}

bool DecodeBytes(const std::vector<std::uint8_t>& bytes, Workbook& out, std::string& err)
{
    err.clear();
    json j;
    try
    {
        j = json::parse(bytes.begin(), bytes.end());
    }
    catch (const std::exception& e)
    {
        err = std::string("JSON parse failed: ") + e.what();
        return false;
    }
    return FromJson(j, out, err);
}

bool EncodeBytes(const Workbook& wb, std::vector<std::uint8_t>& out, std::string& err)
{
    err.clear();
    try
    {
        const std::string text = ToJson(wb).dump(2);
        out.assign(text.begin(), text.end());
        out.push_back('\n');
        return true;
    }
    catch (const std::exception& e)
    {
        err = std::string("JSON encode failed: ") + e.what();
        return false;
    }
}
} // namespace formats::workbook_json
} // namespace gridfill
