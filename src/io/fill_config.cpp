#include "io/fill_config.h"

#include <cstdio>
#include <fstream>

namespace gridfill
{
namespace fill_config
{
namespace
{
static void ReadBool(const json& j, const char* key, bool& out)
{
    if (j.contains(key) && j[key].is_boolean())
        out = j[key].get<bool>();
    else if (j.contains(key))
        std::fprintf(stderr, "[config] ignoring '%s': expected a boolean\n", key);
}
} // namespace

bool ApplyJson(const json& j, FillOptions& inout, std::string& err)
{
    err.clear();
    if (!j.is_object())
    {
        err = "Config root must be an object.";
        return false;
    }
    if (j.contains("schema_version"))
    {
        if (!j["schema_version"].is_number_integer() || j["schema_version"].get<int>() != kSchemaVersion)
        {
            err = "Unsupported config schema_version (expected 1).";
            return false;
        }
    }

    FillOptions o = inout;
    if (j.contains("notation") && j["notation"].is_object())
    {
        const json& n = j["notation"];
        if (n.contains("begin") && n["begin"].is_string())
            o.notation_begin = n["begin"].get<std::string>();
        if (n.contains("end") && n["end"].is_string())
            o.notation_end = n["end"].get<std::string>();
    }
    if (o.notation_begin.empty() || o.notation_end.empty())
    {
        err = "Placeholder notation markers must not be empty.";
        return false;
    }

    ReadBool(j, "keep_template_sheet", o.keep_template_sheet);
    ReadBool(j, "hide_template_sheet", o.hide_template_sheet);
    ReadBool(j, "fail_fast", o.fail_fast);
    ReadBool(j, "recalculate_on_open", o.recalculate_on_open);
    ReadBool(j, "log_diagnostics", o.log_diagnostics);
    ReadBool(j, "clear_template_cells", o.clear_template_cells);

    if (j.contains("default_formula_value"))
    {
        const json& d = j["default_formula_value"];
        if (d.is_string())
            o.default_formula_value = d.get<std::string>();
        else if (d.is_number_integer())
            o.default_formula_value = std::to_string(d.get<long long>());
        else if (d.is_number())
            o.default_formula_value = d.dump();
    }

    inout = std::move(o);
    return true;
}

bool LoadFile(const std::string& path, FillOptions& inout, std::string& err)
{
    err.clear();
    std::ifstream f(path);
    if (!f)
    {
        err = "Failed to open config file: " + path;
        return false;
    }

    json j;
    try
    {
        f >> j;
    }
    catch (const std::exception& e)
    {
        err = std::string("JSON parse error: ") + e.what();
        return false;
    }
    if (!ApplyJson(j, inout, err))
    {
        err = path + ": " + err;
        return false;
    }
    return true;
}

json ToJson(const FillOptions& o)
{
    json j;
    j["schema_version"] = kSchemaVersion;
    j["notation"] = json{{"begin", o.notation_begin}, {"end", o.notation_end}};
    j["keep_template_sheet"] = o.keep_template_sheet;
    j["hide_template_sheet"] = o.hide_template_sheet;
    j["fail_fast"] = o.fail_fast;
    j["recalculate_on_open"] = o.recalculate_on_open;
    j["default_formula_value"] = o.default_formula_value;
    j["log_diagnostics"] = o.log_diagnostics;
    j["clear_template_cells"] = o.clear_template_cells;
    return j;
}
} // namespace fill_config
} // namespace gridfill
