#include "io/data_json.h"

#include "io/binary_codec.h"

#include <fstream>
#include <sstream>

namespace gridfill
{
namespace data_json
{
namespace
{
static constexpr int kMaxDepth = 256;

static bool FromJsonAt(const json& j, Value& out, int depth, std::string& err)
{
    if (depth > kMaxDepth)
    {
        err = "Data nesting is too deep.";
        return false;
    }

    switch (j.type())
    {
        case json::value_t::null: out = Value(); return true;
        case json::value_t::boolean: out = Value::FromBool(j.get<bool>()); return true;
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float: out = Value::FromNumber(j.get<double>()); return true;
        case json::value_t::string: out = Value::FromString(j.get<std::string>()); return true;
        case json::value_t::binary:
        {
            const auto& bin = j.get_binary();
            out = Value::FromBinary(Value::Bytes(bin.begin(), bin.end()));
            return true;
        }
        case json::value_t::array:
        {
            Value::Sequence items;
            items.reserve(j.size());
            for (const json& e : j)
            {
                Value v;
                if (!FromJsonAt(e, v, depth + 1, err))
                    return false;
                items.push_back(std::move(v));
            }
            out = Value::FromSequence(std::move(items));
            return true;
        }
        case json::value_t::object:
        {
            if (j.size() == 1 && j.contains("$base64"))
            {
                const json& b = j["$base64"];
                Value::Bytes bytes;
                if (!b.is_string() || !Base64Decode(b.get<std::string>(), bytes))
                {
                    err = "'$base64' is not a valid base64 string.";
                    return false;
                }
                out = Value::FromBinary(std::move(bytes));
                return true;
            }
            if (j.contains("$hyperlink") && j["$hyperlink"].is_string())
            {
                std::string label;
                if (j.contains("label") && j["label"].is_string())
                    label = j["label"].get<std::string>();
                out = Value::FromHyperlink(j["$hyperlink"].get<std::string>(), std::move(label));
                return true;
            }

            Value::Mapping members;
            for (auto it = j.begin(); it != j.end(); ++it)
            {
                Value v;
                if (!FromJsonAt(it.value(), v, depth + 1, err))
                {
                    err = "'" + it.key() + "': " + err;
                    return false;
                }
                members.emplace(it.key(), std::move(v));
            }
            out = Value::FromMapping(std::move(members));
            return true;
        }
        case json::value_t::discarded: break;
    }
    err = "Unsupported JSON value.";
    return false;
}
} // namespace

json ToJson(const Value& v)
{
    switch (v.GetType())
    {
        case Value::Type::Null: return json();
        case Value::Type::Bool: return json(v.AsBool());
        case Value::Type::Number: return json(v.AsNumber());
        case Value::Type::String: return json(v.AsString());
        case Value::Type::Sequence:
        {
            json arr = json::array();
            for (const Value& e : v.AsSequence())
                arr.push_back(ToJson(e));
            return arr;
        }
        case Value::Type::Mapping:
        {
            json obj = json::object();
            for (const auto& kv : v.AsMapping())
                obj[kv.first] = ToJson(kv.second);
            return obj;
        }
        case Value::Type::Binary:
        {
            std::string b64;
            Base64Encode(v.AsBinary(), b64);
            json obj;
            obj["$base64"] = b64;
            return obj;
        }
        case Value::Type::Hyperlink:
        {
            json obj;
            obj["$hyperlink"] = v.AsHyperlink().url;
            if (!v.AsHyperlink().label.empty())
                obj["label"] = v.AsHyperlink().label;
            return obj;
        }
    }
    return json();
}

bool FromJson(const json& j, Value& out, std::string& err)
{
    err.clear();
    out = Value();
    try
    {
        return FromJsonAt(j, out, 0, err);
    }
    catch (const std::exception& e)
    {
        err = e.what();
        return false;
    }
}

bool ParseText(std::string_view text, Value& out, std::string& err)
{
    err.clear();
    json j;
    try
    {
        j = json::parse(text.begin(), text.end());
    }
    catch (const std::exception& e)
    {
        err = std::string("JSON parse failed: ") + e.what();
        return false;
    }
    return FromJson(j, out, err);
}

bool LoadFile(const std::string& path, Value& out, std::string& err)
{
    err.clear();
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        err = "Failed to open data file: " + path;
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (!ParseText(ss.str(), out, err))
    {
        err = path + ": " + err;
        return false;
    }
    return true;
}
} // namespace data_json
} // namespace gridfill
