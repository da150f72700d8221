#include "core/value.h"

#include <cctype>
#include <cmath>
#include <cstdio>

namespace gridfill
{
namespace
{
static std::string LowerAscii(std::string s)
{
    for (char& c : s)
        c = (char)std::tolower((unsigned char)c);
    return s;
}
} // namespace

Value Value::FromBool(bool b)
{
    Value v;
    v.m_data = b;
    return v;
}

Value Value::FromNumber(double d)
{
    Value v;
    v.m_data = d;
    return v;
}

Value Value::FromString(std::string s)
{
    Value v;
    v.m_data = std::move(s);
    return v;
}

Value Value::FromSequence(Sequence items)
{
    Value v;
    v.m_data = std::make_shared<const Sequence>(std::move(items));
    return v;
}

Value Value::FromMapping(Mapping members)
{
    Value v;
    v.m_data = std::make_shared<const Mapping>(std::move(members));
    return v;
}

Value Value::FromBinary(Bytes bytes)
{
    Value v;
    v.m_data = std::make_shared<const Bytes>(std::move(bytes));
    return v;
}

Value Value::FromHyperlink(std::string url, std::string label)
{
    Value v;
    v.m_data = Link{std::move(url), std::move(label)};
    return v;
}

const Value* Value::Member(std::string_view name) const
{
    if (!IsMapping())
        return nullptr;
    const Mapping& m = AsMapping();
    auto it = m.find(name);
    if (it == m.end())
        return nullptr;
    return &it->second;
}

std::string FormatNumber(double d)
{
    if (std::isnan(d))
        return "NaN";
    if (std::isinf(d))
        return d < 0 ? "-Inf" : "+Inf";
    if (d == std::floor(d) && std::fabs(d) < 1e15)
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.0f", d);
        // "-0" prints as "0".
        if (buf[0] == '-' && buf[1] == '0' && buf[2] == '\0')
            return "0";
        return buf;
    }
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.15g", d);
    return buf;
}

std::string Value::ToDisplayString() const
{
    switch (GetType())
    {
        case Type::Null: return std::string();
        case Type::Bool: return AsBool() ? "true" : "false";
        case Type::Number: return FormatNumber(AsNumber());
        case Type::String: return AsString();
        case Type::Hyperlink: return AsHyperlink().label.empty() ? AsHyperlink().url : AsHyperlink().label;
        case Type::Binary: return "<" + std::to_string(AsBinary().size()) + " bytes>";
        case Type::Sequence:
        {
            std::string out = "[";
            bool first = true;
            for (const Value& v : AsSequence())
            {
                if (!first)
                    out += ", ";
                first = false;
                out += v.ToDisplayString();
            }
            out += "]";
            return out;
        }
        case Type::Mapping:
        {
            std::string out = "{";
            bool first = true;
            for (const auto& kv : AsMapping())
            {
                if (!first)
                    out += ", ";
                first = false;
                out += kv.first;
                out += ": ";
                out += kv.second.ToDisplayString();
            }
            out += "}";
            return out;
        }
    }
    return std::string();
}

const char* TypeName(Value::Type t)
{
    switch (t)
    {
        case Value::Type::Null: return "null";
        case Value::Type::Bool: return "bool";
        case Value::Type::Number: return "number";
        case Value::Type::String: return "string";
        case Value::Type::Sequence: return "sequence";
        case Value::Type::Mapping: return "mapping";
        case Value::Type::Binary: return "binary";
        case Value::Type::Hyperlink: return "hyperlink";
    }
    return "unknown";
}

bool ValuesEqual(const Value& a, const Value& b)
{
    if (a.GetType() != b.GetType())
        return false;
    switch (a.GetType())
    {
        case Value::Type::Null: return true;
        case Value::Type::Bool: return a.AsBool() == b.AsBool();
        case Value::Type::Number: return a.AsNumber() == b.AsNumber();
        case Value::Type::String: return a.AsString() == b.AsString();
        case Value::Type::Binary: return a.AsBinary() == b.AsBinary();
        case Value::Type::Hyperlink:
            return a.AsHyperlink().url == b.AsHyperlink().url && a.AsHyperlink().label == b.AsHyperlink().label;
        case Value::Type::Sequence:
        {
            const auto& sa = a.AsSequence();
            const auto& sb = b.AsSequence();
            if (sa.size() != sb.size())
                return false;
            for (std::size_t i = 0; i < sa.size(); ++i)
                if (!ValuesEqual(sa[i], sb[i]))
                    return false;
            return true;
        }
        case Value::Type::Mapping:
        {
            const auto& ma = a.AsMapping();
            const auto& mb = b.AsMapping();
            if (ma.size() != mb.size())
                return false;
            auto ia = ma.begin();
            auto ib = mb.begin();
            for (; ia != ma.end(); ++ia, ++ib)
            {
                if (ia->first != ib->first || !ValuesEqual(ia->second, ib->second))
                    return false;
            }
            return true;
        }
    }
    return false;
}

int CompareForSort(const Value& a, const Value& b, bool ignore_case)
{
    if (a.IsNull() || b.IsNull())
    {
        if (a.IsNull() && b.IsNull())
            return 0;
        return a.IsNull() ? -1 : 1;
    }
    if (a.IsNumber() && b.IsNumber())
    {
        if (a.AsNumber() < b.AsNumber())
            return -1;
        if (a.AsNumber() > b.AsNumber())
            return 1;
        return 0;
    }
    if (a.IsBool() && b.IsBool())
        return (int)a.AsBool() - (int)b.AsBool();

    std::string sa = a.ToDisplayString();
    std::string sb = b.ToDisplayString();
    if (ignore_case)
    {
        sa = LowerAscii(std::move(sa));
        sb = LowerAscii(std::move(sb));
    }
    const int c = sa.compare(sb);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}
} // namespace gridfill
