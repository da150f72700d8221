#include "engine/command.h"

#include <cctype>
#include <cstdlib>
#include <type_traits>

namespace gridfill
{
namespace
{
static constexpr std::string_view kCommandPrefix = "jx:";

// UTF-8 typographic quotes produced by spreadsheet autocorrect.
static constexpr std::string_view kLeftDoubleQuote = "\xE2\x80\x9C";
static constexpr std::string_view kRightDoubleQuote = "\xE2\x80\x9D";
static constexpr std::string_view kLeftSingleQuote = "\xE2\x80\x98";
static constexpr std::string_view kRightSingleQuote = "\xE2\x80\x99";

static std::string_view Trim(std::string_view s)
{
    while (!s.empty() && std::isspace((unsigned char)s.front()))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace((unsigned char)s.back()))
        s.remove_suffix(1);
    return s;
}

static std::string Upper(std::string_view s)
{
    std::string out(s);
    for (char& c : out)
        c = (char)std::toupper((unsigned char)c);
    return out;
}

static std::vector<std::string_view> SplitLines(std::string_view text)
{
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] != '\n' && text[i] != '\r')
            continue;
        lines.push_back(text.substr(start, i - start));
        if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
            ++i;
        start = i + 1;
    }
    lines.push_back(text.substr(start));
    return lines;
}

static bool IsCommandLine(std::string_view line)
{
    return Trim(line).substr(0, kCommandPrefix.size()) == kCommandPrefix;
}

using Attributes = std::vector<std::pair<std::string, std::string>>;

static const std::string* FindAttr(const Attributes& attrs, std::string_view key)
{
    for (const auto& kv : attrs)
        if (kv.first == key)
            return &kv.second;
    return nullptr;
}

static std::string AttrOr(const Attributes& attrs, std::string_view key, std::string fallback = std::string())
{
    const std::string* v = FindAttr(attrs, key);
    return v ? *v : fallback;
}

static bool ParseIntAttr(const std::string& text, int& out)
{
    const std::string_view t = Trim(text);
    if (t.empty())
        return false;
    char* end = nullptr;
    const std::string s(t);
    const long v = std::strtol(s.c_str(), &end, 10);
    if (!end || *end != '\0' || v < 0 || v > 1000000)
        return false;
    out = (int)v;
    return true;
}

static bool ParseDoubleAttr(const std::string& text, double& out)
{
    const std::string s(Trim(text));
    if (s.empty())
        return false;
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (!end || *end != '\0' || !(v > 0.0))
        return false;
    out = v;
    return true;
}

struct RequiredAttrs
{
    std::string_view name;
    std::vector<std::string_view> required;
};

static const RequiredAttrs* FindRequiredAttrs(std::string_view name)
{
    static const RequiredAttrs kKnown[] = {
        {"area", {"lastCell"}},
        {"each", {"items", "var", "lastCell"}},
        {"if", {"condition", "lastCell"}},
        {"grid", {"headers", "data", "lastCell"}},
        {"image", {"src", "imageType", "lastCell"}},
        {"mergeCells", {"lastCell", "cols", "rows"}},
        {"autoRowHeight", {"lastCell"}},
    };
    for (const auto& s : kKnown)
        if (s.name == name)
            return &s;
    return nullptr;
}

static bool ParseParamsLine(std::string_view line, FormulaParams& out, Diagnostic& err, const CellRef& anchor)
{
    out = FormulaParams{};
    const std::size_t open = line.find('(');
    const std::size_t close = line.rfind(')');
    if (open == std::string_view::npos || close == std::string_view::npos || close < open)
    {
        err = MakeDiagnostic(ErrorCode::MalformedCommand, FormatCellRef(anchor), "Malformed jx:params declaration.");
        return false;
    }
    Attributes attrs;
    std::string perr;
    if (!ParseAttributes(line.substr(open + 1, close - open - 1), attrs, perr))
    {
        err = MakeDiagnostic(ErrorCode::MalformedCommand, FormatCellRef(anchor), perr);
        return false;
    }
    if (const std::string* s = FindAttr(attrs, "formulaStrategy"))
    {
        const std::string u = Upper(Trim(*s));
        if (u == "BY_COLUMN")
            out.strategy = FormulaStrategy::ByColumn;
        else if (u == "BY_ROW")
            out.strategy = FormulaStrategy::ByRow;
        else if (u == "DEFAULT" || u.empty())
            out.strategy = FormulaStrategy::Default;
        else
        {
            err = MakeDiagnostic(ErrorCode::MalformedCommand,
                                 FormatCellRef(anchor),
                                 "Unknown formulaStrategy '" + *s + "'.");
            return false;
        }
    }
    if (const std::string* d = FindAttr(attrs, "defaultValue"))
        out.default_value = *d;
    return true;
}

// Removes a bracketed areas=[...] list from the attribute text. ParseAttributes only
// accepts quoted values, so the list is taken out first.
static bool ExtractAreasList(std::string& text, std::string& out_list, std::string& err)
{
    out_list.clear();
    char quote = 0;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        const char c = text[i];
        if (quote)
        {
            if (c == quote)
                quote = 0;
            continue;
        }
        if (c == '"' || c == '\'')
        {
            quote = c;
            continue;
        }
        if (text.compare(i, 5, "areas") != 0)
            continue;
        if (i > 0 && (std::isalnum((unsigned char)text[i - 1]) || text[i - 1] == '_'))
            continue;
        std::size_t j = i + 5;
        while (j < text.size() && std::isspace((unsigned char)text[j]))
            ++j;
        if (j >= text.size() || text[j] != '=')
            continue;
        ++j;
        while (j < text.size() && std::isspace((unsigned char)text[j]))
            ++j;
        if (j >= text.size() || text[j] != '[')
            continue;
        const std::size_t close = text.find(']', j);
        if (close == std::string::npos)
        {
            err = "Unterminated areas list.";
            return false;
        }
        out_list = text.substr(j + 1, close - j - 1);
        text.erase(i, close + 1 - i);
        return true;
    }
    return true;
}

// "A3:C3", "A3" or "Sheet1!A3:C3" on the anchor's sheet.
static bool ParseAreaRef(std::string_view text, const CellRef& anchor, Region& out, std::string& err)
{
    const std::size_t colon = text.find(':');
    CellRef first;
    CellRef last;
    if (!ParseCellRef(Trim(text.substr(0, colon)), first, err))
        return false;
    if (colon == std::string_view::npos)
        last = first;
    else if (!ParseCellRef(Trim(text.substr(colon + 1)), last, err))
        return false;
    if ((!first.sheet.empty() && first.sheet != anchor.sheet) || (!last.sheet.empty() && last.sheet != anchor.sheet))
    {
        err = "area '" + std::string(text) + "' is not on the anchor's sheet.";
        return false;
    }
    out = Region{anchor.sheet, first.row, first.col, last.row, last.col};
    return true;
}
} // namespace

const char* CommandName(const CommandBody& body)
{
    return std::visit(
        [](const auto& c) -> const char* {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, AreaCommand>)
                return "area";
            else if constexpr (std::is_same_v<T, EachCommand>)
                return "each";
            else if constexpr (std::is_same_v<T, IfCommand>)
                return "if";
            else if constexpr (std::is_same_v<T, GridCommand>)
                return "grid";
            else if constexpr (std::is_same_v<T, ImageCommand>)
                return "image";
            else if constexpr (std::is_same_v<T, MergeCellsCommand>)
                return "mergeCells";
            else
            {
                static_assert(std::is_same_v<T, AutoRowHeightCommand>, "unhandled command kind");
                return "autoRowHeight";
            }
        },
        body);
}

bool IsContainer(const CommandBody& body)
{
    return std::holds_alternative<AreaCommand>(body) || std::holds_alternative<EachCommand>(body) ||
           std::holds_alternative<IfCommand>(body) || std::holds_alternative<AutoRowHeightCommand>(body);
}

bool ParseAttributes(std::string_view text, std::vector<std::pair<std::string, std::string>>& out, std::string& err)
{
    err.clear();
    out.clear();

    std::size_t i = 0;
    const std::size_t n = text.size();
    auto skip_separators = [&]() {
        while (i < n && (std::isspace((unsigned char)text[i]) || text[i] == ','))
            ++i;
    };

    skip_separators();
    while (i < n)
    {
        const std::size_t key_begin = i;
        while (i < n && (std::isalnum((unsigned char)text[i]) || text[i] == '_'))
            ++i;
        if (i == key_begin)
        {
            err = "Expected attribute name at '" + std::string(text.substr(key_begin)) + "'.";
            return false;
        }
        std::string key(text.substr(key_begin, i - key_begin));

        while (i < n && std::isspace((unsigned char)text[i]))
            ++i;
        if (i >= n || text[i] != '=')
        {
            err = "Expected '=' after attribute '" + key + "'.";
            return false;
        }
        ++i;
        while (i < n && std::isspace((unsigned char)text[i]))
            ++i;

        std::string_view close;
        if (i < n && (text[i] == '"' || text[i] == '\''))
        {
            close = text.substr(i, 1);
            ++i;
        }
        else if (text.substr(i, kLeftDoubleQuote.size()) == kLeftDoubleQuote)
        {
            close = kRightDoubleQuote;
            i += kLeftDoubleQuote.size();
        }
        else if (text.substr(i, kLeftSingleQuote.size()) == kLeftSingleQuote)
        {
            close = kRightSingleQuote;
            i += kLeftSingleQuote.size();
        }
        else
        {
            err = "Attribute '" + key + "' value must be quoted.";
            return false;
        }

        const std::size_t end = text.find(close, i);
        if (end == std::string_view::npos)
        {
            err = "Unterminated value for attribute '" + key + "'.";
            return false;
        }
        out.emplace_back(std::move(key), std::string(text.substr(i, end - i)));
        i = end + close.size();
        skip_separators();
    }
    return true;
}

bool ParseCommandLine(std::string_view line, const CellRef& anchor, CommandNode& out, Diagnostic& err)
{
    err = Diagnostic{};
    out = CommandNode{};
    const std::string where = FormatCellRef(anchor);

    line = Trim(line);
    if (line.substr(0, kCommandPrefix.size()) != kCommandPrefix)
    {
        err = MakeDiagnostic(ErrorCode::MalformedCommand, where, "Declaration must start with 'jx:'.");
        return false;
    }
    line.remove_prefix(kCommandPrefix.size());

    const std::size_t open = line.find('(');
    const std::size_t close = line.rfind(')');
    if (open == std::string_view::npos || close == std::string_view::npos || close < open)
    {
        err = MakeDiagnostic(ErrorCode::MalformedCommand,
                             where,
                             "Malformed declaration 'jx:" + std::string(line) + "' (expected name(...)).");
        return false;
    }
    const std::string name(Trim(line.substr(0, open)));
    if (!Trim(line.substr(close + 1)).empty())
    {
        err = MakeDiagnostic(ErrorCode::MalformedCommand, where, "Unexpected text after 'jx:" + name + "(...)'.");
        return false;
    }

    const RequiredAttrs* known = FindRequiredAttrs(name);
    if (!known)
    {
        err = MakeDiagnostic(ErrorCode::UnknownCommand, where, "Unknown command 'jx:" + name + "'.");
        return false;
    }

    std::string attr_text(line.substr(open + 1, close - open - 1));
    std::string areas_list;
    std::string perr;
    if (name == "if" && !ExtractAreasList(attr_text, areas_list, perr))
    {
        err = MakeDiagnostic(ErrorCode::MalformedCommand, where, "jx:if: " + perr);
        return false;
    }
    Attributes attrs;
    if (!ParseAttributes(attr_text, attrs, perr))
    {
        err = MakeDiagnostic(ErrorCode::MalformedCommand, where, "jx:" + name + ": " + perr);
        return false;
    }
    for (std::string_view req : known->required)
    {
        const std::string* v = FindAttr(attrs, req);
        if (!v || Trim(*v).empty())
        {
            err = MakeDiagnostic(ErrorCode::MissingAttribute,
                                 where,
                                 "jx:" + name + " requires attribute '" + std::string(req) + "'.");
            return false;
        }
    }

    CellRef last;
    if (!ParseCellRef(*FindAttr(attrs, "lastCell"), last, perr))
    {
        err = MakeDiagnostic(ErrorCode::MalformedCommand, where, "jx:" + name + " lastCell: " + perr);
        return false;
    }
    if (!last.sheet.empty() && last.sheet != anchor.sheet)
    {
        err = MakeDiagnostic(ErrorCode::RegionOutOfBounds,
                             where,
                             "jx:" + name + " lastCell is on sheet '" + last.sheet + "', not on the anchor's sheet.");
        return false;
    }
    out.region = Region{anchor.sheet, anchor.row, anchor.col, last.row, last.col};

    if (name == "area")
    {
        out.body = AreaCommand{};
    }
    else if (name == "each")
    {
        EachCommand c;
        c.items = AttrOr(attrs, "items");
        c.var = std::string(Trim(AttrOr(attrs, "var")));
        c.var_index = std::string(Trim(AttrOr(attrs, "varIndex")));
        c.select = AttrOr(attrs, "select");
        c.order_by = AttrOr(attrs, "orderBy");
        c.group_by = AttrOr(attrs, "groupBy");
        c.group_order = AttrOr(attrs, "groupOrder");
        c.multisheet = AttrOr(attrs, "multisheet");
        const std::string dir = Upper(Trim(AttrOr(attrs, "direction", "DOWN")));
        if (dir == "DOWN")
            c.direction = Direction::Down;
        else if (dir == "RIGHT")
            c.direction = Direction::Right;
        else
        {
            err = MakeDiagnostic(ErrorCode::MalformedCommand,
                                 where,
                                 "jx:each direction must be DOWN or RIGHT, got '" + dir + "'.");
            return false;
        }
        out.body = std::move(c);
    }
    else if (name == "if")
    {
        IfCommand c;
        c.condition = AttrOr(attrs, "condition");
        // areas=[...] or the quoted areas="A2:C2, A3:C3".
        if (areas_list.empty())
        {
            const std::string attr = AttrOr(attrs, "areas");
            const std::string_view quoted = Trim(attr);
            if (quoted.size() >= 2 && quoted.front() == '[' && quoted.back() == ']')
                areas_list = std::string(quoted.substr(1, quoted.size() - 2));
            else
                areas_list = std::string(quoted);
        }
        const std::vector<std::string> areas = SplitAttributeList(areas_list);
        if (areas.size() >= 2)
        {
            std::string_view ref = Trim(areas[1]);
            if (ref.size() >= 2 && (ref.front() == '"' || ref.front() == '\'') && ref.back() == ref.front())
                ref = Trim(ref.substr(1, ref.size() - 2));
            Region else_region;
            if (!ParseAreaRef(ref, anchor, else_region, perr))
            {
                err = MakeDiagnostic(ErrorCode::MalformedCommand, where, "jx:if areas: " + perr);
                return false;
            }
            if (else_region.Empty())
            {
                err = MakeDiagnostic(ErrorCode::RegionOutOfBounds,
                                     where,
                                     "jx:if else area " + FormatRegion(else_region) + " is empty.");
                return false;
            }
            c.else_region = else_region;
        }
        out.body = std::move(c);
    }
    else if (name == "grid")
    {
        out.body = GridCommand{AttrOr(attrs, "headers"), AttrOr(attrs, "data"), AttrOr(attrs, "props")};
    }
    else if (name == "image")
    {
        ImageCommand c;
        c.src = AttrOr(attrs, "src");
        c.image_type = Upper(Trim(AttrOr(attrs, "imageType")));
        const std::string* sx = FindAttr(attrs, "scaleX");
        const std::string* sy = FindAttr(attrs, "scaleY");
        if ((sx && !ParseDoubleAttr(*sx, c.scale_x)) || (sy && !ParseDoubleAttr(*sy, c.scale_y)))
        {
            err = MakeDiagnostic(ErrorCode::MalformedCommand, where, "jx:image scaleX/scaleY must be positive numbers.");
            return false;
        }
        out.body = std::move(c);
    }
    else if (name == "mergeCells")
    {
        MergeCellsCommand c;
        c.cols = AttrOr(attrs, "cols");
        c.rows = AttrOr(attrs, "rows");
        const std::string* mc = FindAttr(attrs, "minCols");
        const std::string* mr = FindAttr(attrs, "minRows");
        if ((mc && !ParseIntAttr(*mc, c.min_cols)) || (mr && !ParseIntAttr(*mr, c.min_rows)))
        {
            err = MakeDiagnostic(ErrorCode::MalformedCommand,
                                 where,
                                 "jx:mergeCells minCols/minRows must be non-negative integers.");
            return false;
        }
        out.body = std::move(c);
    }
    else
    {
        out.body = AutoRowHeightCommand{};
    }
    return true;
}

bool ParseAnnotation(std::string_view text, const CellRef& anchor, ParsedAnnotation& out, Diagnostic& err)
{
    err = Diagnostic{};
    out = ParsedAnnotation{};

    for (std::string_view raw : SplitLines(text))
    {
        const std::string_view line = Trim(raw);
        if (!IsCommandLine(line))
        {
            if (!line.empty())
            {
                if (!out.plain_text.empty())
                    out.plain_text.push_back('\n');
                out.plain_text += std::string(raw);
            }
            continue;
        }

        std::string_view rest = line.substr(kCommandPrefix.size());
        if (Trim(rest.substr(0, rest.find('('))) == "params")
        {
            FormulaParams params;
            if (!ParseParamsLine(rest, params, err, anchor))
                return false;
            out.params = params;
            continue;
        }

        CommandNode node;
        if (!ParseCommandLine(line, anchor, node, err))
            return false;
        out.commands.push_back(std::move(node));
    }
    return true;
}

std::vector<std::string> SplitAttributeList(std::string_view text)
{
    std::vector<std::string> out;
    int depth = 0;
    char quote = 0;
    std::size_t start = 0;
    for (std::size_t i = 0; i <= text.size(); ++i)
    {
        const char c = i < text.size() ? text[i] : ',';
        if (quote)
        {
            if (c == quote)
                quote = 0;
            continue;
        }
        if (c == '"' || c == '\'')
            quote = c;
        else if (c == '(')
            ++depth;
        else if (c == ')' && depth > 0)
            --depth;
        else if (c == ',' && depth == 0)
        {
            const std::string_view part = Trim(text.substr(start, i - start));
            if (!part.empty())
                out.emplace_back(part);
            start = i + 1;
        }
    }
    return out;
}

std::vector<SortKey> ParseOrderBy(std::string_view text)
{
    std::vector<SortKey> keys;
    for (const std::string& part : SplitAttributeList(text))
    {
        SortKey key;
        std::string_view expr = part;
        const std::size_t space = expr.find_last_of(" \t");
        if (space != std::string_view::npos)
        {
            const std::string dir = Upper(Trim(expr.substr(space + 1)));
            if (dir == "ASC" || dir == "DESC")
            {
                key.descending = dir == "DESC";
                expr = Trim(expr.substr(0, space));
            }
        }
        key.expression = std::string(expr);
        keys.push_back(std::move(key));
    }
    return keys;
}

bool HasCommandLines(std::string_view text)
{
    for (std::string_view line : SplitLines(text))
        if (IsCommandLine(line))
            return true;
    return false;
}

std::string StripCommandLines(std::string_view text)
{
    if (!HasCommandLines(text))
        return std::string(text);
    std::string out;
    for (std::string_view line : SplitLines(text))
    {
        if (IsCommandLine(line) || Trim(line).empty())
            continue;
        if (!out.empty())
            out.push_back('\n');
        out += std::string(line);
    }
    return out;
}
} // namespace gridfill
