#include "engine/describe.h"

#include "engine/command_tree.h"
#include "engine/expression.h"

#include <algorithm>
#include <cctype>
#include <type_traits>

namespace gridfill
{
namespace
{
static void AppendAttr(std::string& out, const char* key, const std::string& value)
{
    if (value.empty())
        return;
    out += ' ';
    out += key;
    out += "=\"";
    out += value;
    out += '"';
}

static std::string NumberText(double d)
{
    return FormatNumber(d);
}

static std::string Attributes(const CommandBody& body)
{
    std::string out;
    std::visit(
        [&](const auto& c) {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, EachCommand>)
            {
                AppendAttr(out, "items", c.items);
                AppendAttr(out, "var", c.var);
                AppendAttr(out, "varIndex", c.var_index);
                if (c.direction == Direction::Right)
                    AppendAttr(out, "direction", "RIGHT");
                AppendAttr(out, "select", c.select);
                AppendAttr(out, "orderBy", c.order_by);
                AppendAttr(out, "groupBy", c.group_by);
                AppendAttr(out, "groupOrder", c.group_order);
                AppendAttr(out, "multisheet", c.multisheet);
            }
            else if constexpr (std::is_same_v<T, IfCommand>)
            {
                AppendAttr(out, "condition", c.condition);
            }
            else if constexpr (std::is_same_v<T, GridCommand>)
            {
                AppendAttr(out, "headers", c.headers);
                AppendAttr(out, "data", c.data);
                AppendAttr(out, "props", c.props);
            }
            else if constexpr (std::is_same_v<T, ImageCommand>)
            {
                AppendAttr(out, "src", c.src);
                AppendAttr(out, "imageType", c.image_type);
                if (c.scale_x != 1.0)
                    AppendAttr(out, "scaleX", NumberText(c.scale_x));
                if (c.scale_y != 1.0)
                    AppendAttr(out, "scaleY", NumberText(c.scale_y));
            }
            else if constexpr (std::is_same_v<T, MergeCellsCommand>)
            {
                AppendAttr(out, "cols", c.cols);
                AppendAttr(out, "rows", c.rows);
                if (c.min_cols > 0)
                    AppendAttr(out, "minCols", std::to_string(c.min_cols));
                if (c.min_rows > 0)
                    AppendAttr(out, "minRows", std::to_string(c.min_rows));
            }
            else
            {
                static_assert(std::is_same_v<T, AreaCommand> || std::is_same_v<T, AutoRowHeightCommand>,
                              "unhandled command kind");
            }
        },
        body);
    return out;
}

static std::string RangeText(const Region& r)
{
    return FormatCellRef(CellRef{std::string(), r.first_row, r.first_col}, false) + ":" +
           FormatCellRef(CellRef{std::string(), r.last_row, r.last_col}, false);
}

static void DescribeNode(const CommandTree& tree, int id, int depth, std::string& out)
{
    const CommandNode& n = tree.Node(id);
    out.append((std::size_t)depth * 2, ' ');
    out += "jx:";
    out += CommandName(n.body);
    out += ' ';
    out += RangeText(n.region);
    out += Attributes(n.body);
    out += '\n';
    for (int child : n.children)
        DescribeNode(tree, child, depth + 1, out);

    const auto* cond = std::get_if<IfCommand>(&n.body);
    if (!cond || !cond->else_region)
        return;
    out.append((std::size_t)(depth + 1) * 2, ' ');
    out += "else ";
    out += RangeText(*cond->else_region);
    out += '\n';
    for (int child : n.else_children)
        DescribeNode(tree, child, depth + 2, out);
}

static const char* StrategyName(FormulaStrategy s)
{
    switch (s)
    {
        case FormulaStrategy::Default: return "DEFAULT";
        case FormulaStrategy::ByColumn: return "BY_COLUMN";
        case FormulaStrategy::ByRow: return "BY_ROW";
    }
    return "DEFAULT";
}

static bool IsIntegerLiteral(std::string_view s)
{
    while (!s.empty() && std::isspace((unsigned char)s.front()))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace((unsigned char)s.back()))
        s.remove_suffix(1);
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return std::isdigit((unsigned char)c) != 0; });
}

// Expression-valued attributes of a command, paired with their attribute names.
static std::vector<std::pair<const char*, std::string>> ExpressionAttributes(const CommandBody& body)
{
    std::vector<std::pair<const char*, std::string>> out;
    auto add = [&](const char* key, const std::string& text) {
        if (!text.empty())
            out.emplace_back(key, text);
    };
    if (const auto* each = std::get_if<EachCommand>(&body))
    {
        add("items", each->items);
        add("select", each->select);
        add("groupBy", each->group_by);
        add("multisheet", each->multisheet);
        for (const SortKey& key : ParseOrderBy(each->order_by))
            add("orderBy", key.expression);
    }
    else if (const auto* cond = std::get_if<IfCommand>(&body))
    {
        add("condition", cond->condition);
    }
    else if (const auto* grid = std::get_if<GridCommand>(&body))
    {
        add("headers", grid->headers);
        add("data", grid->data);
    }
    else if (const auto* image = std::get_if<ImageCommand>(&body))
    {
        add("src", image->src);
    }
    else if (const auto* merge = std::get_if<MergeCellsCommand>(&body))
    {
        if (!IsIntegerLiteral(merge->cols))
            add("cols", merge->cols);
        if (!IsIntegerLiteral(merge->rows))
            add("rows", merge->rows);
    }
    return out;
}
} // namespace

const char* IssueSeverityName(IssueSeverity s)
{
    switch (s)
    {
        case IssueSeverity::Error: return "error";
        case IssueSeverity::Warning: return "warning";
    }
    return "error";
}

bool DescribeTemplate(const Workbook& tmpl, std::string& out, Diagnostic& err)
{
    out.clear();
    CommandTree tree;
    if (!BuildTemplateTree(tmpl, tree, err))
        return false;

    for (std::size_t s = 0; s < tmpl.SheetCount(); ++s)
    {
        const std::string& name = tmpl.SheetAt(s).Name();
        const std::vector<int> roots = tree.RootsOnSheet(name);
        out += "Sheet '" + name + "'";
        if (roots.empty())
            out += " (static)";
        out += '\n';
        for (int id : roots)
            DescribeNode(tree, id, 1, out);
        for (const auto& kv : tree.formula_params)
        {
            if (kv.first.first != name)
                continue;
            out += "  jx:params ";
            out += FormatCellRef(CellRef{std::string(), kv.first.second.row, kv.first.second.col}, false);
            out += " formulaStrategy=";
            out += StrategyName(kv.second.strategy);
            if (kv.second.default_value)
                out += " defaultValue=\"" + *kv.second.default_value + "\"";
            out += '\n';
        }
    }
    return true;
}

bool ValidateTemplate(const Workbook& tmpl, const FillOptions& options, std::vector<ValidationIssue>& out)
{
    out.clear();
    auto report = [&](IssueSeverity severity, Diagnostic d) { out.push_back(ValidationIssue{severity, std::move(d)}); };

    if (options.notation_begin.empty() || options.notation_end.empty())
    {
        report(IssueSeverity::Error,
               MakeDiagnostic(ErrorCode::InvalidOption, "", "Placeholder notation markers must not be empty."));
        return false;
    }
    Notation notation;
    notation.begin = options.notation_begin;
    notation.end = options.notation_end;

    std::vector<CommandNode> commands;
    std::map<std::pair<std::string, CellKey>, FormulaParams> params;
    Diagnostic err;
    if (!CollectCommands(tmpl, commands, params, err))
    {
        report(IssueSeverity::Error, std::move(err));
        return false;
    }

    CommandTree tree;
    if (!BuildCommandTree(commands, tmpl, tree, err))
        report(IssueSeverity::Error, std::move(err));

    ExpressionEvaluator eval;
    for (const CommandNode& n : commands)
    {
        const std::string where = FormatCellRef(CellRef{n.region.sheet, n.region.first_row, n.region.first_col});
        for (const auto& attr : ExpressionAttributes(n.body))
        {
            std::shared_ptr<const Expression> compiled;
            std::string cerr;
            if (!eval.Compile(UnwrapPlaceholder(attr.second, notation), compiled, cerr))
            {
                report(IssueSeverity::Error,
                       MakeDiagnostic(ErrorCode::MalformedExpression,
                                      where,
                                      "jx:" + std::string(CommandName(n.body)) + " " + attr.first + ": " + cerr));
            }
        }
    }

    for (std::size_t s = 0; s < tmpl.SheetCount(); ++s)
    {
        const Sheet& sheet = tmpl.SheetAt(s);
        auto in_area = [&](int row, int col) {
            for (const CommandNode& n : commands)
                if (std::holds_alternative<AreaCommand>(n.body) && n.region.sheet == sheet.Name() &&
                    n.region.Contains(row, col))
                    return true;
            return false;
        };

        for (const auto& kv : sheet.Cells())
        {
            const Cell& cell = kv.second;
            const std::string* text = nullptr;
            if (!cell.formula.empty())
                text = &cell.formula;
            else if (cell.value.IsString())
                text = &cell.value.AsString();
            if (!text || !ContainsPlaceholder(*text, notation))
                continue;

            const std::string where = FormatCellRef(CellRef{sheet.Name(), kv.first.row, kv.first.col});
            std::vector<TextSegment> segments;
            SplitPlaceholders(*text, notation, segments);
            for (const TextSegment& seg : segments)
            {
                if (!seg.expression)
                    continue;
                std::shared_ptr<const Expression> compiled;
                std::string cerr;
                if (!eval.Compile(seg.text, compiled, cerr))
                    report(IssueSeverity::Error, MakeDiagnostic(ErrorCode::MalformedExpression, where, cerr));
            }
            if (!in_area(kv.first.row, kv.first.col))
            {
                report(IssueSeverity::Warning,
                       MakeDiagnostic(ErrorCode::RegionOutOfBounds,
                                      where,
                                      "Placeholder outside every jx:area is copied as literal text."));
            }
        }
    }

    for (const ValidationIssue& issue : out)
        if (issue.severity == IssueSeverity::Error)
            return false;
    return true;
}
} // namespace gridfill
