#include "engine/command_tree.h"

#include <algorithm>

namespace gridfill
{
namespace
{
static std::string Where(const CommandNode& n)
{
    return FormatCellRef(CellRef{n.region.sheet, n.region.first_row, n.region.first_col});
}

static std::string Describe(const CommandNode& n)
{
    return "jx:" + std::string(CommandName(n.body)) + " " + FormatRegion(n.region);
}

static const Region* ElseRegion(const CommandNode& n)
{
    const auto* c = std::get_if<IfCommand>(&n.body);
    return c && c->else_region ? &*c->else_region : nullptr;
}

// Cells a command claims in its parent: its block plus any else region.
static long long Extent(const CommandNode& n)
{
    const Region* e = ElseRegion(n);
    return std::max(n.region.Area(), e ? e->Area() : 0ll);
}

static bool Claims(const CommandNode& n, const Region& r)
{
    const Region* e = ElseRegion(n);
    return n.region.Overlaps(r) || (e && e->Overlaps(r));
}
} // namespace

std::vector<int> CommandTree::RootsOnSheet(const std::string& sheet) const
{
    std::vector<int> out;
    for (int id : roots)
        if (Node(id).region.sheet == sheet)
            out.push_back(id);
    return out;
}

const FormulaParams* CommandTree::ParamsAt(const std::string& sheet, int row, int col) const
{
    auto it = formula_params.find(std::make_pair(sheet, CellKey{row, col}));
    if (it == formula_params.end())
        return nullptr;
    return &it->second;
}

bool CollectCommands(const Workbook& tmpl,
                     std::vector<CommandNode>& out_commands,
                     std::map<std::pair<std::string, CellKey>, FormulaParams>& out_params,
                     Diagnostic& err)
{
    err = Diagnostic{};
    out_commands.clear();
    out_params.clear();

    int declaration = 0;
    for (std::size_t s = 0; s < tmpl.SheetCount(); ++s)
    {
        const Sheet& sheet = tmpl.SheetAt(s);
        for (const auto& kv : sheet.Cells())
        {
            const Cell& cell = kv.second;
            if (cell.comment.empty() || !HasCommandLines(cell.comment))
                continue;

            ParsedAnnotation parsed;
            const CellRef anchor{sheet.Name(), kv.first.row, kv.first.col};
            if (!ParseAnnotation(cell.comment, anchor, parsed, err))
                return false;
            for (CommandNode& node : parsed.commands)
            {
                node.declaration_index = declaration++;
                out_commands.push_back(std::move(node));
            }
            if (parsed.params)
                out_params[std::make_pair(sheet.Name(), kv.first)] = *parsed.params;
        }
    }
    return true;
}

bool BuildCommandTree(std::vector<CommandNode> commands, const Workbook& tmpl, CommandTree& out, Diagnostic& err)
{
    err = Diagnostic{};
    out.nodes = std::move(commands);
    out.roots.clear();

    std::vector<CommandNode>& nodes = out.nodes;
    const int count = (int)nodes.size();
    for (CommandNode& n : nodes)
    {
        n.children.clear();
        n.else_children.clear();
        n.parent = -1;
    }

    // Extents.
    for (const CommandNode& n : nodes)
    {
        if (const Region* e = ElseRegion(n))
        {
            if (e->Overlaps(n.region))
            {
                err = MakeDiagnostic(ErrorCode::OverlappingCommands,
                                     Where(n),
                                     Describe(n) + ": else area " + FormatRegion(*e) + " overlaps the if block.");
                return false;
            }
        }
        if (!n.region.Empty())
            continue;
        if (std::holds_alternative<EachCommand>(n.body))
            err = MakeDiagnostic(ErrorCode::EmptyEachRegion,
                                 Where(n),
                                 Describe(n) + ": lastCell precedes the anchor, the block is empty.");
        else
            err = MakeDiagnostic(ErrorCode::RegionOutOfBounds,
                                 Where(n),
                                 Describe(n) + ": lastCell precedes the anchor.");
        return false;
    }

    // Areas are roots and must be disjoint.
    std::vector<int> areas;
    for (int i = 0; i < count; ++i)
        if (std::holds_alternative<AreaCommand>(nodes[(std::size_t)i].body))
            areas.push_back(i);
    for (std::size_t a = 0; a < areas.size(); ++a)
    {
        for (std::size_t b = a + 1; b < areas.size(); ++b)
        {
            const CommandNode& x = nodes[(std::size_t)areas[a]];
            const CommandNode& y = nodes[(std::size_t)areas[b]];
            if (x.region.Overlaps(y.region))
            {
                err = MakeDiagnostic(ErrorCode::OverlappingCommands,
                                     Where(y),
                                     Describe(y) + " overlaps " + Describe(x) + ".");
                return false;
            }
        }
    }

    // Attach the largest commands first so every candidate parent is already placed.
    // An if counts with its else region. Equal extents nest in declaration order, except
    // that an if with an else region goes first so commands inside the region find it.
    std::vector<int> order;
    for (int i = 0; i < count; ++i)
        if (!std::holds_alternative<AreaCommand>(nodes[(std::size_t)i].body))
            order.push_back(i);
    auto has_else = [&](const CommandNode& n) { return ElseRegion(n) != nullptr; };
    std::stable_sort(order.begin(), order.end(), [&](int a, int b) {
        const CommandNode& x = nodes[(std::size_t)a];
        const CommandNode& y = nodes[(std::size_t)b];
        if (Extent(x) != Extent(y))
            return Extent(x) > Extent(y);
        if (has_else(x) != has_else(y))
            return has_else(x);
        return x.declaration_index < y.declaration_index;
    });

    std::vector<int> placed = areas;
    for (int id : order)
    {
        CommandNode& n = nodes[(std::size_t)id];
        int parent = -1;
        const Region* container = nullptr;
        bool in_else = false;
        for (int cand : placed)
        {
            const CommandNode& c = nodes[(std::size_t)cand];
            if (!IsContainer(c.body) || c.region.sheet != n.region.sheet)
                continue;
            const Region* r = nullptr;
            bool e = false;
            if (c.region.Contains(n.region.first_row, n.region.first_col))
                r = &c.region;
            else if (const Region* er = ElseRegion(c); er && er->Contains(n.region.first_row, n.region.first_col))
            {
                r = er;
                e = true;
            }
            if (!r)
                continue;
            // Smallest container wins; among equals the one placed last is the innermost.
            if (!container || r->Area() <= container->Area())
            {
                parent = cand;
                container = r;
                in_else = e;
            }
        }
        if (parent < 0)
        {
            err = MakeDiagnostic(ErrorCode::RegionOutOfBounds, Where(n), Describe(n) + " is not inside any jx:area.");
            return false;
        }
        const CommandNode& p = nodes[(std::size_t)parent];
        if (!container->Contains(n.region))
        {
            err = MakeDiagnostic(ErrorCode::RegionOutOfBounds,
                                 Where(n),
                                 Describe(n) + " extends beyond its enclosing " + Describe(p) +
                                     (in_else ? " else area." : "."));
            return false;
        }
        if (const Region* e = ElseRegion(n); e && !container->Contains(*e))
        {
            err = MakeDiagnostic(ErrorCode::RegionOutOfBounds,
                                 Where(n),
                                 Describe(n) + ": else area " + FormatRegion(*e) + " extends beyond its enclosing " +
                                     Describe(p) + ".");
            return false;
        }
        if (const auto* each = std::get_if<EachCommand>(&n.body))
        {
            if (!each->multisheet.empty() && !std::holds_alternative<AreaCommand>(p.body))
            {
                err = MakeDiagnostic(ErrorCode::InvalidOption,
                                     Where(n),
                                     Describe(n) + ": multisheet is only allowed directly inside a jx:area.");
                return false;
            }
        }
        n.parent = parent;
        if (in_else)
            nodes[(std::size_t)parent].else_children.push_back(id);
        else
            nodes[(std::size_t)parent].children.push_back(id);
        placed.push_back(id);
    }

    // Sibling order and disjointness. Else regions count as part of their if.
    auto by_anchor = [&](int a, int b) {
        const Region& x = nodes[(std::size_t)a].region;
        const Region& y = nodes[(std::size_t)b].region;
        if (x.first_row != y.first_row)
            return x.first_row < y.first_row;
        if (x.first_col != y.first_col)
            return x.first_col < y.first_col;
        return nodes[(std::size_t)a].declaration_index < nodes[(std::size_t)b].declaration_index;
    };
    auto check_siblings = [&](const std::vector<int>& siblings) {
        for (std::size_t a = 0; a < siblings.size(); ++a)
        {
            for (std::size_t b = a + 1; b < siblings.size(); ++b)
            {
                const CommandNode& x = nodes[(std::size_t)siblings[a]];
                const CommandNode& y = nodes[(std::size_t)siblings[b]];
                const Region* ye = ElseRegion(y);
                if (Claims(x, y.region) || (ye && Claims(x, *ye)))
                {
                    err = MakeDiagnostic(ErrorCode::OverlappingCommands,
                                         Where(y),
                                         Describe(y) + " overlaps sibling " + Describe(x) + ".");
                    return false;
                }
            }
        }
        return true;
    };
    for (CommandNode& n : nodes)
    {
        std::sort(n.children.begin(), n.children.end(), by_anchor);
        std::sort(n.else_children.begin(), n.else_children.end(), by_anchor);
        if (!check_siblings(n.children) || !check_siblings(n.else_children))
            return false;
    }

    // One multisheet command per sheet: each one replaces the whole sheet.
    std::map<std::string, int> multisheet_by_sheet;
    for (int i = 0; i < count; ++i)
    {
        const auto* each = std::get_if<EachCommand>(&nodes[(std::size_t)i].body);
        if (!each || each->multisheet.empty())
            continue;
        const std::string& sheet = nodes[(std::size_t)i].region.sheet;
        if (multisheet_by_sheet.count(sheet))
        {
            err = MakeDiagnostic(ErrorCode::InvalidOption,
                                 Where(nodes[(std::size_t)i]),
                                 "Only one multisheet jx:each is allowed per sheet.");
            return false;
        }
        multisheet_by_sheet[sheet] = i;
    }

    out.roots = areas;
    std::sort(out.roots.begin(), out.roots.end(), [&](int a, int b) {
        const Region& x = nodes[(std::size_t)a].region;
        const Region& y = nodes[(std::size_t)b].region;
        const int sx = tmpl.SheetIndex(x.sheet);
        const int sy = tmpl.SheetIndex(y.sheet);
        if (sx != sy)
            return sx < sy;
        if (x.first_row != y.first_row)
            return x.first_row < y.first_row;
        return x.first_col < y.first_col;
    });
    return true;
}

bool BuildTemplateTree(const Workbook& tmpl, CommandTree& out, Diagnostic& err)
{
    out = CommandTree{};
    std::vector<CommandNode> commands;
    if (!CollectCommands(tmpl, commands, out.formula_params, err))
        return false;
    return BuildCommandTree(std::move(commands), tmpl, out, err);
}
} // namespace gridfill
