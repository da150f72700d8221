#include "engine/transform_engine.h"

#include "io/image_loader.h"

#include <algorithm>
#include <cctype>
#include <climits>
#include <cmath>
#include <cstdio>
#include <map>

namespace gridfill
{
namespace
{
// Literal mergeCells counts stop at six digits; evaluated counts share the bound.
static constexpr int kMaxMergeSpan = 999999;

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

static bool RowsOverlap(const Region& a, const Region& b)
{
    return a.first_row <= b.last_row && b.first_row <= a.last_row;
}

static bool ColsOverlap(const Region& a, const Region& b)
{
    return a.first_col <= b.last_col && b.first_col <= a.last_col;
}

// Composite values cannot live in a cell; they render as their display text.
static Value CellValueOf(const Value& v)
{
    switch (v.GetType())
    {
        case Value::Type::Sequence:
        case Value::Type::Mapping:
        case Value::Type::Binary: return Value::FromString(v.ToDisplayString());
        default: return v;
    }
}
} // namespace

// ---------------------------------------------------------------------------
// Command dispatch
// ---------------------------------------------------------------------------
class TransformEngine::CommandVisitor
{
public:
    CommandVisitor(TransformEngine& engine, int id, const Cursor& at, ScopeId scope, std::uint32_t instance, Size& out)
        : m_engine(engine), m_id(id), m_at(at), m_scope(scope), m_instance(instance), m_out(out)
    {
    }

    bool operator()(const AreaCommand&)
    {
        const CommandNode& node = m_engine.m_tree.Node(m_id);
        return m_engine.RenderBlock(node.region, node.children, m_at, m_scope, m_instance, m_out);
    }
    bool operator()(const EachCommand& c) { return m_engine.ApplyEach(m_id, c, m_at, m_scope, m_instance, m_out); }
    bool operator()(const IfCommand& c) { return m_engine.ApplyIf(m_id, c, m_at, m_scope, m_instance, m_out); }
    bool operator()(const GridCommand& c) { return m_engine.ApplyGrid(m_id, c, m_at, m_scope, m_out); }
    bool operator()(const ImageCommand& c) { return m_engine.ApplyImage(m_id, c, m_at, m_scope, m_out); }
    bool operator()(const MergeCellsCommand& c)
    {
        return m_engine.ApplyMergeCells(m_id, c, m_at, m_scope, m_instance, m_out);
    }
    bool operator()(const AutoRowHeightCommand&)
    {
        return m_engine.ApplyAutoRowHeight(m_id, m_at, m_scope, m_instance, m_out);
    }

private:
    TransformEngine& m_engine;
    int m_id;
    const Cursor& m_at;
    ScopeId m_scope;
    std::uint32_t m_instance;
    Size& m_out;
};

TransformEngine::TransformEngine(const Workbook& tmpl,
                                 const CommandTree& tree,
                                 const FillOptions& options,
                                 Context& context)
    : m_template(tmpl), m_tree(tree), m_options(options), m_context(context)
{
    m_notation.begin = options.notation_begin;
    m_notation.end = options.notation_end;
    if (options.clear_template_cells)
        for (const CommandNode& n : tree.nodes)
            if (const auto* c = std::get_if<IfCommand>(&n.body); c && c->else_region)
                m_else_regions.push_back(*c->else_region);
}

// ---------------------------------------------------------------------------
// Diagnostics
// ---------------------------------------------------------------------------
bool TransformEngine::Recover(Diagnostic d)
{
    if (m_options.log_diagnostics)
        std::fprintf(stderr, "[fill] %s\n", d.ToString().c_str());
    if (m_options.fail_fast)
    {
        m_error = std::move(d);
        return false;
    }
    m_diagnostics.push_back(std::move(d));
    return true;
}

bool TransformEngine::RecoverEval(const EvalError& e, std::string location)
{
    return Recover(MakeDiagnostic(e.code, std::move(location), e.message));
}

bool TransformEngine::Fatal(Diagnostic d)
{
    if (m_options.log_diagnostics)
        std::fprintf(stderr, "[fill] %s\n", d.ToString().c_str());
    m_error = std::move(d);
    return false;
}

EvalEnv TransformEngine::Env(ScopeId scope, int row, int col) const
{
    EvalEnv env;
    env.context = &m_context;
    env.scope = scope;
    env.row = row;
    env.col = col;
    return env;
}

std::string TransformEngine::Where(int row, int col) const
{
    return FormatCellRef(CellRef{m_src_sheet ? m_src_sheet->Name() : std::string(), row, col});
}

std::string TransformEngine::WhereNode(int id) const
{
    const Region& r = m_tree.Node(id).region;
    return FormatCellRef(CellRef{r.sheet, r.first_row, r.first_col});
}

// ---------------------------------------------------------------------------
// Document
// ---------------------------------------------------------------------------
bool TransformEngine::Run(Workbook& out)
{
    m_error = Diagnostic{};
    m_diagnostics.clear();
    m_formulas.clear();
    m_referenced.clear();

    if (m_notation.begin.empty() || m_notation.end.empty())
        return Fatal(MakeDiagnostic(ErrorCode::InvalidOption, "", "Placeholder notation markers must not be empty."));

    out = Workbook{};
    out.SetRecalculateOnOpen(m_options.recalculate_on_open);

    std::map<int, int> multisheet_nodes; // template sheet index -> jx:each node
    for (std::size_t i = 0; i < m_tree.nodes.size(); ++i)
    {
        const auto* each = std::get_if<EachCommand>(&m_tree.nodes[i].body);
        if (each && !each->multisheet.empty())
            multisheet_nodes[m_template.SheetIndex(m_tree.nodes[i].region.sheet)] = (int)i;
    }

    const bool keep_template = m_options.keep_template_sheet || m_options.hide_template_sheet;

    // Names the generated sheets must avoid.
    std::set<std::string> reserved;
    for (std::size_t s = 0; s < m_template.SheetCount(); ++s)
        if (!multisheet_nodes.count((int)s) || keep_template)
            reserved.insert(m_template.SheetAt(s).Name());

    // Blank cells named by a formula still need a recorded position.
    for (std::size_t s = 0; s < m_template.SheetCount(); ++s)
    {
        for (const auto& kv : m_template.SheetAt(s).Cells())
        {
            if (kv.second.formula.empty())
                continue;
            for (const FormulaRef& ref : FindFormulaRefs(kv.second.formula))
            {
                const int sheet = ref.has_sheet ? m_template.SheetIndex(ref.sheet) : (int)s;
                if (sheet >= 0)
                    m_referenced.insert(SourceCell{sheet, ref.row, ref.col});
            }
        }
    }

    std::set<std::string> used;
    for (std::size_t s = 0; s < m_template.SheetCount(); ++s)
    {
        const Sheet& src = m_template.SheetAt(s);
        auto ms = multisheet_nodes.find((int)s);
        if (ms != multisheet_nodes.end())
        {
            if (!RenderMultisheet(s, ms->second, reserved, used, out))
                return false;
            if (keep_template)
            {
                Sheet& kept = out.AddSheet(src.Name());
                kept = src;
                kept.SetHidden(src.Hidden() || m_options.hide_template_sheet);
                used.insert(src.Name());
            }
            continue;
        }

        Sheet& sheet = out.AddSheet(src.Name());
        used.insert(src.Name());
        const int slot = m_tracker.AddOutputSheet(src.Name());
        const bool ok = m_tree.RootsOnSheet(src.Name()).empty() ? RenderStaticSheet(s, sheet, slot)
                                                                : RenderSheet(s, sheet, slot, nullptr);
        if (!ok)
            return false;
    }

    if (out.SheetCount() == 0)
        out.AddSheet("Sheet1");

    std::vector<std::string> template_sheets;
    for (std::size_t s = 0; s < m_template.SheetCount(); ++s)
        template_sheets.push_back(m_template.SheetAt(s).Name());
    std::vector<Region> areas;
    for (int id : m_tree.roots)
        areas.push_back(m_tree.Node(id).region);

    FormulaProcessor formulas(m_tracker, template_sheets, std::move(areas), m_options.default_formula_value);
    for (const PendingFormula& f : m_formulas)
    {
        const FormulaParams* params =
            m_tree.ParamsAt(template_sheets[(std::size_t)f.source.sheet], f.source.row, f.source.col);
        Sheet* sheet = out.FindSheet(m_tracker.OutputSheetName(f.target.sheet));
        if (sheet)
            sheet->SetFormula(f.target.row, f.target.col, formulas.Translate(f, params));
    }
    return true;
}

bool TransformEngine::RenderStaticSheet(std::size_t template_index, Sheet& target, int slot)
{
    const Sheet& src = m_template.SheetAt(template_index);
    m_src_sheet = &src;
    m_src_index = (int)template_index;
    m_multisheet = nullptr;

    target = src;
    for (const auto& kv : src.Cells())
    {
        const CellKey& at = kv.first;
        const Cell& cell = kv.second;
        m_tracker.Record(SourceCell{m_src_index, at.row, at.col}, TargetCell{slot, at.row, at.col, 0});

        if (!cell.comment.empty() && HasCommandLines(cell.comment))
        {
            target.SetComment(at.row, at.col, StripCommandLines(cell.comment));
            const Cell* written = target.FindCell(at.row, at.col);
            if (written && written->Empty())
                target.EraseCell(at.row, at.col);
        }

        // Only formulas pointing into rendered sheets can change.
        if (cell.formula.empty())
            continue;
        bool rendered_ref = false;
        for (const FormulaRef& ref : FindFormulaRefs(cell.formula))
        {
            const int sheet = ref.has_sheet ? m_template.SheetIndex(ref.sheet) : -1;
            if (sheet >= 0 && sheet != m_src_index && !m_tree.RootsOnSheet(ref.sheet).empty())
                rendered_ref = true;
        }
        if (rendered_ref)
        {
            m_formulas.push_back(PendingFormula{SourceCell{m_src_index, at.row, at.col},
                                                TargetCell{slot, at.row, at.col, 0},
                                                cell.formula});
        }
    }
    return true;
}

bool TransformEngine::RenderMultisheet(std::size_t template_index,
                                       int each_node,
                                       const std::set<std::string>& reserved,
                                       std::set<std::string>& used,
                                       Workbook& out)
{
    m_src_sheet = &m_template.SheetAt(template_index);
    m_src_index = (int)template_index;
    m_multisheet = nullptr;

    const EachCommand& each = std::get<EachCommand>(m_tree.Node(each_node).body);
    std::vector<Value> items;
    if (!ResolveEachItems(each_node, each, kRootScope, items))
        return false;

    Value names;
    EvalError e;
    if (!m_eval.Evaluate(UnwrapPlaceholder(each.multisheet, m_notation), Env(kRootScope), names, e))
        return Fatal(MakeDiagnostic(ErrorCode::MultisheetMismatch,
                                    WhereNode(each_node),
                                    "Sheet names '" + each.multisheet + "': " + e.message));
    if (names.IsNull())
        names = Value::FromSequence({});
    if (!names.IsSequence())
        return Fatal(MakeDiagnostic(ErrorCode::MultisheetMismatch,
                                    WhereNode(each_node),
                                    "Sheet names '" + each.multisheet + "' must resolve to a list, got " +
                                        TypeName(names.GetType()) + "."));

    const Value::Sequence& list = names.AsSequence();
    if (list.size() != items.size())
        return Fatal(MakeDiagnostic(ErrorCode::MultisheetMismatch,
                                    WhereNode(each_node),
                                    std::to_string(list.size()) + " sheet names for " + std::to_string(items.size()) +
                                        " items."));

    for (std::size_t i = 0; i < items.size(); ++i)
    {
        const std::string base = SafeSheetName(list[i].ToDisplayString());
        std::string name = base;
        for (int n = 2; reserved.count(name) || used.count(name); ++n)
            name = base + " (" + std::to_string(n) + ")";
        used.insert(name);

        Sheet& sheet = out.AddSheet(name);
        const int slot = m_tracker.AddOutputSheet(name);
        const MultisheetItem bound{each_node, items[i], i};
        if (!RenderSheet(template_index, sheet, slot, &bound))
            return false;
    }
    m_multisheet = nullptr;
    return true;
}

bool TransformEngine::RenderSheet(std::size_t template_index, Sheet& target, int slot, const MultisheetItem* multisheet)
{
    const Sheet& src = m_template.SheetAt(template_index);
    m_src_sheet = &src;
    m_src_index = (int)template_index;
    m_multisheet = multisheet;

    target.SetHidden(src.Hidden());
    for (const auto& kv : src.ColumnWidths())
        target.SetColumnWidth(kv.first, kv.second);

    const std::uint32_t instance = m_tracker.NewInstance(0);

    struct Rendered
    {
        Region region;
        int delta_rows = 0;
        int delta_cols = 0;
    };
    std::vector<Rendered> rendered;
    // Rows gained (or lost) above `row` by the areas sharing column `col`.
    auto displacement = [&](int row, int col) {
        int d = 0;
        for (const Rendered& r : rendered)
            if (row > r.region.last_row && col >= r.region.first_col && col <= r.region.last_col)
                d += r.delta_rows;
        return d;
    };
    // Columns gained left of `target` by the areas sharing any of its rows. A narrower
    // rendering leaves blank columns instead of pulling neighbours left.
    auto col_displacement = [&](const Region& target) {
        int d = 0;
        for (const Rendered& r : rendered)
            if (RowsOverlap(r.region, target) && target.first_col > r.region.last_col)
                d += r.delta_cols;
        return d;
    };
    auto row_displacement = [&](int row) {
        int d = 0;
        for (const Rendered& r : rendered)
            if (row > r.region.last_row)
                d += r.delta_rows;
        return d;
    };

    const std::vector<int> roots = m_tree.RootsOnSheet(src.Name());
    for (int id : roots)
    {
        const CommandNode& node = m_tree.Node(id);
        Cursor at;
        at.sheet = &target;
        at.slot = slot;
        at.row = node.region.first_row + displacement(node.region.first_row, node.region.first_col);
        at.col = node.region.first_col + col_displacement(node.region);

        Size size;
        if (!RenderBlock(node.region, node.children, at, kRootScope, instance, size))
            return false;
        rendered.push_back(Rendered{node.region,
                                    size.height - node.region.Rows(),
                                    std::max(0, size.width - node.region.Cols())});
    }

    // Everything outside the areas is copied as is, pushed down by the areas above it and
    // right by the areas before it on the same rows.
    auto outside = [&](int row, int col) {
        for (int id : roots)
            if (m_tree.Node(id).region.Contains(row, col))
                return false;
        return true;
    };

    std::set<CellKey> positions;
    for (const auto& kv : src.Cells())
        positions.insert(kv.first);
    for (const SourceCell& ref : m_referenced)
        if (ref.sheet == m_src_index)
            positions.insert(CellKey{ref.row, ref.col});
    for (const CellRange& m : src.Merges())
        positions.insert(CellKey{m.first_row, m.first_col});
    for (const ImageAnchor& img : src.Images())
        positions.insert(CellKey{img.range.first_row, img.range.first_col});

    for (const CellKey& pos : positions)
    {
        if (!outside(pos.row, pos.col))
            continue;
        Cursor at;
        at.sheet = &target;
        at.slot = slot;
        at.row = pos.row + displacement(pos.row, pos.col);
        at.col = pos.col + col_displacement(Region{src.Name(), pos.row, pos.col, pos.row, pos.col});
        if (!CopyCell(pos.row, pos.col, at, kRootScope, instance, false))
            return false;
    }

    auto row_outside = [&](int row) {
        for (int id : roots)
        {
            const Region& r = m_tree.Node(id).region;
            if (row >= r.first_row && row <= r.last_row)
                return false;
        }
        return true;
    };
    for (const auto& kv : src.RowHeights())
        if (row_outside(kv.first) && !target.RowHeight(kv.first + row_displacement(kv.first)))
            target.SetRowHeight(kv.first + row_displacement(kv.first), kv.second);
    for (int row : src.AutoHeightRows())
        if (row_outside(row))
            target.FlagAutoRowHeight(row + row_displacement(row));

    m_multisheet = nullptr;
    return true;
}

// ---------------------------------------------------------------------------
// Blocks
// ---------------------------------------------------------------------------
bool TransformEngine::RenderBlock(const Region& src,
                                  const std::vector<int>& children,
                                  const Cursor& at,
                                  ScopeId scope,
                                  std::uint32_t instance,
                                  Size& out)
{
    // Children whose row spans chain together render as one band.
    struct Band
    {
        int first_row = 0;
        int last_row = 0;
        std::vector<int> commands;
    };
    std::vector<Band> bands;
    for (int id : children)
    {
        const Region& r = m_tree.Node(id).region;
        if (!bands.empty() && r.first_row <= bands.back().last_row)
        {
            bands.back().last_row = std::max(bands.back().last_row, r.last_row);
            bands.back().commands.push_back(id);
            continue;
        }
        bands.push_back(Band{r.first_row, r.last_row, {id}});
    }

    int out_rows = 0;
    int width = 0;
    bool has_static = false;
    auto copy_rows = [&](int from, int to) {
        for (int r = from; r <= to; ++r)
        {
            // Rows made only of else cells collapse like a false jx:if.
            bool cleared = true;
            for (int c = src.first_col; c <= src.last_col && cleared; ++c)
                cleared = ClearedElseCell(src, r, c);
            if (cleared)
                continue;
            for (int c = src.first_col; c <= src.last_col; ++c)
            {
                if (ClearedElseCell(src, r, c))
                    continue;
                Cursor dst = at;
                dst.row = at.row + out_rows;
                dst.col = at.col + (c - src.first_col);
                if (!CopyCell(r, c, dst, scope, instance, true))
                    return false;
            }
            ++out_rows;
            has_static = true;
        }
        return true;
    };

    int next_row = src.first_row;
    for (Band& band : bands)
    {
        if (!copy_rows(next_row, band.first_row - 1))
            return false;
        Cursor band_at = at;
        band_at.row = at.row + out_rows;
        Size band_size;
        if (!RenderBand(src, band.first_row, band.last_row, std::move(band.commands), band_at, scope, instance, band_size))
            return false;
        out_rows += band_size.height;
        width = std::max(width, band_size.width);
        next_row = band.last_row + 1;
    }
    if (!copy_rows(next_row, src.last_row))
        return false;

    if (has_static)
        width = std::max(width, src.Cols());
    out = Size{width, out_rows};
    return true;
}

bool TransformEngine::RenderBand(const Region& src,
                                 int band_first_row,
                                 int band_last_row,
                                 std::vector<int> commands,
                                 const Cursor& at,
                                 ScopeId scope,
                                 std::uint32_t instance,
                                 Size& out)
{
    struct Placed
    {
        Region region;
        Size size;
    };
    std::vector<Placed> placed;
    int height = 0;
    int width = 0;

    // A command renders after everything above it in its columns and everything left of it
    // in its rows, so their growth is known when it is placed.
    auto blocks = [&](const Region& before, const Region& r) {
        return (ColsOverlap(before, r) && before.last_row < r.first_row) ||
               (RowsOverlap(before, r) && before.last_col < r.first_col);
    };
    while (!commands.empty())
    {
        std::size_t pick = 0;
        for (std::size_t i = 0; i < commands.size(); ++i)
        {
            const Region& r = m_tree.Node(commands[i]).region;
            bool ready = true;
            for (std::size_t j = 0; j < commands.size() && ready; ++j)
                if (j != i && blocks(m_tree.Node(commands[j]).region, r))
                    ready = false;
            if (ready)
            {
                pick = i;
                break;
            }
        }
        const int id = commands[pick];
        commands.erase(commands.begin() + (std::ptrdiff_t)pick);

        const Region& r = m_tree.Node(id).region;
        int row_off = r.first_row - band_first_row;
        int col_off = r.first_col - src.first_col;
        for (const Placed& p : placed)
        {
            if (ColsOverlap(p.region, r) && p.region.last_row < r.first_row)
                row_off += p.size.height - p.region.Rows();
            if (RowsOverlap(p.region, r) && p.region.last_col < r.first_col)
                col_off += p.size.width - p.region.Cols();
        }

        Cursor cmd_at = at;
        cmd_at.row = at.row + row_off;
        cmd_at.col = at.col + col_off;
        Size size;
        if (!ApplyCommand(id, cmd_at, scope, instance, size))
            return false;
        placed.push_back(Placed{r, size});
        height = std::max(height, row_off + size.height);
        width = std::max(width, col_off + size.width);
    }

    // Uncovered cells of the band follow the commands above and to the left of them.
    for (int row = band_first_row; row <= band_last_row; ++row)
    {
        for (int col = src.first_col; col <= src.last_col; ++col)
        {
            bool covered = ClearedElseCell(src, row, col);
            for (const Placed& p : placed)
                if (p.region.Contains(row, col))
                    covered = true;
            if (covered)
                continue;

            int row_off = row - band_first_row;
            int col_off = col - src.first_col;
            for (const Placed& p : placed)
            {
                if (col >= p.region.first_col && col <= p.region.last_col && p.region.last_row < row)
                    row_off += p.size.height - p.region.Rows();
                if (row >= p.region.first_row && row <= p.region.last_row && p.region.last_col < col)
                    col_off += p.size.width - p.region.Cols();
            }

            Cursor dst = at;
            dst.row = at.row + row_off;
            dst.col = at.col + col_off;
            if (!CopyCell(row, col, dst, scope, instance, true))
                return false;
            height = std::max(height, row_off + 1);
            width = std::max(width, col_off + 1);
        }
    }

    out = Size{width, height};
    return true;
}

bool TransformEngine::ApplyCommand(int id, const Cursor& at, ScopeId scope, std::uint32_t instance, Size& out)
{
    out = Size{};
    CommandVisitor visitor(*this, id, at, scope, instance, out);
    return std::visit(visitor, m_tree.Node(id).body);
}

// ---------------------------------------------------------------------------
// jx:each
// ---------------------------------------------------------------------------
bool TransformEngine::ResolveEachItems(int id, const EachCommand& each, ScopeId scope, std::vector<Value>& out)
{
    out.clear();

    Value items;
    EvalError e;
    if (!m_eval.Evaluate(UnwrapPlaceholder(each.items, m_notation), Env(scope), items, e))
        return RecoverEval(e, WhereNode(id));
    if (items.IsNull())
        return true;
    if (!items.IsSequence())
    {
        return Recover(MakeDiagnostic(ErrorCode::TypeMismatch,
                                      WhereNode(id),
                                      "jx:each items '" + each.items + "' must resolve to a list, got " +
                                          TypeName(items.GetType()) + "."));
    }

    for (const Value& item : items.AsSequence())
    {
        if (each.select.empty())
        {
            out.push_back(item);
            continue;
        }
        Context::Scope frame(m_context, scope, {{each.var, item}}, item);
        bool keep = false;
        if (!m_eval.EvaluateCondition(UnwrapPlaceholder(each.select, m_notation), Env(frame.Id()), keep, e))
        {
            if (!RecoverEval(e, WhereNode(id)))
                return false;
            keep = false;
        }
        if (keep)
            out.push_back(item);
    }

    if (each.group_by.empty())
        return each.order_by.empty() || SortItems(id, each, scope, out);

    // Groups keep first-seen order unless groupOrder asks for a sort by key.
    struct Group
    {
        Value key;
        std::vector<Value> members;
    };
    std::vector<Group> groups;
    // Display text narrows the candidates; ValuesEqual decides, so 1 and "1" stay apart.
    std::multimap<std::string, std::size_t> group_index;
    for (const Value& item : out)
    {
        Value key;
        Context::Scope frame(m_context, scope, {{each.var, item}}, item);
        if (!m_eval.Evaluate(UnwrapPlaceholder(each.group_by, m_notation), Env(frame.Id()), key, e))
        {
            if (!RecoverEval(e, WhereNode(id)))
                return false;
            key = Value();
        }
        const std::string text = key.ToDisplayString();
        std::size_t found = groups.size();
        const auto candidates = group_index.equal_range(text);
        for (auto it = candidates.first; it != candidates.second; ++it)
        {
            if (ValuesEqual(groups[it->second].key, key))
            {
                found = it->second;
                break;
            }
        }
        if (found == groups.size())
        {
            group_index.emplace(text, groups.size());
            groups.push_back(Group{key, {item}});
        }
        else
        {
            groups[found].members.push_back(item);
        }
    }

    if (!each.order_by.empty())
        for (Group& g : groups)
            if (!SortItems(id, each, scope, g.members))
                return false;

    if (!each.group_order.empty())
    {
        const std::string order = Upper(each.group_order);
        const bool descending = order.find("DESC") != std::string::npos;
        const bool ignore_case = order.find("IGNORECASE") != std::string::npos;
        std::stable_sort(groups.begin(), groups.end(), [&](const Group& a, const Group& b) {
            const int c = CompareForSort(a.key, b.key, ignore_case);
            return descending ? c > 0 : c < 0;
        });
    }

    out.clear();
    for (Group& g : groups)
    {
        Value::Mapping record;
        record["key"] = g.key;
        record["item"] = g.members.front();
        record["items"] = Value::FromSequence(std::move(g.members));
        out.push_back(Value::FromMapping(std::move(record)));
    }
    return true;
}

bool TransformEngine::SortItems(int id, const EachCommand& each, ScopeId scope, std::vector<Value>& items)
{
    const std::vector<SortKey> keys = ParseOrderBy(each.order_by);
    if (keys.empty() || items.size() < 2)
        return true;

    std::vector<std::vector<Value>> values(items.size());
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        Context::Scope frame(m_context, scope, {{each.var, items[i]}}, items[i]);
        for (const SortKey& key : keys)
        {
            Value v;
            EvalError e;
            if (!m_eval.Evaluate(UnwrapPlaceholder(key.expression, m_notation), Env(frame.Id()), v, e))
            {
                if (!RecoverEval(e, WhereNode(id)))
                    return false;
                v = Value();
            }
            values[i].push_back(std::move(v));
        }
    }

    std::vector<std::size_t> order(items.size());
    for (std::size_t i = 0; i < order.size(); ++i)
        order[i] = i;
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        for (std::size_t k = 0; k < keys.size(); ++k)
        {
            const int c = CompareForSort(values[a][k], values[b][k]);
            if (c != 0)
                return keys[k].descending ? c > 0 : c < 0;
        }
        return false;
    });

    std::vector<Value> sorted;
    sorted.reserve(items.size());
    for (std::size_t i : order)
        sorted.push_back(items[i]);
    items = std::move(sorted);
    return true;
}

bool TransformEngine::ApplyEach(int id,
                                const EachCommand& each,
                                const Cursor& at,
                                ScopeId scope,
                                std::uint32_t instance,
                                Size& out)
{
    const CommandNode& node = m_tree.Node(id);

    std::vector<Value> items;
    std::size_t first_index = 0;
    if (m_multisheet && m_multisheet->node == id)
    {
        items.push_back(m_multisheet->item);
        first_index = m_multisheet->index;
    }
    else if (!ResolveEachItems(id, each, scope, items))
    {
        return false;
    }

    if (items.empty())
    {
        out = each.direction == Direction::Down ? Size{node.region.Cols(), 0} : Size{0, node.region.Rows()};
        return true;
    }

    int along = 0;
    int across = 0;
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        Context::Bindings bindings;
        bindings.emplace_back(each.var, items[i]);
        if (!each.var_index.empty())
            bindings.emplace_back(each.var_index, Value::FromNumber((double)(first_index + i)));
        Context::Scope frame(m_context, scope, std::move(bindings));

        Cursor item_at = at;
        if (each.direction == Direction::Down)
            item_at.row += along;
        else
            item_at.col += along;

        Size size;
        if (!RenderBlock(node.region, node.children, item_at, frame.Id(), m_tracker.NewInstance(instance), size))
            return false;

        if (each.direction == Direction::Down)
        {
            along += size.height;
            across = std::max(across, size.width);
        }
        else
        {
            along += size.width;
            across = std::max(across, size.height);
        }
    }

    out = each.direction == Direction::Down ? Size{across, along} : Size{along, across};
    return true;
}

// ---------------------------------------------------------------------------
// jx:if
// ---------------------------------------------------------------------------
bool TransformEngine::ApplyIf(int id,
                              const IfCommand& cmd,
                              const Cursor& at,
                              ScopeId scope,
                              std::uint32_t instance,
                              Size& out)
{
    const CommandNode& node = m_tree.Node(id);
    bool condition = false;
    EvalError e;
    if (!m_eval.EvaluateCondition(UnwrapPlaceholder(cmd.condition, m_notation), Env(scope, at.row, at.col), condition, e))
    {
        if (!RecoverEval(e, WhereNode(id)))
            return false;
        condition = false;
    }
    if (!condition)
    {
        if (cmd.else_region)
            return RenderBlock(*cmd.else_region, node.else_children, at, scope, instance, out);
        out = Size{node.region.Cols(), 0};
        return true;
    }
    return RenderBlock(node.region, node.children, at, scope, instance, out);
}

// ---------------------------------------------------------------------------
// jx:grid
// ---------------------------------------------------------------------------
bool TransformEngine::ApplyGrid(int id, const GridCommand& cmd, const Cursor& at, ScopeId scope, Size& out)
{
    const Region& region = m_tree.Node(id).region;

    auto resolve = [&](const std::string& text, const char* what, Value& v) {
        v = Value();
        if (Trim(text).empty())
            return true;
        EvalError e;
        if (!m_eval.Evaluate(UnwrapPlaceholder(text, m_notation), Env(scope, at.row, at.col), v, e))
        {
            v = Value();
            return RecoverEval(e, WhereNode(id));
        }
        if (!v.IsNull() && !v.IsSequence())
        {
            const std::string type = TypeName(v.GetType());
            v = Value();
            return Recover(MakeDiagnostic(ErrorCode::TypeMismatch,
                                          WhereNode(id),
                                          std::string("jx:grid ") + what + " '" + text + "' must resolve to a list, got " +
                                              type + "."));
        }
        return true;
    };

    Value headers;
    Value data;
    if (!resolve(cmd.headers, "headers", headers) || !resolve(cmd.data, "data", data))
        return false;
    const std::vector<std::string> props = SplitAttributeList(cmd.props);

    // Header cells are styled after the anchor row, data cells after the row below it.
    const int header_row = region.first_row;
    const int data_row = region.Rows() >= 2 ? region.first_row + 1 : region.first_row;
    auto write = [&](int template_row, int row, int col, const Value& v) {
        const int src_col = region.first_col + std::min(col - at.col, region.Cols() - 1);
        Cell cell;
        cell.value = CellValueOf(v);
        if (const Cell* style = m_src_sheet->FindCell(template_row, src_col))
            cell.style_id = style->style_id;
        if (!cell.Empty())
            at.sheet->CellAt(row, col) = std::move(cell);
        if (auto h = m_src_sheet->RowHeight(template_row))
            if (!at.sheet->RowHeight(row))
                at.sheet->SetRowHeight(row, *h);
    };

    int row = at.row;
    int width = 0;
    if (headers.IsSequence() && !headers.AsSequence().empty())
    {
        const Value::Sequence& h = headers.AsSequence();
        for (std::size_t j = 0; j < h.size(); ++j)
            write(header_row, row, at.col + (int)j, h[j]);
        width = std::max(width, (int)h.size());
        ++row;
    }

    if (data.IsSequence())
    {
        for (const Value& record : data.AsSequence())
        {
            std::vector<Value> cells;
            if (record.IsSequence())
            {
                cells = record.AsSequence();
            }
            else if (record.IsMapping())
            {
                if (props.empty())
                {
                    for (const auto& kv : record.AsMapping())
                        cells.push_back(kv.second);
                }
                else
                {
                    for (const std::string& p : props)
                    {
                        const Value* member = record.Member(p);
                        cells.push_back(member ? *member : Value());
                    }
                }
            }
            else
            {
                cells.push_back(record);
            }

            for (std::size_t j = 0; j < cells.size(); ++j)
                write(data_row, row, at.col + (int)j, cells[j]);
            width = std::max(width, (int)cells.size());
            ++row;
        }
    }

    if (row == at.row)
        out = Size{region.Cols(), 0};
    else
        out = Size{width, row - at.row};
    return true;
}

// ---------------------------------------------------------------------------
// jx:image
// ---------------------------------------------------------------------------
bool TransformEngine::ApplyImage(int id, const ImageCommand& cmd, const Cursor& at, ScopeId scope, Size& out)
{
    const Region& region = m_tree.Node(id).region;
    out = Size{region.Cols(), region.Rows()};

    Value src;
    EvalError e;
    if (!m_eval.Evaluate(UnwrapPlaceholder(cmd.src, m_notation), Env(scope, at.row, at.col), src, e))
        return RecoverEval(e, WhereNode(id));
    if (src.IsNull())
        return true;
    if (!src.IsBinary())
    {
        return Recover(MakeDiagnostic(ErrorCode::TypeMismatch,
                                      WhereNode(id),
                                      "jx:image src '" + cmd.src + "' must resolve to binary data, got " +
                                          TypeName(src.GetType()) + "."));
    }

    image_loader::ImageInfo info;
    std::string err;
    if (!image_loader::ProbeImage(src.AsBinary(), info, err))
        return Recover(MakeDiagnostic(ErrorCode::TypeMismatch, WhereNode(id), "jx:image: " + err));
    if (!image_loader::ImageTypeMatches(cmd.image_type, info.format))
    {
        return Recover(MakeDiagnostic(ErrorCode::TypeMismatch,
                                      WhereNode(id),
                                      "jx:image declared " + cmd.image_type + " but the data is " + info.format + "."));
    }

    ImageAnchor image;
    image.range = CellRange{at.row, at.col, at.row + region.Rows() - 1, at.col + region.Cols() - 1};
    image.image_type = info.format;
    image.pixel_width = info.width;
    image.pixel_height = info.height;
    image.scale_x = cmd.scale_x;
    image.scale_y = cmd.scale_y;
    image.bytes = src.AsBinary();
    at.sheet->AddImage(std::move(image));
    return true;
}

// ---------------------------------------------------------------------------
// jx:mergeCells / jx:autoRowHeight
// ---------------------------------------------------------------------------
bool TransformEngine::ApplyMergeCells(int id,
                                      const MergeCellsCommand& cmd,
                                      const Cursor& at,
                                      ScopeId scope,
                                      std::uint32_t instance,
                                      Size& out)
{
    const CommandNode& node = m_tree.Node(id);
    if (!RenderBlock(node.region, node.children, at, scope, instance, out))
        return false;

    // Literal counts or expressions; false with `skip` set when the merge is dropped.
    bool skip = false;
    auto count = [&](const std::string& text, const char* what, int& n) {
        const std::string_view t = Trim(text);
        if (!t.empty() && t.size() <= 6 && std::all_of(t.begin(), t.end(), [](char c) { return std::isdigit((unsigned char)c); }))
        {
            n = std::stoi(std::string(t));
            return true;
        }
        Value v;
        EvalError e;
        if (!m_eval.Evaluate(UnwrapPlaceholder(t, m_notation), Env(scope, at.row, at.col), v, e))
        {
            skip = true;
            return RecoverEval(e, WhereNode(id));
        }
        if (!v.IsNumber())
        {
            skip = true;
            return Recover(MakeDiagnostic(ErrorCode::TypeMismatch,
                                          WhereNode(id),
                                          std::string("jx:mergeCells ") + what + " must be a number, got " +
                                              TypeName(v.GetType()) + "."));
        }
        const double d = v.AsNumber();
        if (!std::isfinite(d) || d > (double)kMaxMergeSpan)
        {
            skip = true;
            return Recover(MakeDiagnostic(ErrorCode::TypeMismatch,
                                          WhereNode(id),
                                          std::string("jx:mergeCells ") + what + " must be a count up to " +
                                              std::to_string(kMaxMergeSpan) + ", got " + v.ToDisplayString() + "."));
        }
        n = d < 1.0 ? 0 : (int)d;
        return true;
    };

    int cols = 0;
    int rows = 0;
    if (!count(cmd.cols, "cols", cols) || !count(cmd.rows, "rows", rows))
        return false;
    if (skip || cols < 1 || rows < 1 || (cols == 1 && rows == 1))
        return true;
    if (cols < cmd.min_cols || rows < cmd.min_rows)
        return true;
    if (at.row > INT_MAX - rows || at.col > INT_MAX - cols)
    {
        return Recover(MakeDiagnostic(ErrorCode::TypeMismatch,
                                      WhereNode(id),
                                      "jx:mergeCells range runs past the end of the sheet."));
    }

    at.sheet->AddMerge(CellRange{at.row, at.col, at.row + rows - 1, at.col + cols - 1});
    return true;
}

bool TransformEngine::ApplyAutoRowHeight(int id, const Cursor& at, ScopeId scope, std::uint32_t instance, Size& out)
{
    const CommandNode& node = m_tree.Node(id);
    if (!RenderBlock(node.region, node.children, at, scope, instance, out))
        return false;
    for (int r = 0; r < out.height; ++r)
        at.sheet->FlagAutoRowHeight(at.row + r);
    return true;
}

// ---------------------------------------------------------------------------
// Cells
// ---------------------------------------------------------------------------
bool TransformEngine::SubstituteFormula(const std::string& formula, const EvalEnv& env, std::string& out, EvalError& err)
{
    out.clear();
    std::vector<TextSegment> segments;
    SplitPlaceholders(formula, m_notation, segments);
    for (const TextSegment& seg : segments)
    {
        if (!seg.expression)
        {
            out += seg.text;
            continue;
        }
        Value v;
        if (!m_eval.Evaluate(seg.text, env, v, err))
            return false;
        out += v.IsNumber() ? FormatNumber(v.AsNumber()) : v.ToDisplayString();
    }
    return true;
}

bool TransformEngine::ClearedElseCell(const Region& block, int row, int col) const
{
    for (const Region& e : m_else_regions)
        if (e.sheet == m_src_sheet->Name() && e.Contains(row, col) && !e.Contains(block))
            return true;
    return false;
}

bool TransformEngine::CopyCell(int src_row, int src_col, const Cursor& dst, ScopeId scope, std::uint32_t instance, bool evaluate)
{
    if (!evaluate || m_options.listeners.empty())
        return TransformCell(src_row, src_col, dst, scope, instance, evaluate);

    CellEvent event;
    event.source = CellRef{m_src_sheet->Name(), src_row, src_col};
    event.target = CellRef{dst.sheet->Name(), dst.row, dst.col};
    event.output = dst.sheet;
    event.context = &m_context;
    event.scope = scope;

    bool render = true;
    for (const CellListener& l : m_options.listeners)
    {
        if (l.before && !l.before(event))
        {
            render = false;
            break;
        }
    }
    if (render)
    {
        if (!TransformCell(src_row, src_col, dst, scope, instance, evaluate))
            return false;
    }
    else
    {
        // Formulas still follow a cell the listener took over.
        const SourceCell source{m_src_index, src_row, src_col};
        if (m_src_sheet->FindCell(src_row, src_col) || m_referenced.count(source))
            m_tracker.Record(source, TargetCell{dst.slot, dst.row, dst.col, instance});
    }
    for (const CellListener& l : m_options.listeners)
        if (l.after)
            l.after(event);
    return true;
}

bool TransformEngine::TransformCell(int src_row, int src_col, const Cursor& dst, ScopeId scope, std::uint32_t instance, bool evaluate)
{
    const Sheet& src = *m_src_sheet;
    const SourceCell source{m_src_index, src_row, src_col};
    const TargetCell target{dst.slot, dst.row, dst.col, instance};
    const Cell* cell = src.FindCell(src_row, src_col);
    if (cell || m_referenced.count(source))
        m_tracker.Record(source, target);

    // Geometry
    if (auto h = src.RowHeight(src_row))
        if (!dst.sheet->RowHeight(dst.row))
            dst.sheet->SetRowHeight(dst.row, *h);
    if (src.AutoHeightRows().count(src_row))
        dst.sheet->FlagAutoRowHeight(dst.row);
    if (auto w = src.ColumnWidth(src_col))
        if (!dst.sheet->ColumnWidth(dst.col))
            dst.sheet->SetColumnWidth(dst.col, *w);
    if (const CellRange* m = src.MergeAnchoredAt(src_row, src_col))
        dst.sheet->AddMerge(CellRange{dst.row, dst.col, dst.row + m->Rows() - 1, dst.col + m->Cols() - 1});
    for (const ImageAnchor& img : src.Images())
    {
        if (img.range.first_row != src_row || img.range.first_col != src_col)
            continue;
        ImageAnchor copy = img;
        copy.range = CellRange{dst.row, dst.col, dst.row + img.range.Rows() - 1, dst.col + img.range.Cols() - 1};
        dst.sheet->AddImage(std::move(copy));
    }

    if (!cell)
        return true;

    Cell result;
    result.style_id = cell->style_id;
    if (!cell->comment.empty())
        result.comment = StripCommandLines(cell->comment);

    const EvalEnv env = Env(scope, dst.row, dst.col);
    if (!cell->formula.empty())
    {
        std::string formula = cell->formula;
        if (evaluate && ContainsPlaceholder(formula, m_notation))
        {
            std::string substituted;
            EvalError e;
            if (SubstituteFormula(formula, env, substituted, e))
            {
                formula = std::move(substituted);
            }
            else
            {
                if (!RecoverEval(e, Where(src_row, src_col)))
                    return false;
                formula.clear();
            }
        }
        if (!formula.empty())
        {
            result.formula = formula;
            m_formulas.push_back(PendingFormula{source, target, std::move(formula)});
        }
    }
    else if (evaluate && cell->value.IsString() && ContainsPlaceholder(cell->value.AsString(), m_notation))
    {
        Value v;
        EvalError e;
        if (!m_eval.EvaluateText(cell->value.AsString(), m_notation, env, v, e))
        {
            if (!RecoverEval(e, Where(src_row, src_col)))
                return false;
            v = Value();
        }
        result.value = CellValueOf(v);
    }
    else
    {
        result.value = cell->value;
    }

    if (!result.Empty())
        dst.sheet->CellAt(dst.row, dst.col) = std::move(result);
    return true;
}
} // namespace gridfill
