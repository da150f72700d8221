#pragma once

#include "core/cell_ref.h"
#include "core/diagnostics.h"
#include "core/workbook.h"
#include "engine/command_tree.h"
#include "engine/context.h"
#include "engine/expression.h"
#include "engine/fill_options.h"
#include "engine/formula_processor.h"

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace gridfill
{
// Depth-first interpreter of a CommandTree.
//
// Every render step receives an explicit output cursor and returns the Size it actually
// produced. The caller turns the difference between that Size and the source block into
// the shift applied to everything after it, so no layout state lives outside the recursion.
//
// One engine performs one fill; it is not reusable.
class TransformEngine
{
public:
    TransformEngine(const Workbook& tmpl, const CommandTree& tree, const FillOptions& options, Context& context);

    // Builds the complete output document into `out`. Returns false on the first fatal
    // error (see Error()); recoverable problems are collected in Diagnostics().
    bool Run(Workbook& out);

    const Diagnostic& Error() const { return m_error; }
    const std::vector<Diagnostic>& Diagnostics() const { return m_diagnostics; }

private:
    struct Cursor
    {
        Sheet* sheet = nullptr;
        int slot = 0; // CellTracker output sheet slot
        int row = 0;
        int col = 0;
    };

    // Multisheet expansion: while rendering the sheet generated for one item, the bound
    // jx:each renders exactly that item.
    struct MultisheetItem
    {
        int node = -1;
        Value item;
        std::size_t index = 0;
    };

    class CommandVisitor;

    bool RenderStaticSheet(std::size_t template_index, Sheet& target, int slot);
    bool RenderSheet(std::size_t template_index, Sheet& target, int slot, const MultisheetItem* multisheet);
    bool RenderMultisheet(std::size_t template_index,
                          int each_node,
                          const std::set<std::string>& reserved,
                          std::set<std::string>& used,
                          Workbook& out);

    bool RenderBlock(const Region& src,
                     const std::vector<int>& children,
                     const Cursor& at,
                     ScopeId scope,
                     std::uint32_t instance,
                     Size& out);
    bool RenderBand(const Region& src,
                    int band_first_row,
                    int band_last_row,
                    std::vector<int> commands,
                    const Cursor& at,
                    ScopeId scope,
                    std::uint32_t instance,
                    Size& out);
    bool ApplyCommand(int id, const Cursor& at, ScopeId scope, std::uint32_t instance, Size& out);

    bool ApplyEach(int id, const EachCommand& each, const Cursor& at, ScopeId scope, std::uint32_t instance, Size& out);
    bool ApplyIf(int id, const IfCommand& cmd, const Cursor& at, ScopeId scope, std::uint32_t instance, Size& out);
    bool ApplyGrid(int id, const GridCommand& cmd, const Cursor& at, ScopeId scope, Size& out);
    bool ApplyImage(int id, const ImageCommand& cmd, const Cursor& at, ScopeId scope, Size& out);
    bool ApplyMergeCells(int id,
                         const MergeCellsCommand& cmd,
                         const Cursor& at,
                         ScopeId scope,
                         std::uint32_t instance,
                         Size& out);
    bool ApplyAutoRowHeight(int id, const Cursor& at, ScopeId scope, std::uint32_t instance, Size& out);

    // items -> select -> groupBy -> orderBy. False only on a fatal error.
    bool ResolveEachItems(int id, const EachCommand& each, ScopeId scope, std::vector<Value>& out);
    bool SortItems(int id, const EachCommand& each, ScopeId scope, std::vector<Value>& items);

    // Copies one template cell to the output, substituting placeholders when `evaluate`.
    // Evaluated cells go through the cell listeners first.
    bool CopyCell(int src_row, int src_col, const Cursor& dst, ScopeId scope, std::uint32_t instance, bool evaluate);
    bool TransformCell(int src_row, int src_col, const Cursor& dst, ScopeId scope, std::uint32_t instance, bool evaluate);
    // True for a cell of a jx:if else region that `block` would copy as static content.
    bool ClearedElseCell(const Region& block, int row, int col) const;
    bool SubstituteFormula(const std::string& formula, const EvalEnv& env, std::string& out, EvalError& err);

    EvalEnv Env(ScopeId scope, int row = -1, int col = -1) const;
    std::string Where(int row, int col) const;
    std::string WhereNode(int id) const;

    // Records a recoverable diagnostic. Returns false (and sets the fatal error) in fail-fast mode.
    bool Recover(Diagnostic d);
    bool RecoverEval(const EvalError& e, std::string location);
    bool Fatal(Diagnostic d);

    const Workbook& m_template;
    const CommandTree& m_tree;
    const FillOptions& m_options;
    Context& m_context;
    Notation m_notation;
    ExpressionEvaluator m_eval;
    CellTracker m_tracker;
    std::vector<PendingFormula> m_formulas;
    std::set<SourceCell> m_referenced;
    // Else regions rendered only through their jx:if (empty unless clear_template_cells).
    std::vector<Region> m_else_regions;

    // Template sheet being rendered.
    const Sheet* m_src_sheet = nullptr;
    int m_src_index = 0;
    const MultisheetItem* m_multisheet = nullptr;

    Diagnostic m_error;
    std::vector<Diagnostic> m_diagnostics;
};
} // namespace gridfill
