#pragma once

#include "core/diagnostics.h"
#include "core/workbook.h"
#include "engine/command.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace gridfill
{
// Commands of one template nested by geometric containment.
//
// Areas are roots. Every other command hangs under the smallest enclosing Area/Each/If/
// AutoRowHeight region; children are ordered top-to-bottom, then left-to-right.
struct CommandTree
{
    std::vector<CommandNode> nodes; // declaration order
    std::vector<int> roots;         // Area nodes in sheet order, then anchor order

    // jx:params keyed by (sheet, cell).
    std::map<std::pair<std::string, CellKey>, FormulaParams> formula_params;

    const CommandNode& Node(int id) const { return nodes[(std::size_t)id]; }
    // Roots anchored on `sheet`, in anchor order.
    std::vector<int> RootsOnSheet(const std::string& sheet) const;
    const FormulaParams* ParamsAt(const std::string& sheet, int row, int col) const;
};

// Parses every cell comment of every sheet. Fails on the first parse error.
bool CollectCommands(const Workbook& tmpl,
                     std::vector<CommandNode>& out_commands,
                     std::map<std::pair<std::string, CellKey>, FormulaParams>& out_params,
                     Diagnostic& err);

// Validates and nests already-parsed commands.
bool BuildCommandTree(std::vector<CommandNode> commands, const Workbook& tmpl, CommandTree& out, Diagnostic& err);

// CollectCommands + BuildCommandTree.
bool BuildTemplateTree(const Workbook& tmpl, CommandTree& out, Diagnostic& err);
} // namespace gridfill
