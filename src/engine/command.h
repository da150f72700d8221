#pragma once

#include "core/cell_ref.h"
#include "core/diagnostics.h"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace gridfill
{
// ---------------------------------------------------------------------------
// Command declarations
// ---------------------------------------------------------------------------
// Annotation syntax (one declaration per line of a cell comment):
//   jx:<name>(<key>="<value>" <key>='<value>' ...)
// Every command carries lastCell; the annotated cell is the region's top-left anchor.
//
// The command set is closed: CommandBody is a variant, and every consumer visits it
// exhaustively.

enum class Direction
{
    Down = 0,
    Right,
};

struct AreaCommand
{
};

struct EachCommand
{
    std::string items;
    std::string var;
    std::string var_index; // empty = not bound
    Direction direction = Direction::Down;
    std::string select;
    std::string order_by;    // "e.Name ASC, e.Payment DESC"
    std::string group_by;
    std::string group_order; // "ASC", "DESC", optionally with "IGNORECASE"
    std::string multisheet;  // expression resolving to the sheet name list
};

struct IfCommand
{
    std::string condition;
    // Rendered in place of the if block when the condition is false. Set from the second
    // entry of areas=["A2:C2", "A3:C3"]; the first entry is the if block itself.
    std::optional<Region> else_region;
};

struct GridCommand
{
    std::string headers;
    std::string data;
    std::string props; // comma-separated member names for mapping rows
};

struct ImageCommand
{
    std::string src;
    std::string image_type;
    double scale_x = 1.0;
    double scale_y = 1.0;
};

struct MergeCellsCommand
{
    std::string cols; // integer literal or expression
    std::string rows;
    int min_cols = 0;
    int min_rows = 0;
};

struct AutoRowHeightCommand
{
};

using CommandBody = std::variant<AreaCommand,
                                 EachCommand,
                                 IfCommand,
                                 GridCommand,
                                 ImageCommand,
                                 MergeCellsCommand,
                                 AutoRowHeightCommand>;

struct CommandNode
{
    CommandBody body;
    Region region;
    // Position of the declaration across the whole template (sheet order, then cell order,
    // then line order). Breaks ties between commands sharing one region.
    int declaration_index = 0;
    // Filled by the tree builder; sorted top-to-bottom, left-to-right.
    std::vector<int> children;
    // Commands anchored inside a jx:if else region, ordered like `children`.
    std::vector<int> else_children;
    int parent = -1;
};

const char* CommandName(const CommandBody& body);
bool IsContainer(const CommandBody& body);

// ---------------------------------------------------------------------------
// Formula parameters (jx:params)
// ---------------------------------------------------------------------------
enum class FormulaStrategy
{
    Default = 0,
    ByColumn, // only targets in the formula's own output column
    ByRow,    // only targets in the formula's own output row
};

struct FormulaParams
{
    FormulaStrategy strategy = FormulaStrategy::Default;
    std::optional<std::string> default_value;
};

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------
struct ParsedAnnotation
{
    std::vector<CommandNode> commands;
    std::optional<FormulaParams> params;
    // Comment lines that are not declarations, joined with '\n'.
    std::string plain_text;
};

// Splits "key="value" key2='v2'" into ordered pairs. Accepts straight and typographic quotes.
bool ParseAttributes(std::string_view text, std::vector<std::pair<std::string, std::string>>& out, std::string& err);

// Parses one "jx:..." line anchored at `anchor`.
bool ParseCommandLine(std::string_view line, const CellRef& anchor, CommandNode& out, Diagnostic& err);

// Parses a whole cell comment. Lines not starting with "jx:" are kept as plain text.
bool ParseAnnotation(std::string_view text, const CellRef& anchor, ParsedAnnotation& out, Diagnostic& err);

// Top-level comma split of a list attribute (quotes and parentheses respected).
// Items are trimmed; empty items are dropped.
std::vector<std::string> SplitAttributeList(std::string_view text);

struct SortKey
{
    std::string expression;
    bool descending = false;
};

// "e.Name ASC, e.Payment DESC". The direction defaults to ascending.
std::vector<SortKey> ParseOrderBy(std::string_view text);

// True if any line of the comment is a declaration.
bool HasCommandLines(std::string_view text);

// Comment text with every declaration line removed.
std::string StripCommandLines(std::string_view text);
} // namespace gridfill
