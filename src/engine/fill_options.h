#pragma once

#include "engine/cell_listener.h"

#include <string>
#include <vector>

namespace gridfill
{
struct FillOptions
{
    // Placeholder markers in cell text, formulas and command attributes.
    std::string notation_begin = "${";
    std::string notation_end = "}";

    // Multisheet output normally replaces the annotated sheet. When set, the untouched
    // template sheet stays in the output, after the generated sheets.
    bool keep_template_sheet = false;
    // Keep the template sheet as above, marked hidden.
    bool hide_template_sheet = false;

    // Abort on the first evaluation error instead of rendering the cell empty.
    bool fail_fast = false;

    // Ask the consuming application to recompute formulas when the output is opened.
    bool recalculate_on_open = false;

    // Replacement for formula references into regions that rendered nothing.
    // jx:params(defaultValue="...") overrides it per cell.
    std::string default_formula_value = "0";

    // Print recoverable diagnostics to stderr as they are recorded.
    bool log_diagnostics = false;

    // Template cells of a jx:if else branch render only through that branch. When cleared,
    // they are also copied in place like any other static cell.
    bool clear_template_cells = true;

    // Called in order around every rendered area cell.
    std::vector<CellListener> listeners;
};
} // namespace gridfill
