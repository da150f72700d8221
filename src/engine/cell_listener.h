#pragma once

#include "core/cell_ref.h"
#include "core/workbook.h"
#include "engine/context.h"

#include <functional>

namespace gridfill
{
// One template cell about to be (or just) rendered inside an area.
struct CellEvent
{
    CellRef source;          // template sheet
    CellRef target;          // output sheet
    Sheet* output = nullptr; // the sheet `target` lives on
    const Context* context = nullptr;
    ScopeId scope = kRootScope; // bindings visible to the cell
};

// Per-cell hooks, called for every template cell position an area renders. Cells written
// by jx:grid and cells outside every area are not reported.
//
// `before` returning false skips the default rendering of that cell; the `before` hooks
// after it are not called, every `after` hook still is.
struct CellListener
{
    std::function<bool(const CellEvent&)> before;
    std::function<void(const CellEvent&)> after;
};
} // namespace gridfill
