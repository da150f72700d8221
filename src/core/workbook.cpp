#include "core/workbook.h"

#include <algorithm>

namespace gridfill
{
namespace
{
static bool InRange(const CellRange& r, int row, int col)
{
    return row >= r.first_row && row <= r.last_row && col >= r.first_col && col <= r.last_col;
}
} // namespace

// ---------------------------------------------------------------------------
// Sheet
// ---------------------------------------------------------------------------
Sheet::Sheet(std::string name)
    : m_name(std::move(name))
{
}

const Cell* Sheet::FindCell(int row, int col) const
{
    auto it = m_cells.find(CellKey{row, col});
    if (it == m_cells.end())
        return nullptr;
    return &it->second;
}

Cell& Sheet::CellAt(int row, int col)
{
    return m_cells[CellKey{row, col}];
}

void Sheet::SetValue(int row, int col, Value v)
{
    CellAt(row, col).value = std::move(v);
}

void Sheet::SetFormula(int row, int col, std::string formula)
{
    if (!formula.empty() && formula[0] == '=')
        formula.erase(formula.begin());
    CellAt(row, col).formula = std::move(formula);
}

void Sheet::SetComment(int row, int col, std::string comment)
{
    CellAt(row, col).comment = std::move(comment);
}

void Sheet::SetStyle(int row, int col, int style_id)
{
    CellAt(row, col).style_id = style_id;
}

void Sheet::EraseCell(int row, int col)
{
    m_cells.erase(CellKey{row, col});
}

std::vector<std::pair<CellKey, const Cell*>> Sheet::CellsIn(const CellRange& range) const
{
    std::vector<std::pair<CellKey, const Cell*>> out;
    if (range.last_row < range.first_row || range.last_col < range.first_col)
        return out;
    auto it = m_cells.lower_bound(CellKey{range.first_row, range.first_col});
    const auto end = m_cells.upper_bound(CellKey{range.last_row, range.last_col});
    for (; it != end; ++it)
    {
        if (it->first.col < range.first_col || it->first.col > range.last_col)
            continue;
        out.emplace_back(it->first, &it->second);
    }
    return out;
}

void Sheet::ClearRange(const CellRange& range)
{
    for (const auto& kv : CellsIn(range))
        m_cells.erase(kv.first);

    m_merges.erase(std::remove_if(m_merges.begin(),
                                  m_merges.end(),
                                  [&](const CellRange& m) { return InRange(range, m.first_row, m.first_col); }),
                   m_merges.end());
    m_images.erase(std::remove_if(m_images.begin(),
                                  m_images.end(),
                                  [&](const ImageAnchor& img) {
                                      return InRange(range, img.range.first_row, img.range.first_col);
                                  }),
                   m_images.end());
    for (auto it = m_auto_height_rows.begin(); it != m_auto_height_rows.end();)
    {
        if (*it >= range.first_row && *it <= range.last_row)
            it = m_auto_height_rows.erase(it);
        else
            ++it;
    }
}

std::optional<CellRange> Sheet::UsedRange() const
{
    if (m_cells.empty())
        return std::nullopt;
    CellRange r;
    r.first_row = m_cells.begin()->first.row;
    r.last_row = m_cells.rbegin()->first.row;
    r.first_col = m_cells.begin()->first.col;
    r.last_col = r.first_col;
    for (const auto& kv : m_cells)
    {
        r.first_col = std::min(r.first_col, kv.first.col);
        r.last_col = std::max(r.last_col, kv.first.col);
    }
    return r;
}

void Sheet::AddMerge(const CellRange& range)
{
    // A later declaration on the same anchor replaces the earlier one.
    for (CellRange& m : m_merges)
    {
        if (m.first_row == range.first_row && m.first_col == range.first_col)
        {
            m = range;
            return;
        }
    }
    m_merges.push_back(range);
}

const CellRange* Sheet::MergeAnchoredAt(int row, int col) const
{
    for (const CellRange& m : m_merges)
        if (m.first_row == row && m.first_col == col)
            return &m;
    return nullptr;
}

std::optional<double> Sheet::RowHeight(int row) const
{
    auto it = m_row_heights.find(row);
    if (it == m_row_heights.end())
        return std::nullopt;
    return it->second;
}

std::optional<double> Sheet::ColumnWidth(int col) const
{
    auto it = m_col_widths.find(col);
    if (it == m_col_widths.end())
        return std::nullopt;
    return it->second;
}

// ---------------------------------------------------------------------------
// Workbook
// ---------------------------------------------------------------------------
Workbook::Workbook(const Workbook& other)
    : m_recalculate_on_open(other.m_recalculate_on_open)
{
    m_sheets.reserve(other.m_sheets.size());
    for (const auto& s : other.m_sheets)
        m_sheets.push_back(std::make_unique<Sheet>(*s));
}

Workbook& Workbook::operator=(const Workbook& other)
{
    if (this == &other)
        return *this;
    Workbook copy(other);
    *this = std::move(copy);
    return *this;
}

Sheet* Workbook::FindSheet(std::string_view name)
{
    for (auto& s : m_sheets)
        if (s->Name() == name)
            return s.get();
    return nullptr;
}

const Sheet* Workbook::FindSheet(std::string_view name) const
{
    for (const auto& s : m_sheets)
        if (s->Name() == name)
            return s.get();
    return nullptr;
}

int Workbook::SheetIndex(std::string_view name) const
{
    for (std::size_t i = 0; i < m_sheets.size(); ++i)
        if (m_sheets[i]->Name() == name)
            return (int)i;
    return -1;
}

Sheet& Workbook::AddSheet(const std::string& name)
{
    m_sheets.push_back(std::make_unique<Sheet>(name));
    return *m_sheets.back();
}

bool Workbook::CopySheet(const std::string& source, const std::string& new_name, std::string& err)
{
    err.clear();
    const Sheet* src = FindSheet(source);
    if (!src)
    {
        err = "No sheet named '" + source + "'.";
        return false;
    }
    if (FindSheet(new_name))
    {
        err = "A sheet named '" + new_name + "' already exists.";
        return false;
    }
    auto copy = std::make_unique<Sheet>(*src);
    copy->SetName(new_name);
    m_sheets.push_back(std::move(copy));
    return true;
}

bool Workbook::RenameSheet(const std::string& name, const std::string& new_name, std::string& err)
{
    err.clear();
    Sheet* s = FindSheet(name);
    if (!s)
    {
        err = "No sheet named '" + name + "'.";
        return false;
    }
    if (name == new_name)
        return true;
    if (FindSheet(new_name))
    {
        err = "A sheet named '" + new_name + "' already exists.";
        return false;
    }
    s->SetName(new_name);
    return true;
}

bool Workbook::DeleteSheet(const std::string& name, std::string& err)
{
    err.clear();
    const int idx = SheetIndex(name);
    if (idx < 0)
    {
        err = "No sheet named '" + name + "'.";
        return false;
    }
    m_sheets.erase(m_sheets.begin() + idx);
    return true;
}

bool Workbook::MoveSheet(const std::string& name, std::size_t index, std::string& err)
{
    err.clear();
    const int idx = SheetIndex(name);
    if (idx < 0)
    {
        err = "No sheet named '" + name + "'.";
        return false;
    }
    std::unique_ptr<Sheet> s = std::move(m_sheets[(std::size_t)idx]);
    m_sheets.erase(m_sheets.begin() + idx);
    index = std::min(index, m_sheets.size());
    m_sheets.insert(m_sheets.begin() + (std::ptrdiff_t)index, std::move(s));
    return true;
}

std::string Workbook::UniqueSheetName(const std::string& base) const
{
    if (!FindSheet(base))
        return base;
    for (int n = 2;; ++n)
    {
        std::string candidate = base + " (" + std::to_string(n) + ")";
        if (!FindSheet(candidate))
            return candidate;
    }
}
} // namespace gridfill
