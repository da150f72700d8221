#pragma once

#include "core/value.h"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace gridfill
{
// In-memory grid document: an ordered list of sheets, each a sparse row-major cell map
// plus the sheet-level geometry (merges, row heights, column widths, images).
//
// Both the template and the fill output are Workbooks. The template is never mutated
// during a fill, so one loaded template can back any number of fills.

struct CellKey
{
    int row = 0;
    int col = 0;

    bool operator<(const CellKey& o) const { return row != o.row ? row < o.row : col < o.col; }
    bool operator==(const CellKey& o) const { return row == o.row && col == o.col; }
};

struct Cell
{
    // Scalar content: Null (blank), Bool, Number, String or Hyperlink.
    Value value;
    // Formula text without the leading '='. Non-empty formulas take precedence over value.
    std::string formula;
    // Opaque style reference owned by the container format; copied, never interpreted.
    int style_id = 0;
    std::string comment;

    bool Empty() const { return value.IsNull() && formula.empty() && style_id == 0 && comment.empty(); }
};

struct CellRange
{
    int first_row = 0;
    int first_col = 0;
    int last_row = 0;
    int last_col = 0;

    int Rows() const { return last_row - first_row + 1; }
    int Cols() const { return last_col - first_col + 1; }
    bool operator==(const CellRange& o) const
    {
        return first_row == o.first_row && first_col == o.first_col && last_row == o.last_row &&
               last_col == o.last_col;
    }
};

struct ImageAnchor
{
    CellRange range;
    std::string image_type; // "PNG", "JPEG", "GIF", "BMP"
    int pixel_width = 0;
    int pixel_height = 0;
    double scale_x = 1.0;
    double scale_y = 1.0;
    std::vector<std::uint8_t> bytes;
};

class Sheet
{
public:
    explicit Sheet(std::string name = std::string());

    const std::string& Name() const { return m_name; }
    void SetName(std::string name) { m_name = std::move(name); }
    bool Hidden() const { return m_hidden; }
    void SetHidden(bool hidden) { m_hidden = hidden; }

    // Cells
    const Cell* FindCell(int row, int col) const;
    Cell& CellAt(int row, int col); // creates on demand
    void SetValue(int row, int col, Value v);
    void SetFormula(int row, int col, std::string formula);
    void SetComment(int row, int col, std::string comment);
    void SetStyle(int row, int col, int style_id);
    void EraseCell(int row, int col);
    const std::map<CellKey, Cell>& Cells() const { return m_cells; }

    // Populated cells inside the inclusive rectangle, row-major.
    std::vector<std::pair<CellKey, const Cell*>> CellsIn(const CellRange& range) const;

    // Removes cells, merges and images whose top-left corner is inside range.
    void ClearRange(const CellRange& range);

    // Inclusive bounds of populated cells, or nullopt for an empty sheet.
    std::optional<CellRange> UsedRange() const;

    // Merges
    void AddMerge(const CellRange& range);
    const std::vector<CellRange>& Merges() const { return m_merges; }
    // Merge whose top-left cell is (row, col), if any.
    const CellRange* MergeAnchoredAt(int row, int col) const;

    // Geometry
    void SetRowHeight(int row, double height) { m_row_heights[row] = height; }
    std::optional<double> RowHeight(int row) const;
    const std::map<int, double>& RowHeights() const { return m_row_heights; }
    void SetColumnWidth(int col, double width) { m_col_widths[col] = width; }
    std::optional<double> ColumnWidth(int col) const;
    const std::map<int, double>& ColumnWidths() const { return m_col_widths; }

    // Rows the consuming application should re-measure on open.
    void FlagAutoRowHeight(int row) { m_auto_height_rows.insert(row); }
    const std::set<int>& AutoHeightRows() const { return m_auto_height_rows; }

    // Images
    void AddImage(ImageAnchor image) { m_images.push_back(std::move(image)); }
    const std::vector<ImageAnchor>& Images() const { return m_images; }

private:
    std::string m_name;
    bool m_hidden = false;
    std::map<CellKey, Cell> m_cells;
    std::vector<CellRange> m_merges;
    std::map<int, double> m_row_heights;
    std::map<int, double> m_col_widths;
    std::set<int> m_auto_height_rows;
    std::vector<ImageAnchor> m_images;
};

class Workbook
{
public:
    Workbook() = default;
    Workbook(const Workbook& other);
    Workbook& operator=(const Workbook& other);
    Workbook(Workbook&&) = default;
    Workbook& operator=(Workbook&&) = default;

    std::size_t SheetCount() const { return m_sheets.size(); }
    Sheet& SheetAt(std::size_t index) { return *m_sheets[index]; }
    const Sheet& SheetAt(std::size_t index) const { return *m_sheets[index]; }

    Sheet* FindSheet(std::string_view name);
    const Sheet* FindSheet(std::string_view name) const;
    int SheetIndex(std::string_view name) const; // -1 if missing

    // Returned references stay valid until the sheet is deleted.
    Sheet& AddSheet(const std::string& name);
    bool CopySheet(const std::string& source, const std::string& new_name, std::string& err);
    bool RenameSheet(const std::string& name, const std::string& new_name, std::string& err);
    bool DeleteSheet(const std::string& name, std::string& err);
    // Moves a sheet to position index (clamped).
    bool MoveSheet(const std::string& name, std::size_t index, std::string& err);

    // Name not used by any sheet: base, "base (2)", "base (3)", ...
    std::string UniqueSheetName(const std::string& base) const;

    bool RecalculateOnOpen() const { return m_recalculate_on_open; }
    void SetRecalculateOnOpen(bool v) { m_recalculate_on_open = v; }

private:
    std::vector<std::unique_ptr<Sheet>> m_sheets;
    bool m_recalculate_on_open = false;
};
} // namespace gridfill
