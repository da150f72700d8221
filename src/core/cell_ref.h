#pragma once

#include <string>
#include <string_view>

namespace gridfill
{
// ---------------------------------------------------------------------------
// Cell addressing
// ---------------------------------------------------------------------------
// Rows and columns are 0-based everywhere in the engine; A1 notation is 1-based.
struct CellRef
{
    std::string sheet; // empty = "current sheet"
    int row = 0;
    int col = 0;

    bool operator==(const CellRef& o) const { return sheet == o.sheet && row == o.row && col == o.col; }
    bool operator!=(const CellRef& o) const { return !(*this == o); }
};

struct Size
{
    int width = 0;
    int height = 0;

    bool operator==(const Size& o) const { return width == o.width && height == o.height; }
    bool operator!=(const Size& o) const { return !(*this == o); }
};

// Rectangle governed by a command: top-left = anchor, bottom-right = lastCell (inclusive).
struct Region
{
    std::string sheet;
    int first_row = 0;
    int first_col = 0;
    int last_row = 0;
    int last_col = 0;

    int Rows() const { return last_row - first_row + 1; }
    int Cols() const { return last_col - first_col + 1; }
    bool Empty() const { return last_row < first_row || last_col < first_col; }
    long long Area() const { return Empty() ? 0 : (long long)Rows() * (long long)Cols(); }

    bool Contains(int row, int col) const
    {
        return row >= first_row && row <= last_row && col >= first_col && col <= last_col;
    }
    bool Contains(const Region& o) const
    {
        return sheet == o.sheet && o.first_row >= first_row && o.last_row <= last_row &&
               o.first_col >= first_col && o.last_col <= last_col;
    }
    bool Overlaps(const Region& o) const
    {
        return sheet == o.sheet && first_row <= o.last_row && o.first_row <= last_row &&
               first_col <= o.last_col && o.first_col <= last_col;
    }
    bool operator==(const Region& o) const
    {
        return sheet == o.sheet && first_row == o.first_row && first_col == o.first_col &&
               last_row == o.last_row && last_col == o.last_col;
    }
};

// 0 -> "A", 25 -> "Z", 26 -> "AA".
std::string ColumnName(int col);
// Inverse of ColumnName (case-insensitive). Returns -1 on invalid input.
int ColumnIndex(std::string_view letters);

// Parses "B5", "$B$5", "Sheet1!B5" and "'My Sheet'!B5".
bool ParseCellRef(std::string_view text, CellRef& out, std::string& err);

// "B5" or "Sheet1!B5" ("'My Sheet'!B5" when quoting is required).
std::string FormatCellRef(const CellRef& ref, bool with_sheet = true);
std::string FormatRegion(const Region& region);

// Quotes a sheet name for use in a formula or reference when it contains
// anything other than letters, digits and underscores.
std::string QuoteSheetName(const std::string& name);

// Replaces characters that are illegal in sheet names and caps the length at 31.
std::string SafeSheetName(std::string_view name);
} // namespace gridfill
