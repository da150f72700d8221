#pragma once

#include "core/cell_ref.h"
#include "core/value.h"
#include "core/workbook.h"
#include "io/binary_codec.h"
#include "io/data_json.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

namespace gridfill
{
namespace test
{
// 1x1 RGBA PNG.
static constexpr const char* kTinyPngBase64 =
    "iVBORw0KGgoAAAANSUhEUgAAAAEAAAABCAYAAAAfFcSJAAAADUlEQVR42mNkYPhfDwAChwGA60e6kgAAAABJRU5ErkJggg==";

inline CellRef Ref(const std::string& a1)
{
    CellRef ref;
    std::string err;
    EXPECT_TRUE(ParseCellRef(a1, ref, err)) << err;
    return ref;
}

inline void Put(Sheet& sheet, const std::string& a1, const std::string& text)
{
    const CellRef r = Ref(a1);
    sheet.SetValue(r.row, r.col, Value::FromString(text));
}

inline void PutNumber(Sheet& sheet, const std::string& a1, double d)
{
    const CellRef r = Ref(a1);
    sheet.SetValue(r.row, r.col, Value::FromNumber(d));
}

inline void PutFormula(Sheet& sheet, const std::string& a1, const std::string& formula)
{
    const CellRef r = Ref(a1);
    sheet.SetFormula(r.row, r.col, formula);
}

inline void Annotate(Sheet& sheet, const std::string& a1, const std::string& comment)
{
    const CellRef r = Ref(a1);
    sheet.SetComment(r.row, r.col, comment);
}

inline const Cell* Find(const Sheet& sheet, const std::string& a1)
{
    const CellRef r = Ref(a1);
    return sheet.FindCell(r.row, r.col);
}

// Display text of a cell's value; empty for a missing cell.
inline std::string TextAt(const Sheet& sheet, const std::string& a1)
{
    const Cell* c = Find(sheet, a1);
    return c ? c->value.ToDisplayString() : std::string();
}

inline std::string FormulaAt(const Sheet& sheet, const std::string& a1)
{
    const Cell* c = Find(sheet, a1);
    return c ? c->formula : std::string();
}

inline Value ParseData(const std::string& text)
{
    Value v;
    std::string err;
    EXPECT_TRUE(data_json::ParseText(text, v, err)) << err;
    return v;
}

inline std::vector<std::uint8_t> TinyPng()
{
    std::vector<std::uint8_t> bytes;
    EXPECT_TRUE(Base64Decode(kTinyPngBase64, bytes));
    return bytes;
}

inline Value Employees()
{
    return ParseData(R"({
        "employees": [
            {"name": "Alice", "department": "Sales", "salary": 5000},
            {"name": "Bob", "department": "IT", "salary": 6000},
            {"name": "Carol", "department": "Sales", "salary": 7000}
        ]
    })");
}
} // namespace test
} // namespace gridfill
