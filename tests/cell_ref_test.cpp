#include "core/cell_ref.h"

#include <gtest/gtest.h>

#include <string>

using namespace gridfill;

TEST(CellRef, ColumnNamesRoundTrip)
{
    EXPECT_EQ(ColumnName(0), "A");
    EXPECT_EQ(ColumnName(25), "Z");
    EXPECT_EQ(ColumnName(26), "AA");
    EXPECT_EQ(ColumnName(701), "ZZ");
    EXPECT_EQ(ColumnName(702), "AAA");
    EXPECT_EQ(ColumnName(-1), "");

    EXPECT_EQ(ColumnIndex("A"), 0);
    EXPECT_EQ(ColumnIndex("aa"), 26);
    EXPECT_EQ(ColumnIndex("XFD"), 16383);
    EXPECT_EQ(ColumnIndex("XFE"), -1);
    EXPECT_EQ(ColumnIndex("A1"), -1);
    EXPECT_EQ(ColumnIndex(""), -1);
}

TEST(CellRef, ParsesPlainAbsoluteAndQualifiedReferences)
{
    CellRef ref;
    std::string err;

    ASSERT_TRUE(ParseCellRef("B5", ref, err)) << err;
    EXPECT_EQ(ref.row, 4);
    EXPECT_EQ(ref.col, 1);
    EXPECT_TRUE(ref.sheet.empty());

    ASSERT_TRUE(ParseCellRef(" $C$10 ", ref, err)) << err;
    EXPECT_EQ(ref.row, 9);
    EXPECT_EQ(ref.col, 2);

    ASSERT_TRUE(ParseCellRef("Data!A1", ref, err)) << err;
    EXPECT_EQ(ref.sheet, "Data");
    EXPECT_EQ(ref.row, 0);

    ASSERT_TRUE(ParseCellRef("'My Sheet'!D4", ref, err)) << err;
    EXPECT_EQ(ref.sheet, "My Sheet");
    EXPECT_EQ(ref.col, 3);

    ASSERT_TRUE(ParseCellRef("'O''Brien'!A2", ref, err)) << err;
    EXPECT_EQ(ref.sheet, "O'Brien");
}

TEST(CellRef, RejectsMalformedReferences)
{
    CellRef ref;
    std::string err;
    EXPECT_FALSE(ParseCellRef("", ref, err));
    EXPECT_FALSE(ParseCellRef("5B", ref, err));
    EXPECT_FALSE(ParseCellRef("A0", ref, err));
    EXPECT_FALSE(ParseCellRef("A1B", ref, err));
    EXPECT_FALSE(ParseCellRef("!A1", ref, err));
    EXPECT_FALSE(ParseCellRef("A1048577", ref, err));
    EXPECT_FALSE(err.empty());
}

TEST(CellRef, FormatsWithQuotedSheetNames)
{
    EXPECT_EQ(FormatCellRef(CellRef{"Sheet1", 4, 1}), "Sheet1!B5");
    EXPECT_EQ(FormatCellRef(CellRef{"My Sheet", 4, 1}), "'My Sheet'!B5");
    EXPECT_EQ(FormatCellRef(CellRef{"Sheet1", 4, 1}, false), "B5");
    EXPECT_EQ(FormatCellRef(CellRef{"", 0, 0}), "A1");
    EXPECT_EQ(FormatRegion(Region{"Report", 0, 0, 2, 3}), "Report!A1:D3");

    EXPECT_EQ(QuoteSheetName("Data_2"), "Data_2");
    EXPECT_EQ(QuoteSheetName("2024"), "'2024'");
    EXPECT_EQ(QuoteSheetName("O'Brien"), "'O''Brien'");
}

TEST(CellRef, SafeSheetNameReplacesIllegalCharacters)
{
    EXPECT_EQ(SafeSheetName("Q1/Q2: [draft]?"), "Q1_Q2_ _draft__");
    EXPECT_EQ(SafeSheetName(""), "Sheet");
    EXPECT_EQ(SafeSheetName(std::string(40, 'x')).size(), 31u);
}

TEST(CellRef, RegionGeometry)
{
    const Region outer{"S", 0, 0, 4, 3};
    const Region inner{"S", 1, 1, 2, 2};
    const Region other_sheet{"T", 1, 1, 2, 2};
    const Region right{"S", 2, 3, 5, 6};
    const Region apart{"S", 5, 0, 6, 0};

    EXPECT_EQ(outer.Rows(), 5);
    EXPECT_EQ(outer.Cols(), 4);
    EXPECT_EQ(outer.Area(), 20);
    EXPECT_TRUE(outer.Contains(inner));
    EXPECT_FALSE(outer.Contains(other_sheet));
    EXPECT_TRUE(outer.Overlaps(right));
    EXPECT_FALSE(outer.Overlaps(apart));
    EXPECT_TRUE(Region({"S", 3, 0, 2, 0}).Empty());
}
