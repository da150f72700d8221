#include "engine/command_tree.h"

#include "test_support.h"

#include <gtest/gtest.h>

using namespace gridfill;
using test::Annotate;

namespace
{
CommandTree BuildOk(const Workbook& wb)
{
    CommandTree tree;
    Diagnostic err;
    EXPECT_TRUE(BuildTemplateTree(wb, tree, err)) << err.ToString();
    return tree;
}

Diagnostic BuildFailure(const Workbook& wb)
{
    CommandTree tree;
    Diagnostic err;
    EXPECT_FALSE(BuildTemplateTree(wb, tree, err));
    return err;
}
} // namespace

TEST(CommandTree, NestsBySmallestEnclosingContainer)
{
    Workbook wb;
    Sheet& s = wb.AddSheet("Report");
    Annotate(s, "A1", "jx:area(lastCell=\"C6\")");
    Annotate(s, "A2", "jx:each(items=\"departments\" var=\"d\" lastCell=\"C4\")");
    Annotate(s, "B3", "jx:each(items=\"d.staff\" var=\"e\" lastCell=\"C3\")");
    Annotate(s, "C3", "jx:if(condition=\"e.active\" lastCell=\"C3\")");
    Annotate(s, "A6", "jx:image(src=\"logo\" imageType=\"PNG\" lastCell=\"A6\")");

    const CommandTree tree = BuildOk(wb);
    ASSERT_EQ(tree.nodes.size(), 5u);
    ASSERT_EQ(tree.roots.size(), 1u);

    const int area = tree.roots[0];
    const CommandNode& root = tree.Node(area);
    ASSERT_EQ(root.children.size(), 2u);
    const CommandNode& outer = tree.Node(root.children[0]);
    EXPECT_TRUE(std::holds_alternative<EachCommand>(outer.body));
    EXPECT_TRUE(std::holds_alternative<ImageCommand>(tree.Node(root.children[1]).body));

    ASSERT_EQ(outer.children.size(), 1u);
    const CommandNode& inner = tree.Node(outer.children[0]);
    EXPECT_EQ(std::get<EachCommand>(inner.body).items, "d.staff");
    ASSERT_EQ(inner.children.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<IfCommand>(tree.Node(inner.children[0]).body));
    EXPECT_EQ(tree.Node(inner.children[0]).parent, outer.children[0]);
}

TEST(CommandTree, EqualRegionsNestInDeclarationOrder)
{
    Workbook wb;
    Sheet& s = wb.AddSheet("Sheet1");
    Annotate(s,
             "A1",
             "jx:area(lastCell=\"B1\")\n"
             "jx:autoRowHeight(lastCell=\"B1\")\n"
             "jx:each(items=\"rows\" var=\"r\" lastCell=\"B1\")");

    const CommandTree tree = BuildOk(wb);
    const CommandNode& area = tree.Node(tree.roots[0]);
    ASSERT_EQ(area.children.size(), 1u);
    const CommandNode& auto_height = tree.Node(area.children[0]);
    EXPECT_TRUE(std::holds_alternative<AutoRowHeightCommand>(auto_height.body));
    ASSERT_EQ(auto_height.children.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<EachCommand>(tree.Node(auto_height.children[0]).body));
}

TEST(CommandTree, RootsFollowSheetThenAnchorOrder)
{
    Workbook wb;
    Sheet& first = wb.AddSheet("First");
    Sheet& second = wb.AddSheet("Second");
    Annotate(second, "A1", "jx:area(lastCell=\"A1\")");
    Annotate(first, "A5", "jx:area(lastCell=\"B6\")");
    Annotate(first, "A1", "jx:area(lastCell=\"B2\")");

    const CommandTree tree = BuildOk(wb);
    ASSERT_EQ(tree.roots.size(), 3u);
    EXPECT_EQ(tree.Node(tree.roots[0]).region, (Region{"First", 0, 0, 1, 1}));
    EXPECT_EQ(tree.Node(tree.roots[1]).region, (Region{"First", 4, 0, 5, 1}));
    EXPECT_EQ(tree.Node(tree.roots[2]).region.sheet, "Second");
    EXPECT_EQ(tree.RootsOnSheet("First").size(), 2u);
    EXPECT_TRUE(tree.RootsOnSheet("Third").empty());
}

TEST(CommandTree, RecordsFormulaParams)
{
    Workbook wb;
    Sheet& s = wb.AddSheet("Sheet1");
    Annotate(s, "A1", "jx:area(lastCell=\"B3\")");
    Annotate(s, "B3", "jx:params(formulaStrategy=\"BY_ROW\")");

    const CommandTree tree = BuildOk(wb);
    const FormulaParams* params = tree.ParamsAt("Sheet1", 2, 1);
    ASSERT_NE(params, nullptr);
    EXPECT_EQ(params->strategy, FormulaStrategy::ByRow);
    EXPECT_FALSE(params->default_value.has_value());
    EXPECT_EQ(tree.ParamsAt("Sheet1", 0, 0), nullptr);
}

TEST(CommandTree, CommandOutsideEveryAreaIsRejected)
{
    Workbook wb;
    Sheet& s = wb.AddSheet("Sheet1");
    Annotate(s, "A1", "jx:area(lastCell=\"B2\")");
    Annotate(s, "D4", "jx:each(items=\"x\" var=\"e\" lastCell=\"D4\")");

    const Diagnostic err = BuildFailure(wb);
    EXPECT_EQ(err.code, ErrorCode::RegionOutOfBounds);
    EXPECT_EQ(err.location, "Sheet1!D4");
}

TEST(CommandTree, ChildMayNotExtendBeyondItsParent)
{
    Workbook wb;
    Sheet& s = wb.AddSheet("Sheet1");
    Annotate(s, "A1", "jx:area(lastCell=\"B2\")");
    Annotate(s, "A2", "jx:each(items=\"x\" var=\"e\" lastCell=\"C2\")");
    EXPECT_EQ(BuildFailure(wb).code, ErrorCode::RegionOutOfBounds);
}

TEST(CommandTree, OverlapsAreRejected)
{
    Workbook areas;
    Sheet& a = areas.AddSheet("Sheet1");
    Annotate(a, "A1", "jx:area(lastCell=\"B2\")");
    Annotate(a, "B2", "jx:area(lastCell=\"C3\")");
    EXPECT_EQ(BuildFailure(areas).code, ErrorCode::OverlappingCommands);

    Workbook siblings;
    Sheet& s = siblings.AddSheet("Sheet1");
    Annotate(s, "A1", "jx:area(lastCell=\"D5\")");
    Annotate(s, "B2", "jx:each(items=\"x\" var=\"e\" lastCell=\"C3\")");
    Annotate(s, "A3", "jx:each(items=\"y\" var=\"f\" lastCell=\"B4\")");
    EXPECT_EQ(BuildFailure(siblings).code, ErrorCode::OverlappingCommands);
}

TEST(CommandTree, ElseAreaHoldsItsOwnCommands)
{
    Workbook wb;
    Sheet& s = wb.AddSheet("Sheet1");
    Annotate(s, "A1", "jx:area(lastCell=\"B4\")");
    Annotate(s, "A2", "jx:if(condition=\"show\" lastCell=\"B2\" areas=[\"A2:B2\", \"A3:B4\"])");
    Annotate(s, "A3", "jx:each(items=\"rows\" var=\"r\" lastCell=\"B3\")");

    const CommandTree tree = BuildOk(wb);
    const CommandNode& area = tree.Node(tree.roots[0]);
    ASSERT_EQ(area.children.size(), 1u);
    const CommandNode& branch = tree.Node(area.children[0]);
    ASSERT_TRUE(std::holds_alternative<IfCommand>(branch.body));
    EXPECT_TRUE(branch.children.empty());
    ASSERT_EQ(branch.else_children.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<EachCommand>(tree.Node(branch.else_children[0]).body));
    EXPECT_EQ(tree.Node(branch.else_children[0]).parent, area.children[0]);
}

TEST(CommandTree, ElseAreaPlacementIsValidated)
{
    Workbook overlapping;
    Sheet& a = overlapping.AddSheet("Sheet1");
    Annotate(a, "A1", "jx:area(lastCell=\"B4\")");
    Annotate(a, "A2", "jx:if(condition=\"x\" lastCell=\"B2\" areas=[\"A2:B2\", \"B2:B3\"])");
    EXPECT_EQ(BuildFailure(overlapping).code, ErrorCode::OverlappingCommands);

    Workbook outside;
    Sheet& b = outside.AddSheet("Sheet1");
    Annotate(b, "A1", "jx:area(lastCell=\"B3\")");
    Annotate(b, "A2", "jx:if(condition=\"x\" lastCell=\"B2\" areas=[\"A2:B2\", \"A3:B5\"])");
    EXPECT_EQ(BuildFailure(outside).code, ErrorCode::RegionOutOfBounds);

    Workbook sibling;
    Sheet& c = sibling.AddSheet("Sheet1");
    Annotate(c, "A1", "jx:area(lastCell=\"C4\")");
    Annotate(c, "A2", "jx:if(condition=\"x\" lastCell=\"A2\" areas=[\"A2:A2\", \"A3:B3\"])");
    Annotate(c, "B2", "jx:each(items=\"rows\" var=\"r\" lastCell=\"B3\")");
    const Diagnostic err = BuildFailure(sibling);
    EXPECT_EQ(err.code, ErrorCode::OverlappingCommands);

    Workbook spilling;
    Sheet& d = spilling.AddSheet("Sheet1");
    Annotate(d, "A1", "jx:area(lastCell=\"C4\")");
    Annotate(d, "A2", "jx:if(condition=\"x\" lastCell=\"A2\" areas=[\"A2:A2\", \"A3:B3\"])");
    Annotate(d, "B3", "jx:each(items=\"rows\" var=\"r\" lastCell=\"C3\")");
    EXPECT_EQ(BuildFailure(spilling).code, ErrorCode::RegionOutOfBounds);
}

TEST(CommandTree, EmptyEachRegion)
{
    Workbook wb;
    Sheet& s = wb.AddSheet("Sheet1");
    Annotate(s, "A1", "jx:area(lastCell=\"C3\")");
    Annotate(s, "B2", "jx:each(items=\"x\" var=\"e\" lastCell=\"A1\")");
    EXPECT_EQ(BuildFailure(wb).code, ErrorCode::EmptyEachRegion);
}

TEST(CommandTree, MultisheetRules)
{
    Workbook nested;
    Sheet& n = nested.AddSheet("Sheet1");
    Annotate(n, "A1", "jx:area(lastCell=\"B3\")");
    Annotate(n, "A2", "jx:each(items=\"a\" var=\"x\" lastCell=\"B3\")");
    Annotate(n, "A3", "jx:each(items=\"x.b\" var=\"y\" multisheet=\"names\" lastCell=\"A3\")");
    EXPECT_EQ(BuildFailure(nested).code, ErrorCode::InvalidOption);

    Workbook twice;
    Sheet& t = twice.AddSheet("Sheet1");
    Annotate(t, "A1", "jx:area(lastCell=\"A1\")\njx:each(items=\"a\" var=\"x\" multisheet=\"n1\" lastCell=\"A1\")");
    Annotate(t, "A3", "jx:area(lastCell=\"A3\")\njx:each(items=\"b\" var=\"y\" multisheet=\"n2\" lastCell=\"A3\")");
    EXPECT_EQ(BuildFailure(twice).code, ErrorCode::InvalidOption);
}

TEST(CommandTree, ParseErrorsStopCollection)
{
    Workbook wb;
    Sheet& s = wb.AddSheet("Sheet1");
    Annotate(s, "A1", "jx:area(lastCell=\"B2\")");
    Annotate(s, "B2", "jx:repeat(lastCell=\"B2\")");

    std::vector<CommandNode> commands;
    std::map<std::pair<std::string, CellKey>, FormulaParams> params;
    Diagnostic err;
    EXPECT_FALSE(CollectCommands(wb, commands, params, err));
    EXPECT_EQ(err.code, ErrorCode::UnknownCommand);
    EXPECT_EQ(err.location, "Sheet1!B2");
}
