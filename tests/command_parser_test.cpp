#include "engine/command.h"

#include <gtest/gtest.h>

#include <string>
#include <variant>

using namespace gridfill;

namespace
{
const CellRef kAnchor{"Sheet1", 1, 0}; // A2

CommandNode ParseOk(const std::string& line)
{
    CommandNode node;
    Diagnostic err;
    EXPECT_TRUE(ParseCommandLine(line, kAnchor, node, err)) << err.ToString();
    return node;
}

ErrorCode ParseFailure(const std::string& line)
{
    CommandNode node;
    Diagnostic err;
    EXPECT_FALSE(ParseCommandLine(line, kAnchor, node, err)) << line;
    return err.code;
}
} // namespace

TEST(CommandParser, AttributesAcceptSeveralQuoteStyles)
{
    std::vector<std::pair<std::string, std::string>> attrs;
    std::string err;
    ASSERT_TRUE(ParseAttributes(R"(items="employees", var='e'  lastCell = "B2")", attrs, err)) << err;
    ASSERT_EQ(attrs.size(), 3u);
    EXPECT_EQ(attrs[0].first, "items");
    EXPECT_EQ(attrs[0].second, "employees");
    EXPECT_EQ(attrs[1].second, "e");
    EXPECT_EQ(attrs[2].first, "lastCell");
    EXPECT_EQ(attrs[2].second, "B2");

    // Spreadsheet autocorrect turns straight quotes into typographic ones.
    ASSERT_TRUE(ParseAttributes("condition=\xE2\x80\x9C" "e.salary > 10" "\xE2\x80\x9D", attrs, err)) << err;
    ASSERT_EQ(attrs.size(), 1u);
    EXPECT_EQ(attrs[0].second, "e.salary > 10");

    ASSERT_TRUE(ParseAttributes(R"(select="e.name == 'Bob'")", attrs, err)) << err;
    EXPECT_EQ(attrs[0].second, "e.name == 'Bob'");
}

TEST(CommandParser, AttributeErrors)
{
    std::vector<std::pair<std::string, std::string>> attrs;
    std::string err;
    EXPECT_FALSE(ParseAttributes("items=employees", attrs, err));
    EXPECT_FALSE(ParseAttributes("items \"employees\"", attrs, err));
    EXPECT_FALSE(ParseAttributes("items=\"employees", attrs, err));
    EXPECT_FALSE(ParseAttributes("=\"x\"", attrs, err));
    EXPECT_FALSE(err.empty());
}

TEST(CommandParser, EachWithAllAttributes)
{
    const CommandNode node = ParseOk(
        R"(jx:each(items="employees" var="e" varIndex="i" direction="right" select="e.salary > 0" )"
        R"(orderBy="e.name DESC" groupBy="e.department" groupOrder="desc" lastCell="C3"))");
    ASSERT_TRUE(std::holds_alternative<EachCommand>(node.body));
    const EachCommand& each = std::get<EachCommand>(node.body);
    EXPECT_EQ(each.items, "employees");
    EXPECT_EQ(each.var, "e");
    EXPECT_EQ(each.var_index, "i");
    EXPECT_EQ(each.direction, Direction::Right);
    EXPECT_EQ(each.select, "e.salary > 0");
    EXPECT_EQ(each.order_by, "e.name DESC");
    EXPECT_EQ(each.group_by, "e.department");
    EXPECT_EQ(each.group_order, "desc");
    EXPECT_EQ(node.region, (Region{"Sheet1", 1, 0, 2, 2}));
    EXPECT_STREQ(CommandName(node.body), "each");
    EXPECT_TRUE(IsContainer(node.body));
}

TEST(CommandParser, OtherCommands)
{
    const CommandNode img = ParseOk(R"(jx:image(src="logo" imageType="jpg" scaleX="0.5" lastCell="B3"))");
    const ImageCommand& image = std::get<ImageCommand>(img.body);
    EXPECT_EQ(image.image_type, "JPG");
    EXPECT_DOUBLE_EQ(image.scale_x, 0.5);
    EXPECT_DOUBLE_EQ(image.scale_y, 1.0);
    EXPECT_FALSE(IsContainer(img.body));

    const CommandNode merge = ParseOk(R"(jx:mergeCells(lastCell="B2" cols="2" rows="${len(e.items)}" minRows="2"))");
    const MergeCellsCommand& m = std::get<MergeCellsCommand>(merge.body);
    EXPECT_EQ(m.cols, "2");
    EXPECT_EQ(m.rows, "${len(e.items)}");
    EXPECT_EQ(m.min_rows, 2);
    EXPECT_EQ(m.min_cols, 0);

    const CommandNode grid = ParseOk(R"(jx:grid(headers="headers" data="rows" props="name, salary" lastCell="B2"))");
    EXPECT_EQ(std::get<GridCommand>(grid.body).props, "name, salary");

    EXPECT_TRUE(std::holds_alternative<AreaCommand>(ParseOk(R"(jx:area(lastCell="D9"))").body));
    EXPECT_TRUE(std::holds_alternative<IfCommand>(ParseOk(R"(jx:if(condition="x" lastCell="A2"))").body));
    EXPECT_TRUE(std::holds_alternative<AutoRowHeightCommand>(ParseOk(R"(jx:autoRowHeight(lastCell="A2"))").body));
}

TEST(CommandParser, IfElseAreas)
{
    const CommandNode bracketed = ParseOk(R"(jx:if(condition="show" lastCell="C2" areas=["A2:C2", "A3:C3"]))");
    const IfCommand& a = std::get<IfCommand>(bracketed.body);
    EXPECT_EQ(a.condition, "show");
    ASSERT_TRUE(a.else_region.has_value());
    EXPECT_EQ(*a.else_region, (Region{"Sheet1", 2, 0, 2, 2}));
    EXPECT_EQ(bracketed.region, (Region{"Sheet1", 1, 0, 1, 2}));

    const CommandNode quoted = ParseOk(R"(jx:if(condition="show" areas="A2:A2, Sheet1!B4" lastCell="A2"))");
    ASSERT_TRUE(std::get<IfCommand>(quoted.body).else_region.has_value());
    EXPECT_EQ(*std::get<IfCommand>(quoted.body).else_region, (Region{"Sheet1", 3, 1, 3, 1}));

    // A single entry names only the if block.
    EXPECT_FALSE(std::get<IfCommand>(ParseOk(R"(jx:if(condition="x" lastCell="A2" areas=["A2:A2"]))").body)
                     .else_region.has_value());
    // "areas" inside a quoted value is not the list.
    EXPECT_FALSE(std::get<IfCommand>(ParseOk(R"(jx:if(condition="areas=[1]" lastCell="A2"))").body)
                     .else_region.has_value());

    EXPECT_EQ(ParseFailure(R"(jx:if(condition="x" lastCell="A2" areas=["A2:A2", "Other!A3:A3"]))"),
              ErrorCode::MalformedCommand);
    EXPECT_EQ(ParseFailure(R"(jx:if(condition="x" lastCell="A2" areas=["A2:A2", "A3:A3"))"),
              ErrorCode::MalformedCommand);
    EXPECT_EQ(ParseFailure(R"(jx:if(condition="x" lastCell="A2" areas=["A2:A2", "B4:A3"]))"),
              ErrorCode::RegionOutOfBounds);
    // Only jx:if takes a bracketed list.
    EXPECT_EQ(ParseFailure(R"(jx:area(lastCell="A2" areas=["A2:A2"]))"), ErrorCode::MalformedCommand);
}

TEST(CommandParser, Errors)
{
    EXPECT_EQ(ParseFailure(R"(jx:loop(items="x" lastCell="A2"))"), ErrorCode::UnknownCommand);
    EXPECT_EQ(ParseFailure(R"(jx:each(items="x" lastCell="A2"))"), ErrorCode::MissingAttribute);
    EXPECT_EQ(ParseFailure(R"(jx:each(items="x" var=" " lastCell="A2"))"), ErrorCode::MissingAttribute);
    EXPECT_EQ(ParseFailure(R"(jx:area(lastCell="A2")))"), ErrorCode::MalformedCommand);
    EXPECT_EQ(ParseFailure(R"(jx:area lastCell="A2")"), ErrorCode::MalformedCommand);
    EXPECT_EQ(ParseFailure(R"(jx:area(lastCell="2A"))"), ErrorCode::MalformedCommand);
    EXPECT_EQ(ParseFailure(R"(jx:each(items="x" var="e" direction="UP" lastCell="A2"))"), ErrorCode::MalformedCommand);
    EXPECT_EQ(ParseFailure(R"(jx:image(src="x" imageType="PNG" scaleX="-1" lastCell="A2"))"),
              ErrorCode::MalformedCommand);
    EXPECT_EQ(ParseFailure(R"(jx:mergeCells(lastCell="A2" cols="1" rows="1" minCols="many"))"),
              ErrorCode::MalformedCommand);
    EXPECT_EQ(ParseFailure(R"(jx:area(lastCell="Other!B5"))"), ErrorCode::RegionOutOfBounds);

    CommandNode node;
    Diagnostic err;
    ASSERT_FALSE(ParseCommandLine(R"(jx:loop(lastCell="A2"))", kAnchor, node, err));
    EXPECT_EQ(err.location, "Sheet1!A2");
    EXPECT_EQ(err.Category(), ErrorCategory::Parse);
}

TEST(CommandParser, AnnotationMixesCommandsParamsAndText)
{
    const std::string comment = "Reviewed by finance\n"
                                "jx:area(lastCell=\"C5\")\r\n"
                                "  jx:params(formulaStrategy=\"BY_COLUMN\" defaultValue=\"NA\")\n"
                                "jx:each(items=\"rows\" var=\"r\" lastCell=\"C2\")\n"
                                "second note";
    ParsedAnnotation parsed;
    Diagnostic err;
    ASSERT_TRUE(ParseAnnotation(comment, kAnchor, parsed, err)) << err.ToString();
    ASSERT_EQ(parsed.commands.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<AreaCommand>(parsed.commands[0].body));
    EXPECT_TRUE(std::holds_alternative<EachCommand>(parsed.commands[1].body));
    ASSERT_TRUE(parsed.params.has_value());
    EXPECT_EQ(parsed.params->strategy, FormulaStrategy::ByColumn);
    EXPECT_EQ(parsed.params->default_value.value_or(""), "NA");
    EXPECT_EQ(parsed.plain_text, "Reviewed by finance\nsecond note");

    EXPECT_FALSE(ParseAnnotation("jx:params(formulaStrategy=\"SIDEWAYS\")", kAnchor, parsed, err));
    EXPECT_EQ(err.code, ErrorCode::MalformedCommand);
}

TEST(CommandParser, CommentLineHelpers)
{
    EXPECT_TRUE(HasCommandLines("note\n  jx:area(lastCell=\"A1\")"));
    EXPECT_FALSE(HasCommandLines("just a note about jx:area"));
    EXPECT_EQ(StripCommandLines("note\njx:area(lastCell=\"A1\")\n\nmore"), "note\nmore");
    EXPECT_EQ(StripCommandLines("jx:area(lastCell=\"A1\")"), "");
    EXPECT_EQ(StripCommandLines("untouched\n\ntext"), "untouched\n\ntext");
}

TEST(CommandParser, ListAttributes)
{
    const std::vector<std::string> parts = SplitAttributeList(" name, default(e.x, 'a,b') ,, \"c,d\" ");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "name");
    EXPECT_EQ(parts[1], "default(e.x, 'a,b')");
    EXPECT_EQ(parts[2], "\"c,d\"");

    const std::vector<SortKey> keys = ParseOrderBy("e.department ASC, e.salary desc, e.name");
    ASSERT_EQ(keys.size(), 3u);
    EXPECT_EQ(keys[0].expression, "e.department");
    EXPECT_FALSE(keys[0].descending);
    EXPECT_EQ(keys[1].expression, "e.salary");
    EXPECT_TRUE(keys[1].descending);
    EXPECT_EQ(keys[2].expression, "e.name");
    EXPECT_FALSE(keys[2].descending);
    EXPECT_TRUE(ParseOrderBy("  ").empty());
}
