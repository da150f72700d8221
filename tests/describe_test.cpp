#include "engine/describe.h"

#include "test_support.h"

#include <gtest/gtest.h>

using namespace gridfill;
using test::Annotate;
using test::Put;

namespace
{
Workbook ReportTemplate()
{
    Workbook wb;
    Sheet& s = wb.AddSheet("Report");
    Put(s, "A1", "Name");
    Annotate(s, "A1", "jx:area(lastCell=\"B3\")");
    Put(s, "A2", "${e.name}");
    Annotate(s, "A2", "jx:each(items=\"employees\" var=\"e\" lastCell=\"B2\")");
    Annotate(s, "A3", "jx:image(src=\"logo\" imageType=\"png\" scaleX=\"0.5\" lastCell=\"A3\")");
    test::PutFormula(s, "B3", "SUM(B2)");
    Annotate(s, "B3", "jx:params(formulaStrategy=\"BY_COLUMN\" defaultValue=\"1\")");
    Put(wb.AddSheet("Notes"), "A1", "free text");
    return wb;
}

bool HasIssue(const std::vector<ValidationIssue>& issues, IssueSeverity severity, ErrorCode code, const std::string& at)
{
    for (const ValidationIssue& i : issues)
        if (i.severity == severity && i.diagnostic.code == code && i.diagnostic.location == at)
            return true;
    return false;
}
} // namespace

TEST(DescribeTemplate, PrintsTheCommandOutline)
{
    std::string text;
    Diagnostic err;
    ASSERT_TRUE(DescribeTemplate(ReportTemplate(), text, err)) << err.ToString();
    EXPECT_EQ(text,
              "Sheet 'Report'\n"
              "  jx:area A1:B3\n"
              "    jx:each A2:B2 items=\"employees\" var=\"e\"\n"
              "    jx:image A3:A3 src=\"logo\" imageType=\"PNG\" scaleX=\"0.5\"\n"
              "  jx:params B3 formulaStrategy=BY_COLUMN defaultValue=\"1\"\n"
              "Sheet 'Notes' (static)\n");
}

TEST(DescribeTemplate, ListsTheElseBranchUnderItsIf)
{
    Workbook wb;
    Sheet& s = wb.AddSheet("Sheet1");
    Annotate(s, "A1", "jx:area(lastCell=\"B4\")");
    Annotate(s, "A2", "jx:if(condition=\"vip\" lastCell=\"B2\" areas=[\"A2:B2\", \"A3:B4\"])");
    Annotate(s, "A4", "jx:each(items=\"rows\" var=\"r\" lastCell=\"B4\")");

    std::string text;
    Diagnostic err;
    ASSERT_TRUE(DescribeTemplate(wb, text, err)) << err.ToString();
    EXPECT_EQ(text,
              "Sheet 'Sheet1'\n"
              "  jx:area A1:B4\n"
              "    jx:if A2:B2 condition=\"vip\"\n"
              "      else A3:B4\n"
              "        jx:each A4:B4 items=\"rows\" var=\"r\"\n");
}

TEST(DescribeTemplate, FailsOnAnInvalidTree)
{
    Workbook wb;
    Sheet& s = wb.AddSheet("Sheet1");
    Annotate(s, "A1", "jx:area(lastCell=\"A2\")");
    Annotate(s, "C5", "jx:each(items=\"x\" var=\"e\" lastCell=\"C5\")");

    std::string text = "stale";
    Diagnostic err;
    EXPECT_FALSE(DescribeTemplate(wb, text, err));
    EXPECT_EQ(err.code, ErrorCode::RegionOutOfBounds);
    EXPECT_TRUE(text.empty());
}

TEST(ValidateTemplate, CleanTemplateHasNoIssues)
{
    std::vector<ValidationIssue> issues;
    EXPECT_TRUE(ValidateTemplate(ReportTemplate(), FillOptions(), issues));
    EXPECT_TRUE(issues.empty());
}

TEST(ValidateTemplate, RejectsEmptyNotation)
{
    FillOptions options;
    options.notation_begin.clear();
    std::vector<ValidationIssue> issues;
    EXPECT_FALSE(ValidateTemplate(ReportTemplate(), options, issues));
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].diagnostic.code, ErrorCode::InvalidOption);
}

TEST(ValidateTemplate, ParseErrorsStopValidation)
{
    Workbook wb = ReportTemplate();
    Annotate(wb.SheetAt(0), "B2", "jx:repeat(lastCell=\"B2\")");

    std::vector<ValidationIssue> issues;
    EXPECT_FALSE(ValidateTemplate(wb, FillOptions(), issues));
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].diagnostic.code, ErrorCode::UnknownCommand);
    EXPECT_EQ(issues[0].diagnostic.location, "Report!B2");
}

TEST(ValidateTemplate, ReportsEveryMalformedExpression)
{
    Workbook wb;
    Sheet& s = wb.AddSheet("Sheet1");
    Annotate(s, "A1", "jx:area(lastCell=\"B3\")");
    Annotate(s, "A2", "jx:each(items=\"employees\" var=\"e\" select=\"e.salary >\" lastCell=\"B2\")");
    Put(s, "A2", "${e.name}");
    Put(s, "B2", "total: ${1 +}");
    Annotate(s, "A3", "jx:mergeCells(lastCell=\"B3\" cols=\"2\" rows=\"(\")");

    std::vector<ValidationIssue> issues;
    EXPECT_FALSE(ValidateTemplate(wb, FillOptions(), issues));
    EXPECT_EQ(issues.size(), 3u);
    EXPECT_TRUE(HasIssue(issues, IssueSeverity::Error, ErrorCode::MalformedExpression, "Sheet1!A2"));
    EXPECT_TRUE(HasIssue(issues, IssueSeverity::Error, ErrorCode::MalformedExpression, "Sheet1!B2"));
    EXPECT_TRUE(HasIssue(issues, IssueSeverity::Error, ErrorCode::MalformedExpression, "Sheet1!A3"));
}

TEST(ValidateTemplate, TreeErrorsDoNotHideExpressionErrors)
{
    Workbook wb;
    Sheet& s = wb.AddSheet("Sheet1");
    Annotate(s, "A1", "jx:area(lastCell=\"B2\")");
    Annotate(s, "B2", "jx:area(lastCell=\"C3\")");
    Put(s, "A1", "${(}");

    std::vector<ValidationIssue> issues;
    EXPECT_FALSE(ValidateTemplate(wb, FillOptions(), issues));
    EXPECT_TRUE(HasIssue(issues, IssueSeverity::Error, ErrorCode::OverlappingCommands, "Sheet1!B2") ||
                HasIssue(issues, IssueSeverity::Error, ErrorCode::OverlappingCommands, "Sheet1!A1"));
    EXPECT_TRUE(HasIssue(issues, IssueSeverity::Error, ErrorCode::MalformedExpression, "Sheet1!A1"));
}

TEST(ValidateTemplate, PlaceholdersOutsideAreasAreWarnings)
{
    Workbook wb = ReportTemplate();
    Put(wb.SheetAt(1), "C10", "Printed ${date}");

    std::vector<ValidationIssue> issues;
    EXPECT_TRUE(ValidateTemplate(wb, FillOptions(), issues));
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].severity, IssueSeverity::Warning);
    EXPECT_EQ(issues[0].diagnostic.code, ErrorCode::RegionOutOfBounds);
    EXPECT_EQ(issues[0].diagnostic.location, "Notes!C10");
    EXPECT_STREQ(IssueSeverityName(issues[0].severity), "warning");
}
