#include "engine/filler.h"

#include "io/formats/packed_workbook.h"
#include "io/formats/workbook_json.h"
#include "io/grid_document_adapter.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>

using namespace gridfill;
using test::Annotate;
using test::Put;
using test::TextAt;

namespace
{
Workbook NamesTemplate()
{
    Workbook wb;
    Sheet& s = wb.AddSheet("Staff");
    Put(s, "A1", "${e.name}");
    Annotate(s, "A1", "jx:area(lastCell=\"A1\")\njx:each(items=\"employees\" var=\"e\" lastCell=\"A1\")");
    return wb;
}

std::vector<std::uint8_t> Encode(const Workbook& wb)
{
    std::vector<std::uint8_t> bytes;
    std::string err;
    EXPECT_TRUE(formats::workbook_json::EncodeBytes(wb, bytes, err)) << err;
    return bytes;
}

class FillToPathTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_dir = std::filesystem::temp_directory_path() / (std::string("gridfill_") + info->name());
        std::filesystem::remove_all(m_dir);
        std::filesystem::create_directories(m_dir);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    std::string PathOf(const std::string& name) const { return (m_dir / name).string(); }

    std::filesystem::path m_dir;
};
} // namespace

TEST(FillWorkbook, DataMustBeAMapping)
{
    Workbook out;
    const FillResult r = FillWorkbook(NamesTemplate(), test::ParseData("[1, 2]"), FillOptions(), out);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error.code, ErrorCode::InvalidOption);
    EXPECT_EQ(out.SheetCount(), 0u);
}

TEST(FillWorkbook, NullDataBindsNothing)
{
    Workbook out;
    const FillResult r = FillWorkbook(NamesTemplate(), Value(), FillOptions(), out);
    EXPECT_TRUE(r.ok);
    ASSERT_EQ(r.diagnostics.size(), 1u);
    EXPECT_EQ(r.diagnostics[0].code, ErrorCode::UnresolvedVariable);
    EXPECT_EQ(r.diagnostics[0].location, "Staff!A1");
    ASSERT_EQ(out.SheetCount(), 1u);
    EXPECT_TRUE(out.SheetAt(0).Cells().empty());
}

TEST(FillWorkbook, TemplateIsReusable)
{
    const Workbook tmpl = NamesTemplate();
    Workbook first;
    Workbook second;
    ASSERT_TRUE(FillWorkbook(tmpl, test::Employees(), FillOptions(), first).ok);
    ASSERT_TRUE(FillWorkbook(tmpl, test::ParseData(R"({"employees": [{"name": "Dave"}]})"), FillOptions(), second).ok);
    EXPECT_EQ(TextAt(first.SheetAt(0), "A3"), "Carol");
    EXPECT_EQ(TextAt(second.SheetAt(0), "A1"), "Dave");
    EXPECT_EQ(second.SheetAt(0).Cells().size(), 1u);
    EXPECT_EQ(TextAt(tmpl.SheetAt(0), "A1"), "${e.name}");
}

TEST(FillWorkbook, InvalidTemplateFailsBeforeRendering)
{
    Workbook tmpl = NamesTemplate();
    Annotate(tmpl.SheetAt(0), "C3", "jx:if(condition=\"x\" lastCell=\"C3\")");
    Workbook out;
    const FillResult r = FillWorkbook(tmpl, test::Employees(), FillOptions(), out);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error.code, ErrorCode::RegionOutOfBounds);
    EXPECT_EQ(r.error.location, "Staff!C3");
}

TEST(FillToBytes, KeepsTheTemplateFormatByDefault)
{
    std::vector<std::uint8_t> out;
    const FillResult r = FillToBytes(Encode(NamesTemplate()), test::Employees(), FillOptions(), out);
    ASSERT_TRUE(r.ok) << r.error.ToString();
    ASSERT_EQ(DetectAdapter(out), FindAdapterByName("json"));

    Workbook filled;
    std::string err;
    ASSERT_TRUE(formats::workbook_json::DecodeBytes(out, filled, err)) << err;
    EXPECT_EQ(TextAt(filled.SheetAt(0), "A2"), "Bob");
}

TEST(FillToBytes, ConvertsToTheRequestedFormat)
{
    std::vector<std::uint8_t> out;
    const FillResult r = FillToBytes(Encode(NamesTemplate()), test::Employees(), FillOptions(), out, "gfw");
    ASSERT_TRUE(r.ok) << r.error.ToString();
    ASSERT_TRUE(formats::packed_workbook::HasHeader(out));

    Workbook filled;
    std::string err;
    ASSERT_TRUE(formats::packed_workbook::DecodeBytes(out, filled, err)) << err;
    EXPECT_EQ(TextAt(filled.SheetAt(0), "A3"), "Carol");
}

TEST(FillToBytes, FormatErrors)
{
    std::vector<std::uint8_t> out;
    const FillResult unknown = FillToBytes(Encode(NamesTemplate()), test::Employees(), FillOptions(), out, "xlsb");
    EXPECT_FALSE(unknown.ok);
    EXPECT_EQ(unknown.error.code, ErrorCode::Format);

    const std::string garbage = "not a workbook";
    const FillResult unrecognized =
        FillToBytes(std::vector<std::uint8_t>(garbage.begin(), garbage.end()), Value(), FillOptions(), out);
    EXPECT_FALSE(unrecognized.ok);
    EXPECT_EQ(unrecognized.error.code, ErrorCode::Format);
    EXPECT_EQ(unrecognized.error.message, "Unrecognized template format.");
    EXPECT_EQ(unrecognized.error.Category(), ErrorCategory::Adapter);

    const std::string broken = "{\"sheets\": 3}";
    const FillResult malformed =
        FillToBytes(std::vector<std::uint8_t>(broken.begin(), broken.end()), Value(), FillOptions(), out);
    EXPECT_EQ(malformed.error.code, ErrorCode::Format);
    EXPECT_TRUE(out.empty());
}

TEST(FillStream, ReadsAndWritesTheSameFormat)
{
    const std::vector<std::uint8_t> bytes = Encode(NamesTemplate());
    std::istringstream in(std::string(bytes.begin(), bytes.end()));
    std::ostringstream out;
    const FillResult r = FillStream(in, out, test::Employees(), FillOptions());
    ASSERT_TRUE(r.ok) << r.error.ToString();

    const std::string text = out.str();
    Workbook filled;
    std::string err;
    ASSERT_TRUE(formats::workbook_json::DecodeBytes(std::vector<std::uint8_t>(text.begin(), text.end()), filled, err))
        << err;
    EXPECT_EQ(TextAt(filled.SheetAt(0), "A1"), "Alice");
}

TEST_F(FillToPathTest, WritesThroughTheOutputExtension)
{
    std::string err;
    ASSERT_TRUE(WriteWorkbookFile(PathOf("staff.json"), NamesTemplate(), err)) << err;

    const FillResult r = FillToPath(PathOf("staff.json"), test::Employees(), PathOf("out/staff.GFW"), FillOptions());
    ASSERT_TRUE(r.ok) << r.error.ToString();

    std::vector<std::uint8_t> written;
    ASSERT_TRUE(ReadAllBytes(PathOf("out/staff.GFW"), written, err)) << err;
    EXPECT_TRUE(formats::packed_workbook::HasHeader(written));
    EXPECT_FALSE(std::filesystem::exists(PathOf("out/staff.GFW.tmp")));

    Workbook filled;
    ASSERT_TRUE(ReadWorkbookFile(PathOf("out/staff.GFW"), filled, err)) << err;
    EXPECT_EQ(TextAt(filled.SheetAt(0), "A2"), "Bob");
}

TEST_F(FillToPathTest, ReportsIoAndFormatErrors)
{
    const FillResult missing = FillToPath(PathOf("missing.json"), Value(), PathOf("out.json"), FillOptions());
    EXPECT_FALSE(missing.ok);
    EXPECT_EQ(missing.error.code, ErrorCode::Io);

    const FillResult no_format = FillToPath(PathOf("missing.json"), Value(), PathOf("out.xlsx"), FillOptions());
    EXPECT_EQ(no_format.error.code, ErrorCode::Format);
    EXPECT_FALSE(std::filesystem::exists(PathOf("out.xlsx")));
}

TEST_F(FillToPathTest, FillsATemplateFileIntoBytes)
{
    std::string err;
    ASSERT_TRUE(WriteWorkbookFile(PathOf("staff.gfw"), NamesTemplate(), err)) << err;

    std::vector<std::uint8_t> out;
    const FillResult r = FillToBytes(PathOf("staff.gfw"), test::Employees(), FillOptions(), out);
    ASSERT_TRUE(r.ok) << r.error.ToString();
    ASSERT_TRUE(formats::packed_workbook::HasHeader(out));

    Workbook filled;
    ASSERT_TRUE(formats::packed_workbook::DecodeBytes(out, filled, err)) << err;
    EXPECT_EQ(TextAt(filled.SheetAt(0), "A3"), "Carol");

    std::vector<std::uint8_t> as_json;
    ASSERT_TRUE(FillToBytes(PathOf("staff.gfw"), test::Employees(), FillOptions(), as_json, "json").ok);
    EXPECT_EQ(DetectAdapter(as_json), FindAdapterByName("json"));
}

TEST_F(FillToPathTest, FillToBytesReportsAMissingTemplate)
{
    std::vector<std::uint8_t> out;
    const FillResult r = FillToBytes(PathOf("missing.json"), Value(), FillOptions(), out);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error.code, ErrorCode::Io);
    EXPECT_TRUE(out.empty());
}
