#include <gtest/gtest.h>
#include "etf/panel.hpp"

#include <sstream>

namespace {

PanelSchema schema() {
    PanelSchema s;
    s.countryColumn   = "Country";
    s.indicatorColumn = "Code";
    s.firstYear       = 2020;
    s.lastYear        = 2025;
    return s;
}

}  // namespace

TEST(PanelLoaderTest, ParsesYearColumnsAndIgnoresOthers) {
    std::istringstream in("Country,Code,Units,2021,2022,Notes\n"
                          "Canada,LUR,Percent,5.1,n/a,x\n"
                          "\"Korea, Republic of\",NGDPD,USD,\"1,810.96\",\"1,673.92\",\n");

    const auto panel = PanelLoader::parse(in, schema());
    ASSERT_NE(panel, nullptr);
    ASSERT_EQ(panel->records.size(), 4u);

    EXPECT_EQ(panel->records[0].country, "Canada");
    EXPECT_EQ(panel->records[0].year, 2021);
    EXPECT_DOUBLE_EQ(*panel->records[0].value, 5.1);
    EXPECT_FALSE(panel->records[1].value.has_value());

    EXPECT_EQ(panel->records[2].country, "Korea, Republic of");
    EXPECT_DOUBLE_EQ(*panel->records[2].value, 1810.96);
}

TEST(PanelLoaderTest, MissingIndicatorColumnFails) {
    std::istringstream in("Country,Subject,2021\nCanada,LUR,5.1\n");
    EXPECT_EQ(PanelLoader::parse(in, schema()), nullptr);
}

TEST(PanelLoaderTest, NoYearColumnFails) {
    std::istringstream in("Country,Code,1999,Estimates\nCanada,LUR,5.1,2020\n");
    EXPECT_EQ(PanelLoader::parse(in, schema()), nullptr);
}

TEST(PanelLoaderTest, DuplicateCellKeepsFirst) {
    std::istringstream in("Country,Code,2021\nCanada,LUR,5.1\nCanada,LUR,9.9\n");

    const auto panel = PanelLoader::parse(in, schema());
    ASSERT_NE(panel, nullptr);
    ASSERT_EQ(panel->records.size(), 1u);
    EXPECT_DOUBLE_EQ(*panel->records[0].value, 5.1);
}

TEST(PanelLoaderTest, ShortRowsAndBlankKeys) {
    std::istringstream in("Country,Code,2021,2022\r\nCanada,LUR,5.1\r\n,LUR,1.0,2.0\r\n\r\n");

    const auto panel = PanelLoader::parse(in, schema());
    ASSERT_NE(panel, nullptr);
    ASSERT_EQ(panel->records.size(), 2u);
    EXPECT_FALSE(panel->records[1].value.has_value());
}

TEST(PanelLoaderTest, ParseValue) {
    EXPECT_DOUBLE_EQ(*PanelLoader::parseValue(" -3.25 "), -3.25);
    EXPECT_DOUBLE_EQ(*PanelLoader::parseValue("12,345.5"), 12345.5);
    EXPECT_FALSE(PanelLoader::parseValue("").has_value());
    EXPECT_FALSE(PanelLoader::parseValue("--").has_value());
    EXPECT_FALSE(PanelLoader::parseValue("..").has_value());
    EXPECT_FALSE(PanelLoader::parseValue("abc").has_value());
}

TEST(PanelLoaderTest, QuotedFieldsWithEscapedQuotes) {
    std::istringstream in("Country,Code,Notes,2021\n"
                          "\"Bahamas, The\",LUR,\"say \"\"hi\"\"\",4.2\n");

    const auto panel = PanelLoader::parse(in, schema());
    ASSERT_NE(panel, nullptr);
    ASSERT_EQ(panel->records.size(), 1u);
    EXPECT_EQ(panel->records[0].country, "Bahamas, The");
    EXPECT_DOUBLE_EQ(*panel->records[0].value, 4.2);
}

TEST(PanelLoaderTest, QuotedFieldSpansLines) {
    std::istringstream in("Country,Code,Notes,2023\r\n"
                          "Canada,LUR,\"see\r\nnote\",5.4\r\n"
                          "Norway,LUR,,3.6\r\n");

    const auto panel = PanelLoader::parse(in, schema());
    ASSERT_NE(panel, nullptr);
    ASSERT_EQ(panel->records.size(), 2u);

    EXPECT_EQ(panel->records[0].country, "Canada");
    EXPECT_EQ(panel->records[0].indicator, "LUR");
    EXPECT_EQ(panel->records[0].year, 2023);
    ASSERT_TRUE(panel->records[0].value.has_value());
    EXPECT_DOUBLE_EQ(*panel->records[0].value, 5.4);

    EXPECT_EQ(panel->records[1].country, "Norway");
    EXPECT_DOUBLE_EQ(*panel->records[1].value, 3.6);
}

TEST(PanelLoaderTest, ByteOrderMarkIsIgnored) {
    std::istringstream in("\xEF\xBB\xBF"
                          "Country,Code,2021\nCanada,LUR,5.1\n");

    const auto panel = PanelLoader::parse(in, schema());
    ASSERT_NE(panel, nullptr);
    ASSERT_EQ(panel->records.size(), 1u);
}

TEST(PanelLoaderTest, LoadMissingFileFails) {
    EXPECT_EQ(PanelLoader::load("/nonexistent/panel.csv", schema()), nullptr);
}
