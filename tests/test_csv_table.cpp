#include <gtest/gtest.h>

#include "gesture_slicer/csv_table.hpp"

#include "test_support.hpp"

namespace gesture_slicer {

class CsvTableTest : public ::testing::Test {};

TEST_F(CsvTableTest, ParsesHeaderAndRows) {
  auto table = CsvTable::parse("a,b\n1,2\n\n3,4\r\n");
  ASSERT_EQ(table.header().size(), 2u);
  EXPECT_EQ(table.header()[0], "a");
  EXPECT_EQ(table.header()[1], "b");
  ASSERT_EQ(table.row_count(), 2u);
  EXPECT_EQ(table.rows()[1][1], "4");
  EXPECT_EQ(table.delimiter(), ',');
}

TEST_F(CsvTableTest, SniffsSemicolonDelimiter) {
  auto table = CsvTable::parse("timestamp;frame_index\n10.5;0\n");
  EXPECT_EQ(table.delimiter(), ';');
  ASSERT_EQ(table.row_count(), 1u);
  EXPECT_EQ(table.rows()[0][0], "10.5");
  EXPECT_EQ(table.rows()[0][1], "0");
}

TEST_F(CsvTableTest, SkipsByteOrderMark) {
  auto table = CsvTable::parse("\xEF\xBB\xBFtimestamp,frame\n1,0\n");
  ASSERT_TRUE(table.column({"timestamp"}).has_value());
  EXPECT_EQ(*table.column({"timestamp"}), 0u);
}

TEST_F(CsvTableTest, HandlesQuotedFields) {
  auto table = CsvTable::parse("name,note\n\"x, y\",\"say \"\"hi\"\"\"\n");
  ASSERT_EQ(table.row_count(), 1u);
  EXPECT_EQ(table.rows()[0][0], "x, y");
  EXPECT_EQ(table.rows()[0][1], "say \"hi\"");
}

TEST_F(CsvTableTest, ColumnLookupIgnoresCaseAndSpaces) {
  auto table = CsvTable::parse(" Timestamp ,Frame\n1,2\n");
  EXPECT_EQ(table.column({"timestamp", "time"}), std::optional<size_t>(0));
  EXPECT_EQ(table.column({"frame_index", "frame"}), std::optional<size_t>(1));
  EXPECT_FALSE(table.column({"gesture_name"}).has_value());
}

TEST_F(CsvTableTest, EmptyTextHasNoHeader) {
  auto table = CsvTable::parse("\n\n");
  EXPECT_TRUE(table.header().empty());
  EXPECT_EQ(table.row_count(), 0u);
}

TEST_F(CsvTableTest, LoadReadsFileAndRejectsMissingOne) {
  testing_support::ScratchDir dir;
  testing_support::write_file(dir.file("log.csv"), "timestamp\n1\n2\n");

  CsvTable table;
  ASSERT_TRUE(CsvTable::load(dir.file("log.csv"), table));
  EXPECT_EQ(table.row_count(), 2u);

  CsvTable missing;
  EXPECT_FALSE(CsvTable::load(dir.file("nope.csv"), missing));
}

TEST_F(CsvTableTest, EscapeQuotesOnlyWhenNeeded) {
  EXPECT_EQ(csv_escape("plain"), "plain");
  EXPECT_EQ(csv_escape("a,b"), "\"a,b\"");
  EXPECT_EQ(csv_escape("say \"hi\""), "\"say \"\"hi\"\"\"");
  EXPECT_EQ(csv_escape("two\nlines"), "\"two\nlines\"");
}

TEST_F(CsvTableTest, EscapedFieldParsesBack) {
  const std::string name = "wave, \"big\"";
  auto table = CsvTable::parse("gesture_name\n" + csv_escape(name) + "\n");
  ASSERT_EQ(table.row_count(), 1u);
  EXPECT_EQ(table.rows()[0][0], name);
}

} // namespace gesture_slicer
