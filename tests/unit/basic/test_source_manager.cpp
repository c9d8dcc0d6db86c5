// tests/unit/basic/test_source_manager.cpp - Source registry and line tables
//
#include <gtest/gtest.h>

#include <string>

#include "cfgc/basic/source_manager.hpp"

using namespace cfgc;

TEST(BasicSourceFile, LineColumnIsOneBased)
{
  const SourceFile file("a.c", "int x;\nint y;\n");
  EXPECT_EQ(file.line_count(), 3U);

  const LineColumn start = file.get_line_column(0);
  EXPECT_EQ(start.line, 1U);
  EXPECT_EQ(start.column, 1U);

  const LineColumn y = file.get_line_column(11);
  EXPECT_EQ(y.line, 2U);
  EXPECT_EQ(y.column, 5U);
}

TEST(BasicSourceFile, OffsetsPastTheEndClamp)
{
  const SourceFile file("a.c", "ab");
  const LineColumn lc = file.get_line_column(100);
  EXPECT_EQ(lc.line, 1U);
  EXPECT_EQ(lc.column, 3U);
}

TEST(BasicSourceFile, GetLineStripsTerminators)
{
  const SourceFile file("a.c", "first\r\nsecond\nthird");
  EXPECT_EQ(file.get_line(0), "first");
  EXPECT_EQ(file.get_line(1), "second");
  EXPECT_EQ(file.get_line(2), "third");
  EXPECT_TRUE(file.get_line(3).empty());
}

TEST(BasicSourceFile, SliceAndFullRange)
{
  const SourceFile file("a.c", "int main() {\n  return 0;\n}\n");
  const SourceRange range(FileId{0}, 15, 24);
  EXPECT_EQ(file.get_slice(range), "return 0;");

  const FullSourceRange fr = file.get_full_range(range);
  EXPECT_EQ(fr.start_line, 2U);
  EXPECT_EQ(fr.start_column, 3U);
  EXPECT_EQ(fr.end_line, 2U);
  EXPECT_EQ(fr.end_column, 12U);
  EXPECT_EQ(fr.start_byte, 15U);

  EXPECT_TRUE(file.get_slice(SourceRange{}).empty());
  EXPECT_FALSE(file.get_full_range(SourceRange{}).is_valid());
}

TEST(BasicSourceRegistry, RegisteringTheSamePathTwiceReturnsSameId)
{
  SourceRegistry registry;
  const FileId a = registry.register_file("dir/a.c", "int a;");
  const FileId b = registry.register_file("dir/b.c", "int b;");
  const FileId again = registry.register_file("dir/./a.c", "ignored");

  EXPECT_TRUE(a.is_valid());
  EXPECT_NE(a, b);
  EXPECT_EQ(a, again);
  EXPECT_EQ(registry.size(), 2U);
  EXPECT_EQ(registry.get_file(a)->content(), "int a;");

  const auto found = registry.find_by_path("dir/b.c");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, b);
  EXPECT_FALSE(registry.find_by_path("dir/c.c").has_value());
}

TEST(BasicSourceRegistry, LookupsThroughRanges)
{
  SourceRegistry registry;
  const FileId id = registry.register_file("m.c", "x = 1;\ny = 2;");
  const SourceRange range(id, 7, 8);
  EXPECT_EQ(registry.get_slice(range), "y");
  EXPECT_EQ(registry.get_full_range(range).start_line, 2U);
  EXPECT_EQ(registry.get_path(id), fs::path("m.c"));

  EXPECT_EQ(registry.get_file(FileId::invalid()), nullptr);
  EXPECT_TRUE(registry.get_path(FileId{42}).empty());
  EXPECT_TRUE(registry.get_slice(SourceRange(FileId{42}, 0, 1)).empty());
}

TEST(BasicSourceRange, JoinRanges)
{
  const SourceRange a(FileId{0}, 2, 5);
  const SourceRange b(FileId{0}, 9, 12);
  const SourceRange joined = join_ranges(a, b);
  EXPECT_EQ(joined.get_begin().offset(), 2U);
  EXPECT_EQ(joined.get_end().offset(), 12U);
  EXPECT_EQ(joined.size(), 10U);
  EXPECT_EQ(join_ranges(SourceRange{}, b), b);
}
