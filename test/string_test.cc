#include "ob/string.hh"

#include <gtest/gtest.h>

#include <string>
#include <regex>
#include <vector>

TEST(String, SplitSkipsRepeatedDelimiters)
{
  std::vector<std::string> const expected {"goto", "1", "7"};

  EXPECT_EQ(OB::String::split("goto  1 7", " "), expected);
  EXPECT_TRUE(OB::String::split("", " ").empty());
}

TEST(String, SplitHonoursLimit)
{
  std::vector<std::string> const expected {"open", "a b c"};

  EXPECT_EQ(OB::String::split("open a b c", " ", 1), expected);
}

TEST(String, TrimAndJoin)
{
  EXPECT_EQ(OB::String::trim(" \t max-words 5 \r\n"), "max-words 5");
  EXPECT_EQ(OB::String::trim("   "), "");
  EXPECT_EQ(OB::String::join({"a", "b", "c"}, " "), "a b c");
  EXPECT_EQ(OB::String::join({}, " "), "");
}

TEST(String, Lowercase)
{
  EXPECT_EQ(OB::String::lowercase("CHAPTER One"), "chapter one");
}

TEST(String, MatchReturnsGroups)
{
  auto const res = OB::String::match("window 2 3",
    std::regex("^window(?:\\s+([0-9]+)\\s+([0-9]+))?$"));

  ASSERT_TRUE(res);
  EXPECT_EQ(res.value().at(1), "2");
  EXPECT_EQ(res.value().at(2), "3");

  EXPECT_FALSE(OB::String::match("window x", std::regex("^window\\s+([0-9]+)$")));
  EXPECT_TRUE(OB::String::assert_rx("# note", std::regex("^#[^\\r]*$")));
}
