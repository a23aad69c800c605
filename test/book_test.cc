#include "slidr/book.hh"

#include <gtest/gtest.h>

#include <string>
#include <sstream>

namespace
{

Slidr::Book parse(std::string const& text, std::string const& name = "book.txt")
{
  Slidr::Book book;
  std::istringstream input {text};
  book.parse(input, name);

  return book;
}

} // namespace

TEST(Book, TextWithoutMarkersIsOneChapter)
{
  auto const book = parse("One two. Three.\n");

  ASSERT_EQ(book.size(), 1u);
  EXPECT_EQ(book.name(), "book.txt");
  EXPECT_EQ(book.at(0).title, "book.txt");
  EXPECT_EQ(book.at(0).chapter_index, 0u);
  EXPECT_EQ(book.at(0).word_count, 3u);
  EXPECT_EQ(book.word_count(), 3u);
}

TEST(Book, UnnamedChapterGetsNumberedTitle)
{
  auto const book = parse("Some words here.", "");

  ASSERT_EQ(book.size(), 1u);
  EXPECT_EQ(book.at(0).title, "Chapter 1");
}

TEST(Book, MarkerLinesSplitChapters)
{
  auto const book = parse(
    "Intro words here.\n"
    "Chapter 1\n"
    "Alpha beta.\n"
    "  CHAPTER Two: The End  \n"
    "Gamma.\n");

  ASSERT_EQ(book.size(), 3u);

  EXPECT_EQ(book.at(0).title, "book.txt");
  EXPECT_EQ(book.at(0).word_count, 3u);

  EXPECT_EQ(book.at(1).title, "Chapter 1");
  EXPECT_EQ(book.at(1).text, "Alpha beta.\n");
  EXPECT_EQ(book.at(1).chapter_index, 1u);

  EXPECT_EQ(book.at(2).title, "CHAPTER Two: The End");
  EXPECT_EQ(book.at(2).word_count, 1u);

  for (auto const& e : book.chapters())
  {
    EXPECT_EQ(e.book_id, book.id());
  }

  EXPECT_EQ(book.word_count(), 6u);
}

TEST(Book, BlankLeadingTextIsDropped)
{
  auto const book = parse("\n\n  \nChapter 1\nText.\n");

  ASSERT_EQ(book.size(), 1u);
  EXPECT_EQ(book.at(0).title, "Chapter 1");
}

TEST(Book, EmptyChaptersAreKept)
{
  auto const book = parse("Chapter 1\nA b.\nChapter 2\n\nChapter 3\nC d.\n");

  ASSERT_EQ(book.size(), 3u);
  EXPECT_EQ(book.at(1).word_count, 0u);
  EXPECT_EQ(book.at(2).word_count, 2u);
}

TEST(Book, MarkerMustBeWholeFirstWord)
{
  auto const book = parse("Chapters are great.\nThe chapter ends.\n");

  EXPECT_EQ(book.size(), 1u);
  EXPECT_EQ(book.word_count(), 6u);
}

TEST(Book, TextWithoutWordsIsRejected)
{
  Slidr::Book book;
  std::istringstream input {"  \n\t\n"};

  EXPECT_FALSE(book.parse(input, "blank"));
  EXPECT_TRUE(book.empty());
  EXPECT_TRUE(book.id().empty());
  EXPECT_EQ(book.word_count(), 0u);
}

TEST(Book, IdIsContentHash)
{
  // sha256 of 'abc'
  EXPECT_EQ(parse("abc").id(),
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  EXPECT_EQ(parse("Same text.", "a").id(), parse("Same text.", "b").id());
  EXPECT_NE(parse("Same text.").id(), parse("Other text.").id());
}
