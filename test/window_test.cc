#include "slidr/window.hh"

#include "ob/text.hh"
#include "ob/string.hh"

#include <gtest/gtest.h>

#include <cstddef>

#include <string>
#include <vector>
#include <numeric>

namespace
{

// 'sentences' sentences of 'words' words each
Slidr::Chapter_Text chapter(std::size_t const sentences, std::size_t const words)
{
  std::vector<std::string> buf;

  for (std::size_t i = 0; i < sentences; ++i)
  {
    std::string str;

    for (std::size_t j = 0; j < words; ++j)
    {
      str += "s" + std::to_string(i) + "w" + std::to_string(j);
      str += j + 1 < words ? " " : ".";
    }

    buf.emplace_back(str);
  }

  Slidr::Chapter_Text res;
  res.chapter_index = 3;
  res.text = OB::String::join(buf, " ");
  res.word_count = OB::Text::word_count(res.text);

  return res;
}

Slidr::Chapter_Text irregular()
{
  Slidr::Chapter_Text res;
  res.text =
    "It was late. The lamps along the river had gone out one by one, "
    "and the water carried nothing but the sound of the wind. "
    "Nobody spoke! Why would they? The boat drifted. "
    "A long sentence follows here with many words that will certainly be cut "
    "several times over when the slide limit is small enough to matter. "
    "End.";
  res.word_count = OB::Text::word_count(res.text);

  return res;
}

void expect_consistent(Slidr::Slide_Window const& window)
{
  ASSERT_EQ(window.slides.size(), window.slide_word_counts.size());

  auto const sum = std::accumulate(window.slide_word_counts.begin(),
    window.slide_word_counts.end(), std::size_t {0});

  EXPECT_EQ(sum, window.end_word_offset - window.start_word_offset);

  if (window.empty())
  {
    EXPECT_EQ(window.current_index, 0u);
  }
  else
  {
    EXPECT_LT(window.current_index, window.slides.size());
  }

  for (std::size_t i = 0; i < window.slides.size(); ++i)
  {
    EXPECT_EQ(OB::Text::word_count(window.slides.at(i)), window.slide_word_counts.at(i));
  }
}

} // namespace

TEST(Window, CoversTargetOffset)
{
  auto const text = chapter(30, 10);
  ASSERT_EQ(text.word_count, 300u);

  auto const window = Slidr::compute_window(text, 150, Slidr::Chunk_Config(50));

  expect_consistent(window);

  EXPECT_EQ(window.chapter_index, 3u);
  EXPECT_EQ(window.slides.size(), 11u);
  EXPECT_EQ(window.current_index, 5u);
  EXPECT_EQ(window.start_word_offset, 60u);
  EXPECT_EQ(window.end_word_offset, 270u);
  EXPECT_TRUE(Slidr::is_within_window(window, 150));
  EXPECT_EQ(Slidr::find_slide_index_at_offset(window, 150), window.current_index);
  EXPECT_EQ(Slidr::get_offset_at_slide_index(window, window.current_index), 150u);
  EXPECT_EQ(window.slides.at(window.current_index).substr(0, 6), "s15w0 ");
}

TEST(Window, StartOfChapter)
{
  auto const text = chapter(30, 10);
  auto const window = Slidr::compute_window(text, 0, Slidr::Chunk_Config(50));

  expect_consistent(window);

  EXPECT_EQ(window.current_index, 0u);
  EXPECT_EQ(window.start_word_offset, 0u);
  EXPECT_EQ(window.slides, Slidr::chunk(text.text, Slidr::Chunk_Config(50), 6));
}

TEST(Window, EndOfChapterAnchorsOnLastSlide)
{
  auto const text = chapter(30, 10);

  for (std::size_t target : {300u, 1000u})
  {
    auto const window = Slidr::compute_window(text, target, Slidr::Chunk_Config(50));

    expect_consistent(window);

    EXPECT_EQ(window.slides.size(), 5u);
    EXPECT_EQ(window.current_index, 4u);
    EXPECT_EQ(window.start_word_offset, 200u);
    EXPECT_EQ(window.end_word_offset, 300u);
  }
}

TEST(Window, EmptyChapter)
{
  Slidr::Chapter_Text text;
  text.text = "\n";

  auto const window = Slidr::compute_window(text, 0, Slidr::Chunk_Config(50));

  EXPECT_TRUE(window.empty());
  EXPECT_EQ(window.current_index, 0u);
  EXPECT_EQ(window.start_word_offset, 0u);
  EXPECT_EQ(window.end_word_offset, 0u);
  EXPECT_FALSE(Slidr::is_within_window(window, 0));
  EXPECT_EQ(Slidr::find_slide_index_at_offset(window, 0), 0u);
}

TEST(Window, ZeroNeighbourhoodKeepsCurrentSlide)
{
  auto const text = chapter(30, 10);
  auto const window = Slidr::compute_window(text, 150, Slidr::Chunk_Config(50), {0, 0});

  expect_consistent(window);

  EXPECT_EQ(window.slides.size(), 1u);
  EXPECT_EQ(window.start_word_offset, 150u);
  EXPECT_EQ(window.end_word_offset, 170u);
}

TEST(Window, InvariantHoldsEverywhere)
{
  auto const text = irregular();

  for (long long max : {1, 3, 7, 50})
  {
    for (std::size_t target = 0; target <= text.word_count + 2; ++target)
    {
      auto const window = Slidr::compute_window(text, target, Slidr::Chunk_Config(max), {2, 3});

      expect_consistent(window);

      if (target < text.word_count)
      {
        EXPECT_TRUE(Slidr::is_within_window(window, target));
      }

      EXPECT_LE(window.end_word_offset, text.word_count);
    }
  }
}

TEST(Window, SlideAtOffsetContainsOffset)
{
  auto const text = irregular();

  for (long long max : {3, 7, 50})
  {
    for (std::size_t target = 0; target < text.word_count; target += 5)
    {
      auto const window = Slidr::compute_window(text, target, Slidr::Chunk_Config(max));

      for (std::size_t offset = window.start_word_offset; offset < window.end_word_offset; ++offset)
      {
        auto const index = Slidr::find_slide_index_at_offset(window, offset);
        auto const begin = Slidr::get_offset_at_slide_index(window, index);

        EXPECT_LE(begin, offset);
        EXPECT_LT(offset, begin + window.slide_word_counts.at(index));
      }
    }
  }
}

TEST(Window, LookupsClampToWindow)
{
  auto const text = chapter(30, 10);
  auto const window = Slidr::compute_window(text, 150, Slidr::Chunk_Config(50));

  EXPECT_EQ(Slidr::find_slide_index_at_offset(window, 0), 0u);
  EXPECT_EQ(Slidr::find_slide_index_at_offset(window, 299), window.slides.size() - 1);
  EXPECT_EQ(Slidr::get_offset_at_slide_index(window, 0), window.start_word_offset);
  EXPECT_EQ(Slidr::get_offset_at_slide_index(window, 100), window.end_word_offset);
  EXPECT_FALSE(Slidr::is_within_window(window, 59));
  EXPECT_TRUE(Slidr::is_within_window(window, 60));
  EXPECT_FALSE(Slidr::is_within_window(window, 270));
}

TEST(Window, ShiftThresholds)
{
  Slidr::Slide_Window window;
  window.slides.resize(11);
  window.slide_word_counts.resize(11, 1);

  window.current_index = 8;
  EXPECT_EQ(Slidr::needs_shifting(window), Slidr::Shift::forward);

  window.current_index = 10;
  EXPECT_EQ(Slidr::needs_shifting(window), Slidr::Shift::forward);

  window.current_index = 2;
  EXPECT_EQ(Slidr::needs_shifting(window), Slidr::Shift::backward);

  window.current_index = 5;
  EXPECT_EQ(Slidr::needs_shifting(window), Slidr::Shift::none);

  window.current_index = 4;
  EXPECT_EQ(Slidr::needs_shifting(window, {4, 1}), Slidr::Shift::forward);
  EXPECT_EQ(Slidr::needs_shifting(window, {9, 4}), Slidr::Shift::backward);
}
