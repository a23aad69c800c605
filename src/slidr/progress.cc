#include "slidr/progress.hh"

#include <cmath>
#include <cstddef>

#include <vector>
#include <algorithm>

namespace Slidr
{

std::size_t total_words(std::vector<Chapter_Text> const& chapters)
{
  return words_before_chapter(chapters, chapters.size());
}

std::size_t words_before_chapter(std::vector<Chapter_Text> const& chapters,
  std::size_t const chapter_index)
{
  std::size_t res {0};

  for (std::size_t i = 0; i < chapter_index && i < chapters.size(); ++i)
  {
    res += chapters.at(i).word_count;
  }

  return res;
}

double calculate_progress(std::vector<Chapter_Text> const& chapters,
  std::size_t chapter_index, std::size_t word_offset)
{
  auto const total = total_words(chapters);

  if (total == 0)
  {
    return 0.0;
  }

  if (chapter_index >= chapters.size())
  {
    chapter_index = chapters.size() - 1;
    word_offset = chapters.back().word_count;
  }

  word_offset = std::min(word_offset, chapters.at(chapter_index).word_count);

  auto const position = words_before_chapter(chapters, chapter_index) + word_offset;

  return static_cast<double>(position) / static_cast<double>(total) * 100.0;
}

Position find_position_from_progress(std::vector<Chapter_Text> const& chapters,
  double const percent)
{
  if (chapters.empty())
  {
    return {};
  }

  auto const total = total_words(chapters);
  auto const clamped = std::isnan(percent) ? 0.0 : std::clamp(percent, 0.0, 100.0);

  auto remaining = std::min(total, static_cast<std::size_t>(
    std::floor(clamped / 100.0 * static_cast<double>(total))));

  for (std::size_t i = 0; i < chapters.size(); ++i)
  {
    if (remaining <= chapters.at(i).word_count)
    {
      return {i, remaining};
    }

    remaining -= chapters.at(i).word_count;
  }

  // end of the last chapter
  return {chapters.size() - 1, chapters.back().word_count};
}

} // namespace Slidr
