#ifndef SLIDR_PROGRESS_HH
#define SLIDR_PROGRESS_HH

#include "slidr/book.hh"

#include <cstddef>

#include <vector>

namespace Slidr
{

std::size_t total_words(std::vector<Chapter_Text> const& chapters);

std::size_t words_before_chapter(std::vector<Chapter_Text> const& chapters,
  std::size_t const chapter_index);

// whole book percentage in [0, 100], 0 for a book without words
// out of range positions are clamped to the book
double calculate_progress(std::vector<Chapter_Text> const& chapters,
  std::size_t chapter_index, std::size_t word_offset);

// inverse of calculate_progress, percentages are clamped to [0, 100]
Position find_position_from_progress(std::vector<Chapter_Text> const& chapters,
  double const percent);

} // namespace Slidr

#endif // SLIDR_PROGRESS_HH
