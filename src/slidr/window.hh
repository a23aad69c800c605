#ifndef SLIDR_WINDOW_HH
#define SLIDR_WINDOW_HH

#include "slidr/book.hh"
#include "slidr/chunker.hh"

#include <cstddef>

#include <string>
#include <vector>

namespace Slidr
{

struct Window_Config
{
  std::size_t prev_count {5};
  std::size_t next_count {5};
};

struct Shift_Threshold
{
  std::size_t forward {8};
  std::size_t backward {2};
};

enum class Shift
{
  none,
  forward,
  backward,
};

// bounded neighbourhood of slides around a reading position
// sum(slide_word_counts) == end_word_offset - start_word_offset
// current_index < slides.size(), or both zero when there is no content
struct Slide_Window
{
  std::vector<std::string> slides;
  std::size_t current_index {0};
  std::size_t start_word_offset {0};
  std::size_t end_word_offset {0};
  std::size_t chapter_index {0};
  std::vector<std::size_t> slide_word_counts;

  bool empty() const
  {
    return slides.empty();
  }
};

// chunk the text on both sides of 'target_word_offset' and keep up to
// 'prev_count' slides before it and 'next_count' + 1 slides from it
// the offset is clamped to the chapter, the current slide starts at it
// unless it is the chapter end, then the current slide is the last one
Slide_Window compute_window(Chapter_Text const& chapter, std::size_t target_word_offset,
  Chunk_Config const& chunk_config, Window_Config const& window_config = {});

bool is_within_window(Slide_Window const& window, std::size_t const word_offset);

// index of the slide covering 'word_offset', clamped to the window
std::size_t find_slide_index_at_offset(Slide_Window const& window, std::size_t const word_offset);

// absolute word offset where the slide at 'slide_index' begins
std::size_t get_offset_at_slide_index(Slide_Window const& window, std::size_t const slide_index);

Shift needs_shifting(Slide_Window const& window, Shift_Threshold const& threshold = {});

} // namespace Slidr

#endif // SLIDR_WINDOW_HH
