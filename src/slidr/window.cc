#include "slidr/window.hh"

#include "ob/text.hh"

#include <cstddef>

#include <string>
#include <string_view>
#include <vector>
#include <deque>
#include <utility>

namespace Slidr
{

Slide_Window compute_window(Chapter_Text const& chapter, std::size_t target_word_offset,
  Chunk_Config const& chunk_config, Window_Config const& window_config)
{
  Slide_Window window;
  window.chapter_index = chapter.chapter_index;

  std::string_view const text {chapter.text};

  // byte position of the target word, clamp offsets past the last word
  auto const cut = OB::Text::word_offset_to_byte(text, target_word_offset);

  if (cut == text.size())
  {
    target_word_offset = OB::Text::word_count(text);
  }

  // only the trailing 'prev_count' slides before the cut are kept
  std::deque<Slide> prev;
  {
    Chunker chunker {text.substr(0, cut), chunk_config};
    Slide slide;

    while (chunker.next(slide))
    {
      prev.emplace_back(std::move(slide));

      if (prev.size() > window_config.prev_count)
      {
        prev.pop_front();
      }
    }
  }

  std::size_t prev_words {0};

  for (auto& e : prev)
  {
    prev_words += e.word_count;
    window.slide_word_counts.emplace_back(e.word_count);
    window.slides.emplace_back(std::move(e.text));
  }

  window.current_index = window.slides.size();

  // the text after the cut only needs the current and next slides
  {
    Chunker chunker {text.substr(cut), chunk_config};
    Slide slide;

    for (std::size_t i = 0; i <= window_config.next_count && chunker.next(slide); ++i)
    {
      window.slide_word_counts.emplace_back(slide.word_count);
      window.slides.emplace_back(std::move(slide.text));
    }
  }

  // at the chapter end the last slide is current
  if (window.current_index >= window.slides.size() && ! window.slides.empty())
  {
    window.current_index = window.slides.size() - 1;
  }

  window.start_word_offset = target_word_offset - prev_words;
  window.end_word_offset = window.start_word_offset;

  for (auto const& e : window.slide_word_counts)
  {
    window.end_word_offset += e;
  }

  return window;
}

bool is_within_window(Slide_Window const& window, std::size_t const word_offset)
{
  return word_offset >= window.start_word_offset && word_offset < window.end_word_offset;
}

std::size_t find_slide_index_at_offset(Slide_Window const& window, std::size_t const word_offset)
{
  if (window.slides.empty() || word_offset < window.start_word_offset)
  {
    return 0;
  }

  auto offset = window.start_word_offset;

  for (std::size_t i = 0; i < window.slide_word_counts.size(); ++i)
  {
    offset += window.slide_word_counts.at(i);

    if (word_offset < offset)
    {
      return i;
    }
  }

  // past the end of the window
  return window.slides.size() - 1;
}

std::size_t get_offset_at_slide_index(Slide_Window const& window, std::size_t const slide_index)
{
  auto offset = window.start_word_offset;

  for (std::size_t i = 0; i < slide_index && i < window.slide_word_counts.size(); ++i)
  {
    offset += window.slide_word_counts.at(i);
  }

  return offset;
}

Shift needs_shifting(Slide_Window const& window, Shift_Threshold const& threshold)
{
  if (window.current_index >= threshold.forward)
  {
    return Shift::forward;
  }

  if (window.current_index <= threshold.backward)
  {
    return Shift::backward;
  }

  return Shift::none;
}

} // namespace Slidr
