#include "slidr/session.hh"
#include "slidr/progress.hh"

#include "ob/text.hh"

#include <cstddef>

#include <string>
#include <limits>
#include <utility>
#include <algorithm>

namespace Slidr
{

Session::Session(Book book, Chunk_Config const& chunk,
  Window_Config const& window_config, Shift_Threshold const& threshold)
{
  _ctx.book = std::move(book);
  _ctx.chunk = chunk;
  _ctx.window_config = window_config;
  _ctx.threshold = threshold;

  compute();
}

Session& Session::open(Position const& position)
{
  _ctx.position = position;
  compute();
  notify();

  return *this;
}

bool Session::next()
{
  if (_ctx.book.empty())
  {
    return false;
  }

  auto& window = _ctx.window;

  if (! window.empty() && window.current_index + 1 < window.slides.size())
  {
    ++window.current_index;
    _ctx.position.word_offset = get_offset_at_slide_index(window, window.current_index);
    shift();
  }

  // window exhausted before the chapter end
  else if (window.end_word_offset < _ctx.chapter_words)
  {
    _ctx.position.word_offset = window.end_word_offset;
    compute();
  }

  else if (_ctx.position.chapter_index + 1 < _ctx.book.size())
  {
    ++_ctx.position.chapter_index;
    _ctx.position.word_offset = 0;
    compute();
  }

  else
  {
    return false;
  }

  notify();

  return true;
}

bool Session::prev()
{
  if (_ctx.book.empty())
  {
    return false;
  }

  auto& window = _ctx.window;

  if (! window.empty() && window.current_index > 0)
  {
    // the slide being left starts where the new current slide ends
    auto const end = get_offset_at_slide_index(window, window.current_index);

    --window.current_index;
    _ctx.position.word_offset = get_offset_at_slide_index(window, window.current_index);

    if (needs_shifting(window, _ctx.threshold) == Shift::backward &&
      window.start_word_offset > 0)
    {
      rewind(end);
    }
  }

  // window exhausted after the chapter start
  else if (window.start_word_offset > 0)
  {
    rewind(window.start_word_offset);
  }

  // enter the previous chapter at its end
  else if (_ctx.position.chapter_index > 0)
  {
    --_ctx.position.chapter_index;
    _ctx.position.word_offset = std::numeric_limits<std::size_t>::max();
    compute();

    if (! window.empty())
    {
      _ctx.position.word_offset = get_offset_at_slide_index(window, window.current_index);
    }
  }

  else
  {
    return false;
  }

  notify();

  return true;
}

Session& Session::chapter(std::size_t index)
{
  if (! _ctx.book.empty())
  {
    _ctx.position.chapter_index = std::min(index, _ctx.book.size() - 1);
    _ctx.position.word_offset = 0;
    compute();
    notify();
  }

  return *this;
}

Session& Session::seek(double const percent)
{
  _ctx.position = find_position_from_progress(_ctx.book.chapters(), percent);
  compute();
  notify();

  return *this;
}

Session& Session::max_words(long long const val)
{
  _ctx.chunk = Chunk_Config(val);

  // same position, new slide boundaries
  compute();

  return *this;
}

std::size_t Session::max_words() const
{
  return _ctx.chunk.max_words();
}

Chunk_Config const& Session::chunk_config() const
{
  return _ctx.chunk;
}

Session& Session::window_config(Window_Config const& val)
{
  _ctx.window_config = val;
  compute();

  return *this;
}

Window_Config const& Session::window_config() const
{
  return _ctx.window_config;
}

Session& Session::shift_threshold(Shift_Threshold const& val)
{
  _ctx.threshold = val;

  return *this;
}

Shift_Threshold const& Session::shift_threshold() const
{
  return _ctx.threshold;
}

void Session::on_position(Observer fn)
{
  _ctx.observer = std::move(fn);
}

Book const& Session::book() const
{
  return _ctx.book;
}

Position const& Session::position() const
{
  return _ctx.position;
}

Slide_Window const& Session::window() const
{
  return _ctx.window;
}

std::string Session::slide() const
{
  if (_ctx.window.empty())
  {
    return {};
  }

  return _ctx.window.slides.at(_ctx.window.current_index);
}

double Session::progress() const
{
  return calculate_progress(_ctx.book.chapters(),
    _ctx.position.chapter_index, _ctx.position.word_offset);
}

bool Session::empty() const
{
  return _ctx.book.empty();
}

void Session::observe(double const seconds)
{
  _ctx.pace.add_observation(seconds);
}

double Session::predict() const
{
  return _ctx.pace.predict();
}

bool Session::autoplay() const
{
  return _ctx.pace.should_enable_autoplay();
}

Pace const& Session::pace() const
{
  return _ctx.pace;
}

void Session::reset_pace()
{
  _ctx.pace.reset();
}

void Session::compute()
{
  compute(_ctx.window_config);
}

void Session::compute(Window_Config const& config)
{
  if (_ctx.book.empty())
  {
    _ctx.window = {};
    _ctx.position = {};
    _ctx.chapter_words = 0;

    return;
  }

  _ctx.position.chapter_index = std::min(_ctx.position.chapter_index, _ctx.book.size() - 1);

  auto const& chapter = _ctx.book.at(_ctx.position.chapter_index);

  _ctx.chapter_words = OB::Text::word_count(chapter.text);
  _ctx.position.word_offset = std::min(_ctx.position.word_offset, _ctx.chapter_words);
  _ctx.window = compute_window(chapter, _ctx.position.word_offset, _ctx.chunk, config);
}

void Session::shift()
{
  auto const& window = _ctx.window;

  if (! is_within_window(window, _ctx.position.word_offset) ||
    (needs_shifting(window, _ctx.threshold) == Shift::forward &&
    window.end_word_offset < _ctx.chapter_words))
  {
    compute();
  }
}

void Session::rewind(std::size_t const end)
{
  auto& window = _ctx.window;

  // anchor at 'end' and step back, so the slide ending there becomes current
  _ctx.position.word_offset = end;
  compute({std::max<std::size_t>(1, _ctx.window_config.prev_count),
    _ctx.window_config.next_count});

  if (window.current_index > 0)
  {
    --window.current_index;
    _ctx.position.word_offset = get_offset_at_slide_index(window, window.current_index);
  }
}

void Session::notify()
{
  if (_ctx.observer)
  {
    _ctx.observer(_ctx.position);
  }
}

} // namespace Slidr
