#ifndef SLIDR_SESSION_HH
#define SLIDR_SESSION_HH

#include "slidr/book.hh"
#include "slidr/chunker.hh"
#include "slidr/window.hh"
#include "slidr/pace.hh"

#include <cstddef>

#include <string>
#include <functional>

namespace Slidr
{

// reading state for one book, owns its window and pace estimator
class Session
{
public:

  // called with the new position after every change
  using Observer = std::function<void(Position const&)>;

  Session() = default;

  // positioned at the start of the book
  explicit Session(Book book, Chunk_Config const& chunk = {},
    Window_Config const& window_config = {}, Shift_Threshold const& threshold = {});

  // resume at 'position', clamped to the book
  Session& open(Position const& position = {});

  // step one slide, crossing chapter boundaries
  // false at the end or start of the book
  bool next();
  bool prev();

  // jump to the start of a chapter
  Session& chapter(std::size_t index);

  // jump to a whole book percentage
  Session& seek(double const percent);

  // throws std::invalid_argument when 'val' is not positive
  // the position is kept, slides are rebuilt around it
  Session& max_words(long long const val);
  std::size_t max_words() const;

  Chunk_Config const& chunk_config() const;

  Session& window_config(Window_Config const& val);
  Window_Config const& window_config() const;

  Session& shift_threshold(Shift_Threshold const& val);
  Shift_Threshold const& shift_threshold() const;

  void on_position(Observer fn);

  Book const& book() const;
  Position const& position() const;
  Slide_Window const& window() const;

  // current slide text, empty when there is no content
  std::string slide() const;

  double progress() const;

  bool empty() const;

  void observe(double const seconds);
  double predict() const;
  bool autoplay() const;
  Pace const& pace() const;
  void reset_pace();

private:

  void compute();
  void compute(Window_Config const& config);
  // recompute ahead of a forward step that leaves the window or nears its end
  void shift();
  // make the slide ending at word offset 'end' current
  void rewind(std::size_t const end);
  void notify();

  struct Ctx
  {
    Book book;

    Chunk_Config chunk;
    Window_Config window_config;
    Shift_Threshold threshold;

    Slide_Window window;
    Position position;

    // words in the current chapter text
    std::size_t chapter_words {0};

    Pace pace;

    Observer observer;
  } _ctx;
};

} // namespace Slidr

#endif // SLIDR_SESSION_HH
