#ifndef SLIDR_BOOK_HH
#define SLIDR_BOOK_HH

#include <cstddef>

#include <string>
#include <vector>
#include <iostream>

namespace Slidr
{

struct Chapter_Text
{
  std::string book_id;
  std::size_t chapter_index {0};
  std::string title;
  std::string text;
  std::size_t word_count {0};
};

// durable resume point, independent of slide size
struct Position
{
  std::size_t chapter_index {0};
  std::size_t word_offset {0};

  friend bool operator==(Position const& lhs, Position const& rhs)
  {
    return lhs.chapter_index == rhs.chapter_index &&
      lhs.word_offset == rhs.word_offset;
  }

  friend bool operator!=(Position const& lhs, Position const& rhs)
  {
    return ! (lhs == rhs);
  }
};

class Book
{
public:

  Book() = default;

  // read plain utf-8 text, a line starting with the word 'chapter'
  // opens a new chapter titled by that line
  // returns false when the text has no words
  bool parse(std::istream& input, std::string const& name = {});

  std::string const& id() const
  {
    return _ctx.id;
  }

  std::string const& name() const
  {
    return _ctx.name;
  }

  std::vector<Chapter_Text> const& chapters() const
  {
    return _ctx.chapters;
  }

  Chapter_Text const& at(std::size_t const index) const
  {
    return _ctx.chapters.at(index);
  }

  std::size_t size() const
  {
    return _ctx.chapters.size();
  }

  bool empty() const
  {
    return _ctx.chapters.empty();
  }

  std::size_t word_count() const;

private:

  void add_chapter(std::string title, std::string text);

  struct Ctx
  {
    // sha256 of the raw content
    std::string id;

    std::string name;

    std::vector<Chapter_Text> chapters;
  } _ctx;
};

} // namespace Slidr

#endif // SLIDR_BOOK_HH
