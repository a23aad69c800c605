#include "slidr/book.hh"

#include "ob/crypto.hh"
#include "ob/string.hh"
#include "ob/text.hh"

#include <cstddef>

#include <string>
#include <sstream>
#include <iostream>
#include <vector>
#include <utility>
#include <stdexcept>

namespace Slidr
{

bool Book::parse(std::istream& input, std::string const& name)
{
  _ctx = {};
  _ctx.name = name;

  std::string content;
  {
    std::ostringstream ss;
    ss << input.rdbuf();
    content = ss.str();
  }

  if (OB::Text::word_count(content) == 0)
  {
    return false;
  }

  if (auto const id = OB::Crypto::sha256(content))
  {
    _ctx.id = id.value();
  }
  else
  {
    throw std::runtime_error("failed to compute content id");
  }

  std::istringstream lines {content};
  std::string line;
  std::string title {name};
  std::string text;
  bool marked {false};

  while (std::getline(lines, line))
  {
    auto const words = OB::Text::words(line);

    if (! words.empty() &&
      OB::String::lowercase(std::string(words.front())) == "chapter")
    {
      // text before the first marker only counts when it has words
      if (marked || OB::Text::word_count(text) > 0)
      {
        add_chapter(std::move(title), std::move(text));
      }

      marked = true;
      title = OB::String::trim(line);
      text.clear();

      continue;
    }

    text += line;
    text += "\n";
  }

  add_chapter(std::move(title), std::move(text));

  return true;
}

void Book::add_chapter(std::string title, std::string text)
{
  Chapter_Text chapter;
  chapter.book_id = _ctx.id;
  chapter.chapter_index = _ctx.chapters.size();
  chapter.title = title.empty() ?
    "Chapter " + std::to_string(_ctx.chapters.size() + 1) : std::move(title);
  chapter.word_count = OB::Text::word_count(text);
  chapter.text = std::move(text);

  _ctx.chapters.emplace_back(std::move(chapter));
}

std::size_t Book::word_count() const
{
  std::size_t res {0};

  for (auto const& e : _ctx.chapters)
  {
    res += e.word_count;
  }

  return res;
}

} // namespace Slidr
