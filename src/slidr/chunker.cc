#include "slidr/chunker.hh"
#include "slidr/sentence.hh"

#include "ob/text.hh"

#include <cstddef>

#include <string>
#include <string_view>
#include <vector>
#include <iterator>
#include <utility>
#include <stdexcept>

namespace Slidr
{

namespace
{

std::string join_words(std::vector<std::string_view>::const_iterator begin,
  std::vector<std::string_view>::const_iterator end)
{
  std::string res;

  for (auto it = begin; it != end; ++it)
  {
    if (it != begin)
    {
      res += " ";
    }

    res += *it;
  }

  return res;
}

} // namespace

Chunk_Config::Chunk_Config(long long const max_words)
{
  if (max_words <= 0)
  {
    throw std::invalid_argument("max words must be a positive integer, got '" +
      std::to_string(max_words) + "'");
  }

  _max_words = static_cast<std::size_t>(max_words);
}

Chunker::Chunker(std::string_view text, Chunk_Config const& config) :
  _sentences {Sentence::segment(text)},
  _max_words {config.max_words()}
{
}

bool Chunker::eof() const
{
  return _index >= _sentences.size() && _carry.empty();
}

bool Chunker::next(Slide& slide)
{
  if (eof())
  {
    return false;
  }

  // seed with the carry-over, it counts as one sentence
  std::vector<std::string_view> buf;
  buf.swap(_carry);
  std::size_t count {0};

  if (! buf.empty())
  {
    ++count;
  }

  while (count < sentences_per_slide && _index < _sentences.size())
  {
    auto const words = OB::Text::words(_sentences.at(_index++));
    buf.insert(buf.end(), words.begin(), words.end());
    ++count;
  }

  if (buf.empty())
  {
    return false;
  }

  auto end = buf.cend();

  if (buf.size() > _max_words)
  {
    end = std::next(buf.cbegin(), static_cast<std::ptrdiff_t>(_max_words));
    _carry.assign(end, buf.cend());
  }

  slide.text = join_words(buf.cbegin(), end);
  slide.word_count = static_cast<std::size_t>(std::distance(buf.cbegin(), end));

  return true;
}

std::vector<std::string> chunk(std::string_view text, Chunk_Config const& config,
  std::size_t const limit)
{
  std::vector<std::string> res;

  Chunker chunker {text, config};
  Slide slide;

  while (res.size() < limit && chunker.next(slide))
  {
    res.emplace_back(std::move(slide.text));
  }

  return res;
}

} // namespace Slidr
