#ifndef SLIDR_CHUNKER_HH
#define SLIDR_CHUNKER_HH

#include <cstddef>

#include <string>
#include <string_view>
#include <vector>
#include <limits>

namespace Slidr
{

class Chunk_Config
{
public:

  static std::size_t constexpr max_words_default {50};

  Chunk_Config() = default;

  // throws std::invalid_argument when 'max_words' is not positive
  explicit Chunk_Config(long long const max_words);

  std::size_t max_words() const
  {
    return _max_words;
  }

  friend bool operator==(Chunk_Config const& lhs, Chunk_Config const& rhs)
  {
    return lhs._max_words == rhs._max_words;
  }

  friend bool operator!=(Chunk_Config const& lhs, Chunk_Config const& rhs)
  {
    return ! (lhs == rhs);
  }

private:

  std::size_t _max_words {max_words_default};
}; // class Chunk_Config

struct Slide
{
  std::string text;
  std::size_t word_count {0};
};

// incremental slide producer
// each slide takes up to two sentences, leftover words from a slide
// cut at the word cap carry over and count as the first of the two
// 'text' must outlive the chunker
class Chunker
{
public:

  static std::size_t constexpr sentences_per_slide {2};

  Chunker(std::string_view text, Chunk_Config const& config);

  // produce the next slide, false once the text is exhausted
  bool next(Slide& slide);

  bool eof() const;

private:

  std::vector<std::string_view> _sentences;
  std::size_t _index {0};
  std::vector<std::string_view> _carry;
  std::size_t _max_words {Chunk_Config::max_words_default};
}; // class Chunker

// slide texts for the whole of 'text', at most 'limit' of them
std::vector<std::string> chunk(std::string_view text, Chunk_Config const& config,
  std::size_t const limit = std::numeric_limits<std::size_t>::max());

} // namespace Slidr

#endif // SLIDR_CHUNKER_HH
