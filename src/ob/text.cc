#include "ob/text.hh"

#include <unicode/utext.h>
#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include <cstddef>
#include <cstdint>

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <stdexcept>

namespace
{

// call 'fn(begin, end)' with the byte range of each word
// stops early when 'fn' returns false
template<typename F>
void scan_words(std::string_view str, F&& fn)
{
  char const* const data {str.data()};
  auto const length = static_cast<std::int32_t>(str.size());

  std::int32_t i {0};
  std::int32_t prev {0};
  std::size_t begin {0};
  bool in_word {false};
  UChar32 ch;

  while (i < length)
  {
    prev = i;
    U8_NEXT(data, i, length, ch);

    // malformed sequences count as word characters
    bool const space {ch >= 0 && OB::Text::is_space(ch)};

    if (space && in_word)
    {
      in_word = false;

      if (! fn(begin, static_cast<std::size_t>(prev)))
      {
        return;
      }
    }
    else if (! space && ! in_word)
    {
      in_word = true;
      begin = static_cast<std::size_t>(prev);
    }
  }

  if (in_word)
  {
    fn(begin, str.size());
  }
}

} // namespace

namespace OB::Text
{

bool is_space(std::int32_t ch)
{
  return u_isUWhiteSpace(ch);
}

std::vector<std::string_view> words(std::string_view str)
{
  std::vector<std::string_view> res;

  scan_words(str, [&](std::size_t begin, std::size_t end) {
    res.emplace_back(str.substr(begin, end - begin));

    return true;
  });

  return res;
}

std::size_t word_count(std::string_view str)
{
  std::size_t count {0};

  scan_words(str, [&](std::size_t, std::size_t) {
    ++count;

    return true;
  });

  return count;
}

std::size_t word_offset_to_byte(std::string_view str, std::size_t offset)
{
  std::size_t index {0};
  std::size_t pos {str.size()};

  scan_words(str, [&](std::size_t begin, std::size_t) {
    if (index++ == offset)
    {
      pos = begin;

      return false;
    }

    return true;
  });

  return pos;
}

} // namespace OB::Text

namespace OB
{

Regex& Regex::match(string_view rx, string_view str, std::uint32_t flags)
{
  _str.clear();

  if (str.empty())
  {
    return *this;
  }

  UErrorCode ec = U_ZERO_ERROR;

  std::unique_ptr<UText, decltype(&utext_close)> urx (
    utext_openUTF8(nullptr, rx.data(), static_cast<std::int64_t>(rx.size()), &ec),
    utext_close);

  if (U_FAILURE(ec))
  {
    throw std::runtime_error("failed to create utext");
  }

  std::unique_ptr<UText, decltype(&utext_close)> ustr (
    utext_openUTF8(nullptr, str.data(), static_cast<std::int64_t>(str.size()), &ec),
    utext_close);

  if (U_FAILURE(ec))
  {
    throw std::runtime_error("failed to create utext");
  }

  std::unique_ptr<regex> iter {new regex(urx.get(), flags, ec)};

  if (U_FAILURE(ec))
  {
    throw std::runtime_error("failed to create regex matcher");
  }

  iter->reset(ustr.get());

  // long runs under a lazy quantifier must not hit the backtrack limit
  iter->setStackLimit(0, ec);

  if (U_FAILURE(ec))
  {
    throw std::runtime_error("failed to set regex matcher stack limit");
  }

  // utf-8 utext native indexes are byte offsets
  std::int64_t begin {0};
  std::int64_t end {0};

  while (iter->find(ec))
  {
    begin = iter->start64(ec);

    if (U_FAILURE(ec))
    {
      throw std::runtime_error("failed to get regex matcher start");
    }

    end = iter->end64(ec);

    if (U_FAILURE(ec))
    {
      throw std::runtime_error("failed to get regex matcher end");
    }

    Match match;
    match.pos = static_cast<size_type>(begin);
    match.str = str.substr(match.pos, static_cast<size_type>(end - begin));

    _str.emplace_back(match);
  }

  if (U_FAILURE(ec))
  {
    throw std::runtime_error("failed to find regex match");
  }

  return *this;
}

} // namespace OB
