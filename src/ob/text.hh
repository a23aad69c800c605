#ifndef OB_TEXT_HH
#define OB_TEXT_HH

#define U_CHARSET_IS_UTF8 1

#include <unicode/regex.h>

#include <cstddef>
#include <cstdint>

#include <string>
#include <string_view>
#include <vector>
#include <limits>
#include <iostream>

namespace OB::Text
{

// unicode White_Space property
bool is_space(std::int32_t ch);

// words are maximal runs of non-whitespace code points in a utf-8 string
std::vector<std::string_view> words(std::string_view str);

std::size_t word_count(std::string_view str);

// byte position where the word at 'offset' begins,
// or the string size when 'offset' is past the last word
std::size_t word_offset_to_byte(std::string_view str, std::size_t offset);

} // namespace OB::Text

namespace OB
{

class Regex
{
public:

  using size_type = std::size_t;
  using string_view = std::string_view;
  using regex = icu::RegexMatcher;

  struct Match
  {
    friend std::ostream& operator<<(std::ostream& os, Match const& obj)
    {
      os << obj.str;

      return os;
    }

    // byte position in the subject string
    size_type pos {0};
    string_view str;
  }; // struct Match

  using value_type = std::vector<Match>;
  using const_iterator = typename value_type::const_iterator;

  static size_type constexpr npos {std::numeric_limits<size_type>::max()};

  Regex() = default;
  Regex(Regex&&) = default;
  Regex(Regex const&) = default;

  Regex(string_view rx, string_view str, std::uint32_t flags = 0)
  {
    match(rx, str, flags);
  }

  ~Regex() = default;

  Regex& operator=(Regex&&) = default;
  Regex& operator=(Regex const&) = default;

  // collect every non-overlapping match of 'rx' in 'str'
  // match views refer into 'str', which must outlive them
  Regex& match(string_view rx, string_view str, std::uint32_t flags = 0);

  value_type const& get() const
  {
    return _str;
  }

  Match const& at(size_type pos) const
  {
    return _str.at(pos);
  }

  bool empty() const
  {
    return _str.empty();
  }

  size_type size() const
  {
    return _str.size();
  }

  Regex& clear()
  {
    _str.clear();

    return *this;
  }

  const_iterator begin() const
  {
    return _str.cbegin();
  }

  const_iterator end() const
  {
    return _str.cend();
  }

private:

  value_type _str;
}; // class Regex

} // namespace OB

#endif // OB_TEXT_HH
