#include "slidr/sentence.hh"

#include "ob/text.hh"

#include <unicode/regex.h>

#include <string_view>
#include <vector>

namespace Slidr::Sentence
{

namespace
{

char const* const sentence_rx {
  R"(\P{White_Space}.*?(?:[.!?]+(?=\p{White_Space}|\z)|(?=\p{White_Space}*\z)))"};

} // namespace

std::vector<std::string_view> segment(std::string_view text)
{
  std::vector<std::string_view> res;

  OB::Regex const rx {sentence_rx, text, UREGEX_DOTALL};

  res.reserve(rx.size());

  for (auto const& e : rx)
  {
    res.emplace_back(e.str);
  }

  return res;
}

} // namespace Slidr::Sentence
