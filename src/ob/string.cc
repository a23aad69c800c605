#include "ob/string.hh"

#include <cctype>
#include <cstddef>

#include <string>
#include <optional>
#include <regex>
#include <limits>
#include <vector>
#include <algorithm>

namespace OB::String
{

std::vector<std::string> split(std::string const& str, std::string const& delim,
  std::size_t times)
{
  std::vector<std::string> vtok;
  std::size_t start {0};
  auto end = str.find(delim);

  while ((times-- > 0) && (end != std::string::npos))
  {
    // skip runs of the delimiter
    if (end != start)
    {
      vtok.emplace_back(str.substr(start, end - start));
    }

    start = end + delim.length();
    end = str.find(delim, start);
  }

  if (start < str.size())
  {
    vtok.emplace_back(str.substr(start));
  }

  return vtok;
}

std::string join(std::vector<std::string> const& vec, std::string const& delim)
{
  std::string res;

  for (std::size_t i = 0; i < vec.size(); ++i)
  {
    if (i)
    {
      res += delim;
    }

    res += vec.at(i);
  }

  return res;
}

std::string lowercase(std::string const& str)
{
  std::string res {str};

  std::transform(res.begin(), res.end(), res.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  return res;
}

std::string trim(std::string str)
{
  auto start = str.find_first_not_of(" \t\n\r\f\v");

  if (start != std::string::npos)
  {
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    str = str.substr(start, end - start + 1);

    return str;
  }

  return {};
}

bool assert_rx(std::string const& str, std::regex rx)
{
  std::smatch m;

  if (std::regex_match(str, m, rx, std::regex_constants::match_not_null))
  {
    return true;
  }

  return false;
}

std::optional<std::vector<std::string>> match(std::string const& str, std::regex rx)
{
  std::smatch m;

  if (std::regex_match(str, m, rx, std::regex_constants::match_not_null))
  {
    std::vector<std::string> v;

    for (auto const& e : m)
    {
      v.emplace_back(std::string(e));
    }

    return v;
  }

  return {};
}

} // namespace OB::String
