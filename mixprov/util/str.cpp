#include "str.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace mixprov
{
  std::string
  printable_bytes(std::string_view bytes)
  {
    std::string out;
    out.reserve(bytes.size());
    auto append = std::back_inserter(out);
    for (unsigned char ch : bytes)
    {
      if (ch >= 0x20 and ch < 0x7f and ch != '\\')
        out.push_back(static_cast<char>(ch));
      else
        fmt::format_to(append, "\\x{:02x}", ch);
    }
    return out;
  }

  std::string_view
  TrimWhitespace(std::string_view str)
  {
    size_t begin = str.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos)
      return {};
    str.remove_prefix(begin);

    size_t end = str.find_last_not_of(" \t\r\n");
    if (end != std::string_view::npos)
      str.remove_suffix(str.size() - end - 1);

    return str;
  }

  std::string
  lowercase_ascii_string(std::string src)
  {
    std::transform(src.begin(), src.end(), src.begin(), [](unsigned char ch) {
      return static_cast<char>(std::tolower(ch));
    });
    return src;
  }

}  // namespace mixprov
