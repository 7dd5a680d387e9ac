#pragma once

#include "types.hpp"

#include <string>
#include <string_view>

namespace mixprov
{
  /// Renders a byte string for log output: printable ASCII is kept verbatim and anything else is
  /// escaped as \xNN.
  std::string
  printable_bytes(std::string_view bytes);

  /// Returns the view with all trailing NUL bytes removed.
  inline constexpr std::string_view
  trim_trailing_nuls(std::string_view str)
  {
    while (not str.empty() and str.back() == '\0')
      str.remove_suffix(1);
    return str;
  }

  std::string_view
  TrimWhitespace(std::string_view str);

  std::string
  lowercase_ascii_string(std::string src);

}  // namespace mixprov
