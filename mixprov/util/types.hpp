#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <oxen/log/format.hpp>

using byte_t = uint8_t;

namespace mixprov
{
  using ustring = std::basic_string<uint8_t>;
  using ustring_view = std::basic_string_view<uint8_t>;

  using Duration_t = std::chrono::milliseconds;
  using namespace std::literals;
  using namespace oxen::log::literals;

  // Helper functions to switch between string_view and ustring_view
  inline ustring_view
  to_usv(std::string_view v)
  {
    return {reinterpret_cast<const uint8_t*>(v.data()), v.size()};
  }

  inline std::string_view
  to_sv(ustring_view v)
  {
    return {reinterpret_cast<const char*>(v.data()), v.size()};
  }
}  // namespace mixprov

using mixprov_time_t = mixprov::Duration_t;
