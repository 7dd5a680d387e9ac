#pragma once

#include <string>

namespace mixprov::util
{
  /// Names the calling thread (visible in debuggers and /proc); failures are logged and ignored.
  void
  SetThreadName(const std::string& name);
}  // namespace mixprov::util
