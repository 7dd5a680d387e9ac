#pragma once

#include "types.hpp"

#include <nlohmann/json.hpp>

using namespace std::chrono_literals;

namespace mixprov
{
  /// get time right now as milliseconds since the epoch, advanced by a monotonic clock
  Duration_t
  time_now_ms();

  /// get the uptime of the process
  Duration_t
  uptime();

  /// convert to milliseconds
  uint64_t
  ToMS(Duration_t duration);

  nlohmann::json
  to_json(const Duration_t& t);
}  // namespace mixprov
