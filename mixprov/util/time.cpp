#include "time.hpp"

namespace mixprov
{
  namespace
  {
    using Clock_t = std::chrono::system_clock;

    const static auto started_at_system = Clock_t::now();

    const static auto started_at_steady = std::chrono::steady_clock::now();
  }  // namespace

  uint64_t
  ToMS(Duration_t ms)
  {
    return ms.count();
  }

  Duration_t
  uptime()
  {
    return std::chrono::duration_cast<Duration_t>(
        std::chrono::steady_clock::now() - started_at_steady);
  }

  Duration_t
  time_now_ms()
  {
    return uptime()
        + std::chrono::duration_cast<Duration_t>(started_at_system.time_since_epoch());
  }

  nlohmann::json
  to_json(const Duration_t& t)
  {
    return ToMS(t);
  }
}  // namespace mixprov
