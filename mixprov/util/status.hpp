#pragma once

#include <nlohmann/json.hpp>

namespace mixprov::util
{
  using StatusObject = nlohmann::json;
}  // namespace mixprov::util
