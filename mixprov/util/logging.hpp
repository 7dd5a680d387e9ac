#pragma once

// Header for making log statements such as mixprov::log::info and so on work.

#include <oxen/log.hpp>

namespace mixprov
{
  namespace log = oxen::log;
}  // namespace mixprov
