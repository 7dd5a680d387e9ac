#include "threading.hpp"

#include <mixprov/util/logging.hpp>

#include <cstring>

#include <pthread.h>
#if defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#include <pthread_np.h>
#endif

namespace mixprov::util
{
  static auto logcat = log::Cat("util");

  void
  SetThreadName(const std::string& name)
  {
#if defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
    /* on bsd this function has void return type */
    auto set_name = [](const std::string& name) {
      pthread_set_name_np(pthread_self(), name.c_str());
      return 0;
    };
#elif defined(__APPLE__)
    auto set_name = [](const std::string& name) { return pthread_setname_np(name.c_str()); };
#else
    // linux limits thread names to 15 characters plus the terminator
    auto set_name = [](const std::string& name) {
      return pthread_setname_np(pthread_self(), name.substr(0, 15).c_str());
    };
#endif
    if (auto rc = set_name(name))
      log::error(logcat, "Failed to set thread name to '{}': {}", name, ::strerror(rc));
  }
}  // namespace mixprov::util
