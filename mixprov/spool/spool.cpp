#include "spool.hpp"

#include "memory_spool.hpp"
#include "sqlite_spool.hpp"

#include <mixprov/util/logging.hpp>

namespace mixprov::spool
{
  static auto logcat = log::Cat("spool");

  std::unique_ptr<Spool>
  make_spool(const ProviderConfig& conf)
  {
    switch (conf.spool_type)
    {
      case SpoolType::sqlite:
        return std::make_unique<SqliteSpool>(conf.spool_db);
      case SpoolType::memory:
        log::warning(logcat, "Using a memory spool; spooled messages are lost on shutdown");
        return std::make_unique<MemorySpool>();
    }
    throw SpoolError{"unknown spool type"};
  }
}  // namespace mixprov::spool
