#pragma once

#include <sqlite_orm/sqlite_orm.h>

#include <cstdint>
#include <string>
#include <vector>

namespace mixprov::spool
{
  /// One spooled entry; surb_id is empty for plain messages.
  struct SpoolRow
  {
    int64_t id;
    std::vector<char> user;
    std::vector<char> surb_id;
    std::vector<char> message;
  };

  inline auto
  init_storage(const std::string& file)
  {
    using namespace sqlite_orm;
    return make_storage(
        file,
        make_index("spool_user_idx", &SpoolRow::user, &SpoolRow::id),
        make_table(
            "spool",
            make_column("id", &SpoolRow::id, primary_key()),
            make_column("user", &SpoolRow::user),
            make_column("surb_id", &SpoolRow::surb_id),
            make_column("message", &SpoolRow::message)));
  }

  using SpoolStorage = decltype(init_storage(""));
}  // namespace mixprov::spool
