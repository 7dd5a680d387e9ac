#pragma once

#include <sqlite_orm/sqlite_orm.h>

#include <string>
#include <vector>

/// Table layout of the user database, kept here to keep sqlite_orm out of the other headers

namespace mixprov::userdb
{
  inline constexpr auto VERSION_KEY = "version";
  inline constexpr char SCHEMA_VERSION = 0;

  struct MetadataRow
  {
    std::string name;
    std::vector<char> value;
  };

  struct UserRow
  {
    std::vector<char> username;
    std::vector<char> public_key;
  };

  inline auto
  init_storage(const std::string& file)
  {
    using namespace sqlite_orm;
    return make_storage(
        file,
        make_table(
            "metadata",
            make_column("name", &MetadataRow::name, primary_key()),
            make_column("value", &MetadataRow::value)),
        make_table(
            "users",
            make_column("username", &UserRow::username, primary_key()),
            make_column("public_key", &UserRow::public_key)));
  }

  using UserDbStorage = decltype(init_storage(""));
}  // namespace mixprov::userdb
