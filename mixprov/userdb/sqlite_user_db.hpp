#pragma once

#include "orm.hpp"
#include "user_db.hpp"

#include <mixprov/config/config.hpp>
#include <mixprov/util/fs.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace mixprov::userdb
{
  /// UserDB persisted in a sqlite database.
  ///
  /// The whole directory is mirrored in memory.  Lookups run against an immutable snapshot that
  /// is swapped atomically after every committed write, so readers never wait for a writer;
  /// writers are serialized among themselves and hit the disk before publishing.
  class SqliteUserDB final : public UserDB
  {
   public:
    /// Opens (creating if needed) the database at `file`.
    ///
    /// @throws IncompatibleSchema if an existing database has no or an unknown schema version
    /// @throws std::runtime_error if the database cannot be opened or read
    explicit SqliteUserDB(
        const fs::path& file, size_t max_username_size = DEFAULT_MAX_USERNAME_SIZE);

    ~SqliteUserDB() override;

    bool
    is_valid(std::string_view user, const PubKey* key) const override;

    bool
    exists(std::string_view user) const override;

    void
    add(std::string_view user, const PubKey* key) override;

    size_t
    count() const override;

    void
    close() override;

   private:
    using UserMap = std::unordered_map<std::string, PubKey>;

    void
    check_version();

    void
    load_users();

    /// returns the current snapshot; aborts if there is none
    std::shared_ptr<const UserMap>
    snapshot() const;

    bool
    valid_username(std::string_view user) const;

    const fs::path _file;
    const size_t _max_username_size;

    std::mutex _write_mutex;
    std::unique_ptr<UserDbStorage> _storage;
    // only accessed through std::atomic_load / std::atomic_store
    std::shared_ptr<const UserMap> _users;
  };
}  // namespace mixprov::userdb
