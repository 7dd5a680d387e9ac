#include "sqlite_user_db.hpp"

#include <mixprov/crypto/crypto.hpp>
#include <mixprov/util/file.hpp>
#include <mixprov/util/logging.hpp>
#include <mixprov/util/str.hpp>

#include <atomic>
#include <cstdlib>
#include <system_error>
#include <vector>

namespace mixprov::userdb
{
  static auto logcat = log::Cat("userdb");

  SqliteUserDB::SqliteUserDB(const fs::path& file, size_t max_username_size)
      : _file{file}, _max_username_size{max_username_size}
  {
    if (auto ec = util::EnsurePrivateFile(_file))
      throw std::runtime_error{"cannot create user db {}: {}"_format(_file.string(), ec.message())};

    log::info(logcat, "Loading user db from {}", _file.string());
    try
    {
      _storage = std::make_unique<UserDbStorage>(init_storage(_file.string()));
      _storage->open_forever();
      check_version();
      load_users();
    }
    catch (const std::system_error& e)
    {
      throw std::runtime_error{"cannot open user db {}: {}"_format(_file.string(), e.what())};
    }
  }

  SqliteUserDB::~SqliteUserDB()
  {
    close();
  }

  void
  SqliteUserDB::check_version()
  {
    using namespace sqlite_orm;

    // sync_schema() may drop and recreate tables whose layout differs, so it must not run before
    // the stored version has been accepted
    if (not _storage->table_exists("metadata"))
    {
      if (_storage->table_exists("users"))
        throw IncompatibleSchema{"user db {} has no schema version"_format(_file.string())};

      _storage->sync_schema(true);
      _storage->replace(MetadataRow{VERSION_KEY, {SCHEMA_VERSION}});
      log::debug(logcat, "Initialized new user db schema version {}", int{SCHEMA_VERSION});
      return;
    }

    std::vector<std::vector<char>> version;
    try
    {
      version = _storage->select(
          &MetadataRow::value, where(c(&MetadataRow::name) == std::string{VERSION_KEY}));
    }
    catch (const std::system_error& e)
    {
      throw IncompatibleSchema{
          "user db {} has an unreadable schema version: {}"_format(_file.string(), e.what())};
    }

    if (version.empty())
      throw IncompatibleSchema{"user db {} has no schema version"_format(_file.string())};
    const auto& value = version.front();
    if (value.size() != 1 or value[0] != SCHEMA_VERSION)
      throw IncompatibleSchema{"user db {} has incompatible schema version {}"_format(
          _file.string(), printable_bytes({value.data(), value.size()}))};

    _storage->sync_schema(true);
  }

  void
  SqliteUserDB::load_users()
  {
    auto users = std::make_shared<UserMap>();
    for (const auto& row : _storage->get_all<UserRow>())
    {
      if (row.public_key.size() != PubKey::SIZE)
        throw std::runtime_error{"user db {}: invalid key length {} for '{}'"_format(
            _file.string(),
            row.public_key.size(),
            printable_bytes({row.username.data(), row.username.size()}))};
      users->emplace(
          std::string{row.username.begin(), row.username.end()},
          PubKey{reinterpret_cast<const byte_t*>(row.public_key.data())});
    }
    log::info(logcat, "Loaded {} users from {}", users->size(), _file.string());
    std::atomic_store(&_users, std::shared_ptr<const UserMap>{std::move(users)});
  }

  std::shared_ptr<const SqliteUserDB::UserMap>
  SqliteUserDB::snapshot() const
  {
    auto users = std::atomic_load(&_users);
    if (not users)
    {
      log::critical(logcat, "user db {} has no user table snapshot", _file.string());
      std::abort();
    }
    return users;
  }

  bool
  SqliteUserDB::valid_username(std::string_view user) const
  {
    return user.data() != nullptr and not user.empty() and user.size() <= _max_username_size;
  }

  bool
  SqliteUserDB::is_valid(std::string_view user, const PubKey* key) const
  {
    if (not valid_username(user) or key == nullptr)
      return false;

    auto users = snapshot();
    auto itr = users->find(std::string{user});
    if (itr == users->end())
      return false;
    return crypto::constant_time_equal(itr->second.data(), key->data(), PubKey::SIZE);
  }

  bool
  SqliteUserDB::exists(std::string_view user) const
  {
    if (not valid_username(user))
      return false;
    auto users = snapshot();
    return users->count(std::string{user}) != 0;
  }

  void
  SqliteUserDB::add(std::string_view user, const PubKey* key)
  {
    if (user.data() == nullptr or user.empty())
      throw std::invalid_argument{"username must not be empty"};
    if (user.size() > _max_username_size)
      throw std::invalid_argument{
          "username exceeds {} bytes: {}"_format(_max_username_size, user.size())};
    if (key == nullptr)
      throw std::invalid_argument{"public key must be provided"};

    std::lock_guard lock{_write_mutex};
    if (not _storage)
      throw std::runtime_error{"user db {} is closed"_format(_file.string())};

    if (not _storage->table_exists("users"))
    {
      log::critical(logcat, "user db {} lost its users table", _file.string());
      std::abort();
    }

    _storage->replace(UserRow{
        std::vector<char>(user.begin(), user.end()),
        std::vector<char>(key->begin(), key->end())});

    auto next = std::make_shared<UserMap>(*snapshot());
    (*next)[std::string{user}] = *key;
    std::atomic_store(&_users, std::shared_ptr<const UserMap>{std::move(next)});

    log::debug(logcat, "Added user '{}' with key {}", printable_bytes(user), key->ToString());
  }

  size_t
  SqliteUserDB::count() const
  {
    return snapshot()->size();
  }

  void
  SqliteUserDB::close()
  {
    std::lock_guard lock{_write_mutex};
    if (not _storage)
      return;
    _storage.reset();
    log::debug(logcat, "Closed user db {}", _file.string());
  }
}  // namespace mixprov::userdb
