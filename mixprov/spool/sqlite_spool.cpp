#include "sqlite_spool.hpp"

#include <mixprov/util/file.hpp>
#include <mixprov/util/logging.hpp>

#include <algorithm>
#include <system_error>

namespace mixprov::spool
{
  static auto logcat = log::Cat("spool");

  static std::vector<char>
  to_blob(std::string_view s)
  {
    return {s.begin(), s.end()};
  }

  SqliteSpool::SqliteSpool(const fs::path& file) : _file{file}
  {
    if (auto ec = util::EnsurePrivateFile(_file))
      throw SpoolError{"cannot create spool {}: {}"_format(_file.string(), ec.message())};

    log::info(logcat, "Opening spool {}", _file.string());
    try
    {
      _storage = std::make_unique<SpoolStorage>(init_storage(_file.string()));
      _storage->open_forever();
      _storage->sync_schema(true);
    }
    catch (const std::system_error& e)
    {
      throw SpoolError{"cannot open spool {}: {}"_format(_file.string(), e.what())};
    }
  }

  SqliteSpool::~SqliteSpool()
  {
    close();
  }

  SpoolStorage&
  SqliteSpool::storage()
  {
    if (not _storage)
      throw SpoolError{"spool {} is closed"_format(_file.string())};
    return *_storage;
  }

  void
  SqliteSpool::append(std::string_view user, std::vector<char> surb_id, ustring_view msg)
  {
    std::lock_guard lock{_mutex};
    auto& db = storage();
    auto id = db.insert(SpoolRow{0, to_blob(user), std::move(surb_id), to_blob(to_sv(msg))});
    log::trace(logcat, "spooled entry {} ({} bytes)", id, msg.size());
  }

  void
  SqliteSpool::store_message(std::string_view user, ustring_view msg)
  {
    append(user, {}, msg);
  }

  void
  SqliteSpool::store_surb_reply(std::string_view user, const sphinx::SURBID& id, ustring_view msg)
  {
    append(user, {id.begin(), id.end()}, msg);
  }

  std::optional<SpoolEntry>
  SqliteSpool::get(std::string_view user, bool advance)
  {
    using namespace sqlite_orm;

    std::lock_guard lock{_mutex};
    auto& db = storage();

    auto guard = db.transaction_guard();
    auto rows = db.get_all<SpoolRow>(
        where(c(&SpoolRow::user) == to_blob(user)),
        order_by(&SpoolRow::id),
        limit(advance ? 2 : 1));

    auto head = rows.begin();
    if (advance and head != rows.end())
    {
      db.remove<SpoolRow>(head->id);
      ++head;
    }
    guard.commit();

    if (head == rows.end())
      return std::nullopt;

    SpoolEntry entry;
    entry.message.assign(head->message.begin(), head->message.end());
    if (not head->surb_id.empty())
    {
      if (head->surb_id.size() != sphinx::SURB_ID_LENGTH)
        throw SpoolError{
            "spool {}: entry {} has a malformed SURB id"_format(_file.string(), head->id)};
      sphinx::SURBID id;
      std::copy(head->surb_id.begin(), head->surb_id.end(), id.begin());
      entry.surb_id = id;
    }
    return entry;
  }

  void
  SqliteSpool::close()
  {
    std::lock_guard lock{_mutex};
    if (not _storage)
      return;
    _storage.reset();
    log::debug(logcat, "Closed spool {}", _file.string());
  }
}  // namespace mixprov::spool
