#include "memory_spool.hpp"

namespace mixprov::spool
{
  void
  MemorySpool::append(std::string_view user, SpoolEntry entry)
  {
    std::lock_guard lock{_mutex};
    if (_closed)
      throw SpoolError{"spool is closed"};
    _spools[std::string{user}].push_back(std::move(entry));
  }

  void
  MemorySpool::store_message(std::string_view user, ustring_view msg)
  {
    append(user, SpoolEntry{ustring{msg}, std::nullopt});
  }

  void
  MemorySpool::store_surb_reply(std::string_view user, const sphinx::SURBID& id, ustring_view msg)
  {
    append(user, SpoolEntry{ustring{msg}, id});
  }

  std::optional<SpoolEntry>
  MemorySpool::get(std::string_view user, bool advance)
  {
    std::lock_guard lock{_mutex};
    if (_closed)
      throw SpoolError{"spool is closed"};

    auto itr = _spools.find(std::string{user});
    if (itr == _spools.end())
      return std::nullopt;

    auto& entries = itr->second;
    if (advance and not entries.empty())
      entries.pop_front();
    if (entries.empty())
    {
      _spools.erase(itr);
      return std::nullopt;
    }
    return entries.front();
  }

  void
  MemorySpool::close()
  {
    std::lock_guard lock{_mutex};
    _closed = true;
    _spools.clear();
  }
}  // namespace mixprov::spool
