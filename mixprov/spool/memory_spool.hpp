#pragma once

#include "spool.hpp"

#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace mixprov::spool
{
  /// Spool held entirely in memory; its content is lost when it is closed.
  class MemorySpool final : public Spool
  {
   public:
    void
    store_message(std::string_view user, ustring_view msg) override;

    void
    store_surb_reply(std::string_view user, const sphinx::SURBID& id, ustring_view msg) override;

    std::optional<SpoolEntry>
    get(std::string_view user, bool advance) override;

    void
    close() override;

   private:
    void
    append(std::string_view user, SpoolEntry entry);

    std::mutex _mutex;
    std::unordered_map<std::string, std::deque<SpoolEntry>> _spools;
    bool _closed{false};
  };
}  // namespace mixprov::spool
