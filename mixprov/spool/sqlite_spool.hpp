#pragma once

#include "orm.hpp"
#include "spool.hpp"

#include <mixprov/util/fs.hpp>

#include <memory>
#include <mutex>

namespace mixprov::spool
{
  /// Durable spool in a sqlite database: a single table ordered by insertion id, with an index
  /// on (user, id) for fetching the head of a user's spool.
  class SqliteSpool final : public Spool
  {
   public:
    /// @throws std::runtime_error if the database cannot be opened
    explicit SqliteSpool(const fs::path& file);

    ~SqliteSpool() override;

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
    append(std::string_view user, std::vector<char> surb_id, ustring_view msg);

    SpoolStorage&
    storage();

    const fs::path _file;
    std::mutex _mutex;
    std::unique_ptr<SpoolStorage> _storage;
  };
}  // namespace mixprov::spool
