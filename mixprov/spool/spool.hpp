#pragma once

#include <mixprov/config/config.hpp>
#include <mixprov/sphinx/commands.hpp>
#include <mixprov/util/types.hpp>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string_view>

namespace mixprov::spool
{
  struct SpoolError : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  /// One entry of a user's spool: a message, or a SURB reply if surb_id is set.
  struct SpoolEntry
  {
    ustring message;
    std::optional<sphinx::SURBID> surb_id;
  };

  /// Per-user FIFO store of messages waiting to be fetched.  Failures are reported as SpoolError
  /// (or another std::runtime_error from the storage engine).
  struct Spool
  {
    virtual ~Spool() = default;

    /// Appends a message to the user's spool.
    virtual void
    store_message(std::string_view user, ustring_view msg) = 0;

    /// Appends a SURB reply to the user's spool.
    virtual void
    store_surb_reply(std::string_view user, const sphinx::SURBID& id, ustring_view msg) = 0;

    /// Optionally deletes the first entry of the user's spool, then returns the (new) first
    /// entry, or nullopt if the spool is empty.
    virtual std::optional<SpoolEntry>
    get(std::string_view user, bool advance) = 0;

    virtual void
    close() = 0;
  };

  /// Creates the spool backend selected by `conf.spool_type`.
  std::unique_ptr<Spool>
  make_spool(const ProviderConfig& conf);
}  // namespace mixprov::spool
