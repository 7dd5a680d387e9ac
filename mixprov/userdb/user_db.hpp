#pragma once

#include <mixprov/crypto/types.hpp>

#include <cstddef>
#include <stdexcept>
#include <string_view>

namespace mixprov::userdb
{
  /// Thrown when an existing database carries a schema version this code does not understand.
  struct IncompatibleSchema : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  /// The provider's directory of users allowed to connect and to receive messages.
  struct UserDB
  {
    virtual ~UserDB() = default;

    /// Returns true iff `user` is registered with exactly `key`.  An empty or oversized username
    /// or a null key is rejected without a lookup.  Key comparison is constant-time.
    virtual bool
    is_valid(std::string_view user, const PubKey* key) const = 0;

    /// Returns true iff `user` is registered.
    virtual bool
    exists(std::string_view user) const = 0;

    /// Registers `user` with `key`, replacing any existing key.  Throws std::invalid_argument for
    /// an empty or oversized username or a null key, and std::runtime_error if the change cannot
    /// be persisted.
    virtual void
    add(std::string_view user, const PubKey* key) = 0;

    /// number of registered users
    virtual size_t
    count() const = 0;

    virtual void
    close() = 0;
  };
}  // namespace mixprov::userdb
