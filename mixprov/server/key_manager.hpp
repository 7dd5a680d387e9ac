#pragma once

#include <mixprov/config/config.hpp>
#include <mixprov/crypto/types.hpp>
#include <mixprov/util/fs.hpp>

#include <functional>
#include <string_view>

namespace mixprov
{
  inline constexpr auto IDENTITY_KEY_FILE = "identity.private.key";
  inline constexpr auto LINK_KEY_FILE = "link.private.key";

  /// KeyManager manages the long term private keys stored in the data directory: the Ed25519
  /// identity key and the X25519 link key.
  ///
  /// Keys are read from disk if they exist and are valid, or are generated and written to disk
  /// with owner-only permissions.
  struct KeyManager
  {
    KeyManager() = default;

    KeyManager(const KeyManager&) = delete;
    KeyManager&
    operator=(const KeyManager&) = delete;

    /// Loads or generates both keys.  Blocks on I/O.
    ///
    /// @return true on success, false (after logging the reason) otherwise
    bool
    initialize(const Config& config);

    /// wipes both keys from memory
    void
    reset();

    bool
    initialized() const
    {
      return is_initialized;
    }

    SecretKey identity_key;
    SecretKey link_key;

    fs::path idkey_path;
    fs::path linkkey_path;

   private:
    /// Loads the key stored at `path`, generating and saving a new one first if there is none.
    /// `check` verifies that a loaded key is internally consistent.
    static bool
    keygen(
        const fs::path& path,
        std::string_view type,
        SecretKey& key,
        std::function<void(SecretKey&)> keygen,
        std::function<bool(const SecretKey&)> check);

    bool is_initialized = false;
  };
}  // namespace mixprov
