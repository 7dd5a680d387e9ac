#include "key_manager.hpp"

#include <mixprov/crypto/crypto.hpp>
#include <mixprov/crypto/key_file.hpp>
#include <mixprov/util/logging.hpp>

namespace mixprov
{
  static auto logcat = log::Cat("keys");

  bool
  KeyManager::initialize(const Config& config)
  {
    if (is_initialized)
      return false;

    const fs::path& root = config.server.data_dir;
    idkey_path = root / IDENTITY_KEY_FILE;
    linkkey_path = root / LINK_KEY_FILE;

    if (not keygen(
            idkey_path,
            crypto::IDENTITY_KEY_TYPE,
            identity_key,
            crypto::identity_keygen,
            crypto::check_identity_privkey))
    {
      log::critical(logcat, "Failed to initialize identity key");
      return false;
    }

    if (not keygen(
            linkkey_path,
            crypto::LINK_KEY_TYPE,
            link_key,
            crypto::encryption_keygen,
            crypto::check_encryption_privkey))
    {
      log::critical(logcat, "Failed to initialize link key");
      return false;
    }

    is_initialized = true;
    return true;
  }

  void
  KeyManager::reset()
  {
    identity_key.Reset();
    link_key.Reset();
    is_initialized = false;
  }

  bool
  KeyManager::keygen(
      const fs::path& path,
      std::string_view type,
      SecretKey& key,
      std::function<void(SecretKey&)> keygen,
      std::function<bool(const SecretKey&)> check)
  {
    try
    {
      if (crypto::load_key_file(path, type, key))
      {
        if (not check(key))
        {
          key.Reset();
          log::error(logcat, "{} in {} is inconsistent", type, path.string());
          return false;
        }
        return true;
      }

      log::info(logcat, "Generating new {} at {}", type, path.string());
      keygen(key);
      crypto::save_key_file(path, type, key);
      return true;
    }
    catch (const std::exception& e)
    {
      key.Reset();
      log::error(logcat, "Failed to load {} from {}: {}", type, path.string(), e.what());
      return false;
    }
  }
}  // namespace mixprov
