#pragma once

#include "i_scheduler.hpp"
#include "key_manager.hpp"
#include "provider.hpp"

#include <mixprov/config/config.hpp>
#include <mixprov/sphinx/i_surb_crypto.hpp>
#include <mixprov/util/status.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace mixprov
{
  /// Brings up a node from its config: data directory, logging, node keys, and (on providers)
  /// the provider backend.  The scheduler and the Sphinx engine are owned by the caller and must
  /// outlive the server.
  class Server
  {
   public:
    /// With [debug]:generate-only set the server stops right after writing the node keys; check
    /// stopped() before using it.
    ///
    /// @throws std::runtime_error if any part fails to initialize; whatever was already brought
    ///         up is torn down again
    Server(Config config, IScheduler& scheduler, sphinx::ISURBCrypto& surb_crypto);

    ~Server();

    Server(const Server&) = delete;
    Server&
    operator=(const Server&) = delete;

    /// Halts the provider and wipes the node keys.  Only the first call does anything.
    void
    shutdown();

    /// true once shutdown() has run
    bool
    stopped() const
    {
      return _stopped;
    }

    /// the provider backend, or nullptr if this node is not a provider
    Provider*
    provider()
    {
      return _provider.get();
    }

    const Config&
    config() const
    {
      return _config;
    }

    PubKey
    identity_public_key() const
    {
      return _keys.identity_key.toPublic();
    }

    PubKey
    link_public_key() const
    {
      return _keys.link_key.toPublic();
    }

    util::StatusObject
    extract_status() const;

   private:
    void
    init_data_dir();

    void
    init_logging();

    const Config _config;
    KeyManager _keys;
    std::unique_ptr<Provider> _provider;
    std::once_flag _shutdown_once;
    std::atomic<bool> _stopped{false};
  };
}  // namespace mixprov
