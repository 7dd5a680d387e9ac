#include "server.hpp"

#include <mixprov/util/logging.hpp>
#include <mixprov/util/time.hpp>

#include <system_error>

namespace mixprov
{
  static auto logcat = log::Cat("server");

  Server::Server(Config config, IScheduler& scheduler, sphinx::ISURBCrypto& surb_crypto)
      : _config{std::move(config)}
  {
    init_data_dir();
    init_logging();

    if (_config.logging.level <= log::Level::debug and not _config.logging.disable)
      log::warning(logcat, "Unsafe debug logging is enabled; usernames and keys will be logged");
    log::info(logcat, "Server identifier is: '{}'", _config.server.identifier);

    if (not _keys.initialize(_config))
      throw std::runtime_error{"failed to initialize node keys"};
    log::info(logcat, "Server identity public key is: {}", identity_public_key().ToString());
    log::info(logcat, "Server link public key is: {}", link_public_key().ToString());

    if (_config.debug.generate_only)
    {
      log::info(logcat, "generate-only set, node keys written");
      shutdown();
      return;
    }

    if (_config.server.is_provider)
    {
      try
      {
        _provider = std::make_unique<Provider>(_config.provider, scheduler, surb_crypto);
      }
      catch (const std::exception& e)
      {
        log::error(logcat, "Failed to initialize provider backend: {}", e.what());
        shutdown();
        throw;
      }
    }
  }

  Server::~Server()
  {
    shutdown();
  }

  void
  Server::init_data_dir()
  {
    const auto& dir = _config.server.data_dir;
    constexpr auto dir_mode = fs::perms::owner_all;

    std::error_code ec;
    auto st = fs::symlink_status(dir, ec);
    if (not fs::exists(st))
    {
      if (ec and ec != std::errc::no_such_file_or_directory)
        throw std::system_error{ec, "failed to stat data-dir " + dir.string()};
      if (not fs::create_directory(dir, ec))
        throw std::system_error{ec, "failed to create data-dir " + dir.string()};
      fs::permissions(dir, dir_mode, fs::perm_options::replace, ec);
      if (ec)
        throw std::system_error{ec, "failed to set permissions on data-dir " + dir.string()};
      return;
    }

    if (not fs::is_directory(st))
      throw std::runtime_error{"data-dir '{}' is not a directory"_format(dir.string())};
    if ((st.permissions() & fs::perms::mask) != dir_mode)
      throw std::runtime_error{"data-dir '{}' has invalid permissions {:o}"_format(
          dir.string(), static_cast<unsigned>(st.permissions() & fs::perms::mask))};
  }

  void
  Server::init_logging()
  {
    const auto& conf = _config.logging;

    log::clear_sinks();
    if (conf.disable)
    {
      log::reset_level(log::Level::off);
      return;
    }

    auto log_type = conf.type;
    if (log_type == log::Type::File and conf.file.empty())
      log_type = log::Type::Print;

    log::reset_level(conf.level);
    log::add_sink(log_type, log_type == log::Type::System ? "mixprov" : conf.file);
  }

  void
  Server::shutdown()
  {
    std::call_once(_shutdown_once, [this] {
      log::info(logcat, "Starting graceful shutdown");
      if (_provider)
        _provider->halt();
      _keys.reset();
      _stopped = true;
      log::info(logcat, "Shutdown complete");
    });
  }

  util::StatusObject
  Server::extract_status() const
  {
    util::StatusObject obj{
        {"identifier", _config.server.identifier},
        {"isProvider", _config.server.is_provider},
        {"uptime", to_json(uptime())},
    };
    if (_provider)
      obj["provider"] = _provider->extract_status();
    return obj;
  }
}  // namespace mixprov
