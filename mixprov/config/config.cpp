#include "config.hpp"

#include <mixprov/sphinx/constants.hpp>
#include <mixprov/util/file.hpp>
#include <mixprov/util/str.hpp>

#include <stdexcept>

namespace mixprov
{
  using namespace config;

  static auto logcat = log::Cat("config");

  void
  ServerConfig::define_config_options(ConfigDefinition& conf)
  {
    conf.define_option<std::string>(
        "server",
        "identifier",
        Required,
        Comment{
            "Human readable identifier of this node, for example its FQDN.",
        },
        [this](std::string arg) {
          if (arg.empty())
            throw std::invalid_argument{"[server]:identifier must not be empty"};
          identifier = std::move(arg);
        });

    conf.define_option<std::string>(
        "server",
        "data-dir",
        Required,
        Comment{
            "Absolute path to the directory holding the node keys and databases.  It is created",
            "if missing and must only be accessible by its owner (mode 0700).",
        },
        [this](std::string arg) {
          fs::path dir{arg};
          if (not dir.is_absolute())
            throw std::invalid_argument{"[server]:data-dir must be an absolute path: " + arg};
          data_dir = std::move(dir);
        });

    conf.define_option<bool>(
        "server",
        "is-provider",
        Default{false},
        assignment_acceptor(is_provider),
        Comment{
            "Run this node as a provider, accepting and spooling messages for local users.",
        });
  }

  SpoolType
  spool_type_from_string(std::string_view str)
  {
    auto s = lowercase_ascii_string(std::string{str});
    if (s == "sqlite")
      return SpoolType::sqlite;
    if (s == "memory")
      return SpoolType::memory;
    throw std::invalid_argument{"invalid spool type: " + s};
  }

  std::string_view
  to_string(SpoolType t)
  {
    switch (t)
    {
      case SpoolType::sqlite:
        return "sqlite";
      case SpoolType::memory:
        return "memory";
    }
    return "unknown";
  }

  void
  ProviderConfig::define_config_options(ConfigDefinition& conf)
  {
    conf.define_option<std::string>(
        "provider",
        "user-db",
        Default{DEFAULT_USER_DB},
        [this](std::string arg) { user_db = std::move(arg); },
        Comment{
            "Path to the user database; relative paths are resolved against the data directory.",
        });

    conf.define_option<std::string>(
        "provider",
        "spool-db",
        Default{DEFAULT_SPOOL_DB},
        [this](std::string arg) { spool_db = std::move(arg); },
        Comment{
            "Path to the message spool database; relative paths are resolved against the data",
            "directory.  Unused with spool-type=memory.",
        });

    conf.define_option<std::string>(
        "provider",
        "spool-type",
        Default{"sqlite"},
        [this](std::string arg) { spool_type = spool_type_from_string(arg); },
        Comment{
            "Message spool backend.  Valid options are:",
            "  sqlite - durable spool stored in spool-db",
            "  memory - non-persistent spool, lost on restart",
        });

    conf.define_option<size_t>(
        "provider",
        "max-username-size",
        Default{DEFAULT_MAX_USERNAME_SIZE},
        [this](size_t arg) {
          if (arg < 1 or arg > sphinx::RECIPIENT_ID_LENGTH)
            throw std::invalid_argument{
                "[provider]:max-username-size must be between 1 and {}"_format(
                    sphinx::RECIPIENT_ID_LENGTH)};
          max_username_size = arg;
        },
        Comment{
            "Maximum length in bytes of a username.",
        });

    conf.define_option<size_t>(
        "provider",
        "queue-size",
        Default{0},
        assignment_acceptor(queue_size),
        Comment{
            "Maximum number of packets waiting to be spooled.  Packets arriving while the queue is",
            "full are dropped.  0 means unbounded.",
        });
  }

  void
  LoggingConfig::define_config_options(ConfigDefinition& conf)
  {
    conf.define_option<std::string>(
        "logging",
        "type",
        Default{"print"},
        [this](std::string arg) { type = log::type_from_string(arg); },
        Comment{
            "Log type (format). Valid options are:",
            "  print - print logs to standard output",
            "  system - logs directed to the system logger (syslog/eventlog/etc.)",
            "  file - plaintext formatting to a file",
        });

    conf.define_option<std::string>(
        "logging",
        "level",
        Default{"info"},
        [this](std::string arg) { level = log::level_from_string(arg); },
        Comment{
            "Minimum log level to print. Logging below this level will be ignored.",
            "Valid log levels, in ascending order, are:",
            "  trace",
            "  debug",
            "  info",
            "  warn",
            "  error",
            "  critical",
            "  none",
            "Levels of debug and below print usernames and keys.",
        });

    conf.define_option<std::string>(
        "logging",
        "file",
        Default{""},
        assignment_acceptor(file),
        Comment{
            "When using type=file this is the output filename; relative paths are resolved",
            "against the data directory.",
        });

    conf.define_option<bool>(
        "logging",
        "disable",
        Default{false},
        assignment_acceptor(disable),
        Comment{
            "Discard all log output.",
        });
  }

  void
  DebugConfig::define_config_options(ConfigDefinition& conf)
  {
    conf.define_option<bool>(
        "debug",
        "generate-only",
        Default{false},
        Hidden,
        assignment_acceptor(generate_only),
        Comment{
            "Generate the node keys and exit.",
        });

    conf.define_option<int>(
        "debug",
        "num-sphinx-workers",
        Default{1},
        Hidden,
        [this](int arg) {
          if (arg < 1)
            throw std::invalid_argument{"[debug]:num-sphinx-workers must be at least 1"};
          num_sphinx_workers = arg;
        });
  }

  void
  Config::init_config(ConfigDefinition& conf)
  {
    server.define_config_options(conf);
    provider.define_config_options(conf);
    logging.define_config_options(conf);
    debug.define_config_options(conf);
  }

  void
  Config::resolve_paths()
  {
    if (provider.user_db.is_relative())
      provider.user_db = server.data_dir / provider.user_db;
    if (provider.spool_db.is_relative())
      provider.spool_db = server.data_dir / provider.spool_db;
    if (not logging.file.empty() and fs::path{logging.file}.is_relative())
      logging.file = (server.data_dir / logging.file).string();
  }

  bool
  Config::load_config_data(std::string_view ini, std::optional<fs::path> filename)
  {
    ConfigDefinition conf;
    init_config(conf);

    parser.clear();
    if (not parser.load_from_str(ini, filename ? filename->string() : "<string>"))
      return false;

    parser.iter_all_sections([&](std::string_view section, const SectionValues& values) {
      for (const auto& pair : values)
        conf.add_config_value(section, pair.first, pair.second);
    });

    conf.process();
    resolve_paths();

    log::debug(
        logcat,
        "loaded config from {}",
        filename ? filename->string() : std::string{"<string>"});
    return true;
  }

  bool
  Config::load(const fs::path& fname)
  {
    std::string ini;
    try
    {
      ini = util::file_to_string(fname);
    }
    catch (const std::exception& e)
    {
      log::error(logcat, "cannot read config file {}: {}", fname.string(), e.what());
      return false;
    }
    return load_config_data(ini, fname);
  }

  bool
  Config::load_string(std::string_view ini)
  {
    return load_config_data(ini, std::nullopt);
  }

  std::string
  Config::generate_ini()
  {
    Config config;
    ConfigDefinition conf;
    config.init_config(conf);

    conf.add_section_comments("server", {"Node identity and role."});
    conf.add_section_comments("provider", {"Provider message spooling, used if is-provider=true."});

    return conf.generate_ini_config(false);
  }

}  // namespace mixprov
