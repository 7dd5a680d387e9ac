#pragma once

#include "definition.hpp"
#include "ini.hpp"

#include <mixprov/util/fs.hpp>
#include <mixprov/util/logging.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mixprov
{
  using SectionValues = ConfigParser::SectionValues;

  inline constexpr size_t DEFAULT_MAX_USERNAME_SIZE = 64;
  inline constexpr auto DEFAULT_USER_DB = "users.db";
  inline constexpr auto DEFAULT_SPOOL_DB = "spool.db";

  struct ServerConfig
  {
    /// human readable identifier of this node, used in log output
    std::string identifier;
    /// directory holding key material and the provider databases
    fs::path data_dir;
    bool is_provider = false;

    void
    define_config_options(ConfigDefinition& conf);
  };

  enum class SpoolType
  {
    sqlite,
    memory,
  };

  SpoolType
  spool_type_from_string(std::string_view str);

  std::string_view
  to_string(SpoolType t);

  struct ProviderConfig
  {
    fs::path user_db;
    fs::path spool_db;
    SpoolType spool_type = SpoolType::sqlite;
    size_t max_username_size = DEFAULT_MAX_USERNAME_SIZE;
    /// capacity of the dispatch queue; 0 for unbounded
    size_t queue_size = 0;

    void
    define_config_options(ConfigDefinition& conf);
  };

  struct LoggingConfig
  {
    log::Type type = log::Type::Print;
    log::Level level = log::Level::info;
    std::string file;
    bool disable = false;

    void
    define_config_options(ConfigDefinition& conf);
  };

  struct DebugConfig
  {
    /// create the node keys and exit
    bool generate_only = false;
    int num_sphinx_workers = 1;

    void
    define_config_options(ConfigDefinition& conf);
  };

  struct Config
  {
    ServerConfig server;
    ProviderConfig provider;
    LoggingConfig logging;
    DebugConfig debug;

    /// Loads the config from an ini file.  Returns false if the file cannot be read; throws on
    /// invalid content.
    bool
    load(const fs::path& fname);

    /// Loads the config from a string of ini, same effects as Config::load
    bool
    load_string(std::string_view ini);

    /// Renders a documented config with every option at its default.
    static std::string
    generate_ini();

   private:
    void
    init_config(ConfigDefinition& conf);

    bool
    load_config_data(std::string_view ini, std::optional<fs::path> fname);

    /// resolves paths that were given relative to the data directory
    void
    resolve_paths();

    ConfigParser parser;
  };

}  // namespace mixprov
