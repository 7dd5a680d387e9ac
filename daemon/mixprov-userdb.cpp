#include <mixprov/config/config.hpp>
#include <mixprov/crypto/types.hpp>
#include <mixprov/userdb/sqlite_user_db.hpp>
#include <mixprov/util/logging.hpp>
#include <mixprov/util/str.hpp>

#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>

#include <iostream>
#include <optional>
#include <string>

namespace
{
  auto logcat = mixprov::log::Cat("userdb-tool");

  struct command_line_options
  {
    std::string configPath;
    bool generate = false;
    bool verbose = false;

    std::string user;
    std::string pubkey;
  };

  std::optional<mixprov::Config>
  load_config(const std::string& path)
  {
    mixprov::Config conf;
    try
    {
      if (not conf.load(path))
        return std::nullopt;
    }
    catch (const std::exception& e)
    {
      mixprov::log::error(logcat, "invalid config {}: {}", path, e.what());
      return std::nullopt;
    }
    return conf;
  }
}  // namespace

int
main(int argc, char* argv[])
{
  using namespace mixprov;

  CLI::App cli{"Manage the users registered with a mixprov provider", "mixprov-userdb"};
  command_line_options options{};

  cli.add_flag("-g,--generate", options.generate, "Print a default configuration and exit");
  cli.add_flag("-v,--verbose", options.verbose, "Enable debug logging (prints keys)");
  cli.add_option("-c,--config", options.configPath, "Path to the provider configuration file");
  cli.require_subcommand(0, 1);

  auto* add = cli.add_subcommand("add", "Register a user, replacing any existing key");
  add->add_option("user", options.user, "Username")->required();
  add->add_option("pubkey", options.pubkey, "Hex encoded X25519 link public key")->required();

  auto* exists = cli.add_subcommand("exists", "Check whether a user is registered");
  exists->add_option("user", options.user, "Username")->required();

  auto* verify = cli.add_subcommand("verify", "Check a user's key");
  verify->add_option("user", options.user, "Username")->required();
  verify->add_option("pubkey", options.pubkey, "Hex encoded X25519 link public key")->required();

  try
  {
    cli.parse(argc, argv);
  }
  catch (const CLI::ParseError& e)
  {
    return cli.exit(e);
  }

  log::add_sink(log::Type::Print, "stderr");
  log::reset_level(options.verbose ? log::Level::debug : log::Level::warn);

  if (options.generate)
  {
    std::cout << Config::generate_ini();
    return 0;
  }

  if (cli.get_subcommands().empty())
  {
    std::cerr << cli.help();
    return 1;
  }

  if (options.configPath.empty())
  {
    log::error(logcat, "--config is required");
    return 1;
  }

  auto conf = load_config(options.configPath);
  if (not conf)
    return 1;

  try
  {
    userdb::SqliteUserDB db{conf->provider.user_db, conf->provider.max_username_size};

    if (*add)
    {
      auto key = PubKey::from_hex(TrimWhitespace(options.pubkey));
      db.add(options.user, &key);
      std::cout << "added " << printable_bytes(options.user) << std::endl;
      return 0;
    }

    if (*exists)
    {
      const bool found = db.exists(options.user);
      std::cout << printable_bytes(options.user) << (found ? " exists" : " does not exist")
                << std::endl;
      return found ? 0 : 1;
    }

    if (*verify)
    {
      auto key = PubKey::from_hex(TrimWhitespace(options.pubkey));
      const bool valid = db.is_valid(options.user, &key);
      std::cout << printable_bytes(options.user) << (valid ? ": key matches" : ": key mismatch")
                << std::endl;
      return valid ? 0 : 1;
    }
  }
  catch (const std::exception& e)
  {
    log::error(logcat, "{}", e.what());
    return 1;
  }

  return 1;
}
