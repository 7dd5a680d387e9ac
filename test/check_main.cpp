#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <mixprov/util/logging.hpp>

int
main(int argc, char* argv[])
{
  mixprov::log::reset_level(mixprov::log::Level::off);

  return Catch::Session().run(argc, argv);
}
