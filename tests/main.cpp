#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "presence/core/Log.hpp"

int main(int argc, char* argv[]) {
  presence::core::Log::Instance().SetConsoleEnabled(false);
  return Catch::Session().run(argc, argv);
}
