#include <catch2/catch.hpp>

#include <cstdlib>
#include <fstream>

#include "TestSupport.hpp"
#include "presence/core/Config.hpp"

using namespace presence::core;

TEST_CASE("config parse reads present keys and keeps defaults for the rest") {
  PresenceConfig config;
  std::string error;
  const bool ok = ParsePresenceConfig(R"({
    "movement": {"base_speed": 240, "accelerate_gain": "fast"},
    "broadcast": {"position_interval_seconds": 0.1},
    "relay": {"host": "relay.local", "port": 47700},
    "local_broadcast": {"enabled": false}
  })", config, &error);

  REQUIRE(ok);
  REQUIRE(config.movement.baseSpeed == Approx(240.0));
  REQUIRE(config.movement.accelerateGain == Approx(8.0));
  REQUIRE(config.broadcast.positionIntervalSeconds == Approx(0.1));
  REQUIRE(config.broadcast.voiceIntervalSeconds == Approx(0.14));
  REQUIRE(config.HasRelayConfiguration());
  REQUIRE_FALSE(config.localBroadcast.enabled);
  REQUIRE(config.WorldWidth() == Approx(1024.0));
  REQUIRE(config.WorldHeight() == Approx(640.0));
}

TEST_CASE("config values are clamped into sane ranges") {
  PresenceConfig config;
  REQUIRE(ParsePresenceConfig(R"({"movement":{"max_tick_seconds":3.0},"liveness":{"stale_timeout_seconds":-4}})", config));
  REQUIRE(config.movement.maxTickSeconds == Approx(0.25));
  REQUIRE(config.liveness.staleTimeoutSeconds == Approx(0.0));
}

TEST_CASE("invalid config JSON is reported") {
  PresenceConfig config;
  std::string error;
  REQUIRE_FALSE(ParsePresenceConfig("{oops", config, &error));
  REQUIRE_FALSE(error.empty());
  REQUIRE_FALSE(ParsePresenceConfig("[]", config, &error));
}

TEST_CASE("missing config file is created with defaults") {
  ScratchDirectory scratch;
  const std::string path = (scratch.Path() / "config" / "presence.json").string();

  PresenceConfig config;
  REQUIRE(LoadPresenceConfig(path, config));
  REQUIRE(std::filesystem::exists(path));

  PresenceConfig reloaded;
  REQUIRE(LoadPresenceConfig(path, reloaded));
  REQUIRE(reloaded.movement.baseSpeed == Approx(config.movement.baseSpeed));
  REQUIRE(reloaded.storage.root == config.storage.root);
}

TEST_CASE("corrupt config file falls back to defaults and is rewritten") {
  ScratchDirectory scratch;
  const std::string path = (scratch.Path() / "presence.json").string();
  {
    std::ofstream out(path);
    out << "{ definitely not json";
  }

  PresenceConfig config;
  config.movement.baseSpeed = 1.0F;
  std::string error;
  REQUIRE_FALSE(LoadPresenceConfig(path, config, &error));
  REQUIRE(config.movement.baseSpeed == Approx(180.0));

  PresenceConfig reloaded;
  REQUIRE(LoadPresenceConfig(path, reloaded));
}

TEST_CASE("serialized config parses back to the same values") {
  PresenceConfig config;
  config.relay.host = "10.0.0.2";
  config.relay.port = 5000;
  config.storage.root = "/tmp/rooms";
  config.log.level = "debug";

  PresenceConfig parsed;
  REQUIRE(ParsePresenceConfig(SerializePresenceConfig(config), parsed));
  REQUIRE(parsed.relay.host == "10.0.0.2");
  REQUIRE(parsed.relay.port == 5000);
  REQUIRE(parsed.storage.root == "/tmp/rooms");
  REQUIRE(parsed.log.level == "debug");
}

TEST_CASE("environment overrides win over the file") {
  setenv("PRESENCE_RELAY_HOST", "env-relay", 1);
  setenv("PRESENCE_RELAY_PORT", "47701", 1);
  setenv("PRESENCE_DISABLE_LOCAL_BROADCAST", "1", 1);

  PresenceConfig config;
  ApplyEnvironmentOverrides(config);
  REQUIRE(config.relay.host == "env-relay");
  REQUIRE(config.relay.port == 47701);
  REQUIRE_FALSE(config.localBroadcast.enabled);

  unsetenv("PRESENCE_RELAY_HOST");
  unsetenv("PRESENCE_RELAY_PORT");
  unsetenv("PRESENCE_DISABLE_LOCAL_BROADCAST");
}
