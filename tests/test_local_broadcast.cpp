#include <catch2/catch.hpp>

#include "presence/net/LocalBroadcastTransport.hpp"

using presence::net::LocalBroadcastTransport;

TEST_CASE("datagram header carries room key and origin") {
  const std::string datagram = LocalBroadcastTransport::BuildDatagram("vm_room_a", "inst-1", R"({"type":"x"})");
  REQUIRE(datagram.rfind("PRESENCE|room=vm_room_a|origin=inst-1\n", 0) == 0);

  std::string room;
  std::string origin;
  std::string payload;
  REQUIRE(LocalBroadcastTransport::ParseDatagram(datagram, room, origin, payload));
  REQUIRE(room == "vm_room_a");
  REQUIRE(origin == "inst-1");
  REQUIRE(payload == R"({"type":"x"})");
}

TEST_CASE("foreign or truncated datagrams are rejected") {
  std::string room;
  std::string origin;
  std::string payload;
  REQUIRE_FALSE(LocalBroadcastTransport::ParseDatagram("DISCOVER_REQUEST|protocol=1", room, origin, payload));
  REQUIRE_FALSE(LocalBroadcastTransport::ParseDatagram("PRESENCE|room=a|origin=b", room, origin, payload));
  REQUIRE_FALSE(LocalBroadcastTransport::ParseDatagram("PRESENCE|room=a\n{}", room, origin, payload));
}

TEST_CASE("header fields are read up to the next separator") {
  REQUIRE(LocalBroadcastTransport::ParseField("PRESENCE|room=a|origin=b", "room") == "a");
  REQUIRE(LocalBroadcastTransport::ParseField("PRESENCE|room=a|origin=b", "origin") == "b");
  REQUIRE(LocalBroadcastTransport::ParseField("PRESENCE|room=a", "origin").empty());
}

TEST_CASE("disabled local broadcast refuses to open") {
  presence::core::LocalBroadcastSettings settings;
  settings.enabled = false;
  std::string error;
  REQUIRE(LocalBroadcastTransport::Open(settings, "vm_room_a", "inst-1", &error) == nullptr);
  REQUIRE_FALSE(error.empty());
}
