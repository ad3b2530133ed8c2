#include <catch2/catch.hpp>

#include "presence/net/RelayProtocol.hpp"

using namespace presence::net;

TEST_CASE("join packet carries room and key after the kind byte") {
  RelayJoinRequest request;
  request.room = "vm_room_lobby";
  request.key = "secret";
  const auto packet = BuildJoinPacket(request);
  REQUIRE(packet.front() == kRelayPacketJoinRoom);

  RelayJoinRequest parsed;
  REQUIRE(ParseJoinPacket(packet, parsed));
  REQUIRE(parsed.room == "vm_room_lobby");
  REQUIRE(parsed.key == "secret");
}

TEST_CASE("malformed join packets are rejected") {
  RelayJoinRequest parsed;
  REQUIRE_FALSE(ParseJoinPacket({}, parsed));
  REQUIRE_FALSE(ParseJoinPacket({kRelayPacketData, '{', '}'}, parsed));

  std::vector<std::uint8_t> garbage{kRelayPacketJoinRoom};
  const std::string body = "{\"room\":";
  garbage.insert(garbage.end(), body.begin(), body.end());
  REQUIRE_FALSE(ParseJoinPacket(garbage, parsed));

  std::vector<std::uint8_t> emptyRoom{kRelayPacketJoinRoom};
  const std::string emptyBody = "{\"room\":\"\"}";
  emptyRoom.insert(emptyRoom.end(), emptyBody.begin(), emptyBody.end());
  REQUIRE_FALSE(ParseJoinPacket(emptyRoom, parsed));
}

TEST_CASE("data packets wrap the payload verbatim") {
  const std::string payload = R"({"type":"leave","payload":{"id":"x"}})";
  const auto packet = BuildDataPacket(payload);
  REQUIRE(packet.front() == kRelayPacketData);
  REQUIRE(PacketBody(packet.data(), packet.size()) == payload);
  REQUIRE(PacketBody(packet.data(), 1).empty());
}
