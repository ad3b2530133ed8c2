#include <catch2/catch.hpp>

#include <nlohmann/json.hpp>

#include "presence/protocol/MessageCodec.hpp"

using namespace presence;
using json = nlohmann::json;

static scene::Participant MakeSnapshot() {
  scene::Participant p;
  p.id = "peer-a";
  p.profile.name = "Ana";
  p.profile.color = "#22c55e";
  p.profile.accessory = "hat";
  p.position = {100.0F, 200.0F};
  p.direction = scene::Direction::Left;
  p.camEnabled = true;
  p.micEnabled = false;
  p.speakingLevel = 0.25F;
  return p;
}

TEST_CASE("join encodes type tag and full snapshot") {
  const std::string text = protocol::EncodeMessage(protocol::JoinMessage{MakeSnapshot()});
  const json node = json::parse(text);

  REQUIRE(node["type"] == "join");
  REQUIRE(node["payload"]["id"] == "peer-a");
  REQUIRE(node["payload"]["profile"]["name"] == "Ana");
  REQUIRE(node["payload"]["profile"]["accessory"] == "hat");
  REQUIRE(node["payload"]["x"].get<float>() == Approx(100.0));
  REQUIRE(node["payload"]["dir"] == "left");
  REQUIRE(node["payload"]["camEnabled"] == true);
}

TEST_CASE("decoding a state reply keeps every snapshot field") {
  const std::string text = protocol::EncodeMessage(protocol::StateMessage{MakeSnapshot()});
  std::string error;
  const auto decoded = protocol::DecodeMessage(text, &error);

  REQUIRE(decoded.has_value());
  REQUIRE(protocol::TypeOf(*decoded) == protocol::MessageType::State);
  const auto& snapshot = std::get<protocol::StateMessage>(*decoded).snapshot;
  REQUIRE(snapshot.id == "peer-a");
  REQUIRE(snapshot.profile.color == "#22c55e");
  REQUIRE(snapshot.profile.accessory == std::optional<std::string>("hat"));
  REQUIRE(snapshot.position.y == Approx(200.0));
  REQUIRE(snapshot.direction == scene::Direction::Left);
  REQUIRE(snapshot.camEnabled);
  REQUIRE_FALSE(snapshot.micEnabled);
  REQUIRE(snapshot.speakingLevel == Approx(0.25));
}

TEST_CASE("move, voice, object and chat payloads decode") {
  const std::string move = R"({"type":"move","payload":{"id":"b","x":12.5,"y":40,"dir":"up"}})";
  const auto m = protocol::DecodeMessage(move);
  REQUIRE(m.has_value());
  const auto& mv = std::get<protocol::MoveMessage>(*m);
  REQUIRE(mv.id == "b");
  REQUIRE(mv.x == Approx(12.5));
  REQUIRE(mv.direction == scene::Direction::Up);

  const auto v = protocol::DecodeMessage(R"({"type":"voice","payload":{"id":"b","level":0.4,"micEnabled":true}})");
  REQUIRE(v.has_value());
  REQUIRE(std::get<protocol::VoiceMessage>(*v).level == Approx(0.4));
  REQUIRE(std::get<protocol::VoiceMessage>(*v).micEnabled);

  const auto o = protocol::DecodeMessage(R"({"type":"object","payload":{"id":"lamp1","state":{"on":false}}})");
  REQUIRE(o.has_value());
  const auto& obj = std::get<protocol::ObjectMessage>(*o);
  REQUIRE(obj.id == "lamp1");
  REQUIRE(std::get<bool>(obj.state.at("on")) == false);

  const auto c = protocol::DecodeMessage(R"({"type":"chat","payload":{"id":"b","name":"Bo","text":"hi","ts":1700000000000}})");
  REQUIRE(c.has_value());
  REQUIRE(std::get<protocol::ChatMessage>(*c).text == "hi");
  REQUIRE(std::get<protocol::ChatMessage>(*c).timestampMs == 1700000000000LL);
}

TEST_CASE("leave and avatar survive an encode/decode pass") {
  const auto leave = protocol::DecodeMessage(protocol::EncodeMessage(protocol::LeaveMessage{"gone"}));
  REQUIRE(leave.has_value());
  REQUIRE(protocol::SubjectId(*leave) == "gone");

  protocol::AvatarMessage avatar;
  avatar.id = "c";
  avatar.profile.name = "Cy";
  avatar.profile.color = "#000000";
  avatar.micEnabled = true;
  const auto decoded = protocol::DecodeMessage(protocol::EncodeMessage(avatar));
  REQUIRE(decoded.has_value());
  const auto& back = std::get<protocol::AvatarMessage>(*decoded);
  REQUIRE(back.profile.name == "Cy");
  REQUIRE_FALSE(back.profile.accessory.has_value());
  REQUIRE(back.micEnabled);
  REQUIRE_FALSE(back.camEnabled);
}

TEST_CASE("unknown fields are ignored") {
  const auto m = protocol::DecodeMessage(
      R"({"type":"move","extra":1,"payload":{"id":"b","x":1,"y":2,"dir":"down","velocity":[1,2]}})");
  REQUIRE(m.has_value());
  REQUIRE(std::get<protocol::MoveMessage>(*m).y == Approx(2.0));
}

TEST_CASE("legacy bubble key fills the caption") {
  const auto m = protocol::DecodeMessage(
      R"({"type":"join","payload":{"id":"b","profile":{"name":"Bo","color":"#fff","bubble":"hello"},"x":1,"y":2,"dir":"down","camEnabled":false,"micEnabled":false}})");
  REQUIRE(m.has_value());
  REQUIRE(std::get<protocol::JoinMessage>(*m).snapshot.profile.caption == std::optional<std::string>("hello"));
}

TEST_CASE("malformed and unknown messages are rejected without throwing") {
  std::string error;
  REQUIRE_FALSE(protocol::DecodeMessage("{not json", &error).has_value());
  REQUIRE_FALSE(error.empty());

  REQUIRE_FALSE(protocol::DecodeMessage(R"({"type":"teleport","payload":{"id":"x"}})").has_value());
  REQUIRE_FALSE(protocol::DecodeMessage(R"({"payload":{"id":"x"}})").has_value());
  REQUIRE_FALSE(protocol::DecodeMessage(R"([1,2,3])").has_value());

  // Mandatory fields.
  REQUIRE_FALSE(protocol::DecodeMessage(R"({"type":"move","payload":{"id":"b","x":1,"dir":"up"}})").has_value());
  REQUIRE_FALSE(protocol::DecodeMessage(R"({"type":"move","payload":{"id":"b","x":1,"y":1,"dir":"sideways"}})").has_value());
  REQUIRE_FALSE(protocol::DecodeMessage(R"({"type":"voice","payload":{"id":"b","level":0.1}})").has_value());
  REQUIRE_FALSE(protocol::DecodeMessage(
      R"({"type":"join","payload":{"id":"b","profile":{"name":"Bo"},"x":1,"y":2,"dir":"down","camEnabled":false}})").has_value());
}

TEST_CASE("out of range numbers are rejected instead of narrowed") {
  REQUIRE_FALSE(protocol::DecodeMessage(
      R"({"type":"chat","payload":{"id":"b","name":"Bo","text":"hi","ts":1e300}})").has_value());
  REQUIRE_FALSE(protocol::DecodeMessage(
      R"({"type":"chat","payload":{"id":"b","name":"Bo","text":"hi","ts":1700000000000.5}})").has_value());
  REQUIRE_FALSE(protocol::DecodeMessage(
      R"({"type":"chat","payload":{"id":"b","name":"Bo","text":"hi","ts":18446744073709551615}})").has_value());
  REQUIRE_FALSE(protocol::DecodeMessage(R"({"type":"move","payload":{"id":"b","x":1e300,"y":2,"dir":"up"}})").has_value());
  REQUIRE_FALSE(protocol::DecodeMessage(R"({"type":"move","payload":{"id":"b","x":1,"y":-1e39,"dir":"up"}})").has_value());
  REQUIRE_FALSE(protocol::DecodeMessage(R"({"type":"voice","payload":{"id":"b","level":1e308,"micEnabled":true}})").has_value());

  const auto edge = protocol::DecodeMessage(R"({"type":"move","payload":{"id":"b","x":-3.0e38,"y":0,"dir":"up"}})");
  REQUIRE(edge.has_value());
  REQUIRE(std::get<protocol::MoveMessage>(*edge).x == Approx(-3.0e38));
}

TEST_CASE("avatar and snapshot capability flags are mandatory") {
  REQUIRE_FALSE(protocol::DecodeMessage(
      R"({"type":"avatar","payload":{"id":"b","profile":{"name":"Bo","color":"#fff"}}})").has_value());
  REQUIRE_FALSE(protocol::DecodeMessage(
      R"({"type":"avatar","payload":{"id":"b","profile":{"name":"Bo","color":"#fff"},"camEnabled":true}})").has_value());
  REQUIRE_FALSE(protocol::DecodeMessage(
      R"({"type":"state","payload":{"id":"b","profile":{"name":"Bo","color":"#fff"},"x":1,"y":2,"dir":"down","camEnabled":true}})").has_value());

  const auto avatar = protocol::DecodeMessage(
      R"({"type":"avatar","payload":{"id":"b","profile":{"name":"Bo","color":"#fff"},"camEnabled":true,"micEnabled":true}})");
  REQUIRE(avatar.has_value());
  REQUIRE(std::get<protocol::AvatarMessage>(*avatar).camEnabled);
  REQUIRE(std::get<protocol::AvatarMessage>(*avatar).micEnabled);
}
