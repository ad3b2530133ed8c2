#include <catch2/catch.hpp>

#include <fstream>

#include "TestSupport.hpp"
#include "presence/net/StorageTransport.hpp"

using presence::net::StorageTransport;

namespace
{
presence::core::StorageSettings FastSettings(const ScratchDirectory& scratch)
{
  presence::core::StorageSettings settings;
  settings.root = scratch.Path().string();
  settings.pollIntervalSeconds = 0.0;
  settings.retentionSeconds = 3.0;
  return settings;
}

std::vector<std::string> Drain(StorageTransport& transport)
{
  std::vector<std::string> received;
  const auto id = transport.AddReceiver([&](const std::string& payload) { received.push_back(payload); });
  transport.Poll();
  transport.RemoveReceiver(id);
  return received;
}
} // namespace

TEST_CASE("storage instances exchange messages in write order") {
  ScratchDirectory scratch;
  auto alice = StorageTransport::Open(FastSettings(scratch), "vm_room_a", "alice");
  auto bob = StorageTransport::Open(FastSettings(scratch), "vm_room_a", "bob");
  REQUIRE(alice != nullptr);
  REQUIRE(bob != nullptr);

  REQUIRE(alice->Send("first"));
  REQUIRE(alice->Send("second"));

  const auto received = Drain(*bob);
  REQUIRE(received == std::vector<std::string>{"first", "second"});
  REQUIRE(Drain(*bob).empty());
}

TEST_CASE("storage readers skip their own files") {
  ScratchDirectory scratch;
  auto alice = StorageTransport::Open(FastSettings(scratch), "vm_room_a", "alice");
  REQUIRE(alice->Send("hello"));
  REQUIRE(Drain(*alice).empty());
}

TEST_CASE("files present before open are not replayed") {
  ScratchDirectory scratch;
  auto alice = StorageTransport::Open(FastSettings(scratch), "vm_room_a", "alice");
  REQUIRE(alice->Send("old news"));

  auto late = StorageTransport::Open(FastSettings(scratch), "vm_room_a", "late");
  REQUIRE(Drain(*late).empty());

  REQUIRE(alice->Send("fresh"));
  REQUIRE(Drain(*late) == std::vector<std::string>{"fresh"});
}

TEST_CASE("rooms are separate directories") {
  ScratchDirectory scratch;
  auto alice = StorageTransport::Open(FastSettings(scratch), "vm_room_a", "alice");
  auto other = StorageTransport::Open(FastSettings(scratch), "vm_room_b", "other");
  REQUIRE(alice->Send("only for a"));
  REQUIRE(Drain(*other).empty());
}

TEST_CASE("expired files are removed on poll") {
  ScratchDirectory scratch;
  auto bob = StorageTransport::Open(FastSettings(scratch), "vm_room_a", "bob");

  StorageTransport::FileName stale;
  stale.timestampMs = 1000;
  stale.originId = "ghost";
  stale.sequence = 1;
  const auto stalePath = bob->Directory() / StorageTransport::FormatFileName(stale);
  {
    std::ofstream out(stalePath);
    out << R"({"type":"leave","payload":{"id":"ghost"}})";
  }

  REQUIRE(Drain(*bob).empty());
  REQUIRE_FALSE(std::filesystem::exists(stalePath));
}

TEST_CASE("file names sort chronologically and parse back") {
  StorageTransport::FileName name;
  name.timestampMs = 1700000000123;
  name.originId = "node_7";
  name.sequence = 42;

  const std::string text = StorageTransport::FormatFileName(name);
  REQUIRE(text == "001700000000123_node_7_42.json");

  const auto parsed = StorageTransport::ParseFileName(text);
  REQUIRE(parsed.has_value());
  REQUIRE(parsed->timestampMs == name.timestampMs);
  REQUIRE(parsed->originId == "node_7");
  REQUIRE(parsed->sequence == 42);

  REQUIRE_FALSE(StorageTransport::ParseFileName(".tmp_" + text).has_value());
  REQUIRE_FALSE(StorageTransport::ParseFileName("notes.txt").has_value());
  REQUIRE_FALSE(StorageTransport::ParseFileName("abc_node_1.json").has_value());
  REQUIRE_FALSE(StorageTransport::ParseFileName("00012_node.json").has_value());
}
