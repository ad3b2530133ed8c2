#include <catch2/catch.hpp>

#include "presence/scene/ChatLog.hpp"

using namespace presence;

static protocol::ChatMessage Line(int n) {
  protocol::ChatMessage m;
  m.id = "p";
  m.name = "P";
  m.text = std::to_string(n);
  m.timestampMs = n;
  return m;
}

TEST_CASE("chat log keeps the newest entries up to capacity") {
  scene::ChatLog log;
  REQUIRE(log.Capacity() == 200);
  for (int i = 0; i < 250; ++i) log.Append(Line(i));

  REQUIRE(log.Size() == 200);
  const auto entries = log.Entries();
  REQUIRE(entries.front().text == "50");
  REQUIRE(entries.back().text == "249");
}

TEST_CASE("chat tail returns the last entries in order") {
  scene::ChatLog log(5);
  for (int i = 0; i < 3; ++i) log.Append(Line(i));

  const auto tail = log.Tail(2);
  REQUIRE(tail.size() == 2);
  REQUIRE(tail[0].text == "1");
  REQUIRE(tail[1].text == "2");
  REQUIRE(log.Tail(10).size() == 3);

  log.Clear();
  REQUIRE(log.Size() == 0);
}
