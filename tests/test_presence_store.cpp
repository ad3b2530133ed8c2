#include <catch2/catch.hpp>

#include "presence/scene/PresenceStore.hpp"

using namespace presence;

static scene::ReconcileContext Context() {
  scene::ReconcileContext ctx;
  ctx.localId = "me";
  return ctx;
}

static scene::Participant Peer(const std::string& id) {
  scene::Participant p;
  p.id = id;
  p.position = {200.0F, 200.0F};
  return p;
}

TEST_CASE("store applies inbound messages with the supplied clock") {
  scene::PresenceStore store(Context(), scene::MakeDefaultRoomObjects(64.0F));
  store.UpsertLocal(Peer("me"));

  REQUIRE(store.Apply(protocol::JoinMessage{Peer("b")}, 4.0) == scene::ReconcileOutcome::Applied);
  REQUIRE(store.ParticipantCount() == 2);
  REQUIRE(store.FindParticipant("b")->lastSeenSeconds == Approx(4.0));
  REQUIRE(store.LocalParticipant()->id == "me");
}

TEST_CASE("stale peers are evicted but the local entry is kept") {
  scene::PresenceStore store(Context(), {});
  store.UpsertLocal(Peer("me"));
  store.Apply(protocol::JoinMessage{Peer("quiet")}, 0.0);
  store.Apply(protocol::JoinMessage{Peer("chatty")}, 0.0);

  // A sub-epsilon move still counts as a sign of life.
  store.Apply(protocol::MoveMessage{"chatty", 200.1F, 200.0F, scene::Direction::Down}, 4.0);

  const auto evicted = store.EvictStale(6.0, 5.0);
  REQUIRE(evicted == std::vector<scene::PeerId>{"quiet"});
  REQUIRE(store.Contains("chatty"));
  REQUIRE(store.Contains("me"));

  REQUIRE(store.EvictStale(1000.0, 0.0).empty());
}

TEST_CASE("toggling an object returns its full state") {
  scene::PresenceStore store(Context(), scene::MakeDefaultRoomObjects(64.0F));

  const auto patch = store.ToggleObject("lamp1");
  REQUIRE(patch.has_value());
  REQUIRE_FALSE(std::get<bool>(patch->at("on")));
  REQUIRE_FALSE(std::get<scene::LampState>(store.FindObject("lamp1")->state).on);

  REQUIRE_FALSE(store.ToggleObject("rug1").has_value());
  REQUIRE_FALSE(store.ToggleObject("missing").has_value());
}

TEST_CASE("local updates are applied in place") {
  scene::PresenceStore store(Context(), {});
  REQUIRE_FALSE(store.UpdateLocal([](scene::Participant&) {}));

  store.UpsertLocal(Peer("me"));
  REQUIRE(store.UpdateLocal([](scene::Participant& p) { p.position = {64.0F, 96.0F}; }));
  REQUIRE(store.LocalParticipant()->position.y == Approx(96.0));

  store.Clear();
  REQUIRE(store.ParticipantCount() == 0);
  REQUIRE(store.Objects().empty());
}
