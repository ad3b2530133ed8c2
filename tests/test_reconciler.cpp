#include <catch2/catch.hpp>

#include "presence/scene/Reconciler.hpp"

using namespace presence;
using scene::ReconcileOutcome;

static scene::ReconcileContext Context(double now = 1.0) {
  scene::ReconcileContext ctx;
  ctx.localId = "me";
  ctx.nowSeconds = now;
  return ctx;
}

static scene::Participant Snapshot(const std::string& id, float x, float y) {
  scene::Participant p;
  p.id = id;
  p.profile.name = id;
  p.position = {x, y};
  return p;
}

static scene::PresenceState WithRemote(float x, float y) {
  scene::PresenceState state;
  state.objects = scene::MakeDefaultRoomObjects(64.0F);
  auto result = scene::Reconcile(state, protocol::JoinMessage{Snapshot("b", x, y)}, Context());
  return result.state;
}

TEST_CASE("join inserts, state upserts, both clamp to bounds") {
  scene::PresenceState state;
  auto r = scene::Reconcile(state, protocol::JoinMessage{Snapshot("b", 5000.0F, -20.0F)}, Context(2.0));
  REQUIRE(r.outcome == ReconcileOutcome::Applied);
  const auto* b = r.state.FindParticipant("b");
  REQUIRE(b != nullptr);
  REQUIRE(b->position.x == Approx(992.0));
  REQUIRE(b->position.y == Approx(32.0));
  REQUIRE(b->lastSeenSeconds == Approx(2.0));

  auto s = scene::Reconcile(r.state, protocol::StateMessage{Snapshot("b", 100.0F, 100.0F)}, Context(3.0));
  REQUIRE(s.state.participants.size() == 1);
  REQUIRE(s.state.FindParticipant("b")->position.x == Approx(100.0));
}

TEST_CASE("messages about the local id never touch the local entry") {
  scene::PresenceState state;
  state.participants["me"] = Snapshot("me", 300.0F, 300.0F);

  auto r = scene::Reconcile(state, protocol::JoinMessage{Snapshot("me", 50.0F, 50.0F)}, Context());
  REQUIRE(r.outcome == ReconcileOutcome::Ignored);
  REQUIRE(r.state.FindParticipant("me")->position.x == Approx(300.0));

  r = scene::Reconcile(r.state, protocol::MoveMessage{"me", 60.0F, 60.0F, scene::Direction::Up}, Context());
  REQUIRE(r.outcome == ReconcileOutcome::Ignored);
  r = scene::Reconcile(r.state, protocol::LeaveMessage{"me"}, Context());
  REQUIRE(r.state.FindParticipant("me") != nullptr);
}

TEST_CASE("move for an unknown id is dropped") {
  scene::PresenceState state;
  auto r = scene::Reconcile(state, protocol::MoveMessage{"ghost", 10.0F, 10.0F, scene::Direction::Up}, Context());
  REQUIRE(r.outcome == ReconcileOutcome::Ignored);
  REQUIRE(r.state.participants.empty());
}

TEST_CASE("move below epsilon refreshes liveness without writing position") {
  auto state = WithRemote(100.0F, 100.0F);

  auto r = scene::Reconcile(state, protocol::MoveMessage{"b", 100.3F, 99.8F, scene::Direction::Left}, Context(9.0));
  REQUIRE(r.outcome == ReconcileOutcome::Refreshed);
  const auto* b = r.state.FindParticipant("b");
  REQUIRE(b->position.x == Approx(100.0));
  REQUIRE(b->direction == scene::Direction::Down);
  REQUIRE(b->lastSeenSeconds == Approx(9.0));

  r = scene::Reconcile(r.state, protocol::MoveMessage{"b", 120.0F, 100.0F, scene::Direction::Right}, Context(10.0));
  REQUIRE(r.outcome == ReconcileOutcome::Applied);
  REQUIRE(r.state.FindParticipant("b")->position.x == Approx(120.0));
  REQUIRE(r.state.FindParticipant("b")->direction == scene::Direction::Right);
}

TEST_CASE("avatar creates unknown peers at spawn and updates known ones") {
  scene::PresenceState state;
  protocol::AvatarMessage avatar;
  avatar.id = "c";
  avatar.profile.name = "Cy";
  avatar.camEnabled = true;

  auto r = scene::Reconcile(state, avatar, Context());
  const auto* c = r.state.FindParticipant("c");
  REQUIRE(c != nullptr);
  REQUIRE(c->position.x == Approx(512.0));
  REQUIRE(c->position.y == Approx(320.0));
  REQUIRE(c->camEnabled);

  avatar.profile.name = "Cyrus";
  r = scene::Reconcile(r.state, avatar, Context());
  REQUIRE(r.state.FindParticipant("c")->profile.name == "Cyrus");
}

TEST_CASE("voice updates only known peers and clamps the level") {
  auto state = WithRemote(100.0F, 100.0F);
  auto r = scene::Reconcile(state, protocol::VoiceMessage{"b", 3.0F, true}, Context());
  REQUIRE(r.state.FindParticipant("b")->speakingLevel == Approx(1.0));
  REQUIRE(r.state.FindParticipant("b")->micEnabled);

  r = scene::Reconcile(r.state, protocol::VoiceMessage{"z", 0.5F, true}, Context());
  REQUIRE(r.outcome == ReconcileOutcome::Ignored);
  REQUIRE(r.state.participants.size() == 1);
}

TEST_CASE("leave removes the peer") {
  auto state = WithRemote(100.0F, 100.0F);
  auto r = scene::Reconcile(state, protocol::LeaveMessage{"b"}, Context());
  REQUIRE(r.outcome == ReconcileOutcome::Applied);
  REQUIRE(r.state.participants.empty());

  r = scene::Reconcile(r.state, protocol::LeaveMessage{"b"}, Context());
  REQUIRE(r.outcome == ReconcileOutcome::Ignored);
}

TEST_CASE("object patches merge into the matching object only") {
  auto state = WithRemote(100.0F, 100.0F);
  const protocol::ObjectMessage off{"lamp1", scene::StatePatch{{"on", false}}};

  auto once = scene::Reconcile(state, off, Context());
  auto twice = scene::Reconcile(once.state, off, Context());
  REQUIRE_FALSE(std::get<scene::LampState>(twice.state.FindObject("lamp1")->state).on);
  REQUIRE(twice.state.FindObject("lamp1")->state == once.state.FindObject("lamp1")->state);

  auto missing = scene::Reconcile(state, protocol::ObjectMessage{"sofa", {}}, Context());
  REQUIRE(missing.outcome == ReconcileOutcome::Ignored);
}

TEST_CASE("reconciliation does not depend on the order of independent fields") {
  auto base = WithRemote(100.0F, 100.0F);
  const protocol::Message move = protocol::MoveMessage{"b", 300.0F, 200.0F, scene::Direction::Right};
  const protocol::Message voice = protocol::VoiceMessage{"b", 0.6F, true};
  const protocol::Message object = protocol::ObjectMessage{"board1", scene::StatePatch{{"highlight", true}}};

  auto a = scene::Reconcile(base, move, Context());
  a = scene::Reconcile(a.state, voice, Context());
  a = scene::Reconcile(a.state, object, Context());

  auto b = scene::Reconcile(base, object, Context());
  b = scene::Reconcile(b.state, voice, Context());
  b = scene::Reconcile(b.state, move, Context());

  const auto* pa = a.state.FindParticipant("b");
  const auto* pb = b.state.FindParticipant("b");
  REQUIRE(pa->position.x == Approx(pb->position.x));
  REQUIRE(pa->speakingLevel == Approx(pb->speakingLevel));
  REQUIRE(a.state.FindObject("board1")->state == b.state.FindObject("board1")->state);
}

TEST_CASE("chat never mutates presence") {
  auto state = WithRemote(100.0F, 100.0F);
  protocol::ChatMessage chat;
  chat.id = "b";
  chat.text = "hi";
  auto r = scene::Reconcile(state, chat, Context());
  REQUIRE(r.outcome == ReconcileOutcome::Ignored);
  REQUIRE(r.state.participants.size() == 1);
}
