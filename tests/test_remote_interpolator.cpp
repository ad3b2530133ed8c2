#include <catch2/catch.hpp>

#include <cmath>

#include "presence/sim/RemoteInterpolator.hpp"

using namespace presence;
using sim::RemoteInterpolator;

static scene::PresenceState StateWith(const std::string& id, float x, float y, float level = 0.0F) {
  scene::PresenceState state;
  scene::Participant p;
  p.id = id;
  p.position = {x, y};
  p.speakingLevel = level;
  state.participants[id] = p;
  return state;
}

TEST_CASE("convergence factor matches the 60 Hz reference lerp") {
  REQUIRE(RemoteInterpolator::ConvergenceFactor(12.0F, 60.0F, 1.0 / 60.0) == Approx(0.2));
  REQUIRE(RemoteInterpolator::ConvergenceFactor(12.0F, 60.0F, 0.0) == Approx(0.0));
  REQUIRE(RemoteInterpolator::ConvergenceFactor(12.0F, 60.0F, 10.0) == Approx(1.0));
}

TEST_CASE("new remote entries snap, then converge without overshoot") {
  RemoteInterpolator interp;
  interp.Tick(1.0 / 60.0, StateWith("b", 100.0F, 100.0F), "me");
  REQUIRE(interp.DisplayPosition("b")->x == Approx(100.0));

  const auto target = StateWith("b", 200.0F, 100.0F);
  float previous = 100.0F;
  for (int i = 0; i < 120; ++i) {
    interp.Tick(1.0 / 60.0, target, "me");
    const float x = interp.DisplayPosition("b")->x;
    REQUIRE(x >= previous);
    REQUIRE(x <= 200.0F);
    previous = x;
  }
  REQUIRE(previous == Approx(200.0).margin(0.01));
}

TEST_CASE("smoothing is independent of frame rate") {
  RemoteInterpolator fast;
  RemoteInterpolator slow;
  fast.Tick(0.0, StateWith("b", 0.0F, 0.0F), "me");
  slow.Tick(0.0, StateWith("b", 0.0F, 0.0F), "me");

  const auto target = StateWith("b", 100.0F, 0.0F);
  for (int i = 0; i < 6; ++i) fast.Tick(1.0 / 60.0, target, "me");
  for (int i = 0; i < 3; ++i) slow.Tick(1.0 / 30.0, target, "me");

  REQUIRE(fast.DisplayPosition("b")->x == Approx(slow.DisplayPosition("b")->x).epsilon(1e-4));
}

TEST_CASE("local entry mirrors its authoritative position") {
  RemoteInterpolator interp;
  interp.Tick(1.0 / 60.0, StateWith("me", 100.0F, 100.0F), "me");
  interp.Tick(1.0 / 60.0, StateWith("me", 400.0F, 100.0F), "me");
  REQUIRE(interp.DisplayPosition("me")->x == Approx(400.0));
}

TEST_CASE("voice level is smoothed toward the authoritative level") {
  RemoteInterpolator interp;
  interp.Tick(1.0 / 60.0, StateWith("b", 0.0F, 0.0F, 0.0F), "me");
  interp.Tick(0.1, StateWith("b", 0.0F, 0.0F, 1.0F), "me");
  REQUIRE(interp.Find("b")->voiceLevel == Approx(1.0 - std::exp(-1.0)));
}

TEST_CASE("departed peers lose their display state") {
  RemoteInterpolator interp;
  interp.Tick(1.0 / 60.0, StateWith("b", 0.0F, 0.0F), "me");
  REQUIRE(interp.Contains("b"));

  interp.Tick(1.0 / 60.0, scene::PresenceState{}, "me");
  REQUIRE_FALSE(interp.Contains("b"));

  interp.Tick(1.0 / 60.0, StateWith("c", 0.0F, 0.0F), "me");
  interp.Remove("c");
  REQUIRE(interp.Size() == 0);
}
