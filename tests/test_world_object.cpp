#include <catch2/catch.hpp>

#include "presence/scene/WorldObject.hpp"

using namespace presence::scene;

TEST_CASE("default room has lamp, rug and board") {
  const auto objects = MakeDefaultRoomObjects(64.0F);
  REQUIRE(objects.size() == 3);

  REQUIRE(objects[0].id == "lamp1");
  REQUIRE(objects[0].kind == ObjectKind::Lamp);
  REQUIRE(objects[0].interactive);
  REQUIRE(std::get<LampState>(objects[0].state).on);

  REQUIRE(objects[1].id == "rug1");
  REQUIRE_FALSE(objects[1].interactive);
  REQUIRE(std::holds_alternative<std::monostate>(objects[1].state));

  REQUIRE(objects[2].id == "board1");
  REQUIRE_FALSE(std::get<BoardState>(objects[2].state).highlight);
}

TEST_CASE("merge is a shallow key-wise overwrite and idempotent") {
  WorldObject lamp = MakeDefaultRoomObjects(64.0F)[0];
  const StatePatch patch{{"on", false}};

  lamp.MergeState(patch);
  const ObjectState once = lamp.state;
  lamp.MergeState(patch);
  REQUIRE(lamp.state == once);
  REQUIRE_FALSE(std::get<LampState>(lamp.state).on);

  // Keys the kind does not know, or of the wrong type, leave the state alone.
  lamp.MergeState(StatePatch{{"highlight", true}, {"on", std::string("yes")}});
  REQUIRE_FALSE(std::get<LampState>(lamp.state).on);

  lamp.MergeState(StatePatch{});
  REQUIRE(lamp.state == once);
}

TEST_CASE("toggle flips the interactive flag and reports full state") {
  WorldObject board = MakeDefaultRoomObjects(64.0F)[2];
  REQUIRE(board.Toggle());
  const StatePatch patch = board.StateAsPatch();
  REQUIRE(patch.size() == 1);
  REQUIRE(std::get<bool>(patch.at("highlight")));

  WorldObject rug = MakeDefaultRoomObjects(64.0F)[1];
  REQUIRE_FALSE(rug.Toggle());
  REQUIRE(rug.StateAsPatch().empty());
}

TEST_CASE("hit test prefers the topmost object") {
  std::vector<WorldObject> objects;
  WorldObject below;
  below.id = "below";
  below.origin = {0.0F, 0.0F};
  below.size = {100.0F, 100.0F};
  WorldObject above = below;
  above.id = "above";
  above.origin = {50.0F, 50.0F};
  objects.push_back(below);
  objects.push_back(above);

  REQUIRE(HitObject(objects, {75.0F, 75.0F})->id == "above");
  REQUIRE(HitObject(objects, {10.0F, 10.0F})->id == "below");
  REQUIRE(HitObject(objects, {500.0F, 500.0F}) == nullptr);
}
