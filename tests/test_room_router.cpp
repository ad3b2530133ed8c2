#include <catch2/catch.hpp>

#include <algorithm>

#include "presence/net/RoomRouter.hpp"

using presence::net::RoomRouter;

TEST_CASE("router forwards to room members except the sender") {
  RoomRouter router;
  router.Join(1, "vm_room_a");
  router.Join(2, "vm_room_a");
  router.Join(3, "vm_room_a");
  router.Join(4, "vm_room_b");

  auto recipients = router.Recipients(1);
  std::sort(recipients.begin(), recipients.end());
  REQUIRE(recipients == std::vector<RoomRouter::PeerHandle>{2, 3});
  REQUIRE(router.Recipients(4).empty());
  REQUIRE(router.Recipients(99).empty());
  REQUIRE(router.RoomCount() == 2);
}

TEST_CASE("joining another room moves the peer") {
  RoomRouter router;
  router.Join(1, "vm_room_a");
  router.Join(2, "vm_room_a");
  router.Join(1, "vm_room_b");

  REQUIRE(router.RoomOf(1) == std::optional<std::string>("vm_room_b"));
  REQUIRE(router.MemberCount("vm_room_a") == 1);
  REQUIRE(router.Recipients(2).empty());
}

TEST_CASE("leaving drops empty rooms") {
  RoomRouter router;
  router.Join(7, "vm_room_solo");
  router.Leave(7);
  router.Leave(7);

  REQUIRE(router.RoomCount() == 0);
  REQUIRE_FALSE(router.RoomOf(7).has_value());
}
