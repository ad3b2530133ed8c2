#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace presence::net
{
// Room membership table for the relay. A peer belongs to at most one room.
class RoomRouter
{
public:
    using PeerHandle = std::uint64_t;

    // Moves the peer if it already belonged to another room.
    void Join(PeerHandle peer, const std::string& room);
    void Leave(PeerHandle peer);

    // Every other member of the sender's room; empty when the sender joined nothing.
    [[nodiscard]] std::vector<PeerHandle> Recipients(PeerHandle sender) const;

    [[nodiscard]] std::optional<std::string> RoomOf(PeerHandle peer) const;
    [[nodiscard]] std::size_t RoomCount() const { return m_rooms.size(); }
    [[nodiscard]] std::size_t MemberCount(const std::string& room) const;

private:
    std::map<std::string, std::set<PeerHandle>> m_rooms;
    std::unordered_map<PeerHandle, std::string> m_membership;
};
} // namespace presence::net
