#include "presence/net/RoomRouter.hpp"

namespace presence::net
{
void RoomRouter::Join(PeerHandle peer, const std::string& room)
{
    Leave(peer);
    m_rooms[room].insert(peer);
    m_membership[peer] = room;
}

void RoomRouter::Leave(PeerHandle peer)
{
    const auto membership = m_membership.find(peer);
    if (membership == m_membership.end())
    {
        return;
    }

    const auto room = m_rooms.find(membership->second);
    if (room != m_rooms.end())
    {
        room->second.erase(peer);
        if (room->second.empty())
        {
            m_rooms.erase(room);
        }
    }
    m_membership.erase(membership);
}

std::vector<RoomRouter::PeerHandle> RoomRouter::Recipients(PeerHandle sender) const
{
    std::vector<PeerHandle> recipients;
    const auto membership = m_membership.find(sender);
    if (membership == m_membership.end())
    {
        return recipients;
    }

    const auto room = m_rooms.find(membership->second);
    if (room == m_rooms.end())
    {
        return recipients;
    }

    recipients.reserve(room->second.size());
    for (const PeerHandle member : room->second)
    {
        if (member != sender)
        {
            recipients.push_back(member);
        }
    }
    return recipients;
}

std::optional<std::string> RoomRouter::RoomOf(PeerHandle peer) const
{
    const auto membership = m_membership.find(peer);
    if (membership == m_membership.end())
    {
        return std::nullopt;
    }
    return membership->second;
}

std::size_t RoomRouter::MemberCount(const std::string& room) const
{
    const auto it = m_rooms.find(room);
    return it == m_rooms.end() ? 0 : it->second.size();
}
} // namespace presence::net
