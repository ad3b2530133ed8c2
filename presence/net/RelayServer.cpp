#include "presence/net/RelayServer.hpp"

#include <cstring>
#include <vector>

#include <enet/enet.h>

#include "presence/core/Log.hpp"
#include "presence/net/RelayProtocol.hpp"

namespace presence::net
{
namespace
{
constexpr const char* kTag = "RelayServer";
} // namespace

RelayServer::RelayServer(Settings settings)
    : m_settings(std::move(settings))
{
}

RelayServer::~RelayServer()
{
    Stop();
}

bool RelayServer::Start(std::string* outError)
{
    Stop();

    if (enet_initialize() != 0)
    {
        if (outError != nullptr)
        {
            *outError = "ENet initialization failed.";
        }
        return false;
    }
    m_enetInitialized = true;

    ENetAddress address{};
    address.host = ENET_HOST_ANY;
    address.port = m_settings.port;

    m_host = enet_host_create(&address, m_settings.maxPeers, kRelayChannelCount, 0, 0);
    if (m_host == nullptr)
    {
        if (outError != nullptr)
        {
            *outError = "Failed to create ENet host on port " + std::to_string(m_settings.port) + ".";
        }
        Stop();
        return false;
    }

    core::Log::Info(kTag, "Listening on port " + std::to_string(m_settings.port));
    return true;
}

void RelayServer::Stop()
{
    if (m_host != nullptr)
    {
        for (const auto& entry : m_peers)
        {
            enet_peer_disconnect_now(entry.second, 0);
        }
        enet_host_flush(m_host);
        enet_host_destroy(m_host);
        m_host = nullptr;
    }
    m_peers.clear();
    m_router = RoomRouter{};

    if (m_enetInitialized)
    {
        enet_deinitialize();
        m_enetInitialized = false;
    }
}

void RelayServer::Poll(int timeoutMs)
{
    if (m_host == nullptr)
    {
        return;
    }

    ENetEvent event{};
    while (m_host != nullptr && enet_host_service(m_host, &event, timeoutMs) > 0)
    {
        timeoutMs = 0;

        switch (event.type)
        {
            case ENET_EVENT_TYPE_CONNECT:
            {
                const RoomRouter::PeerHandle handle = m_nextHandle++;
                event.peer->data = reinterpret_cast<void*>(static_cast<std::uintptr_t>(handle));
                m_peers[handle] = event.peer;
                core::Log::Debug(kTag, "Peer " + std::to_string(handle) + " connected.");
                break;
            }
            case ENET_EVENT_TYPE_RECEIVE:
            {
                HandlePacket(event.peer, event.packet->data, event.packet->dataLength);
                enet_packet_destroy(event.packet);
                break;
            }
            case ENET_EVENT_TYPE_DISCONNECT:
            {
                DropPeer(event.peer);
                break;
            }
            case ENET_EVENT_TYPE_NONE:
            default:
                break;
        }
    }
}

RelayServer::Stats RelayServer::GetStats() const
{
    Stats stats;
    stats.peers = m_peers.size();
    stats.rooms = m_router.RoomCount();
    stats.forwardedPackets = m_forwardedPackets;
    stats.rejectedJoins = m_rejectedJoins;
    return stats;
}

void RelayServer::HandlePacket(_ENetPeer* peer, const std::uint8_t* data, std::size_t size)
{
    if (data == nullptr || size == 0)
    {
        return;
    }

    const RoomRouter::PeerHandle handle = HandleOf(peer);
    if (data[0] == kRelayPacketJoinRoom)
    {
        RelayJoinRequest request;
        const std::vector<std::uint8_t> bytes(data, data + size);
        if (!ParseJoinPacket(bytes, request))
        {
            core::Log::Warn(kTag, "Malformed join from peer " + std::to_string(handle));
            return;
        }

        if (!m_settings.key.empty() && request.key != m_settings.key)
        {
            ++m_rejectedJoins;
            core::Log::Warn(kTag, "Rejected peer " + std::to_string(handle) + " for " + request.room + ": bad key.");
            const std::vector<std::uint8_t> reject = BuildRejectPacket("invalid key");
            ENetPacket* packet = enet_packet_create(reject.data(), reject.size(), ENET_PACKET_FLAG_RELIABLE);
            if (packet != nullptr && enet_peer_send(peer, kRelayChannelControl, packet) != 0)
            {
                enet_packet_destroy(packet);
            }
            enet_peer_disconnect_later(peer, 0);
            return;
        }

        m_router.Join(handle, request.room);
        core::Log::Info(kTag, "Peer " + std::to_string(handle) + " joined " + request.room +
            " (" + std::to_string(m_router.MemberCount(request.room)) + " members).");
        return;
    }

    if (data[0] == kRelayPacketData)
    {
        Forward(handle, data, size);
    }
}

void RelayServer::Forward(RoomRouter::PeerHandle sender, const std::uint8_t* data, std::size_t size)
{
    for (const RoomRouter::PeerHandle recipient : m_router.Recipients(sender))
    {
        const auto it = m_peers.find(recipient);
        if (it == m_peers.end())
        {
            continue;
        }

        ENetPacket* packet = enet_packet_create(data, size, ENET_PACKET_FLAG_RELIABLE);
        if (packet == nullptr)
        {
            continue;
        }
        if (enet_peer_send(it->second, kRelayChannelData, packet) != 0)
        {
            enet_packet_destroy(packet);
            continue;
        }
        ++m_forwardedPackets;
    }
}

void RelayServer::DropPeer(_ENetPeer* peer)
{
    const RoomRouter::PeerHandle handle = HandleOf(peer);
    m_router.Leave(handle);
    m_peers.erase(handle);
    peer->data = nullptr;
    core::Log::Debug(kTag, "Peer " + std::to_string(handle) + " disconnected.");
}

RoomRouter::PeerHandle RelayServer::HandleOf(const _ENetPeer* peer)
{
    return static_cast<RoomRouter::PeerHandle>(reinterpret_cast<std::uintptr_t>(peer->data));
}
} // namespace presence::net
