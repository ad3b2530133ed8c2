#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

#include "presence/net/RoomRouter.hpp"

struct _ENetHost;
struct _ENetPeer;

namespace presence::net
{
class RelayServer
{
public:
    struct Settings
    {
        std::uint16_t port = 47700;
        std::size_t maxPeers = 64;
        // Empty accepts every join request.
        std::string key;
    };

    struct Stats
    {
        std::size_t peers = 0;
        std::size_t rooms = 0;
        std::uint64_t forwardedPackets = 0;
        std::uint64_t rejectedJoins = 0;
    };

    explicit RelayServer(Settings settings);
    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    bool Start(std::string* outError = nullptr);
    void Stop();

    void Poll(int timeoutMs);

    [[nodiscard]] bool IsRunning() const { return m_host != nullptr; }
    [[nodiscard]] Stats GetStats() const;
    [[nodiscard]] const RoomRouter& Router() const { return m_router; }

private:
    void HandlePacket(_ENetPeer* peer, const std::uint8_t* data, std::size_t size);
    void Forward(RoomRouter::PeerHandle sender, const std::uint8_t* data, std::size_t size);
    void DropPeer(_ENetPeer* peer);
    [[nodiscard]] static RoomRouter::PeerHandle HandleOf(const _ENetPeer* peer);

    Settings m_settings;
    bool m_enetInitialized = false;
    _ENetHost* m_host = nullptr;
    RoomRouter m_router;
    std::unordered_map<RoomRouter::PeerHandle, _ENetPeer*> m_peers;
    RoomRouter::PeerHandle m_nextHandle = 1;
    std::uint64_t m_forwardedPackets = 0;
    std::uint64_t m_rejectedJoins = 0;
};
} // namespace presence::net
