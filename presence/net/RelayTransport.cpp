#include "presence/net/RelayTransport.hpp"

#include <enet/enet.h>

#include "presence/core/Log.hpp"
#include "presence/core/Time.hpp"
#include "presence/net/RelayProtocol.hpp"

namespace presence::net
{
namespace
{
constexpr const char* kTag = "Relay";
} // namespace

std::unique_ptr<RelayTransport> RelayTransport::Create(
    const core::RelaySettings& settings,
    const std::string& roomKey,
    std::string* outError
)
{
    if (settings.host.empty() || settings.port == 0)
    {
        if (outError != nullptr)
        {
            *outError = "Relay host or port not configured.";
        }
        return nullptr;
    }

    std::unique_ptr<RelayTransport> transport(new RelayTransport(settings, roomKey));
    if (enet_initialize() != 0)
    {
        if (outError != nullptr)
        {
            *outError = "ENet initialization failed.";
        }
        return nullptr;
    }
    transport->m_enetInitialized = true;

    std::lock_guard<std::mutex> lock(transport->m_mutex);
    if (!transport->Connect(outError))
    {
        return nullptr;
    }
    return transport;
}

RelayTransport::RelayTransport(core::RelaySettings settings, const std::string& roomKey)
    : TransportProvider(roomKey)
    , m_settings(std::move(settings))
{
}

RelayTransport::~RelayTransport()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_peer != nullptr && m_host != nullptr)
    {
        enet_peer_disconnect(m_peer, 0);

        ENetEvent event{};
        while (enet_host_service(m_host, &event, 10) > 0)
        {
            if (event.type == ENET_EVENT_TYPE_RECEIVE)
            {
                enet_packet_destroy(event.packet);
            }
            else if (event.type == ENET_EVENT_TYPE_DISCONNECT)
            {
                break;
            }
        }
    }

    ResetTransport();
    if (m_enetInitialized)
    {
        enet_deinitialize();
        m_enetInitialized = false;
    }
}

bool RelayTransport::Send(const std::string& payload)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_rejected)
    {
        return false;
    }

    if (!m_connected)
    {
        m_pending.push_back(payload);
        while (m_pending.size() > kMaxPendingSends)
        {
            m_pending.pop_front();
        }
        return true;
    }

    return SendPacket(BuildDataPacket(payload), kRelayChannelData);
}

bool RelayTransport::IsConnected() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connected;
}

bool RelayTransport::WasRejected() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_rejected;
}

std::size_t RelayTransport::PendingSendCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.size();
}

void RelayTransport::CollectIncoming(std::vector<std::string>& outPayloads)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const double now = core::Time::MonotonicSeconds();

    if (m_host == nullptr)
    {
        if (!m_rejected && now - m_lastAttemptSeconds >= kReconnectDelaySeconds)
        {
            std::string error;
            if (!Connect(&error))
            {
                core::Log::Warn(kTag, "Reconnect failed: " + error);
            }
        }
        return;
    }

    if (!m_connected && now - m_connectStartedSeconds > m_settings.connectTimeoutSeconds)
    {
        core::Log::Warn(kTag, "Connection to " + m_settings.host + ":" + std::to_string(m_settings.port) + " timed out.");
        ResetTransport();
        return;
    }

    ENetEvent event{};
    while (m_host != nullptr && enet_host_service(m_host, &event, 0) > 0)
    {
        switch (event.type)
        {
            case ENET_EVENT_TYPE_CONNECT:
            {
                m_connected = true;
                core::Log::Info(kTag, "Connected to " + m_settings.host + ":" + std::to_string(m_settings.port) + ", joining " + RoomKey());
                RelayJoinRequest request;
                request.room = RoomKey();
                request.key = m_settings.key;
                // Same channel as the data that follows, so the relay never sees data before membership.
                SendPacket(BuildJoinPacket(request), kRelayChannelData);
                FlushPending();
                break;
            }
            case ENET_EVENT_TYPE_RECEIVE:
            {
                const std::uint8_t* data = event.packet->data;
                const std::size_t size = event.packet->dataLength;
                if (size >= 2 && data[0] == kRelayPacketData)
                {
                    outPayloads.push_back(PacketBody(data, size));
                }
                else if (size >= 1 && data[0] == kRelayPacketReject)
                {
                    m_rejected = true;
                    core::Log::Error(kTag, "Relay rejected room join: " + PacketBody(data, size));
                }
                enet_packet_destroy(event.packet);
                break;
            }
            case ENET_EVENT_TYPE_DISCONNECT:
            {
                core::Log::Warn(kTag, "Disconnected from relay.");
                m_connected = false;
                m_peer = nullptr;
                ResetTransport();
                break;
            }
            case ENET_EVENT_TYPE_NONE:
            default:
                break;
        }
    }
}

bool RelayTransport::Connect(std::string* outError)
{
    ResetTransport();
    m_lastAttemptSeconds = core::Time::MonotonicSeconds();

    m_host = enet_host_create(nullptr, 1, kRelayChannelCount, 0, 0);
    if (m_host == nullptr)
    {
        if (outError != nullptr)
        {
            *outError = "Failed to create ENet client host.";
        }
        return false;
    }

    ENetAddress address{};
    if (enet_address_set_host(&address, m_settings.host.c_str()) != 0)
    {
        if (outError != nullptr)
        {
            *outError = "Failed to resolve host: " + m_settings.host;
        }
        ResetTransport();
        return false;
    }
    address.port = m_settings.port;

    m_peer = enet_host_connect(m_host, &address, kRelayChannelCount, 0);
    if (m_peer == nullptr)
    {
        if (outError != nullptr)
        {
            *outError = "Failed to connect ENet peer.";
        }
        ResetTransport();
        return false;
    }

    m_connected = false;
    m_connectStartedSeconds = m_lastAttemptSeconds;
    return true;
}

void RelayTransport::ResetTransport()
{
    if (m_host != nullptr)
    {
        enet_host_destroy(m_host);
        m_host = nullptr;
    }
    m_peer = nullptr;
    m_connected = false;
}

bool RelayTransport::SendPacket(const std::vector<std::uint8_t>& bytes, std::uint8_t channel)
{
    if (m_host == nullptr || m_peer == nullptr || bytes.empty())
    {
        return false;
    }

    ENetPacket* packet = enet_packet_create(bytes.data(), bytes.size(), ENET_PACKET_FLAG_RELIABLE);
    if (packet == nullptr)
    {
        return false;
    }

    if (enet_peer_send(m_peer, channel, packet) != 0)
    {
        enet_packet_destroy(packet);
        return false;
    }

    enet_host_flush(m_host);
    return true;
}

void RelayTransport::FlushPending()
{
    while (!m_pending.empty())
    {
        if (!SendPacket(BuildDataPacket(m_pending.front()), kRelayChannelData))
        {
            core::Log::Warn(kTag, "Dropped queued payload after connect.");
        }
        m_pending.pop_front();
    }
}
} // namespace presence::net
