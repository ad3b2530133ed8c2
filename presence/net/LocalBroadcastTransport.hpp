#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "presence/core/Config.hpp"
#include "presence/net/TransportProvider.hpp"

namespace presence::net
{
// Same-machine datagrams over a loopback multicast group. Every datagram carries
// a "PRESENCE|room=<key>|origin=<instance>" header line followed by the JSON payload.
class LocalBroadcastTransport final : public TransportProvider
{
public:
    static constexpr std::size_t kMaxDatagramBytes = 60000;

    static std::unique_ptr<LocalBroadcastTransport> Open(
        const core::LocalBroadcastSettings& settings,
        const std::string& roomKey,
        const std::string& originId,
        std::string* outError = nullptr
    );

    ~LocalBroadcastTransport() override;

    [[nodiscard]] TransportKind Kind() const override { return TransportKind::LocalBroadcast; }
    bool Send(const std::string& payload) override;

    [[nodiscard]] const std::string& OriginId() const { return m_originId; }

    [[nodiscard]] static std::string BuildDatagram(const std::string& roomKey, const std::string& originId, const std::string& payload);
    // Returns false when the datagram is malformed.
    [[nodiscard]] static bool ParseDatagram(const std::string& datagram, std::string& outRoomKey, std::string& outOriginId, std::string& outPayload);
    [[nodiscard]] static std::string ParseField(const std::string& header, const std::string& key);

protected:
    void CollectIncoming(std::vector<std::string>& outPayloads) override;

private:
    LocalBroadcastTransport(core::LocalBroadcastSettings settings, const std::string& roomKey, std::string originId);

    bool OpenSocket(std::string* outError);
    void CloseSocket();

    core::LocalBroadcastSettings m_settings;
    std::string m_originId;

    std::mutex m_socketMutex;
    int m_socket = -1;
    std::uint32_t m_groupAddress = 0;
#ifdef _WIN32
    bool m_wsaInitialized = false;
#endif
};
} // namespace presence::net
