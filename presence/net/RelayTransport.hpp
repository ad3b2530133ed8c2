#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "presence/core/Config.hpp"
#include "presence/net/TransportProvider.hpp"

struct _ENetHost;
struct _ENetPeer;

namespace presence::net
{
// ENet client attached to a presence_relay process; one connection per room key.
class RelayTransport final : public TransportProvider
{
public:
    static constexpr std::size_t kMaxPendingSends = 64;
    static constexpr double kReconnectDelaySeconds = 2.0;

    // Succeeds once the connection attempt is in flight; the handshake completes during Poll.
    static std::unique_ptr<RelayTransport> Create(
        const core::RelaySettings& settings,
        const std::string& roomKey,
        std::string* outError = nullptr
    );

    ~RelayTransport() override;

    [[nodiscard]] TransportKind Kind() const override { return TransportKind::Relay; }
    bool Send(const std::string& payload) override;

    [[nodiscard]] bool IsConnected() const;
    [[nodiscard]] bool WasRejected() const;
    [[nodiscard]] std::size_t PendingSendCount() const;

protected:
    void CollectIncoming(std::vector<std::string>& outPayloads) override;

private:
    RelayTransport(core::RelaySettings settings, const std::string& roomKey);

    bool Connect(std::string* outError);
    void ResetTransport();
    bool SendPacket(const std::vector<std::uint8_t>& bytes, std::uint8_t channel);
    void FlushPending();

    core::RelaySettings m_settings;

    mutable std::mutex m_mutex;
    bool m_enetInitialized = false;
    _ENetHost* m_host = nullptr;
    _ENetPeer* m_peer = nullptr;
    bool m_connected = false;
    bool m_rejected = false;
    double m_connectStartedSeconds = 0.0;
    double m_lastAttemptSeconds = 0.0;
    std::deque<std::string> m_pending;
};
} // namespace presence::net
