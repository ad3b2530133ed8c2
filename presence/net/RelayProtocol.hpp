#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace presence::net
{
// First byte of every relay packet.
constexpr std::uint8_t kRelayPacketJoinRoom = 1;
constexpr std::uint8_t kRelayPacketData = 2;
constexpr std::uint8_t kRelayPacketReject = 3;

constexpr std::uint8_t kRelayChannelControl = 0;
constexpr std::uint8_t kRelayChannelData = 1;
constexpr std::size_t kRelayChannelCount = 2;

struct RelayJoinRequest
{
    std::string room;
    std::string key;
};

[[nodiscard]] std::vector<std::uint8_t> BuildJoinPacket(const RelayJoinRequest& request);
[[nodiscard]] bool ParseJoinPacket(const std::vector<std::uint8_t>& packet, RelayJoinRequest& outRequest);

[[nodiscard]] std::vector<std::uint8_t> BuildDataPacket(const std::string& payload);
[[nodiscard]] std::vector<std::uint8_t> BuildRejectPacket(const std::string& reason);

// Text after the kind byte.
[[nodiscard]] std::string PacketBody(const std::uint8_t* data, std::size_t size);
} // namespace presence::net
