#include "presence/net/RelayProtocol.hpp"

#include <nlohmann/json.hpp>

namespace presence::net
{
namespace
{
using json = nlohmann::json;

std::vector<std::uint8_t> Frame(std::uint8_t kind, const std::string& body)
{
    std::vector<std::uint8_t> packet;
    packet.reserve(body.size() + 1);
    packet.push_back(kind);
    packet.insert(packet.end(), body.begin(), body.end());
    return packet;
}
} // namespace

std::vector<std::uint8_t> BuildJoinPacket(const RelayJoinRequest& request)
{
    const json body = {
        {"room", request.room},
        {"key", request.key},
    };
    return Frame(kRelayPacketJoinRoom, body.dump());
}

bool ParseJoinPacket(const std::vector<std::uint8_t>& packet, RelayJoinRequest& outRequest)
{
    if (packet.size() < 2 || packet[0] != kRelayPacketJoinRoom)
    {
        return false;
    }

    try
    {
        const json body = json::parse(packet.begin() + 1, packet.end());
        if (!body.is_object() || !body.contains("room") || !body["room"].is_string())
        {
            return false;
        }

        RelayJoinRequest request;
        request.room = body["room"].get<std::string>();
        if (body.contains("key") && body["key"].is_string())
        {
            request.key = body["key"].get<std::string>();
        }
        if (request.room.empty())
        {
            return false;
        }
        outRequest = std::move(request);
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

std::vector<std::uint8_t> BuildDataPacket(const std::string& payload)
{
    return Frame(kRelayPacketData, payload);
}

std::vector<std::uint8_t> BuildRejectPacket(const std::string& reason)
{
    return Frame(kRelayPacketReject, reason);
}

std::string PacketBody(const std::uint8_t* data, std::size_t size)
{
    if (data == nullptr || size < 2)
    {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(data) + 1, size - 1);
}
} // namespace presence::net
