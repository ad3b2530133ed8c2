#include "presence/protocol/MessageCodec.hpp"

#include <cfloat>
#include <cmath>
#include <cstdint>
#include <limits>

#include <nlohmann/json.hpp>

namespace presence::protocol
{
namespace
{
using json = nlohmann::json;

void SetError(std::string* outError, const std::string& text)
{
    if (outError != nullptr)
    {
        *outError = text;
    }
}

bool ReadString(const json& node, const char* key, std::string& out)
{
    if (!node.contains(key) || !node[key].is_string())
    {
        return false;
    }
    out = node[key].get<std::string>();
    return true;
}

// Values outside the float range are rejected rather than narrowed.
bool ReadFloat(const json& node, const char* key, float& out)
{
    if (!node.contains(key) || !node[key].is_number())
    {
        return false;
    }
    const double value = node[key].get<double>();
    if (!std::isfinite(value) || std::abs(value) > static_cast<double>(FLT_MAX))
    {
        return false;
    }
    out = static_cast<float>(value);
    return true;
}

bool ReadInt64(const json& node, const char* key, std::int64_t& out)
{
    if (!node.contains(key) || !node[key].is_number_integer())
    {
        return false;
    }
    const json& value = node[key];
    if (value.is_number_unsigned() && value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
    {
        return false;
    }
    out = value.get<std::int64_t>();
    return true;
}

bool ReadBool(const json& node, const char* key, bool& out)
{
    if (!node.contains(key) || !node[key].is_boolean())
    {
        return false;
    }
    out = node[key].get<bool>();
    return true;
}

bool ReadDirection(const json& node, const char* key, scene::Direction& out)
{
    std::string text;
    if (!ReadString(node, key, text))
    {
        return false;
    }
    const auto direction = scene::ParseDirection(text);
    if (!direction.has_value())
    {
        return false;
    }
    out = *direction;
    return true;
}

json ProfileToJson(const scene::AvatarProfile& profile)
{
    json node = {
        {"name", profile.name},
        {"color", profile.color},
    };
    if (profile.accessory.has_value())
    {
        node["accessory"] = *profile.accessory;
    }
    if (profile.caption.has_value())
    {
        node["caption"] = *profile.caption;
    }
    return node;
}

bool ProfileFromJson(const json& node, scene::AvatarProfile& out)
{
    if (!node.is_object())
    {
        return false;
    }

    scene::AvatarProfile profile;
    if (!ReadString(node, "name", profile.name) || !ReadString(node, "color", profile.color))
    {
        return false;
    }

    std::string text;
    if (ReadString(node, "accessory", text))
    {
        profile.accessory = text;
    }
    if (ReadString(node, "caption", text) || ReadString(node, "bubble", text))
    {
        profile.caption = text;
    }

    out = std::move(profile);
    return true;
}

json SnapshotToJson(const scene::Participant& participant)
{
    return json{
        {"id", participant.id},
        {"profile", ProfileToJson(participant.profile)},
        {"x", participant.position.x},
        {"y", participant.position.y},
        {"dir", scene::DirectionToText(participant.direction)},
        {"camEnabled", participant.camEnabled},
        {"micEnabled", participant.micEnabled},
        {"speakingLevel", participant.speakingLevel},
    };
}

bool SnapshotFromJson(const json& node, scene::Participant& out)
{
    scene::Participant participant;
    if (!ReadString(node, "id", participant.id) || participant.id.empty())
    {
        return false;
    }
    if (!node.contains("profile") || !ProfileFromJson(node["profile"], participant.profile))
    {
        return false;
    }
    if (!ReadFloat(node, "x", participant.position.x) || !ReadFloat(node, "y", participant.position.y))
    {
        return false;
    }
    if (!ReadDirection(node, "dir", participant.direction))
    {
        return false;
    }
    if (!ReadBool(node, "camEnabled", participant.camEnabled) || !ReadBool(node, "micEnabled", participant.micEnabled))
    {
        return false;
    }

    // Optional on the wire.
    ReadFloat(node, "speakingLevel", participant.speakingLevel);

    out = std::move(participant);
    return true;
}

json StatePatchToJson(const scene::StatePatch& patch)
{
    json node = json::object();
    for (const auto& [key, value] : patch)
    {
        if (const auto flag = std::get_if<bool>(&value); flag != nullptr)
        {
            node[key] = *flag;
        }
        else if (const auto number = std::get_if<double>(&value); number != nullptr)
        {
            node[key] = *number;
        }
        else if (const auto text = std::get_if<std::string>(&value); text != nullptr)
        {
            node[key] = *text;
        }
    }
    return node;
}

bool StatePatchFromJson(const json& node, scene::StatePatch& out)
{
    if (!node.is_object())
    {
        return false;
    }

    scene::StatePatch patch;
    for (auto it = node.begin(); it != node.end(); ++it)
    {
        const json& value = it.value();
        if (value.is_boolean())
        {
            patch[it.key()] = value.get<bool>();
        }
        else if (value.is_number())
        {
            patch[it.key()] = value.get<double>();
        }
        else if (value.is_string())
        {
            patch[it.key()] = value.get<std::string>();
        }
    }

    out = std::move(patch);
    return true;
}

struct EncodeVisitor
{
    json operator()(const JoinMessage& message) const
    {
        return json{{"type", "join"}, {"payload", SnapshotToJson(message.snapshot)}};
    }

    json operator()(const LeaveMessage& message) const
    {
        return json{{"type", "leave"}, {"payload", {{"id", message.id}}}};
    }

    json operator()(const StateMessage& message) const
    {
        return json{{"type", "state"}, {"payload", SnapshotToJson(message.snapshot)}};
    }

    json operator()(const MoveMessage& message) const
    {
        return json{
            {"type", "move"},
            {"payload", {
                {"id", message.id},
                {"x", message.x},
                {"y", message.y},
                {"dir", scene::DirectionToText(message.direction)},
            }},
        };
    }

    json operator()(const AvatarMessage& message) const
    {
        return json{
            {"type", "avatar"},
            {"payload", {
                {"id", message.id},
                {"profile", ProfileToJson(message.profile)},
                {"camEnabled", message.camEnabled},
                {"micEnabled", message.micEnabled},
            }},
        };
    }

    json operator()(const VoiceMessage& message) const
    {
        return json{
            {"type", "voice"},
            {"payload", {
                {"id", message.id},
                {"level", message.level},
                {"micEnabled", message.micEnabled},
            }},
        };
    }

    json operator()(const ObjectMessage& message) const
    {
        return json{
            {"type", "object"},
            {"payload", {
                {"id", message.id},
                {"state", StatePatchToJson(message.state)},
            }},
        };
    }

    json operator()(const ChatMessage& message) const
    {
        return json{
            {"type", "chat"},
            {"payload", {
                {"id", message.id},
                {"name", message.name},
                {"text", message.text},
                {"ts", message.timestampMs},
            }},
        };
    }
};

std::optional<Message> DecodePayload(const std::string& type, const json& payload, std::string* outError)
{
    if (type == "join" || type == "state")
    {
        scene::Participant snapshot;
        if (!SnapshotFromJson(payload, snapshot))
        {
            SetError(outError, "Incomplete participant snapshot in " + type);
            return std::nullopt;
        }
        if (type == "join")
        {
            return Message{JoinMessage{std::move(snapshot)}};
        }
        return Message{StateMessage{std::move(snapshot)}};
    }

    if (type == "leave")
    {
        LeaveMessage message;
        if (!ReadString(payload, "id", message.id))
        {
            SetError(outError, "leave without id");
            return std::nullopt;
        }
        return Message{std::move(message)};
    }

    if (type == "move")
    {
        MoveMessage message;
        if (!ReadString(payload, "id", message.id) || !ReadFloat(payload, "x", message.x) ||
            !ReadFloat(payload, "y", message.y) || !ReadDirection(payload, "dir", message.direction))
        {
            SetError(outError, "Incomplete move payload");
            return std::nullopt;
        }
        return Message{std::move(message)};
    }

    if (type == "avatar")
    {
        AvatarMessage message;
        if (!ReadString(payload, "id", message.id) || !payload.contains("profile") ||
            !ProfileFromJson(payload["profile"], message.profile) ||
            !ReadBool(payload, "camEnabled", message.camEnabled) || !ReadBool(payload, "micEnabled", message.micEnabled))
        {
            SetError(outError, "Incomplete avatar payload");
            return std::nullopt;
        }
        return Message{std::move(message)};
    }

    if (type == "voice")
    {
        VoiceMessage message;
        if (!ReadString(payload, "id", message.id) || !ReadFloat(payload, "level", message.level) ||
            !ReadBool(payload, "micEnabled", message.micEnabled))
        {
            SetError(outError, "Incomplete voice payload");
            return std::nullopt;
        }
        return Message{std::move(message)};
    }

    if (type == "object")
    {
        ObjectMessage message;
        if (!ReadString(payload, "id", message.id) || !payload.contains("state") ||
            !StatePatchFromJson(payload["state"], message.state))
        {
            SetError(outError, "Incomplete object payload");
            return std::nullopt;
        }
        return Message{std::move(message)};
    }

    if (type == "chat")
    {
        ChatMessage message;
        if (!ReadString(payload, "id", message.id) || !ReadString(payload, "name", message.name) ||
            !ReadString(payload, "text", message.text) || !ReadInt64(payload, "ts", message.timestampMs))
        {
            SetError(outError, "Incomplete chat payload");
            return std::nullopt;
        }
        return Message{std::move(message)};
    }

    SetError(outError, "Unknown message type: " + type);
    return std::nullopt;
}
} // namespace

std::string EncodeMessage(const Message& message)
{
    return std::visit(EncodeVisitor{}, message).dump();
}

std::optional<Message> DecodeMessage(std::string_view text, std::string* outError)
{
    try
    {
        const json root = json::parse(text.begin(), text.end());
        if (!root.is_object())
        {
            SetError(outError, "Message root is not an object");
            return std::nullopt;
        }

        std::string type;
        if (!ReadString(root, "type", type))
        {
            SetError(outError, "Message without type tag");
            return std::nullopt;
        }
        if (!root.contains("payload") || !root["payload"].is_object())
        {
            SetError(outError, "Message without payload object");
            return std::nullopt;
        }

        return DecodePayload(type, root["payload"], outError);
    }
    catch (const std::exception& ex)
    {
        SetError(outError, std::string{"Malformed message: "} + ex.what());
        return std::nullopt;
    }
}
} // namespace presence::protocol
