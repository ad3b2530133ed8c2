#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "presence/scene/Participant.hpp"
#include "presence/scene/WorldObject.hpp"

namespace presence::protocol
{
enum class MessageType
{
    Join,
    Leave,
    State,
    Move,
    Avatar,
    Voice,
    Object,
    Chat
};

struct JoinMessage
{
    scene::Participant snapshot;
};

struct LeaveMessage
{
    scene::PeerId id;
};

// Handshake reply; same payload as join.
struct StateMessage
{
    scene::Participant snapshot;
};

struct MoveMessage
{
    scene::PeerId id;
    float x = 0.0F;
    float y = 0.0F;
    scene::Direction direction = scene::Direction::Down;
};

struct AvatarMessage
{
    scene::PeerId id;
    scene::AvatarProfile profile;
    bool camEnabled = false;
    bool micEnabled = false;
};

struct VoiceMessage
{
    scene::PeerId id;
    float level = 0.0F;
    bool micEnabled = false;
};

struct ObjectMessage
{
    std::string id;
    scene::StatePatch state;
};

struct ChatMessage
{
    scene::PeerId id;
    std::string name;
    std::string text;
    std::int64_t timestampMs = 0;
};

// Alternative order matches MessageType.
using Message = std::variant<
    JoinMessage,
    LeaveMessage,
    StateMessage,
    MoveMessage,
    AvatarMessage,
    VoiceMessage,
    ObjectMessage,
    ChatMessage>;

[[nodiscard]] MessageType TypeOf(const Message& message);
[[nodiscard]] const char* MessageTypeToText(MessageType type);
[[nodiscard]] const char* MessageTypeToText(const Message& message);

// Participant id the message refers to (object messages return the object id).
[[nodiscard]] const std::string& SubjectId(const Message& message);
} // namespace presence::protocol
