#include "presence/protocol/Message.hpp"

namespace presence::protocol
{
namespace
{
struct SubjectVisitor
{
    const std::string& operator()(const JoinMessage& message) const { return message.snapshot.id; }
    const std::string& operator()(const LeaveMessage& message) const { return message.id; }
    const std::string& operator()(const StateMessage& message) const { return message.snapshot.id; }
    const std::string& operator()(const MoveMessage& message) const { return message.id; }
    const std::string& operator()(const AvatarMessage& message) const { return message.id; }
    const std::string& operator()(const VoiceMessage& message) const { return message.id; }
    const std::string& operator()(const ObjectMessage& message) const { return message.id; }
    const std::string& operator()(const ChatMessage& message) const { return message.id; }
};
} // namespace

MessageType TypeOf(const Message& message)
{
    return static_cast<MessageType>(message.index());
}

const char* MessageTypeToText(MessageType type)
{
    switch (type)
    {
        case MessageType::Join: return "join";
        case MessageType::Leave: return "leave";
        case MessageType::State: return "state";
        case MessageType::Move: return "move";
        case MessageType::Avatar: return "avatar";
        case MessageType::Voice: return "voice";
        case MessageType::Object: return "object";
        case MessageType::Chat: return "chat";
    }
    return "unknown";
}

const char* MessageTypeToText(const Message& message)
{
    return MessageTypeToText(TypeOf(message));
}

const std::string& SubjectId(const Message& message)
{
    return std::visit(SubjectVisitor{}, message);
}
} // namespace presence::protocol
