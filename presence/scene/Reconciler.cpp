#include "presence/scene/Reconciler.hpp"

#include <algorithm>
#include <cmath>

#include <glm/common.hpp>

namespace presence::scene
{
namespace
{
class ReconcileVisitor
{
public:
    ReconcileVisitor(PresenceState& state, const ReconcileContext& context)
        : m_state(state)
        , m_context(context)
    {
    }

    ReconcileOutcome operator()(const protocol::JoinMessage& message) const { return Upsert(message.snapshot); }
    ReconcileOutcome operator()(const protocol::StateMessage& message) const { return Upsert(message.snapshot); }

    ReconcileOutcome operator()(const protocol::LeaveMessage& message) const
    {
        if (IsLocal(message.id))
        {
            return ReconcileOutcome::Ignored;
        }
        return m_state.participants.erase(message.id) > 0 ? ReconcileOutcome::Applied : ReconcileOutcome::Ignored;
    }

    ReconcileOutcome operator()(const protocol::MoveMessage& message) const
    {
        Participant* existing = FindRemote(message.id);
        if (existing == nullptr || !std::isfinite(message.x) || !std::isfinite(message.y))
        {
            return ReconcileOutcome::Ignored;
        }

        existing->lastSeenSeconds = m_context.nowSeconds;
        const glm::vec2 target = ClampToBounds(glm::vec2{message.x, message.y}, m_context.boundsMin, m_context.boundsMax);
        if (std::abs(existing->position.x - target.x) > m_context.moveEpsilon ||
            std::abs(existing->position.y - target.y) > m_context.moveEpsilon)
        {
            existing->position = target;
            existing->direction = message.direction;
            return ReconcileOutcome::Applied;
        }
        return ReconcileOutcome::Refreshed;
    }

    ReconcileOutcome operator()(const protocol::AvatarMessage& message) const
    {
        if (IsLocal(message.id) || message.id.empty())
        {
            return ReconcileOutcome::Ignored;
        }

        auto [it, inserted] = m_state.participants.try_emplace(message.id);
        Participant& participant = it->second;
        if (inserted)
        {
            participant.id = message.id;
            participant.position = m_context.spawnPosition;
            participant.direction = Direction::Down;
            participant.speakingLevel = 0.0F;
        }
        participant.profile = message.profile;
        participant.camEnabled = message.camEnabled;
        participant.micEnabled = message.micEnabled;
        participant.lastSeenSeconds = m_context.nowSeconds;
        return ReconcileOutcome::Applied;
    }

    ReconcileOutcome operator()(const protocol::VoiceMessage& message) const
    {
        Participant* existing = FindRemote(message.id);
        if (existing == nullptr)
        {
            return ReconcileOutcome::Ignored;
        }

        existing->micEnabled = message.micEnabled;
        existing->speakingLevel = std::isfinite(message.level) ? std::clamp(message.level, 0.0F, 1.0F) : 0.0F;
        existing->lastSeenSeconds = m_context.nowSeconds;
        return ReconcileOutcome::Applied;
    }

    ReconcileOutcome operator()(const protocol::ObjectMessage& message) const
    {
        for (WorldObject& object : m_state.objects)
        {
            if (object.id == message.id)
            {
                object.MergeState(message.state);
                return ReconcileOutcome::Applied;
            }
        }
        return ReconcileOutcome::Ignored;
    }

    ReconcileOutcome operator()(const protocol::ChatMessage&) const
    {
        return ReconcileOutcome::Ignored;
    }

private:
    [[nodiscard]] bool IsLocal(const PeerId& id) const { return !m_context.localId.empty() && id == m_context.localId; }

    Participant* FindRemote(const PeerId& id) const
    {
        if (IsLocal(id))
        {
            return nullptr;
        }
        const auto it = m_state.participants.find(id);
        return it == m_state.participants.end() ? nullptr : &it->second;
    }

    ReconcileOutcome Upsert(const Participant& snapshot) const
    {
        if (IsLocal(snapshot.id) || snapshot.id.empty())
        {
            return ReconcileOutcome::Ignored;
        }

        Participant participant = snapshot;
        if (!std::isfinite(participant.position.x) || !std::isfinite(participant.position.y))
        {
            participant.position = m_context.spawnPosition;
        }
        participant.position = ClampToBounds(participant.position, m_context.boundsMin, m_context.boundsMax);
        participant.speakingLevel = std::isfinite(participant.speakingLevel) ? std::clamp(participant.speakingLevel, 0.0F, 1.0F) : 0.0F;
        participant.lastSeenSeconds = m_context.nowSeconds;
        m_state.participants[participant.id] = std::move(participant);
        return ReconcileOutcome::Applied;
    }

    PresenceState& m_state;
    const ReconcileContext& m_context;
};
} // namespace

const Participant* PresenceState::FindParticipant(const PeerId& id) const
{
    const auto it = participants.find(id);
    return it == participants.end() ? nullptr : &it->second;
}

const WorldObject* PresenceState::FindObject(const std::string& id) const
{
    for (const WorldObject& object : objects)
    {
        if (object.id == id)
        {
            return &object;
        }
    }
    return nullptr;
}

ReconcileResult Reconcile(PresenceState state, const protocol::Message& message, const ReconcileContext& context)
{
    ReconcileResult result;
    result.outcome = std::visit(ReconcileVisitor{state, context}, message);
    result.state = std::move(state);
    return result;
}

glm::vec2 ClampToBounds(glm::vec2 position, glm::vec2 boundsMin, glm::vec2 boundsMax)
{
    return glm::clamp(position, boundsMin, boundsMax);
}
} // namespace presence::scene
