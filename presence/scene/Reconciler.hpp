#pragma once

#include <unordered_map>
#include <vector>

#include <glm/vec2.hpp>

#include "presence/protocol/Message.hpp"
#include "presence/scene/Participant.hpp"
#include "presence/scene/WorldObject.hpp"

namespace presence::scene
{
struct PresenceState
{
    std::unordered_map<PeerId, Participant> participants;
    std::vector<WorldObject> objects;

    [[nodiscard]] const Participant* FindParticipant(const PeerId& id) const;
    [[nodiscard]] const WorldObject* FindObject(const std::string& id) const;
};

struct ReconcileContext
{
    PeerId localId;
    double nowSeconds = 0.0;
    glm::vec2 spawnPosition{512.0F, 320.0F};
    glm::vec2 boundsMin{32.0F, 32.0F};
    glm::vec2 boundsMax{992.0F, 608.0F};
    float moveEpsilon = 0.5F;
};

enum class ReconcileOutcome
{
    Applied,
    Refreshed,
    Ignored
};

struct ReconcileResult
{
    PresenceState state;
    ReconcileOutcome outcome = ReconcileOutcome::Ignored;
};

// (currentState, message) -> newState. Rules:
// - messages about the local id never touch the local entry;
// - join/state/avatar create unknown participants, move/voice for unknown ids are dropped;
// - move writes position/direction only past moveEpsilon, but always refreshes lastSeen;
// - object state is a shallow key-wise overwrite on the matching object;
// - chat leaves the state untouched.
// Every rule is last-write-wins per field, so the result does not depend on cross-message ordering.
[[nodiscard]] ReconcileResult Reconcile(PresenceState state, const protocol::Message& message, const ReconcileContext& context);

[[nodiscard]] glm::vec2 ClampToBounds(glm::vec2 position, glm::vec2 boundsMin, glm::vec2 boundsMax);
} // namespace presence::scene
