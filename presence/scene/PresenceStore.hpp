#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "presence/scene/Reconciler.hpp"

namespace presence::scene
{
// Owns the participant map and world objects for one process. Inbound handlers and the
// simulation tick may run on different threads; every access takes a short lock.
class PresenceStore
{
public:
    PresenceStore(ReconcileContext context, std::vector<WorldObject> objects);

    PresenceStore(const PresenceStore&) = delete;
    PresenceStore& operator=(const PresenceStore&) = delete;

    ReconcileOutcome Apply(const protocol::Message& message, double nowSeconds);

    void UpsertLocal(const Participant& participant);
    bool UpdateLocal(const std::function<void(Participant&)>& update);
    bool RemoveParticipant(const PeerId& id);
    void Clear();

    // Non-local participants whose lastSeen is older than timeoutSeconds. timeoutSeconds <= 0 disables.
    std::vector<PeerId> EvictStale(double nowSeconds, double timeoutSeconds);

    // Applies a local interaction and returns the object's full state for broadcast.
    std::optional<StatePatch> ToggleObject(const std::string& objectId);

    [[nodiscard]] PresenceState Snapshot() const;
    [[nodiscard]] std::optional<Participant> FindParticipant(const PeerId& id) const;
    [[nodiscard]] std::optional<Participant> LocalParticipant() const;
    [[nodiscard]] std::optional<WorldObject> FindObject(const std::string& id) const;
    [[nodiscard]] std::vector<WorldObject> Objects() const;
    [[nodiscard]] std::size_t ParticipantCount() const;
    [[nodiscard]] bool Contains(const PeerId& id) const;

    [[nodiscard]] const PeerId& LocalId() const { return m_context.localId; }
    [[nodiscard]] const ReconcileContext& Context() const { return m_context; }

private:
    mutable std::mutex m_mutex;
    PresenceState m_state;
    const ReconcileContext m_context;
};
} // namespace presence::scene
