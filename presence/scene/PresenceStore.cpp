#include "presence/scene/PresenceStore.hpp"

namespace presence::scene
{
PresenceStore::PresenceStore(ReconcileContext context, std::vector<WorldObject> objects)
    : m_context(std::move(context))
{
    m_state.objects = std::move(objects);
}

ReconcileOutcome PresenceStore::Apply(const protocol::Message& message, double nowSeconds)
{
    ReconcileContext context = m_context;
    context.nowSeconds = nowSeconds;

    std::lock_guard<std::mutex> lock(m_mutex);
    ReconcileResult result = Reconcile(std::move(m_state), message, context);
    m_state = std::move(result.state);
    return result.outcome;
}

void PresenceStore::UpsertLocal(const Participant& participant)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    Participant local = participant;
    local.id = m_context.localId;
    m_state.participants[local.id] = std::move(local);
}

bool PresenceStore::UpdateLocal(const std::function<void(Participant&)>& update)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_state.participants.find(m_context.localId);
    if (it == m_state.participants.end())
    {
        return false;
    }
    update(it->second);
    return true;
}

bool PresenceStore::RemoveParticipant(const PeerId& id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.participants.erase(id) > 0;
}

void PresenceStore::Clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_state.participants.clear();
}

std::vector<PeerId> PresenceStore::EvictStale(double nowSeconds, double timeoutSeconds)
{
    std::vector<PeerId> evicted;
    if (timeoutSeconds <= 0.0)
    {
        return evicted;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto it = m_state.participants.begin(); it != m_state.participants.end();)
    {
        if (it->first != m_context.localId && nowSeconds - it->second.lastSeenSeconds > timeoutSeconds)
        {
            evicted.push_back(it->first);
            it = m_state.participants.erase(it);
        }
        else
        {
            ++it;
        }
    }
    return evicted;
}

std::optional<StatePatch> PresenceStore::ToggleObject(const std::string& objectId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (WorldObject& object : m_state.objects)
    {
        if (object.id == objectId)
        {
            if (!object.Toggle())
            {
                return std::nullopt;
            }
            return object.StateAsPatch();
        }
    }
    return std::nullopt;
}

PresenceState PresenceStore::Snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

std::optional<Participant> PresenceStore::FindParticipant(const PeerId& id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (const Participant* participant = m_state.FindParticipant(id))
    {
        return *participant;
    }
    return std::nullopt;
}

std::optional<Participant> PresenceStore::LocalParticipant() const
{
    return FindParticipant(m_context.localId);
}

std::optional<WorldObject> PresenceStore::FindObject(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (const WorldObject* object = m_state.FindObject(id))
    {
        return *object;
    }
    return std::nullopt;
}

std::vector<WorldObject> PresenceStore::Objects() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.objects;
}

std::size_t PresenceStore::ParticipantCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.participants.size();
}

bool PresenceStore::Contains(const PeerId& id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.participants.find(id) != m_state.participants.end();
}
} // namespace presence::scene
