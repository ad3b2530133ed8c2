#include "presence/room/RoomSession.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <variant>

#include "presence/core/Log.hpp"

namespace presence::room
{
namespace
{
constexpr const char* kTag = "Session";

scene::ReconcileContext MakeReconcileContext(const scene::PeerId& localId, const core::PresenceConfig& config)
{
    const sim::MovementTuning movement = sim::MovementTuning::FromConfig(config);

    scene::ReconcileContext context;
    context.localId = localId;
    context.spawnPosition = glm::vec2{config.WorldWidth() * 0.5F, config.WorldHeight() * 0.5F};
    context.boundsMin = movement.boundsMin;
    context.boundsMax = movement.boundsMax;
    context.moveEpsilon = config.broadcast.moveEpsilon;
    return context;
}

std::string Trim(const std::string& text)
{
    auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    const auto begin = std::find_if_not(text.begin(), text.end(), isSpace);
    const auto end = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::int64_t UnixMillis()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}
} // namespace

RoomSession::RoomSession(
    net::TransportRegistry& registry,
    std::string roomId,
    scene::AvatarProfile profile,
    MediaDevices& devices,
    const core::PresenceConfig& config,
    Clock clock
)
    : m_roomId(std::move(roomId))
    , m_localId(scene::GeneratePeerId())
    , m_config(config)
    , m_devices(devices)
    , m_clock(std::move(clock))
    , m_channel(std::make_unique<net::Channel>(registry, m_roomId))
    , m_store(MakeReconcileContext(m_localId, config), scene::MakeDefaultRoomObjects(config.world.tileSize))
    , m_simulation(sim::MovementTuning::FromConfig(config), MakeReconcileContext(m_localId, config).spawnPosition)
    , m_scheduler(sim::BroadcastTuning::FromConfig(config))
    , m_time(config.movement.maxTickSeconds)
    , m_interpolator(sim::InterpolationTuning::FromConfig(config))
    , m_profile(std::move(profile))
{
    m_profile.caption.reset();
}

RoomSession::~RoomSession()
{
    Leave();
    m_channel->Close();
}

bool RoomSession::Join()
{
    if (m_joined.load())
    {
        return false;
    }

    const scene::Participant local = LocalSnapshot();
    m_store.UpsertLocal(local);
    m_time.Reset();
    m_scheduler.Reset();

    m_joined.store(true);
    m_subscription = m_channel->Subscribe([this](const protocol::Message& message) { OnMessage(message); });

    m_channel->Post(protocol::JoinMessage{local});
    core::Log::Info(kTag, "Joined room " + m_roomId + " as " + m_profile.name + " (" + m_localId + ")");
    return true;
}

void RoomSession::Leave()
{
    if (!m_joined.exchange(false))
    {
        return;
    }

    m_channel->Post(protocol::LeaveMessage{m_localId});
    m_channel->Unsubscribe(m_subscription);
    m_subscription = 0;

    if (m_camEnabled)
    {
        m_devices.ReleaseCamera();
        m_camEnabled = false;
    }
    if (m_micEnabled)
    {
        m_devices.ReleaseMicrophone();
        m_micEnabled = false;
    }

    {
        // A handler already dispatched on the pump thread finishes before the store is cleared.
        std::lock_guard<std::mutex> inbound(m_inboundMutex);
        m_store.Clear();
        std::lock_guard<std::mutex> lock(m_displayMutex);
        m_interpolator.Clear();
    }
    core::Log::Info(kTag, "Left room " + m_roomId);
}

void RoomSession::Tick(float rawAudioLevel)
{
    if (!m_joined.load())
    {
        return;
    }

    const double nowSeconds = m_clock();
    m_time.BeginFrame(nowSeconds);
    const double elapsed = m_time.DeltaSeconds();

    m_simulation.Tick(elapsed);
    const float level = m_voice.Feed(rawAudioLevel, m_micEnabled);

    if (m_captionExpiresAt && nowSeconds >= *m_captionExpiresAt)
    {
        if (m_profile.caption == m_captionText)
        {
            m_profile.caption.reset();
        }
        m_captionExpiresAt.reset();
    }

    const glm::vec2 position = m_simulation.Position();
    const scene::Direction facing = m_simulation.Facing();
    m_store.UpdateLocal([&](scene::Participant& local) {
        local.profile = m_profile;
        local.position = position;
        local.direction = facing;
        local.camEnabled = m_camEnabled;
        local.micEnabled = m_micEnabled;
        local.speakingLevel = level;
        local.lastSeenSeconds = nowSeconds;
    });

    const std::vector<scene::PeerId> evicted = m_store.EvictStale(nowSeconds, m_config.liveness.staleTimeoutSeconds);
    for (const scene::PeerId& id : evicted)
    {
        core::Log::Info(kTag, "Evicted silent peer " + id);
    }

    {
        std::lock_guard<std::mutex> lock(m_displayMutex);
        for (const scene::PeerId& id : evicted)
        {
            m_interpolator.Remove(id);
        }
        m_interpolator.Tick(elapsed, m_store.Snapshot(), m_localId);
    }

    sim::LocalBroadcastState broadcast;
    broadcast.id = m_localId;
    broadcast.position = position;
    broadcast.direction = facing;
    broadcast.voiceLevel = level;
    broadcast.micEnabled = m_micEnabled;
    for (const protocol::Message& message : m_scheduler.Update(nowSeconds, broadcast))
    {
        m_channel->Post(message);
    }

    // Peers that evicted us during a stall re-create our entry from the periodic snapshot.
    if (m_scheduler.AnnounceDue(nowSeconds))
    {
        m_channel->Post(protocol::StateMessage{LocalSnapshot()});
    }
}

void RoomSession::SetProfile(const scene::AvatarProfile& profile)
{
    const std::optional<std::string> caption = m_profile.caption;
    m_profile = profile;
    m_profile.caption = caption;

    m_store.UpdateLocal([&](scene::Participant& local) { local.profile = m_profile; });
    PostAvatarIfChanged();
}

bool RoomSession::SetCameraEnabled(bool enabled)
{
    if (enabled == m_camEnabled)
    {
        return true;
    }

    if (enabled)
    {
        std::string error;
        if (!m_devices.AcquireCamera(&error))
        {
            core::Log::Warn(kTag, "Camera unavailable: " + error);
            return false;
        }
    }
    else
    {
        m_devices.ReleaseCamera();
    }

    m_camEnabled = enabled;
    m_store.UpdateLocal([&](scene::Participant& local) { local.camEnabled = enabled; });
    PostAvatarIfChanged();
    return true;
}

bool RoomSession::SetMicrophoneEnabled(bool enabled)
{
    if (enabled == m_micEnabled)
    {
        return true;
    }

    if (enabled)
    {
        std::string error;
        if (!m_devices.AcquireMicrophone(&error))
        {
            core::Log::Warn(kTag, "Microphone unavailable: " + error);
            return false;
        }
    }
    else
    {
        m_devices.ReleaseMicrophone();
        m_voice.Reset();
    }

    m_micEnabled = enabled;
    m_store.UpdateLocal([&](scene::Participant& local) {
        local.micEnabled = enabled;
        local.speakingLevel = 0.0F;
    });

    if (m_joined.load())
    {
        m_channel->Post(m_scheduler.OnMicrophoneToggled(m_localId, enabled));
    }
    PostAvatarIfChanged();
    return true;
}

bool RoomSession::SendChat(const std::string& text)
{
    const std::string trimmed = Trim(text);
    if (trimmed.empty())
    {
        return false;
    }

    protocol::ChatMessage chat;
    chat.id = m_localId;
    chat.name = m_profile.name;
    chat.text = trimmed;
    chat.timestampMs = UnixMillis();
    m_chat.Append(chat);

    if (m_joined.load())
    {
        m_channel->Post(chat);
    }

    m_profile.caption = trimmed;
    m_captionText = trimmed;
    m_captionExpiresAt = m_clock() + kCaptionSeconds;
    m_store.UpdateLocal([&](scene::Participant& local) { local.profile.caption = trimmed; });
    return true;
}

void RoomSession::PointAt(glm::vec2 worldPoint)
{
    const std::vector<scene::WorldObject> objects = m_store.Objects();
    const scene::WorldObject* hit = scene::HitObject(objects, worldPoint);
    if (hit != nullptr && hit->interactive)
    {
        const std::optional<scene::StatePatch> state = m_store.ToggleObject(hit->id);
        if (state && m_joined.load())
        {
            m_channel->Post(protocol::ObjectMessage{hit->id, *state});
        }
        return;
    }

    m_simulation.SetTarget(worldPoint);
}

void RoomSession::SetDirectionalInput(const sim::DirectionalInput& input)
{
    m_simulation.SetDirectionalInput(input);
}

RoomFrame RoomSession::Frame() const
{
    RoomFrame frame;
    frame.localId = m_localId;

    const scene::PresenceState state = m_store.Snapshot();
    frame.participants.reserve(state.participants.size());
    for (const auto& entry : state.participants)
    {
        frame.participants.push_back(entry.second);
    }
    std::sort(frame.participants.begin(), frame.participants.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
    frame.objects = state.objects;

    {
        std::lock_guard<std::mutex> lock(m_displayMutex);
        frame.display = m_interpolator.Entries();
    }

    frame.chat = m_chat.Tail(kFrameChatTail);
    frame.transport = ActiveTransport();
    return frame;
}

std::optional<net::TransportKind> RoomSession::ActiveTransport() const
{
    return m_channel->Kind();
}

void RoomSession::OnMessage(const protocol::Message& message)
{
    std::lock_guard<std::mutex> inbound(m_inboundMutex);
    if (!m_joined.load())
    {
        return;
    }

    const scene::ReconcileOutcome outcome = m_store.Apply(message, m_clock());

    if (const auto* join = std::get_if<protocol::JoinMessage>(&message))
    {
        if (join->snapshot.id == m_localId)
        {
            return;
        }
        if (outcome == scene::ReconcileOutcome::Applied)
        {
            core::Log::Info(kTag, join->snapshot.profile.name + " joined (" + join->snapshot.id + ")");
        }
        // Newcomers learn about us from the reply.
        m_channel->Post(protocol::StateMessage{LocalSnapshot()});
    }
    else if (const auto* leave = std::get_if<protocol::LeaveMessage>(&message))
    {
        std::lock_guard<std::mutex> lock(m_displayMutex);
        m_interpolator.Remove(leave->id);
    }
    else if (const auto* chat = std::get_if<protocol::ChatMessage>(&message))
    {
        if (chat->id != m_localId)
        {
            m_chat.Append(*chat);
        }
    }
}

void RoomSession::PostAvatarIfChanged()
{
    if (!m_joined.load())
    {
        return;
    }

    if (std::optional<protocol::Message> avatar = m_scheduler.OnAvatarChanged(BuildAvatarMessage()))
    {
        m_channel->Post(*avatar);
    }
}

protocol::AvatarMessage RoomSession::BuildAvatarMessage() const
{
    protocol::AvatarMessage avatar;
    avatar.id = m_localId;
    avatar.profile = m_profile;
    avatar.profile.caption.reset();
    avatar.camEnabled = m_camEnabled;
    avatar.micEnabled = m_micEnabled;
    return avatar;
}

scene::Participant RoomSession::LocalSnapshot() const
{
    if (std::optional<scene::Participant> local = m_store.LocalParticipant())
    {
        return *local;
    }

    scene::Participant local;
    local.id = m_localId;
    local.profile = m_profile;
    local.position = m_simulation.Position();
    local.direction = m_simulation.Facing();
    local.camEnabled = m_camEnabled;
    local.micEnabled = m_micEnabled;
    local.lastSeenSeconds = m_clock();
    return local;
}
} // namespace presence::room
