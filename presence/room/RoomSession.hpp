#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <glm/vec2.hpp>

#include "presence/core/Config.hpp"
#include "presence/core/Time.hpp"
#include "presence/net/Channel.hpp"
#include "presence/room/MediaDevices.hpp"
#include "presence/scene/ChatLog.hpp"
#include "presence/scene/PresenceStore.hpp"
#include "presence/sim/BroadcastScheduler.hpp"
#include "presence/sim/LocalSimulation.hpp"
#include "presence/sim/RemoteInterpolator.hpp"

namespace presence::room
{
// Everything a presentation layer needs for one frame.
struct RoomFrame
{
    scene::PeerId localId;
    std::vector<scene::Participant> participants;
    std::unordered_map<scene::PeerId, sim::DisplayState> display;
    std::vector<scene::WorldObject> objects;
    std::vector<protocol::ChatMessage> chat;
    std::optional<net::TransportKind> transport;
};

class RoomSession
{
public:
    using Clock = std::function<double()>;

    static constexpr double kCaptionSeconds = 3.0;
    static constexpr std::size_t kFrameChatTail = 20;

    RoomSession(
        net::TransportRegistry& registry,
        std::string roomId,
        scene::AvatarProfile profile,
        MediaDevices& devices,
        const core::PresenceConfig& config,
        Clock clock = &core::Time::MonotonicSeconds
    );
    ~RoomSession();

    RoomSession(const RoomSession&) = delete;
    RoomSession& operator=(const RoomSession&) = delete;

    // Registers the local participant, subscribes and announces it. Returns false once already joined.
    bool Join();
    // Best-effort leave announcement, then teardown of the subscription.
    void Leave();

    // Every timestamp the session records comes from the injected clock.
    void Tick(float rawAudioLevel);

    void SetProfile(const scene::AvatarProfile& profile);
    bool SetCameraEnabled(bool enabled);
    bool SetMicrophoneEnabled(bool enabled);
    // Returns false for blank text.
    bool SendChat(const std::string& text);
    // Toggles an interactive object under the point, or sets a click-to-move target.
    void PointAt(glm::vec2 worldPoint);
    void SetDirectionalInput(const sim::DirectionalInput& input);

    [[nodiscard]] RoomFrame Frame() const;

    [[nodiscard]] bool IsJoined() const { return m_joined.load(); }
    [[nodiscard]] const scene::PeerId& LocalId() const { return m_localId; }
    [[nodiscard]] const std::string& RoomId() const { return m_roomId; }
    [[nodiscard]] const scene::PresenceStore& Store() const { return m_store; }
    [[nodiscard]] const scene::ChatLog& Chat() const { return m_chat; }
    [[nodiscard]] const sim::LocalSimulation& Simulation() const { return m_simulation; }
    [[nodiscard]] net::Channel& RoomChannel() { return *m_channel; }
    [[nodiscard]] std::optional<net::TransportKind> ActiveTransport() const;

private:
    void OnMessage(const protocol::Message& message);
    void PostAvatarIfChanged();
    [[nodiscard]] protocol::AvatarMessage BuildAvatarMessage() const;
    [[nodiscard]] scene::Participant LocalSnapshot() const;

    const std::string m_roomId;
    const scene::PeerId m_localId;
    const core::PresenceConfig m_config;
    MediaDevices& m_devices;
    Clock m_clock;

    std::unique_ptr<net::Channel> m_channel;
    net::Channel::SubscriptionId m_subscription = 0;

    scene::PresenceStore m_store;
    scene::ChatLog m_chat;
    sim::LocalSimulation m_simulation;
    sim::BroadcastScheduler m_scheduler;
    sim::VoiceMeter m_voice;
    core::Time m_time;

    std::atomic<bool> m_joined{false};
    // Serializes inbound reconciliation against Leave's teardown.
    std::mutex m_inboundMutex;

    mutable std::mutex m_displayMutex;
    sim::RemoteInterpolator m_interpolator;

    // Tick-side state; touched only from the owning thread.
    scene::AvatarProfile m_profile;
    bool m_camEnabled = false;
    bool m_micEnabled = false;
    std::optional<double> m_captionExpiresAt;
    std::string m_captionText;
};
} // namespace presence::room
