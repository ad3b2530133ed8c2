#pragma once

#include <optional>
#include <vector>

#include <glm/vec2.hpp>

#include "presence/core/Config.hpp"
#include "presence/protocol/Message.hpp"

namespace presence::sim
{
struct BroadcastTuning
{
    double positionIntervalSeconds = 0.060;
    double voiceIntervalSeconds = 0.140;
    float voiceHysteresis = 0.03F;
    float voiceOutputGain = 2.2F;
    double announceIntervalSeconds = 2.0;

    [[nodiscard]] static BroadcastTuning FromConfig(const core::PresenceConfig& config);
};

struct LocalBroadcastState
{
    scene::PeerId id;
    glm::vec2 position{0.0F, 0.0F};
    scene::Direction direction = scene::Direction::Down;
    float voiceLevel = 0.0F;
    bool micEnabled = false;
};

// Smooths the raw 0..1 microphone level fed once per tick.
class VoiceMeter
{
public:
    static constexpr float kSmoothing = 0.25F;

    float Feed(float rawLevel, bool micEnabled);
    void Reset() { m_level = 0.0F; }

    [[nodiscard]] float Level() const { return m_level; }

private:
    float m_level = 0.0F;
};

class BroadcastScheduler
{
public:
    explicit BroadcastScheduler(const BroadcastTuning& tuning = BroadcastTuning{});

    // Timer-driven outbound traffic: a move every position interval (no delta suppression) and a
    // voice update every voice interval when the level moved past the hysteresis or mic state flipped.
    [[nodiscard]] std::vector<protocol::Message> Update(double nowSeconds, const LocalBroadcastState& local);

    // Immediate, unconditional on change. Returns nothing when the avatar equals the last one sent.
    [[nodiscard]] std::optional<protocol::Message> OnAvatarChanged(const protocol::AvatarMessage& avatar);

    // Mic toggles are announced at once with a zero level.
    [[nodiscard]] protocol::Message OnMicrophoneToggled(const scene::PeerId& id, bool micEnabled);

    // True once per announce interval. The first call only starts the timer, since joining
    // already announced the full snapshot.
    [[nodiscard]] bool AnnounceDue(double nowSeconds);

    void Reset();

    [[nodiscard]] float OutputLevel(float smoothedLevel) const;
    [[nodiscard]] float LastSentVoiceLevel() const { return m_lastVoiceLevel; }
    [[nodiscard]] bool LastSentMicEnabled() const { return m_lastMicEnabled; }
    [[nodiscard]] const BroadcastTuning& Tuning() const { return m_tuning; }

private:
    BroadcastTuning m_tuning;

    std::optional<double> m_lastMoveSeconds;
    std::optional<double> m_lastVoiceCheckSeconds;
    std::optional<double> m_lastAnnounceSeconds;
    float m_lastVoiceLevel = 0.0F;
    bool m_lastMicEnabled = false;
    std::optional<protocol::AvatarMessage> m_lastAvatar;
};
} // namespace presence::sim
