#include "presence/sim/BroadcastScheduler.hpp"

#include <algorithm>
#include <cmath>

namespace presence::sim
{
BroadcastTuning BroadcastTuning::FromConfig(const core::PresenceConfig& config)
{
    BroadcastTuning tuning;
    tuning.positionIntervalSeconds = config.broadcast.positionIntervalSeconds;
    tuning.voiceIntervalSeconds = config.broadcast.voiceIntervalSeconds;
    tuning.voiceHysteresis = config.broadcast.voiceHysteresis;
    tuning.voiceOutputGain = config.broadcast.voiceOutputGain;
    tuning.announceIntervalSeconds = config.broadcast.announceIntervalSeconds;
    return tuning;
}

float VoiceMeter::Feed(float rawLevel, bool micEnabled)
{
    if (!micEnabled || !std::isfinite(rawLevel))
    {
        m_level = 0.0F;
        return m_level;
    }
    m_level += (std::clamp(rawLevel, 0.0F, 1.0F) - m_level) * kSmoothing;
    return m_level;
}

BroadcastScheduler::BroadcastScheduler(const BroadcastTuning& tuning)
    : m_tuning(tuning)
{
}

float BroadcastScheduler::OutputLevel(float smoothedLevel) const
{
    return std::clamp(smoothedLevel * m_tuning.voiceOutputGain, 0.0F, 1.0F);
}

std::vector<protocol::Message> BroadcastScheduler::Update(double nowSeconds, const LocalBroadcastState& local)
{
    std::vector<protocol::Message> outbound;

    if (!m_lastMoveSeconds.has_value() || nowSeconds - *m_lastMoveSeconds >= m_tuning.positionIntervalSeconds)
    {
        m_lastMoveSeconds = nowSeconds;
        outbound.emplace_back(protocol::MoveMessage{local.id, local.position.x, local.position.y, local.direction});
    }

    if (!m_lastVoiceCheckSeconds.has_value() || nowSeconds - *m_lastVoiceCheckSeconds >= m_tuning.voiceIntervalSeconds)
    {
        m_lastVoiceCheckSeconds = nowSeconds;
        const float level = local.micEnabled ? OutputLevel(local.voiceLevel) : 0.0F;
        if (std::abs(level - m_lastVoiceLevel) > m_tuning.voiceHysteresis || local.micEnabled != m_lastMicEnabled)
        {
            m_lastVoiceLevel = level;
            m_lastMicEnabled = local.micEnabled;
            outbound.emplace_back(protocol::VoiceMessage{local.id, level, local.micEnabled});
        }
    }

    return outbound;
}

std::optional<protocol::Message> BroadcastScheduler::OnAvatarChanged(const protocol::AvatarMessage& avatar)
{
    if (m_lastAvatar.has_value() && m_lastAvatar->id == avatar.id && m_lastAvatar->profile == avatar.profile &&
        m_lastAvatar->camEnabled == avatar.camEnabled && m_lastAvatar->micEnabled == avatar.micEnabled)
    {
        return std::nullopt;
    }
    m_lastAvatar = avatar;
    return protocol::Message{avatar};
}

protocol::Message BroadcastScheduler::OnMicrophoneToggled(const scene::PeerId& id, bool micEnabled)
{
    m_lastVoiceLevel = 0.0F;
    m_lastMicEnabled = micEnabled;
    return protocol::VoiceMessage{id, 0.0F, micEnabled};
}

bool BroadcastScheduler::AnnounceDue(double nowSeconds)
{
    if (!m_lastAnnounceSeconds.has_value())
    {
        m_lastAnnounceSeconds = nowSeconds;
        return false;
    }
    if (nowSeconds - *m_lastAnnounceSeconds < m_tuning.announceIntervalSeconds)
    {
        return false;
    }
    m_lastAnnounceSeconds = nowSeconds;
    return true;
}

void BroadcastScheduler::Reset()
{
    m_lastMoveSeconds.reset();
    m_lastVoiceCheckSeconds.reset();
    m_lastAnnounceSeconds.reset();
    m_lastVoiceLevel = 0.0F;
    m_lastMicEnabled = false;
    m_lastAvatar.reset();
}
} // namespace presence::sim
