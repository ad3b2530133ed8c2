#include "presence/sim/RemoteInterpolator.hpp"

#include <algorithm>
#include <cmath>

namespace presence::sim
{
InterpolationTuning InterpolationTuning::FromConfig(const core::PresenceConfig& config)
{
    InterpolationTuning tuning;
    tuning.remoteLerp = config.interpolation.remoteLerp;
    tuning.referenceRate = config.interpolation.referenceRate;
    tuning.voiceGain = config.interpolation.voiceGain;
    return tuning;
}

RemoteInterpolator::RemoteInterpolator(const InterpolationTuning& tuning)
    : m_tuning(tuning)
{
}

float RemoteInterpolator::ConvergenceFactor(float k, float referenceRate, double elapsedSeconds)
{
    if (elapsedSeconds <= 0.0 || referenceRate <= 0.0F)
    {
        return 0.0F;
    }
    const double perFrame = std::clamp(1.0 - static_cast<double>(k) / static_cast<double>(referenceRate), 0.0, 1.0);
    const double factor = 1.0 - std::pow(perFrame, elapsedSeconds * static_cast<double>(referenceRate));
    return static_cast<float>(std::clamp(factor, 0.0, 1.0));
}

void RemoteInterpolator::Tick(double elapsedSeconds, const scene::PresenceState& state, const scene::PeerId& localId)
{
    const float positionFactor = ConvergenceFactor(m_tuning.remoteLerp, m_tuning.referenceRate, elapsedSeconds);
    const float voiceFactor = elapsedSeconds > 0.0
        ? static_cast<float>(1.0 - std::exp(-static_cast<double>(m_tuning.voiceGain) * elapsedSeconds))
        : 0.0F;

    for (auto it = m_display.begin(); it != m_display.end();)
    {
        if (state.participants.find(it->first) == state.participants.end())
        {
            it = m_display.erase(it);
        }
        else
        {
            ++it;
        }
    }

    for (const auto& [id, participant] : state.participants)
    {
        auto [it, inserted] = m_display.try_emplace(id);
        DisplayState& display = it->second;

        if (inserted || id == localId)
        {
            display.position = participant.position;
            display.voiceLevel = participant.speakingLevel;
            continue;
        }

        display.position += (participant.position - display.position) * positionFactor;
        display.voiceLevel += (participant.speakingLevel - display.voiceLevel) * voiceFactor;
    }
}

void RemoteInterpolator::Remove(const scene::PeerId& id)
{
    m_display.erase(id);
}

void RemoteInterpolator::Clear()
{
    m_display.clear();
}

std::optional<DisplayState> RemoteInterpolator::Find(const scene::PeerId& id) const
{
    const auto it = m_display.find(id);
    if (it == m_display.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<glm::vec2> RemoteInterpolator::DisplayPosition(const scene::PeerId& id) const
{
    const auto it = m_display.find(id);
    if (it == m_display.end())
    {
        return std::nullopt;
    }
    return it->second.position;
}

bool RemoteInterpolator::Contains(const scene::PeerId& id) const
{
    return m_display.find(id) != m_display.end();
}
} // namespace presence::sim
