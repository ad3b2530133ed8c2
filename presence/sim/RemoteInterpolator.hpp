#pragma once

#include <cstddef>
#include <optional>
#include <unordered_map>

#include <glm/vec2.hpp>

#include "presence/core/Config.hpp"
#include "presence/scene/Reconciler.hpp"

namespace presence::sim
{
struct InterpolationTuning
{
    float remoteLerp = 12.0F;
    float referenceRate = 60.0F;
    float voiceGain = 10.0F;

    [[nodiscard]] static InterpolationTuning FromConfig(const core::PresenceConfig& config);
};

struct DisplayState
{
    glm::vec2 position{0.0F, 0.0F};
    float voiceLevel = 0.0F;
};

// Presentation-only smoothing of authoritative participant state.
class RemoteInterpolator
{
public:
    explicit RemoteInterpolator(const InterpolationTuning& tuning = InterpolationTuning{});

    // Advances every display entry toward the store state. The local entry mirrors its
    // authoritative position; entries for ids no longer in the store are dropped.
    void Tick(double elapsedSeconds, const scene::PresenceState& state, const scene::PeerId& localId);

    void Remove(const scene::PeerId& id);
    void Clear();

    [[nodiscard]] std::optional<DisplayState> Find(const scene::PeerId& id) const;
    [[nodiscard]] std::optional<glm::vec2> DisplayPosition(const scene::PeerId& id) const;
    [[nodiscard]] bool Contains(const scene::PeerId& id) const;
    [[nodiscard]] std::size_t Size() const { return m_display.size(); }
    [[nodiscard]] const std::unordered_map<scene::PeerId, DisplayState>& Entries() const { return m_display; }

    // Fraction of the remaining gap closed in elapsedSeconds: 1 - (1 - k/rate)^(elapsed*rate).
    [[nodiscard]] static float ConvergenceFactor(float k, float referenceRate, double elapsedSeconds);

private:
    InterpolationTuning m_tuning;
    std::unordered_map<scene::PeerId, DisplayState> m_display;
};
} // namespace presence::sim
