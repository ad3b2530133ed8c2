#pragma once

#include <optional>
#include <string>
#include <unordered_set>

#include <glm/vec2.hpp>

#include "presence/core/Config.hpp"
#include "presence/scene/Participant.hpp"

namespace presence::sim
{
struct DirectionalInput
{
    bool up = false;
    bool down = false;
    bool left = false;
    bool right = false;

    [[nodiscard]] bool Any() const { return up || down || left || right; }
    [[nodiscard]] glm::vec2 Axis() const;

    // Lower-case key names: "w"/"arrowup", "s"/"arrowdown", "a"/"arrowleft", "d"/"arrowright".
    [[nodiscard]] static DirectionalInput FromKeys(const std::unordered_set<std::string>& keys);
};

struct MovementTuning
{
    float baseSpeed = 180.0F;
    float accelerateGain = 8.0F;
    float decelerateGain = 10.0F;
    float arrivalDistance = 3.0F;
    double maxTickSeconds = 0.05;
    glm::vec2 boundsMin{32.0F, 32.0F};
    glm::vec2 boundsMax{992.0F, 608.0F};

    [[nodiscard]] static MovementTuning FromConfig(const core::PresenceConfig& config);
};

// Authoritative movement of the local participant. Ticked by the render clock.
class LocalSimulation
{
public:
    explicit LocalSimulation(const MovementTuning& tuning, glm::vec2 spawnPosition);

    // Directional input takes precedence; any active direction clears the pending target.
    void SetDirectionalInput(const DirectionalInput& input);
    void SetTarget(glm::vec2 target);
    void ClearTarget();

    void Tick(double elapsedSeconds);

    [[nodiscard]] glm::vec2 Position() const { return m_position; }
    [[nodiscard]] glm::vec2 Velocity() const { return m_velocity; }
    [[nodiscard]] scene::Direction Facing() const { return m_facing; }
    [[nodiscard]] const std::optional<glm::vec2>& Target() const { return m_target; }
    [[nodiscard]] const DirectionalInput& Input() const { return m_input; }
    [[nodiscard]] double LastStepSeconds() const { return m_lastStepSeconds; }
    [[nodiscard]] const MovementTuning& Tuning() const { return m_tuning; }

    void Teleport(glm::vec2 position);

    [[nodiscard]] glm::vec2 DesiredVelocity() const;

    // Larger-magnitude axis wins; ties and zero velocity keep the previous facing.
    [[nodiscard]] static scene::Direction DirectionFromVelocity(glm::vec2 velocity, scene::Direction previous);
    [[nodiscard]] static float SmoothApproach(float current, float target, float gain, double elapsedSeconds);

private:
    MovementTuning m_tuning;
    glm::vec2 m_position;
    glm::vec2 m_velocity{0.0F, 0.0F};
    scene::Direction m_facing = scene::Direction::Down;
    DirectionalInput m_input;
    std::optional<glm::vec2> m_target;
    double m_lastStepSeconds = 0.0;
};
} // namespace presence::sim
