#include "presence/sim/LocalSimulation.hpp"

#include <algorithm>
#include <cmath>

#include <glm/common.hpp>
#include <glm/geometric.hpp>

namespace presence::sim
{
namespace
{
constexpr float kVelocitySnapEpsilon = 1e-3F;
} // namespace

glm::vec2 DirectionalInput::Axis() const
{
    glm::vec2 axis{0.0F, 0.0F};
    if (up)
    {
        axis.y -= 1.0F;
    }
    if (down)
    {
        axis.y += 1.0F;
    }
    if (left)
    {
        axis.x -= 1.0F;
    }
    if (right)
    {
        axis.x += 1.0F;
    }
    return axis;
}

DirectionalInput DirectionalInput::FromKeys(const std::unordered_set<std::string>& keys)
{
    DirectionalInput input;
    input.up = keys.count("arrowup") > 0 || keys.count("w") > 0;
    input.down = keys.count("arrowdown") > 0 || keys.count("s") > 0;
    input.left = keys.count("arrowleft") > 0 || keys.count("a") > 0;
    input.right = keys.count("arrowright") > 0 || keys.count("d") > 0;
    return input;
}

MovementTuning MovementTuning::FromConfig(const core::PresenceConfig& config)
{
    MovementTuning tuning;
    tuning.baseSpeed = config.movement.baseSpeed;
    tuning.accelerateGain = config.movement.accelerateGain;
    tuning.decelerateGain = config.movement.decelerateGain;
    tuning.arrivalDistance = config.movement.arrivalDistance;
    tuning.maxTickSeconds = config.movement.maxTickSeconds;

    const float halfFootprint = config.world.tileSize * 0.5F;
    tuning.boundsMin = glm::vec2{halfFootprint, halfFootprint};
    tuning.boundsMax = glm::vec2{config.WorldWidth() - halfFootprint, config.WorldHeight() - halfFootprint};
    return tuning;
}

LocalSimulation::LocalSimulation(const MovementTuning& tuning, glm::vec2 spawnPosition)
    : m_tuning(tuning)
    , m_position(glm::clamp(spawnPosition, tuning.boundsMin, tuning.boundsMax))
{
}

void LocalSimulation::SetDirectionalInput(const DirectionalInput& input)
{
    m_input = input;
    if (input.Any())
    {
        m_target.reset();
    }
}

void LocalSimulation::SetTarget(glm::vec2 target)
{
    m_target = glm::clamp(target, m_tuning.boundsMin, m_tuning.boundsMax);
}

void LocalSimulation::ClearTarget()
{
    m_target.reset();
}

void LocalSimulation::Teleport(glm::vec2 position)
{
    m_position = glm::clamp(position, m_tuning.boundsMin, m_tuning.boundsMax);
    m_velocity = glm::vec2{0.0F, 0.0F};
    m_target.reset();
}

glm::vec2 LocalSimulation::DesiredVelocity() const
{
    const glm::vec2 axis = m_input.Axis();
    if (axis.x != 0.0F || axis.y != 0.0F)
    {
        return glm::normalize(axis) * m_tuning.baseSpeed;
    }

    if (m_target.has_value())
    {
        const glm::vec2 delta = *m_target - m_position;
        const float distance = glm::length(delta);
        if (distance > 1.0F)
        {
            return delta / distance * m_tuning.baseSpeed;
        }
    }

    return glm::vec2{0.0F, 0.0F};
}

void LocalSimulation::Tick(double elapsedSeconds)
{
    const double dt = std::clamp(elapsedSeconds, 0.0, m_tuning.maxTickSeconds);
    m_lastStepSeconds = dt;

    const glm::vec2 desired = DesiredVelocity();
    m_velocity.x = SmoothApproach(
        m_velocity.x, desired.x, desired.x == 0.0F ? m_tuning.decelerateGain : m_tuning.accelerateGain, dt);
    m_velocity.y = SmoothApproach(
        m_velocity.y, desired.y, desired.y == 0.0F ? m_tuning.decelerateGain : m_tuning.accelerateGain, dt);

    if (desired.x == 0.0F && std::abs(m_velocity.x) < kVelocitySnapEpsilon)
    {
        m_velocity.x = 0.0F;
    }
    if (desired.y == 0.0F && std::abs(m_velocity.y) < kVelocitySnapEpsilon)
    {
        m_velocity.y = 0.0F;
    }

    m_position += m_velocity * static_cast<float>(dt);
    m_position = glm::clamp(m_position, m_tuning.boundsMin, m_tuning.boundsMax);

    if (m_target.has_value())
    {
        const glm::vec2 delta = *m_target - m_position;
        const float arrival = m_tuning.arrivalDistance;
        if (glm::dot(delta, delta) < arrival * arrival)
        {
            m_target.reset();
        }
    }

    m_facing = DirectionFromVelocity(m_velocity, m_facing);
}

scene::Direction LocalSimulation::DirectionFromVelocity(glm::vec2 velocity, scene::Direction previous)
{
    const float ax = std::abs(velocity.x);
    const float ay = std::abs(velocity.y);
    if (ax > ay)
    {
        return velocity.x >= 0.0F ? scene::Direction::Right : scene::Direction::Left;
    }
    if (ay > ax)
    {
        return velocity.y >= 0.0F ? scene::Direction::Down : scene::Direction::Up;
    }
    return previous;
}

float LocalSimulation::SmoothApproach(float current, float target, float gain, double elapsedSeconds)
{
    const float t = 1.0F - static_cast<float>(std::exp(-static_cast<double>(gain) * elapsedSeconds));
    return current + (target - current) * t;
}
} // namespace presence::sim
