#pragma once

#include <optional>
#include <string>

#include <glm/vec2.hpp>

namespace presence::scene
{
using PeerId = std::string;

enum class Direction
{
    Up,
    Down,
    Left,
    Right
};

[[nodiscard]] const char* DirectionToText(Direction direction);
[[nodiscard]] std::optional<Direction> ParseDirection(const std::string& text);

struct AvatarProfile
{
    std::string name = "Guest";
    std::string color = "#7c3aed";
    std::optional<std::string> accessory;
    std::optional<std::string> caption;

    [[nodiscard]] bool operator==(const AvatarProfile& other) const = default;
};

struct Participant
{
    PeerId id;
    AvatarProfile profile;
    glm::vec2 position{0.0F, 0.0F};
    Direction direction = Direction::Down;
    bool camEnabled = false;
    bool micEnabled = false;
    float speakingLevel = 0.0F;
    double lastSeenSeconds = 0.0;
};

[[nodiscard]] AvatarProfile MakeDefaultProfile(unsigned int seed);
[[nodiscard]] PeerId GeneratePeerId();
} // namespace presence::scene
