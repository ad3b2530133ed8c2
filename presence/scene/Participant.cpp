#include "presence/scene/Participant.hpp"

#include <array>
#include <cstdint>
#include <cstdio>
#include <random>

namespace presence::scene
{
namespace
{
constexpr std::array<const char*, 7> kProfileColors{
    "#7c3aed",
    "#16a34a",
    "#0ea5e9",
    "#f97316",
    "#ef4444",
    "#14b8a6",
    "#6b7280",
};
} // namespace

const char* DirectionToText(Direction direction)
{
    switch (direction)
    {
        case Direction::Up: return "up";
        case Direction::Left: return "left";
        case Direction::Right: return "right";
        case Direction::Down:
        default: return "down";
    }
}

std::optional<Direction> ParseDirection(const std::string& text)
{
    if (text == "up")
    {
        return Direction::Up;
    }
    if (text == "down")
    {
        return Direction::Down;
    }
    if (text == "left")
    {
        return Direction::Left;
    }
    if (text == "right")
    {
        return Direction::Right;
    }
    return std::nullopt;
}

AvatarProfile MakeDefaultProfile(unsigned int seed)
{
    AvatarProfile profile;
    profile.name = "Guest";
    profile.color = kProfileColors[seed % kProfileColors.size()];
    profile.accessory = std::string{};
    return profile;
}

PeerId GeneratePeerId()
{
    std::random_device device;
    std::mt19937_64 rng((static_cast<std::uint64_t>(device()) << 32U) ^ device());
    const std::uint64_t high = rng();
    const std::uint64_t low = rng();

    // UUID v4 text layout.
    char buffer[40]{};
    std::snprintf(
        buffer,
        sizeof(buffer),
        "%08x-%04x-4%03x-%04x-%012llx",
        static_cast<unsigned int>(high >> 32U),
        static_cast<unsigned int>((high >> 16U) & 0xFFFFU),
        static_cast<unsigned int>(high & 0x0FFFU),
        static_cast<unsigned int>(((low >> 48U) & 0x3FFFU) | 0x8000U),
        static_cast<unsigned long long>(low & 0xFFFFFFFFFFFFULL)
    );
    return buffer;
}
} // namespace presence::scene
