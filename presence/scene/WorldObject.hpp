#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <glm/vec2.hpp>

namespace presence::scene
{
enum class ObjectKind
{
    Lamp,
    Rug,
    Board
};

[[nodiscard]] const char* ObjectKindToText(ObjectKind kind);
[[nodiscard]] std::optional<ObjectKind> ParseObjectKind(const std::string& text);

// Wire-level partial state: plain key/value pairs, merged key-wise.
using StateValue = std::variant<bool, double, std::string>;
using StatePatch = std::map<std::string, StateValue>;

struct LampState
{
    bool on = false;

    void Merge(const StatePatch& patch);
    [[nodiscard]] StatePatch ToPatch() const;
    [[nodiscard]] bool operator==(const LampState& other) const = default;
};

struct BoardState
{
    bool highlight = false;

    void Merge(const StatePatch& patch);
    [[nodiscard]] StatePatch ToPatch() const;
    [[nodiscard]] bool operator==(const BoardState& other) const = default;
};

// Stateless fixtures (rugs) hold std::monostate.
using ObjectState = std::variant<std::monostate, LampState, BoardState>;

struct WorldObject
{
    std::string id;
    ObjectKind kind = ObjectKind::Rug;
    glm::vec2 origin{0.0F, 0.0F};
    glm::vec2 size{0.0F, 0.0F};
    bool interactive = false;
    ObjectState state;

    [[nodiscard]] bool Contains(glm::vec2 point) const;
    [[nodiscard]] glm::vec2 Center() const { return origin + size * 0.5F; }

    // Shallow key-wise overwrite; keys the kind does not know are ignored.
    void MergeState(const StatePatch& patch);
    [[nodiscard]] StatePatch StateAsPatch() const;

    // Flips the kind's interactive flag (lamp: on, board: highlight). Returns false if nothing toggled.
    bool Toggle();
};

[[nodiscard]] ObjectState DefaultStateFor(ObjectKind kind);
[[nodiscard]] std::vector<WorldObject> MakeDefaultRoomObjects(float tileSize);

// Topmost (last) object containing the point.
[[nodiscard]] const WorldObject* HitObject(const std::vector<WorldObject>& objects, glm::vec2 point);
} // namespace presence::scene
