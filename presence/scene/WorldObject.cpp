#include "presence/scene/WorldObject.hpp"

namespace presence::scene
{
namespace
{
std::optional<bool> FindBool(const StatePatch& patch, const char* key)
{
    const auto it = patch.find(key);
    if (it == patch.end())
    {
        return std::nullopt;
    }
    if (const auto value = std::get_if<bool>(&it->second); value != nullptr)
    {
        return *value;
    }
    return std::nullopt;
}

struct MergeVisitor
{
    const StatePatch& patch;

    void operator()(std::monostate&) const {}
    void operator()(LampState& state) const { state.Merge(patch); }
    void operator()(BoardState& state) const { state.Merge(patch); }
};

struct PatchVisitor
{
    StatePatch operator()(const std::monostate&) const { return {}; }
    StatePatch operator()(const LampState& state) const { return state.ToPatch(); }
    StatePatch operator()(const BoardState& state) const { return state.ToPatch(); }
};
} // namespace

const char* ObjectKindToText(ObjectKind kind)
{
    switch (kind)
    {
        case ObjectKind::Lamp: return "lamp";
        case ObjectKind::Board: return "board";
        case ObjectKind::Rug:
        default: return "rug";
    }
}

std::optional<ObjectKind> ParseObjectKind(const std::string& text)
{
    if (text == "lamp")
    {
        return ObjectKind::Lamp;
    }
    if (text == "rug")
    {
        return ObjectKind::Rug;
    }
    if (text == "board")
    {
        return ObjectKind::Board;
    }
    return std::nullopt;
}

void LampState::Merge(const StatePatch& patch)
{
    if (const auto value = FindBool(patch, "on"))
    {
        on = *value;
    }
}

StatePatch LampState::ToPatch() const
{
    return StatePatch{{"on", on}};
}

void BoardState::Merge(const StatePatch& patch)
{
    if (const auto value = FindBool(patch, "highlight"))
    {
        highlight = *value;
    }
}

StatePatch BoardState::ToPatch() const
{
    return StatePatch{{"highlight", highlight}};
}

bool WorldObject::Contains(glm::vec2 point) const
{
    return point.x >= origin.x && point.x <= origin.x + size.x && point.y >= origin.y && point.y <= origin.y + size.y;
}

void WorldObject::MergeState(const StatePatch& patch)
{
    std::visit(MergeVisitor{patch}, state);
}

StatePatch WorldObject::StateAsPatch() const
{
    return std::visit(PatchVisitor{}, state);
}

bool WorldObject::Toggle()
{
    if (!interactive)
    {
        return false;
    }

    if (auto* lamp = std::get_if<LampState>(&state); lamp != nullptr)
    {
        lamp->on = !lamp->on;
        return true;
    }
    if (auto* board = std::get_if<BoardState>(&state); board != nullptr)
    {
        board->highlight = !board->highlight;
        return true;
    }
    return false;
}

ObjectState DefaultStateFor(ObjectKind kind)
{
    switch (kind)
    {
        case ObjectKind::Lamp: return LampState{};
        case ObjectKind::Board: return BoardState{};
        case ObjectKind::Rug:
        default: return std::monostate{};
    }
}

std::vector<WorldObject> MakeDefaultRoomObjects(float tileSize)
{
    std::vector<WorldObject> objects;
    objects.reserve(3);

    WorldObject lamp;
    lamp.id = "lamp1";
    lamp.kind = ObjectKind::Lamp;
    lamp.origin = glm::vec2{11.0F * tileSize, 2.0F * tileSize};
    lamp.size = glm::vec2{tileSize, tileSize * 2.0F};
    lamp.interactive = true;
    lamp.state = LampState{true};
    objects.push_back(lamp);

    WorldObject rug;
    rug.id = "rug1";
    rug.kind = ObjectKind::Rug;
    rug.origin = glm::vec2{4.0F * tileSize, 6.0F * tileSize};
    rug.size = glm::vec2{tileSize * 3.0F, tileSize * 2.0F};
    rug.interactive = false;
    rug.state = std::monostate{};
    objects.push_back(rug);

    WorldObject board;
    board.id = "board1";
    board.kind = ObjectKind::Board;
    board.origin = glm::vec2{1.5F * tileSize, 1.2F * tileSize};
    board.size = glm::vec2{tileSize * 2.5F, tileSize * 0.8F};
    board.interactive = true;
    board.state = BoardState{false};
    objects.push_back(board);

    return objects;
}

const WorldObject* HitObject(const std::vector<WorldObject>& objects, glm::vec2 point)
{
    for (auto it = objects.rbegin(); it != objects.rend(); ++it)
    {
        if (it->Contains(point))
        {
            return &*it;
        }
    }
    return nullptr;
}
} // namespace presence::scene
