#pragma once

/// @file entity_kind.hpp
/// @brief Behavioural variants of an entity and their payloads.
///
/// Kinds are a closed variant rather than a class hierarchy: each
/// alternative carries its own state and Entity dispatches events to it
/// with std::visit.

#include <algorithm>
#include <cstdint>
#include <string_view>
#include <variant>

#include "ger/foundation/game_serializer.hpp"
#include "ger/world/entity_types.hpp"

namespace ger::world {

/// Plain entity with no event behaviour.
struct GenericKind {};

/// Combat-capable entity.  `damage` events lower health; reaching zero
/// marks the monster defeated, which is terminal.
struct MonsterKind {
    int32_t health = 100;
    int32_t maxHealth = 100;
    int32_t damage = 10;
    bool defeated = false;

    /// Set health, clamping to [0, maxHealth].
    void SetHealth(int32_t value) noexcept {
        health = std::clamp(value, static_cast<int32_t>(0),
                            std::max(maxHealth, static_cast<int32_t>(0)));
    }
};

/// Human-controlled entity.  Tracks the last directional input.
struct PlayerKind {
    EntityAction currentAction = EntityAction::None;
};

using EntityKind = std::variant<GenericKind, MonsterKind, PlayerKind>;

constexpr std::string_view kindName(const EntityKind& kind) {
    switch (kind.index()) {
        case 0: return "Generic";
        case 1: return "Monster";
        case 2: return "Player";
    }
    return "Unknown";
}

}  // namespace ger::world

GER_SERIALIZABLE(ger::world::GenericKind, 1);

GER_SERIALIZABLE(ger::world::MonsterKind, 1,
    field("health", &ger::world::MonsterKind::health),
    field("maxHealth", &ger::world::MonsterKind::maxHealth),
    field("damage", &ger::world::MonsterKind::damage),
    field("defeated", &ger::world::MonsterKind::defeated)
);

GER_SERIALIZABLE(ger::world::PlayerKind, 1,
    field("currentAction", &ger::world::PlayerKind::currentAction)
);
