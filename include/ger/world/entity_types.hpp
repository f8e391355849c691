#pragma once

/// @file entity_types.hpp
/// @brief Entity enumerations and the event protocol.

#include <cstdint>
#include <optional>
#include <string_view>

namespace ger::world {

/// Classification fixed at construction.  Drives registry side effects
/// (player registration, user-event routing), not behaviour.
enum class EntityType : uint8_t {
    Npc    = 0,
    Player = 1
};

/// Directional input actions.  The numeric values are the payload of an
/// `action` user event on the wire.
enum class EntityAction : uint8_t {
    None  = 0,
    West  = 1,
    North = 2,
    East  = 3,
    South = 4
};

constexpr std::string_view entityTypeName(EntityType type) {
    switch (type) {
        case EntityType::Npc:    return "NPC";
        case EntityType::Player: return "PLAYER";
    }
    return "UNKNOWN";
}

/// Decode a wire action code; nullopt for codes outside the enumeration.
constexpr std::optional<EntityAction> entityActionFromCode(int64_t code) {
    if (code < 0 || code > static_cast<int64_t>(EntityAction::South)) {
        return std::nullopt;
    }
    return static_cast<EntityAction>(code);
}

/// Event names understood by the built-in entity kinds.  Other names are
/// accepted and ignored.
namespace events {

inline constexpr std::string_view kTick = "tick";
inline constexpr std::string_view kDamage = "damage";  ///< numeric amount
inline constexpr std::string_view kHeal = "heal";      ///< numeric amount

/// User event carrying an EntityAction code.
inline constexpr std::string_view kAction = "action";

}  // namespace events

}  // namespace ger::world
