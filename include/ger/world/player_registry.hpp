#pragma once

/// @file player_registry.hpp
/// @brief Interface to the external service that tracks player entities.

#include "ger/foundation/game_result.hpp"
#include "ger/foundation/types.hpp"

namespace ger::world {

/// Collaborator notified when a Player-typed entity joins a manager.
///
/// EntityManager calls registerPlayer() exactly once per Player it adds,
/// synchronously and under its own lock, before the entity becomes
/// visible.  A failed call aborts the add.  Implementations must not call
/// back into the same manager.
///
/// There is no matching deregistration: deleting a player entity does not
/// notify the registry, so implementations must tolerate entries for
/// entities that no longer exist.
class IPlayerRegistry {
public:
    virtual ~IPlayerRegistry() = default;

    virtual foundation::GameResult<void> registerPlayer(foundation::ManagerId managerId,
                                                        foundation::EntityId entityId) = 0;
};

}  // namespace ger::world
