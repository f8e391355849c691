#pragma once

/// @file entity_manager.hpp
/// @brief Owning registry that allocates entity ids, stores entities, and
///        routes events to them.

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "ger/foundation/game_result.hpp"
#include "ger/foundation/game_serializer.hpp"
#include "ger/foundation/types.hpp"
#include "ger/world/attribute_value.hpp"
#include "ger/world/entity.hpp"
#include "ger/world/math_types.hpp"
#include "ger/world/player_registry.hpp"

namespace ger::world {

/// Persisted state of a manager, in wire order.
struct ManagerState {
    uint32_t id = 0;
    uint64_t nextId = 0;
    std::vector<EntityState> entities;
};

/// Sole owner of the entities of one world / room.
///
/// Ids come from a counter that starts at 0 and only grows: an id is
/// handed out once and never reused, even after its entity is deleted.
/// Every operation on an unknown id fails with EntityNotFound and leaves
/// the manager untouched.
///
/// All operations lock a single per-manager mutex, so one manager may be
/// shared between worker threads.  Individual field updates are not
/// grouped into transactions.
///
/// Per-entity state machine: Unregistered -> Registered -> Deleted.
class EntityManager {
public:
    /// @param id             Identifier of this manager.
    /// @param playerRegistry Notified when Player entities are added; not
    ///                       owned and must outlive the manager.  Without a
    ///                       registry, adding a Player fails.
    explicit EntityManager(ManagerId id, IPlayerRegistry* playerRegistry = nullptr);

    EntityManager(const EntityManager&) = delete;
    EntityManager& operator=(const EntityManager&) = delete;
    EntityManager(EntityManager&&) = delete;
    EntityManager& operator=(EntityManager&&) = delete;

    [[nodiscard]] ManagerId id() const noexcept { return id_; }

    // ── Entity lifecycle ─────────────────────────────────────────────

    /// Take ownership of @p entity and assign it the next id.
    ///
    /// For Player-typed entities the player registry is called with
    /// (manager id, new id) first; if that fails nothing is stored and the
    /// id counter does not advance.
    ///
    /// @p entity is only moved from on success.  On failure it still owns
    /// the entity, so the caller may retry with it.
    ///
    /// @return The new id, or InvalidArgument (null entity),
    ///         AlreadyRegistered (entity already carries an id),
    ///         PlayerRegistryUnavailable, or the registry's error.
    GameResult<EntityId> addEntity(std::unique_ptr<Entity>&& entity);

    /// Read-only view of a registered entity.  The pointer stays valid
    /// until the entity is deleted or the manager is destroyed.
    [[nodiscard]] GameResult<const Entity*> getEntity(EntityId id) const;

    /// Remove and destroy an entity.  The player registry is not notified.
    GameResult<void> deleteEntity(EntityId id);

    [[nodiscard]] bool contains(EntityId id) const;

    /// Number of registered entities.
    [[nodiscard]] std::size_t count() const;

    /// Next id to be handed out; equals the number of entities ever added.
    [[nodiscard]] uint64_t nextId() const;

    // ── State access ─────────────────────────────────────────────────

    [[nodiscard]] GameResult<Vector3> getEntityPosition(EntityId id) const;
    GameResult<void> setEntityPosition(EntityId id, const Vector3& position);

    GameResult<void> updateAttribute(EntityId id, std::string key, AttributeValue value);
    [[nodiscard]] GameResult<AttributeMap> getEntityAttributes(EntityId id) const;

    /// Snapshot of every entity's attribute bag, keyed by id.
    [[nodiscard]] std::map<EntityId, AttributeMap> getAllEntities() const;

    // ── Events ───────────────────────────────────────────────────────

    GameResult<void> event(EntityId id, std::string_view eventKind,
                           const AttributeValue& value);

    /// Deliver an input event.  Fails with InvalidArgument for entities
    /// that are not Player-typed.
    GameResult<void> userEvent(EntityId id, std::string_view eventKind,
                               const AttributeValue& value);

    /// Deliver event() to every registered entity once.  Callers must not
    /// rely on the delivery order.
    ///
    /// @return Number of entities the event was delivered to.
    std::size_t broadcast(std::string_view eventKind, const AttributeValue& value);

    /// Monster @p attackerId deals its damage to monster @p targetId.
    ///
    /// @return EntityNotFound, KindMismatch if either side is not a
    ///         monster, or InvalidArgument if the attacker is defeated.
    GameResult<void> attack(EntityId attackerId, EntityId targetId);

    // ── Serialization ────────────────────────────────────────────────

    /// Encode id, id counter, and every entity.
    [[nodiscard]] std::vector<uint8_t> serialize() const;

    /// Rebuild a manager from serialize() output.
    ///
    /// The restored entities are not re-announced to @p playerRegistry.
    /// Fails with a Serialization-subsystem error when the bytes are
    /// malformed or break the manager invariants.
    [[nodiscard]] static GameResult<std::unique_ptr<EntityManager>> deserialize(
        std::span<const uint8_t> data, IPlayerRegistry* playerRegistry = nullptr);

    /// One line per entity with its id and debug dump.
    [[nodiscard]] std::string debug() const;

private:
    using EntityMap = std::map<EntityId, std::unique_ptr<Entity>>;

    [[nodiscard]] GameError notFound(EntityId id) const;

    /// Lookup helpers; the caller must hold mutex_.
    Entity* findLocked(EntityId id);
    const Entity* findLocked(EntityId id) const;

    ManagerId id_;
    IPlayerRegistry* playerRegistry_ = nullptr;

    mutable std::mutex mutex_;
    EntityMap entities_;
    uint64_t nextId_ = 0;
};

}  // namespace ger::world

GER_SERIALIZABLE(ger::world::ManagerState, 1,
    field("id", &ger::world::ManagerState::id),
    field("nextId", &ger::world::ManagerState::nextId),
    field("entities", &ger::world::ManagerState::entities)
);
