#pragma once

/// @file entity.hpp
/// @brief A single game object: identity, spatial state, level, attribute
///        bag, and behavioural kind.

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ger/foundation/game_result.hpp"
#include "ger/foundation/game_serializer.hpp"
#include "ger/foundation/types.hpp"
#include "ger/world/attribute_value.hpp"
#include "ger/world/entity_kind.hpp"
#include "ger/world/entity_types.hpp"
#include "ger/world/math_types.hpp"

namespace ger::world {

using foundation::EntityId;
using foundation::GameError;
using foundation::GameResult;
using foundation::ManagerId;

/// Complete persisted state of an entity, in wire order.
///
/// `id` and `managerId` are either both set (registered) or both empty.
struct EntityState {
    std::optional<uint64_t> id;
    std::optional<uint32_t> managerId;
    EntityType type = EntityType::Npc;
    Vector3 position;
    Vector2 orientation{1.0f, 0.0f};
    int32_t level = 1;
    AttributeMap attributes;
    EntityKind kind;
};

class EntityManager;

/// Game object held by an EntityManager.
///
/// An entity is built standalone, then handed to EntityManager::addEntity,
/// which stamps its id and manager id exactly once.  After that every
/// outside access goes through the manager.
///
/// Example:
/// @code
///   auto orc = std::make_unique<Entity>(Entity::monster(50, 7));
///   orc->setPosition({3.0f, 0.0f, 4.0f});
///   orc->updateAttribute("faction", std::string("horde"));
///   auto id = manager.addEntity(std::move(orc));
/// @endcode
class Entity {
public:
    explicit Entity(EntityType type = EntityType::Npc, EntityKind kind = GenericKind{});

    /// Npc with a Monster payload at full health.  @p maxHealth below 1 is
    /// raised to 1.
    [[nodiscard]] static Entity monster(int32_t maxHealth, int32_t damage);

    /// Player-typed entity with a Player payload.
    [[nodiscard]] static Entity player();

    // ── Identity ─────────────────────────────────────────────────────

    /// Id assigned by the owning manager; nullopt until registered.
    [[nodiscard]] std::optional<EntityId> id() const noexcept;

    /// Owning manager; nullopt until registered.
    [[nodiscard]] std::optional<ManagerId> managerId() const noexcept;

    [[nodiscard]] bool isRegistered() const noexcept { return state_.id.has_value(); }

    [[nodiscard]] EntityType type() const noexcept { return state_.type; }

    [[nodiscard]] const EntityKind& kind() const noexcept { return state_.kind; }

    /// Monster payload, or nullptr for other kinds.
    [[nodiscard]] const MonsterKind* monsterState() const noexcept {
        return std::get_if<MonsterKind>(&state_.kind);
    }

    /// Player payload, or nullptr for other kinds.
    [[nodiscard]] const PlayerKind* playerState() const noexcept {
        return std::get_if<PlayerKind>(&state_.kind);
    }

    // ── Spatial state ────────────────────────────────────────────────

    [[nodiscard]] const Vector3& position() const noexcept { return state_.position; }
    void setPosition(const Vector3& position) noexcept { state_.position = position; }

    /// Position projected onto the ground (XZ) plane.
    [[nodiscard]] Vector2 positionXZ() const noexcept {
        return {state_.position.x, state_.position.z};
    }

    [[nodiscard]] const Vector2& orientation() const noexcept { return state_.orientation; }
    void setOrientation(const Vector2& orientation) noexcept { state_.orientation = orientation; }

    void turnLeft(float degrees);
    void turnRight(float degrees);

    // ── Level ────────────────────────────────────────────────────────

    [[nodiscard]] int32_t level() const noexcept { return state_.level; }

    /// @return InvalidArgument when @p level < 1.
    GameResult<void> setLevel(int32_t level);

    // ── Attributes ───────────────────────────────────────────────────

    /// Insert or overwrite the attribute at @p key.
    void updateAttribute(std::string key, AttributeValue value);

    /// @return The value, or NotFound.
    [[nodiscard]] GameResult<AttributeValue> getAttribute(std::string_view key) const;

    [[nodiscard]] bool hasAttribute(std::string_view key) const;

    /// @return true if an attribute was removed.
    bool removeAttribute(std::string_view key);

    /// Snapshot copy of the whole bag; later changes to the entity are not
    /// reflected in it and edits to it do not reach the entity.
    [[nodiscard]] AttributeMap getAllAttributes() const { return state_.attributes; }

    // ── Events ───────────────────────────────────────────────────────

    /// World / lifecycle event (damage, heal, tick, ...).
    void event(std::string_view eventKind, const AttributeValue& value);

    /// Input-originated event.  The manager only routes these to
    /// Player-typed entities.
    void userEvent(std::string_view eventKind, const AttributeValue& value);

    // ── Serialization ────────────────────────────────────────────────

    [[nodiscard]] std::vector<uint8_t> serialize() const;

    /// Rebuild an entity from serialize() output.
    ///
    /// Fails with a Serialization-subsystem error for malformed bytes,
    /// unknown schema, or inconsistent state (half-stamped identity,
    /// level below 1).
    [[nodiscard]] static GameResult<Entity> deserialize(std::span<const uint8_t> data);

    /// Human-readable dump of every field.  Not a stable format.
    [[nodiscard]] std::string debug() const;

    [[nodiscard]] const EntityState& state() const noexcept { return state_; }

private:
    friend class EntityManager;

    explicit Entity(EntityState state) : state_(std::move(state)) {}

    /// Validate a decoded state before it becomes an Entity.
    static GameResult<void> validate(const EntityState& state);

    /// Called by the manager exactly once at registration.
    void stamp(ManagerId managerId, EntityId id) noexcept;

    EntityState state_;
};

}  // namespace ger::world

GER_SERIALIZABLE(ger::world::EntityState, 1,
    field("id", &ger::world::EntityState::id),
    field("managerId", &ger::world::EntityState::managerId),
    field("type", &ger::world::EntityState::type),
    field("position", &ger::world::EntityState::position),
    field("orientation", &ger::world::EntityState::orientation),
    field("level", &ger::world::EntityState::level),
    field("attributes", &ger::world::EntityState::attributes),
    field("kind", &ger::world::EntityState::kind)
);
