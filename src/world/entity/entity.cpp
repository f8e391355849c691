/// @file entity.cpp
/// @brief Entity state, attribute bag, and kind-based event dispatch.

#include "ger/world/entity.hpp"

#include "ger/foundation/game_logger.hpp"

#include <algorithm>
#include <cstdint>
#include <numbers>
#include <string>
#include <utility>

namespace ger::world {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameSerializer;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

constexpr float kDegToRad = std::numbers::pi_v<float> / 180.0f;

/// Event amounts beyond the int32 health range all have the same effect.
int32_t saturateAmount(int64_t amount) {
    return static_cast<int32_t>(std::min<int64_t>(amount, INT32_MAX));
}

/// Applies a world event to whichever kind the entity holds.
struct WorldEventVisitor {
    const EntityState& owner;
    std::string_view eventKind;
    const AttributeValue& value;

    void operator()(GenericKind&) const {}

    void operator()(MonsterKind& monster) const {
        if (monster.defeated) {
            return;
        }
        auto amount = integerValue(value);
        if (!amount || *amount <= 0) {
            return;
        }

        // health and step both lie in [0, INT32_MAX], so the int64 sum
        // and difference cannot overflow.
        const int64_t step = saturateAmount(*amount);
        if (eventKind == events::kDamage) {
            monster.SetHealth(static_cast<int32_t>(
                std::max<int64_t>(static_cast<int64_t>(monster.health) - step, 0)));
            if (monster.health <= 0) {
                monster.defeated = true;
                LogContext ctx;
                if (owner.id) {
                    ctx.entityId = EntityId(*owner.id);
                }
                if (owner.managerId) {
                    ctx.managerId = ManagerId(*owner.managerId);
                }
                ctx.extra["damage"] = std::to_string(*amount);
                GER_LOG_CTX(LogLevel::Info, LogCategory::Entity, "Monster defeated", ctx);
            }
        } else if (eventKind == events::kHeal) {
            monster.SetHealth(static_cast<int32_t>(
                std::min<int64_t>(static_cast<int64_t>(monster.health) + step, INT32_MAX)));
        }
    }

    void operator()(PlayerKind&) const {}
};

/// Applies an input event.  Only the Player kind reacts.
struct UserEventVisitor {
    std::string_view eventKind;
    const AttributeValue& value;

    void operator()(GenericKind&) const {}
    void operator()(MonsterKind&) const {}

    void operator()(PlayerKind& player) const {
        if (eventKind != events::kAction) {
            return;
        }
        const auto* code = std::get_if<int64_t>(&value);
        if (code == nullptr) {
            return;
        }
        if (auto action = entityActionFromCode(*code)) {
            player.currentAction = *action;
        }
    }
};

}  // namespace

// ── Construction ─────────────────────────────────────────────────────

Entity::Entity(EntityType type, EntityKind kind) {
    state_.type = type;
    state_.kind = std::move(kind);
}

Entity Entity::monster(int32_t maxHealth, int32_t damage) {
    MonsterKind payload;
    payload.maxHealth = std::max(maxHealth, static_cast<int32_t>(1));
    payload.health = payload.maxHealth;
    payload.damage = damage;
    return Entity(EntityType::Npc, payload);
}

Entity Entity::player() {
    return Entity(EntityType::Player, PlayerKind{});
}

// ── Identity ─────────────────────────────────────────────────────────

std::optional<EntityId> Entity::id() const noexcept {
    if (!state_.id) {
        return std::nullopt;
    }
    return EntityId(*state_.id);
}

std::optional<ManagerId> Entity::managerId() const noexcept {
    if (!state_.managerId) {
        return std::nullopt;
    }
    return ManagerId(*state_.managerId);
}

void Entity::stamp(ManagerId managerId, EntityId id) noexcept {
    state_.id = id.value();
    state_.managerId = managerId.value();
}

// ── Spatial state ────────────────────────────────────────────────────

// Left is a negative rotation in the XZ plane.
void Entity::turnLeft(float degrees) {
    state_.orientation = state_.orientation.Rotated(-degrees * kDegToRad);
}

void Entity::turnRight(float degrees) {
    state_.orientation = state_.orientation.Rotated(degrees * kDegToRad);
}

GameResult<void> Entity::setLevel(int32_t level) {
    if (level < 1) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument,
                      "level must be >= 1, got " + std::to_string(level)));
    }
    state_.level = level;
    return GameResult<void>::ok();
}

// ── Attributes ───────────────────────────────────────────────────────

void Entity::updateAttribute(std::string key, AttributeValue value) {
    state_.attributes.insert_or_assign(std::move(key), std::move(value));
}

GameResult<AttributeValue> Entity::getAttribute(std::string_view key) const {
    auto it = state_.attributes.find(std::string(key));
    if (it == state_.attributes.end()) {
        return GameResult<AttributeValue>::err(
            GameError(ErrorCode::NotFound,
                      "attribute not found: " + std::string(key)));
    }
    return GameResult<AttributeValue>::ok(it->second);
}

bool Entity::hasAttribute(std::string_view key) const {
    return state_.attributes.count(std::string(key)) > 0;
}

bool Entity::removeAttribute(std::string_view key) {
    return state_.attributes.erase(std::string(key)) > 0;
}

// ── Events ───────────────────────────────────────────────────────────

void Entity::event(std::string_view eventKind, const AttributeValue& value) {
    std::visit(WorldEventVisitor{state_, eventKind, value}, state_.kind);
}

void Entity::userEvent(std::string_view eventKind, const AttributeValue& value) {
    std::visit(UserEventVisitor{eventKind, value}, state_.kind);
}

// ── Serialization ────────────────────────────────────────────────────

std::vector<uint8_t> Entity::serialize() const {
    return GameSerializer::instance().serializeBinary(state_);
}

GameResult<Entity> Entity::deserialize(std::span<const uint8_t> data) {
    auto decoded = GameSerializer::instance().deserializeBinary<EntityState>(data);
    if (!decoded) {
        return GameResult<Entity>::err(std::move(decoded).error());
    }
    auto valid = validate(decoded.value());
    if (!valid) {
        return GameResult<Entity>::err(std::move(valid).error());
    }
    return GameResult<Entity>::ok(Entity(std::move(decoded).value()));
}

GameResult<void> Entity::validate(const EntityState& state) {
    if (state.id.has_value() != state.managerId.has_value()) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidRegistryState,
                      "entity id and manager id must be set together"));
    }
    if (state.type != EntityType::Npc && state.type != EntityType::Player) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidRegistryState, "unknown entity type"));
    }
    if (state.level < 1) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidRegistryState, "entity level below 1"));
    }
    if (const auto* monster = std::get_if<MonsterKind>(&state.kind)) {
        if (monster->maxHealth < 1 || monster->health < 0 ||
            monster->health > monster->maxHealth) {
            return GameResult<void>::err(
                GameError(ErrorCode::InvalidRegistryState, "monster health out of range"));
        }
        if (monster->defeated != (monster->health == 0)) {
            return GameResult<void>::err(
                GameError(ErrorCode::InvalidRegistryState,
                          "monster defeat flag disagrees with its health"));
        }
    }
    if (const auto* player = std::get_if<PlayerKind>(&state.kind)) {
        if (!entityActionFromCode(static_cast<int64_t>(player->currentAction))) {
            return GameResult<void>::err(
                GameError(ErrorCode::InvalidRegistryState, "unknown player action"));
        }
    }
    return GameResult<void>::ok();
}

std::string Entity::debug() const {
    std::string out(kindName(state_.kind));
    out += ' ';
    out += entityTypeName(state_.type);
    out += ' ';
    out += GameSerializer::instance().serializeJson(state_);
    return out;
}

}  // namespace ger::world
