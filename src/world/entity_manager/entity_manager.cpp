/// @file entity_manager.cpp
/// @brief EntityManager implementation.

#include "ger/world/entity_manager.hpp"

#include "ger/foundation/error_code.hpp"
#include "ger/foundation/game_logger.hpp"

#include <set>
#include <sstream>
#include <utility>

namespace ger::world {

using foundation::ErrorCode;
using foundation::GameSerializer;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

EntityManager::EntityManager(ManagerId id, IPlayerRegistry* playerRegistry)
    : id_(id), playerRegistry_(playerRegistry) {}

// ── Entity lifecycle ─────────────────────────────────────────────────

GameResult<EntityId> EntityManager::addEntity(std::unique_ptr<Entity>&& entity) {
    if (!entity) {
        return GameResult<EntityId>::err(
            GameError(ErrorCode::InvalidArgument, "cannot add a null entity"));
    }
    if (entity->isRegistered()) {
        return GameResult<EntityId>::err(
            GameError(ErrorCode::AlreadyRegistered,
                      "entity is already registered as id " +
                          std::to_string(entity->id()->value()),
                      *entity->id()));
    }

    std::lock_guard<std::mutex> lock(mutex_);

    const EntityId newId(nextId_);

    // The player registry is consulted before anything is committed so a
    // failure leaves entities_ and nextId_ untouched.
    if (entity->type() == EntityType::Player) {
        if (playerRegistry_ == nullptr) {
            return GameResult<EntityId>::err(
                GameError(ErrorCode::PlayerRegistryUnavailable,
                          "player entity added to a manager without a player registry"));
        }
        auto registered = playerRegistry_->registerPlayer(id_, newId);
        if (!registered) {
            return GameResult<EntityId>::err(std::move(registered).error());
        }
    }

    entity->stamp(id_, newId);
    const auto type = entity->type();
    entities_.emplace(newId, std::move(entity));
    ++nextId_;

    LogContext ctx;
    ctx.managerId = id_;
    ctx.entityId = newId;
    ctx.extra["type"] = std::string(entityTypeName(type));
    GER_LOG_CTX(LogLevel::Debug, LogCategory::Registry, "Entity added", ctx);

    return GameResult<EntityId>::ok(newId);
}

GameResult<const Entity*> EntityManager::getEntity(EntityId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* entity = findLocked(id);
    if (entity == nullptr) {
        return GameResult<const Entity*>::err(notFound(id));
    }
    return GameResult<const Entity*>::ok(entity);
}

GameResult<void> EntityManager::deleteEntity(EntityId id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entities_.find(id);
    if (it == entities_.end()) {
        return GameResult<void>::err(notFound(id));
    }
    entities_.erase(it);

    LogContext ctx;
    ctx.managerId = id_;
    ctx.entityId = id;
    GER_LOG_CTX(LogLevel::Debug, LogCategory::Registry, "Entity deleted", ctx);

    return GameResult<void>::ok();
}

bool EntityManager::contains(EntityId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entities_.count(id) > 0;
}

std::size_t EntityManager::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entities_.size();
}

uint64_t EntityManager::nextId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nextId_;
}

// ── State access ─────────────────────────────────────────────────────

GameResult<Vector3> EntityManager::getEntityPosition(EntityId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* entity = findLocked(id);
    if (entity == nullptr) {
        return GameResult<Vector3>::err(notFound(id));
    }
    return GameResult<Vector3>::ok(entity->position());
}

GameResult<void> EntityManager::setEntityPosition(EntityId id, const Vector3& position) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entity = findLocked(id);
    if (entity == nullptr) {
        return GameResult<void>::err(notFound(id));
    }
    entity->setPosition(position);
    return GameResult<void>::ok();
}

GameResult<void> EntityManager::updateAttribute(EntityId id, std::string key,
                                                AttributeValue value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entity = findLocked(id);
    if (entity == nullptr) {
        return GameResult<void>::err(notFound(id));
    }
    entity->updateAttribute(std::move(key), std::move(value));
    return GameResult<void>::ok();
}

GameResult<AttributeMap> EntityManager::getEntityAttributes(EntityId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* entity = findLocked(id);
    if (entity == nullptr) {
        return GameResult<AttributeMap>::err(notFound(id));
    }
    return GameResult<AttributeMap>::ok(entity->getAllAttributes());
}

std::map<EntityId, AttributeMap> EntityManager::getAllEntities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<EntityId, AttributeMap> snapshot;
    for (const auto& [id, entity] : entities_) {
        snapshot.emplace(id, entity->getAllAttributes());
    }
    return snapshot;
}

// ── Events ───────────────────────────────────────────────────────────

GameResult<void> EntityManager::event(EntityId id, std::string_view eventKind,
                                      const AttributeValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entity = findLocked(id);
    if (entity == nullptr) {
        return GameResult<void>::err(notFound(id));
    }
    entity->event(eventKind, value);
    return GameResult<void>::ok();
}

GameResult<void> EntityManager::userEvent(EntityId id, std::string_view eventKind,
                                          const AttributeValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entity = findLocked(id);
    if (entity == nullptr) {
        return GameResult<void>::err(notFound(id));
    }
    if (entity->type() != EntityType::Player) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument,
                      "user events are only delivered to player entities", id));
    }
    entity->userEvent(eventKind, value);
    return GameResult<void>::ok();
}

std::size_t EntityManager::broadcast(std::string_view eventKind, const AttributeValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, entity] : entities_) {
        entity->event(eventKind, value);
    }

    LogContext ctx;
    ctx.managerId = id_;
    ctx.extra["event"] = std::string(eventKind);
    ctx.extra["recipients"] = std::to_string(entities_.size());
    GER_LOG_CTX(LogLevel::Trace, LogCategory::Registry, "Event broadcast", ctx);

    return entities_.size();
}

GameResult<void> EntityManager::attack(EntityId attackerId, EntityId targetId) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto* attacker = findLocked(attackerId);
    if (attacker == nullptr) {
        return GameResult<void>::err(notFound(attackerId));
    }
    auto* target = findLocked(targetId);
    if (target == nullptr) {
        return GameResult<void>::err(notFound(targetId));
    }

    const auto* attackerState = attacker->monsterState();
    if (attackerState == nullptr) {
        return GameResult<void>::err(
            GameError(ErrorCode::KindMismatch, "attacker is not a monster", attackerId));
    }
    if (target->monsterState() == nullptr) {
        return GameResult<void>::err(
            GameError(ErrorCode::KindMismatch, "target is not a monster", targetId));
    }
    if (attackerState->defeated) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "defeated monster cannot attack",
                      attackerId));
    }

    const int32_t damage = attackerState->damage;
    target->event(events::kDamage, AttributeValue{static_cast<int64_t>(damage)});

    LogContext ctx;
    ctx.managerId = id_;
    ctx.entityId = attackerId;
    ctx.extra["target"] = std::to_string(targetId.value());
    ctx.extra["damage"] = std::to_string(damage);
    GER_LOG_CTX(LogLevel::Debug, LogCategory::Entity, "Monster attacked", ctx);

    return GameResult<void>::ok();
}

// ── Serialization ────────────────────────────────────────────────────

std::vector<uint8_t> EntityManager::serialize() const {
    std::lock_guard<std::mutex> lock(mutex_);

    ManagerState state;
    state.id = id_.value();
    state.nextId = nextId_;
    state.entities.reserve(entities_.size());
    for (const auto& [id, entity] : entities_) {
        state.entities.push_back(entity->state());
    }
    return GameSerializer::instance().serializeBinary(state);
}

GameResult<std::unique_ptr<EntityManager>> EntityManager::deserialize(
    std::span<const uint8_t> data, IPlayerRegistry* playerRegistry) {
    using ManagerResult = GameResult<std::unique_ptr<EntityManager>>;

    auto decoded = GameSerializer::instance().deserializeBinary<ManagerState>(data);
    if (!decoded) {
        return ManagerResult::err(std::move(decoded).error());
    }
    auto state = std::move(decoded).value();

    auto manager = std::make_unique<EntityManager>(ManagerId(state.id), playerRegistry);
    manager->nextId_ = state.nextId;

    for (auto& entityState : state.entities) {
        auto valid = Entity::validate(entityState);
        if (!valid) {
            return ManagerResult::err(std::move(valid).error());
        }
        if (!entityState.id || *entityState.managerId != state.id) {
            return ManagerResult::err(
                GameError(ErrorCode::InvalidRegistryState,
                          "entity is not stamped with this manager's id"));
        }
        const EntityId entityId(*entityState.id);
        if (entityId.value() >= state.nextId) {
            return ManagerResult::err(
                GameError(ErrorCode::InvalidRegistryState,
                          "entity id was never issued by this manager", entityId));
        }
        auto entity = std::unique_ptr<Entity>(new Entity(std::move(entityState)));
        if (!manager->entities_.emplace(entityId, std::move(entity)).second) {
            return ManagerResult::err(
                GameError(ErrorCode::InvalidRegistryState, "duplicate entity id", entityId));
        }
    }

    LogContext ctx;
    ctx.managerId = manager->id_;
    ctx.extra["entities"] = std::to_string(manager->entities_.size());
    ctx.extra["next_id"] = std::to_string(manager->nextId_);
    GER_LOG_CTX(LogLevel::Info, LogCategory::Serialization, "Entity manager restored", ctx);

    return ManagerResult::ok(std::move(manager));
}

std::string EntityManager::debug() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ostringstream out;
    out << "EntityManager " << id_.value() << " (next id " << nextId_ << ", "
        << entities_.size() << " entities)\n";
    for (const auto& [id, entity] : entities_) {
        out << " - ID " << id.value() << ": " << entity->debug() << '\n';
    }
    return out.str();
}

// ── Private ──────────────────────────────────────────────────────────

GameError EntityManager::notFound(EntityId id) const {
    return GameError(ErrorCode::EntityNotFound,
                     "entity " + std::to_string(id.value()) + " does not exist in manager " +
                         std::to_string(id_.value()),
                     id);
}

Entity* EntityManager::findLocked(EntityId id) {
    auto it = entities_.find(id);
    return it == entities_.end() ? nullptr : it->second.get();
}

const Entity* EntityManager::findLocked(EntityId id) const {
    auto it = entities_.find(id);
    return it == entities_.end() ? nullptr : it->second.get();
}

}  // namespace ger::world
