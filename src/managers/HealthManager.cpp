/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/HealthManager.hpp"
#include "core/Logger.hpp"
#include "events/EntityEvents.hpp"
#include "managers/EntityDataManager.hpp"
#include "managers/EventManager.hpp"
#include <algorithm>

HealthManager::HealthManager(EntityDataManager& entityData, EventManager& eventManager)
    : m_entityData(entityData), m_eventManager(eventManager) {}

HealthResult HealthManager::applyDelta(EntityId entityId, EntityId sourceId, int amount) {
    EntityRecord* record = m_entityData.getEntity(entityId);
    if (!record) {
        HEALTH_DEBUG("applyDelta on unknown entity " + std::to_string(entityId));
        return HealthResult::UnknownEntity;
    }
    if (!record->isAlive()) {
        return HealthResult::NotAlive;
    }

    if (amount < 0 && m_damageModifier) {
        amount = std::min(0, m_damageModifier(entityId, sourceId, amount));
    }
    if (amount == 0) {
        return HealthResult::Unchanged;
    }

    const int64_t current = record->hitPoints.get();
    const int64_t maxHp = record->maxHitPoints.get();
    const int newHitPoints = static_cast<int>(std::clamp<int64_t>(current + amount, 0, maxHp));

    HealthResult result = commitHitPoints(*record, sourceId, newHitPoints);
    if (result != HealthResult::Applied || newHitPoints > 0) {
        return result;
    }

    LifeState downState = record->kind == EntityKind::Player ? LifeState::Fainted : LifeState::Dead;
    HEALTH_INFO(record->displayName + " (" + std::to_string(entityId) + ") is " + toString(downState));
    return commitLifeState(*record, downState);
}

HealthResult HealthManager::revive(EntityId entityId, EntityId sourceId, int hitPoints) {
    EntityRecord* record = m_entityData.getEntity(entityId);
    if (!record) {
        return HealthResult::UnknownEntity;
    }
    if (record->lifeState.get() != LifeState::Fainted) {
        return HealthResult::NotRevivable;
    }

    const int restored = std::clamp(hitPoints, 1, record->maxHitPoints.get());
    HealthResult result = commitHitPoints(*record, sourceId, restored);
    if (result != HealthResult::Applied) {
        return result;
    }
    HEALTH_INFO(record->displayName + " (" + std::to_string(entityId) + ") revived with " +
                std::to_string(restored) + " HP");
    return commitLifeState(*record, LifeState::Alive);
}

HealthResult HealthManager::kill(EntityId entityId, EntityId sourceId) {
    EntityRecord* record = m_entityData.getEntity(entityId);
    if (!record) {
        return HealthResult::UnknownEntity;
    }
    if (!record->isAlive()) {
        return HealthResult::NotAlive;
    }

    HealthResult result = commitHitPoints(*record, sourceId, 0);
    if (result != HealthResult::Applied) {
        return result;
    }
    LifeState downState = record->kind == EntityKind::Player ? LifeState::Fainted : LifeState::Dead;
    return commitLifeState(*record, downState);
}

int HealthManager::getHitPoints(EntityId entityId) const {
    const EntityRecord* record = m_entityData.getEntity(entityId);
    return record ? record->hitPoints.get() : 0;
}

int HealthManager::getMaxHitPoints(EntityId entityId) const {
    const EntityRecord* record = m_entityData.getEntity(entityId);
    return record ? record->maxHitPoints.get() : 0;
}

LifeState HealthManager::getLifeState(EntityId entityId) const {
    const EntityRecord* record = m_entityData.getEntity(entityId);
    return record ? record->lifeState.get() : LifeState::Dead;
}

HealthResult HealthManager::commitHitPoints(EntityRecord& record, EntityId sourceId,
                                            int newHitPoints) {
    const int oldHitPoints = record.hitPoints.get();
    switch (record.hitPoints.setValue(newHitPoints)) {
    case SyncResult::Unchanged:
        return HealthResult::Unchanged;
    case SyncResult::NotAuthorized:
        return HealthResult::NotAuthorized;
    case SyncResult::Changed:
        break;
    }

    HEALTH_DEBUG("Entity " + std::to_string(record.id) + " HP " + std::to_string(oldHitPoints) +
                 " -> " + std::to_string(newHitPoints) + " (source " + std::to_string(sourceId) + ")");
    m_eventManager.publish(HealthChangedEvent(record.id, sourceId, oldHitPoints, newHitPoints));
    return HealthResult::Applied;
}

HealthResult HealthManager::commitLifeState(EntityRecord& record, LifeState newState) {
    const LifeState oldState = record.lifeState.get();
    switch (record.lifeState.setValue(newState)) {
    case SyncResult::Unchanged:
        return HealthResult::Applied;
    case SyncResult::NotAuthorized:
        return HealthResult::NotAuthorized;
    case SyncResult::Changed:
        break;
    }

    m_eventManager.publish(LifeStateChangedEvent(record.id, oldState, newState));
    return HealthResult::Applied;
}
