/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef HEALTH_MANAGER_HPP
#define HEALTH_MANAGER_HPP

/**
 * @file HealthManager.hpp
 * @brief Authoritative hit point and life-state mutation
 *
 * Every damage and heal goes through applyDelta(). Damage first passes the
 * damage modifier (ActionManager installs one for active buffs), is then
 * clamped to [0, max], and a drop to zero moves the entity out of Alive
 * exactly once: players faint, NPCs die.
 *
 * Publishes, in order, HealthChangedEvent then LifeStateChangedEvent.
 */

#include "entities/EntityTypes.hpp"
#include <cstdint>
#include <functional>
#include <ostream>

class EntityDataManager;
class EventManager;
struct EntityRecord;

enum class HealthResult : uint8_t {
    Applied = 0,
    Unchanged,
    UnknownEntity,
    NotAlive,
    NotRevivable,
    NotAuthorized
};

inline std::ostream& operator<<(std::ostream& os, HealthResult result) {
    switch (result) {
    case HealthResult::Applied: return os << "Applied";
    case HealthResult::Unchanged: return os << "Unchanged";
    case HealthResult::UnknownEntity: return os << "UnknownEntity";
    case HealthResult::NotAlive: return os << "NotAlive";
    case HealthResult::NotRevivable: return os << "NotRevivable";
    case HealthResult::NotAuthorized: return os << "NotAuthorized";
    }
    return os << "Unknown";
}

class HealthManager {
public:
    // Receives a negative amount, returns the (still non-positive) amount to apply
    using DamageModifier = std::function<int(EntityId targetId, EntityId sourceId, int amount)>;

    HealthManager(EntityDataManager& entityData, EventManager& eventManager);

    HealthManager(const HealthManager&) = delete;
    HealthManager& operator=(const HealthManager&) = delete;

    /**
     * @brief Damage (negative) or heal (positive) an Alive entity
     * @param sourceId Entity responsible, or INVALID_ENTITY_ID
     * @return Applied, Unchanged (zero delta or already at the bound),
     * UnknownEntity, or NotAlive (the delta is ignored)
     */
    HealthResult applyDelta(EntityId entityId, EntityId sourceId, int amount);

    /**
     * @brief Brings a Fainted entity back to Alive with hitPoints (clamped to [1, max])
     * @return NotRevivable for Alive or Dead entities
     */
    HealthResult revive(EntityId entityId, EntityId sourceId, int hitPoints);

    // Drops hit points to zero, bypassing the damage modifier
    HealthResult kill(EntityId entityId, EntityId sourceId = INVALID_ENTITY_ID);

    void setDamageModifier(DamageModifier modifier) { m_damageModifier = std::move(modifier); }
    void clearDamageModifier() { m_damageModifier = nullptr; }

    int getHitPoints(EntityId entityId) const;
    int getMaxHitPoints(EntityId entityId) const;
    LifeState getLifeState(EntityId entityId) const;

private:
    EntityDataManager& m_entityData;
    EventManager& m_eventManager;
    DamageModifier m_damageModifier;

    HealthResult commitHitPoints(EntityRecord& record, EntityId sourceId, int newHitPoints);
    HealthResult commitLifeState(EntityRecord& record, LifeState newState);
};

#endif // HEALTH_MANAGER_HPP
