/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ACTION_MANAGER_HPP
#define ACTION_MANAGER_HPP

/**
 * @file ActionManager.hpp
 * @brief Per-entity action queues and cooldowns, shared by players and AI
 *
 * Lifecycle of an instance:
 * 1. requestAction() validates and appends it; an empty queue starts it now
 * 2. start: cooldown is charged, provisional targets resolved, Started published
 * 3. advance(): the effect fires once when elapsed crosses executeTime
 * 4. elapsed >= duration ends it and the next queued instance starts in the
 *    same tick
 *
 * Cancelling never charges a cooldown that was not already charged at start
 * and never undoes an effect that already fired.
 *
 * While an entity's active action is a Buff, its incoming damage is scaled
 * by the buff's damageMultiplier (installed as the HealthManager damage
 * modifier). Queues of entities leaving Alive are flushed.
 */

#include "actions/ActionInstance.hpp"
#include "actions/ActionQueue.hpp"
#include "actions/CooldownTable.hpp"
#include "entities/EntityTypes.hpp"
#include "managers/EventManager.hpp"
#include <boost/container/flat_map.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class EntityDataManager;
class GameDataCatalog;
class HealthManager;

namespace VanguardEngine {
class SimulationClock;
}

class ActionManager {
public:
    ActionManager(const GameDataCatalog& catalog, EntityDataManager& entityData,
                  HealthManager& health, EventManager& eventManager,
                  const VanguardEngine::SimulationClock& clock);
    ~ActionManager();

    ActionManager(const ActionManager&) = delete;
    ActionManager& operator=(const ActionManager&) = delete;

    /**
     * @brief Validates and enqueues an action for an entity
     * @return Started if it became active immediately, Queued if it waits,
     * otherwise the reason it was rejected (nothing is mutated then)
     */
    ActionRequestResult requestAction(EntityId entityId, const std::string& actionId,
                                      const std::vector<EntityId>& targetIds = {},
                                      QueueMode queueMode = QueueMode::Append);

    // Advances one entity's active action by deltaTime
    void advance(EntityId entityId, float deltaTime);

    // Advances every entity with a non-empty queue, in id order
    void update(float deltaTime);

    /**
     * @brief Cancels one instance, active or queued
     * @return false if it is unknown or already finished
     */
    bool cancelAction(EntityId entityId, ActionInstanceId instanceId);

    // Cancels the active instance and drops the queue; returns instances removed
    size_t cancelAll(EntityId entityId);

    const ActionInstance* getActiveAction(EntityId entityId) const;
    // Active plus waiting instances
    size_t getQueueLength(EntityId entityId) const;

    bool isOnCooldown(EntityId entityId, const std::string& actionId) const;
    float getCooldownRemaining(EntityId entityId, const std::string& actionId) const;
    std::optional<double> getLastStartTime(EntityId entityId, const std::string& actionId) const;

    /**
     * @brief Scales incoming (negative) damage by the target's active buff
     */
    int modifyIncomingDamage(EntityId targetId, EntityId sourceId, int amount) const;

    // Forgets queue and cooldowns of a destroyed entity
    void removeEntity(EntityId entityId);
    void clear();

    uint64_t getExecutedCount() const { return m_executedCount; }
    const GameDataCatalog& getCatalog() const { return m_catalog; }

private:
    struct EntityActionState {
        ActionQueue queue;
        CooldownTable cooldowns;
    };

    const GameDataCatalog& m_catalog;
    EntityDataManager& m_entityData;
    HealthManager& m_health;
    EventManager& m_eventManager;
    const VanguardEngine::SimulationClock& m_clock;

    // unique_ptr keeps states stable while effects publish re-entrant events
    boost::container::flat_map<EntityId, std::unique_ptr<EntityActionState>> m_states;
    ActionInstanceId m_nextInstanceId{1};
    uint64_t m_executedCount{0};
    EventManager::HandlerToken m_lifeStateToken;

    EntityActionState& getOrCreateState(EntityId entityId);
    EntityActionState* findState(EntityId entityId);
    const EntityActionState* findState(EntityId entityId) const;

    // Starts front instances until one stays active or the queue empties
    void startNext(EntityActionState& state);
    // Fires the effect and ends the front instance as its elapsed time allows
    // @return true if the front instance ended
    bool progressFront(EntityActionState& state);
    void endFront(EntityActionState& state, ActionPhase phase);

    void publishPhase(ActionPhase phase, const ActionInstance& instance);
};

#endif // ACTION_MANAGER_HPP
