/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/ActionManager.hpp"
#include "actions/ActionEffects.hpp"
#include "core/Logger.hpp"
#include "core/SimulationClock.hpp"
#include "data/GameDataCatalog.hpp"
#include "events/ActionEvents.hpp"
#include "events/EntityEvents.hpp"
#include "managers/EntityDataManager.hpp"
#include "managers/HealthManager.hpp"
#include <algorithm>
#include <cmath>

ActionManager::ActionManager(const GameDataCatalog& catalog, EntityDataManager& entityData,
                             HealthManager& health, EventManager& eventManager,
                             const VanguardEngine::SimulationClock& clock)
    : m_catalog(catalog)
    , m_entityData(entityData)
    , m_health(health)
    , m_eventManager(eventManager)
    , m_clock(clock) {
    m_lifeStateToken = m_eventManager.subscribe<LifeStateChangedEvent>(
        [this](const LifeStateChangedEvent& event) {
            if (event.getNewState() != LifeState::Alive) {
                size_t removed = cancelAll(event.getEntityId());
                if (removed > 0) {
                    ACTION_DEBUG("Flushed " + std::to_string(removed) + " action(s) of downed entity " +
                                 std::to_string(event.getEntityId()));
                }
            }
        });

    m_health.setDamageModifier([this](EntityId targetId, EntityId sourceId, int amount) {
        return modifyIncomingDamage(targetId, sourceId, amount);
    });
}

ActionManager::~ActionManager() {
    m_health.clearDamageModifier();
    if (!m_eventManager.removeHandler(m_lifeStateToken)) {
        ACTION_WARN("Life state subscription was already removed");
    }
}

ActionRequestResult ActionManager::requestAction(EntityId entityId, const std::string& actionId,
                                                 const std::vector<EntityId>& targetIds,
                                                 QueueMode queueMode) {
    ActionDefinitionPtr definition = m_catalog.getAction(actionId);
    if (!definition) {
        ACTION_WARN("Unknown action '" + actionId + "' requested by " + std::to_string(entityId));
        return ActionRequestResult::UnknownAction;
    }

    EntityRecord* owner = m_entityData.getEntity(entityId);
    if (!owner) {
        return ActionRequestResult::UnknownEntity;
    }
    if (!owner->isAlive()) {
        return ActionRequestResult::EntityNotAlive;
    }

    const EntityActionState* existing = findState(entityId);
    if (existing && existing->cooldowns.isOnCooldown(*definition, m_clock.now())) {
        ACTION_DEBUG("'" + actionId + "' on cooldown for " + std::to_string(entityId));
        return ActionRequestResult::OnCooldown;
    }

    EntityActionState& state = getOrCreateState(entityId);

    if (queueMode == QueueMode::Replace) {
        state.queue.dropQueued();
        const ActionInstance* active = state.queue.active();
        if (active && active->definition->interruptible) {
            endFront(state, ActionPhase::Cancelled);
        }
    }

    ActionInstance instance;
    instance.instanceId = m_nextInstanceId++;
    instance.definition = definition;
    instance.ownerId = entityId;
    instance.requestedTargets = targetIds;

    const bool wasEmpty = state.queue.empty();
    state.queue.push(std::move(instance));

    if (!wasEmpty) {
        return ActionRequestResult::Queued;
    }
    startNext(state);
    return ActionRequestResult::Started;
}

void ActionManager::advance(EntityId entityId, float deltaTime) {
    EntityActionState* state = findState(entityId);
    if (!state) {
        return;
    }

    ActionInstance* front = state->queue.front();
    if (!front) {
        return;
    }
    if (!front->started) {
        startNext(*state);
        return;
    }

    front->elapsedSeconds += std::max(0.0f, deltaTime);
    if (progressFront(*state)) {
        startNext(*state);
    }
}

void ActionManager::update(float deltaTime) {
    std::vector<EntityId> busy;
    busy.reserve(m_states.size());
    for (const auto& [id, state] : m_states) {
        if (!state->queue.empty()) {
            busy.push_back(id);
        }
    }
    for (EntityId id : busy) {
        advance(id, deltaTime);
    }
}

bool ActionManager::cancelAction(EntityId entityId, ActionInstanceId instanceId) {
    EntityActionState* state = findState(entityId);
    if (!state) {
        return false;
    }

    const ActionInstance* front = state->queue.front();
    if (front && front->instanceId == instanceId && front->isActive()) {
        endFront(*state, ActionPhase::Cancelled);
        startNext(*state);
        return true;
    }
    return state->queue.removeQueued(instanceId);
}

size_t ActionManager::cancelAll(EntityId entityId) {
    EntityActionState* state = findState(entityId);
    if (!state) {
        return 0;
    }

    size_t removed = state->queue.dropQueued();
    if (state->queue.active()) {
        endFront(*state, ActionPhase::Cancelled);
        ++removed;
    }
    return removed;
}

const ActionInstance* ActionManager::getActiveAction(EntityId entityId) const {
    const EntityActionState* state = findState(entityId);
    return state ? state->queue.active() : nullptr;
}

size_t ActionManager::getQueueLength(EntityId entityId) const {
    const EntityActionState* state = findState(entityId);
    return state ? state->queue.size() : 0;
}

bool ActionManager::isOnCooldown(EntityId entityId, const std::string& actionId) const {
    return getCooldownRemaining(entityId, actionId) > 0.0f;
}

float ActionManager::getCooldownRemaining(EntityId entityId, const std::string& actionId) const {
    const EntityActionState* state = findState(entityId);
    ActionDefinitionPtr definition = m_catalog.getAction(actionId);
    if (!state || !definition) {
        return 0.0f;
    }
    return state->cooldowns.getRemaining(*definition, m_clock.now());
}

std::optional<double> ActionManager::getLastStartTime(EntityId entityId,
                                                      const std::string& actionId) const {
    const EntityActionState* state = findState(entityId);
    if (!state) {
        return std::nullopt;
    }
    return state->cooldowns.getLastStart(actionId);
}

int ActionManager::modifyIncomingDamage(EntityId targetId, EntityId /*sourceId*/, int amount) const {
    if (amount >= 0) {
        return amount;
    }
    const ActionInstance* active = getActiveAction(targetId);
    if (!active || active->definition->logic != ActionLogic::Buff) {
        return amount;
    }
    long scaled = std::lround(static_cast<double>(amount) * active->definition->damageMultiplier);
    return static_cast<int>(std::min(0L, scaled));
}

void ActionManager::removeEntity(EntityId entityId) {
    m_states.erase(entityId);
}

void ActionManager::clear() {
    m_states.clear();
}

ActionManager::EntityActionState& ActionManager::getOrCreateState(EntityId entityId) {
    auto it = m_states.find(entityId);
    if (it == m_states.end()) {
        it = m_states.emplace(entityId, std::make_unique<EntityActionState>()).first;
    }
    return *it->second;
}

ActionManager::EntityActionState* ActionManager::findState(EntityId entityId) {
    auto it = m_states.find(entityId);
    return it != m_states.end() ? it->second.get() : nullptr;
}

const ActionManager::EntityActionState* ActionManager::findState(EntityId entityId) const {
    auto it = m_states.find(entityId);
    return it != m_states.end() ? it->second.get() : nullptr;
}

void ActionManager::startNext(EntityActionState& state) {
    while (ActionInstance* front = state.queue.front()) {
        if (front->started) {
            return;
        }

        const EntityRecord* owner = m_entityData.getEntity(front->ownerId);
        if (!owner || !owner->isAlive()) {
            state.queue.clear();
            return;
        }

        // Two queued copies of one action: the second may not start inside the first's cooldown
        const ActionDefinition& def = *front->definition;
        if (state.cooldowns.isOnCooldown(def, m_clock.now())) {
            ACTION_DEBUG("Dropping queued '" + def.id + "' of " + std::to_string(front->ownerId) +
                         ": still cooling down");
            state.queue.popFront();
            continue;
        }

        front->started = true;
        front->elapsedSeconds = 0.0f;
        front->spawnPosition = owner->position;
        front->spawnDirection = owner->facing;
        front->provisionalTargets = ActionEffects::resolveTargets(m_entityData, *front);
        state.cooldowns.recordStart(def.id, m_clock.now());

        const ActionInstanceId id = front->instanceId;
        publishPhase(ActionPhase::Started, *front);

        front = state.queue.front();
        if (!front || front->instanceId != id) {
            // A lifecycle handler already replaced the queue contents
            return;
        }
        if (!progressFront(state)) {
            return;
        }
    }
}

bool ActionManager::progressFront(EntityActionState& state) {
    ActionInstance* front = state.queue.front();
    if (!front || !front->isActive()) {
        return false;
    }

    const ActionInstanceId id = front->instanceId;
    ActionDefinitionPtr definition = front->definition;

    if (!front->effectApplied && front->elapsedSeconds >= definition->executeTimeSeconds) {
        front->effectApplied = true;
        // Effects publish health events; work on a copy in case handlers touch this queue
        const ActionInstance snapshot = *front;
        ActionEffects::execute(m_entityData, m_health, snapshot);
        ++m_executedCount;
        publishPhase(ActionPhase::Executed, snapshot);

        front = state.queue.front();
        if (!front || front->instanceId != id) {
            return true;
        }
    }

    if (front->elapsedSeconds >= definition->durationSeconds) {
        endFront(state, ActionPhase::Ended);
        return true;
    }
    return false;
}

void ActionManager::endFront(EntityActionState& state, ActionPhase phase) {
    ActionInstance* front = state.queue.front();
    if (!front) {
        return;
    }
    ActionInstance finished = std::move(*front);
    finished.ended = true;
    state.queue.popFront();
    publishPhase(phase, finished);
}

void ActionManager::publishPhase(ActionPhase phase, const ActionInstance& instance) {
    m_eventManager.publish(ActionLifecycleEvent(phase, instance.ownerId, instance.instanceId,
                                                instance.definition->id,
                                                instance.definition->animTrigger));
}
