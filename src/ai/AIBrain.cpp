/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/AIBrain.hpp"
#include "actions/ActionEffects.hpp"
#include "core/Logger.hpp"
#include "managers/EntityDataManager.hpp"
#include <limits>

AIBrain::AIBrain(EntityId entityId) : m_entityId(entityId) {}

void AIBrain::addState(std::unique_ptr<AIState> state) {
    if (state) {
        m_states.push_back(std::move(state));
    }
}

void AIBrain::update(AIContext& ctx) {
    AIState* chosen = nullptr;
    for (auto& state : m_states) {
        if (state->isEligible(ctx)) {
            chosen = state.get();
            break;
        }
    }
    if (!chosen) {
        return;
    }

    if (chosen != mp_activeState) {
        if (mp_activeState) {
            mp_activeState->exit(ctx);
        }
        AI_DEBUG("Entity " + std::to_string(m_entityId) + " -> " + chosen->getName());
        mp_activeState = chosen;
        mp_activeState->enter(ctx);
    }
    mp_activeState->update(ctx);
}

bool AIBrain::isValidTarget(const EntityDataManager& entityData, EntityId targetId) const {
    const EntityRecord* self = entityData.getEntity(m_entityId);
    const EntityRecord* target = entityData.getEntity(targetId);
    if (!self || !target || targetId == m_entityId) {
        return false;
    }
    return ActionEffects::isHostile(*self, *target) && target->isAlive() && !target->stealthy;
}

bool AIBrain::addHated(const EntityDataManager& entityData, EntityId targetId) {
    if (!isValidTarget(entityData, targetId)) {
        return false;
    }
    return m_hated.insert(targetId).second;
}

void AIBrain::clearHated() {
    m_hated.clear();
    m_target = INVALID_ENTITY_ID;
}

void AIBrain::prune(const EntityDataManager& entityData) {
    for (auto it = m_hated.begin(); it != m_hated.end();) {
        if (isValidTarget(entityData, *it)) {
            ++it;
        } else {
            it = m_hated.erase(it);
        }
    }
    if (m_target != INVALID_ENTITY_ID && !isValidTarget(entityData, m_target)) {
        m_target = INVALID_ENTITY_ID;
    }
}

bool AIBrain::isInDetectionRange(const EntityDataManager& entityData, EntityId targetId) const {
    const EntityRecord* self = entityData.getEntity(m_entityId);
    const EntityRecord* target = entityData.getEntity(targetId);
    if (!self || !target) {
        return false;
    }
    const float range = self->detectionRange;
    return Vector2D::distanceSquared(self->position, target->position) <= range * range;
}

EntityId AIBrain::selectTarget(const EntityDataManager& entityData) {
    if (m_target != INVALID_ENTITY_ID && isValidTarget(entityData, m_target) &&
        isInDetectionRange(entityData, m_target)) {
        return m_target;
    }
    if (m_target != INVALID_ENTITY_ID) {
        AI_DEBUG("Entity " + std::to_string(m_entityId) + " lost target " + std::to_string(m_target));
    }
    m_target = INVALID_ENTITY_ID;

    const EntityRecord* self = entityData.getEntity(m_entityId);
    if (!self) {
        return INVALID_ENTITY_ID;
    }

    // Hated entities out of detection stay hated but cannot be chosen
    const float rangeSq = self->detectionRange * self->detectionRange;
    float bestDistSq = std::numeric_limits<float>::max();
    // flat_set iterates in ascending id order, so strict < keeps the lowest id on ties
    for (EntityId candidate : m_hated) {
        if (!isValidTarget(entityData, candidate)) {
            continue;
        }
        float distSq = Vector2D::distanceSquared(self->position,
                                                 entityData.getEntity(candidate)->position);
        if (distSq <= rangeSq && distSq < bestDistSq) {
            bestDistSq = distSq;
            m_target = candidate;
        }
    }
    return m_target;
}

std::string AIBrain::getActiveStateName() const {
    return mp_activeState ? mp_activeState->getName() : "None";
}
