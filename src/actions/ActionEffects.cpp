/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "actions/ActionEffects.hpp"
#include "actions/ActionInstance.hpp"
#include "core/Logger.hpp"
#include "managers/EntityDataManager.hpp"
#include "managers/HealthManager.hpp"
#include <limits>

namespace {

bool inRange(const EntityRecord& owner, const EntityRecord& target, float range) {
    return Vector2D::distanceSquared(owner.position, target.position) <= range * range;
}

// Ally or enemy per the definition's friendly flag; the owner is never its own enemy
bool matchesSide(const EntityRecord& owner, const EntityRecord& target, bool friendly) {
    if (friendly) {
        return !ActionEffects::isHostile(owner, target);
    }
    return target.id != owner.id && ActionEffects::isHostile(owner, target);
}

bool isValidSingleTarget(const EntityRecord& owner, const EntityRecord& target,
                         const ActionDefinition& def, LifeState requiredState) {
    return target.lifeState.get() == requiredState && matchesSide(owner, target, def.friendly) &&
           inRange(owner, target, def.range);
}

// Explicit hints win in request order; otherwise the closest, ties by lowest id
EntityId pickSingleTarget(const EntityDataManager& entityData, const EntityRecord& owner,
                          const ActionInstance& instance, LifeState requiredState) {
    const ActionDefinition& def = *instance.definition;

    for (EntityId hint : instance.requestedTargets) {
        const EntityRecord* target = entityData.getEntity(hint);
        if (target && isValidSingleTarget(owner, *target, def, requiredState)) {
            return hint;
        }
    }

    EntityId best = INVALID_ENTITY_ID;
    float bestDistSq = std::numeric_limits<float>::max();
    for (EntityId id : entityData.getEntityIds()) {
        const EntityRecord* target = entityData.getEntity(id);
        if (id == owner.id || target->stealthy ||
            !isValidSingleTarget(owner, *target, def, requiredState)) {
            continue;
        }
        float distSq = Vector2D::distanceSquared(owner.position, target->position);
        // Ids ascend, so strict < keeps the lowest id on ties
        if (distSq < bestDistSq) {
            bestDistSq = distSq;
            best = id;
        }
    }
    return best;
}

} // namespace

namespace ActionEffects {

bool isHostile(const EntityRecord& a, const EntityRecord& b) {
    return a.kind != b.kind;
}

std::vector<EntityId> resolveTargets(const EntityDataManager& entityData,
                                     const ActionInstance& instance) {
    std::vector<EntityId> targets;
    const EntityRecord* owner = entityData.getEntity(instance.ownerId);
    if (!owner || !instance.definition) {
        return targets;
    }
    const ActionDefinition& def = *instance.definition;

    switch (def.logic) {
    case ActionLogic::Melee:
    case ActionLogic::Ranged: {
        EntityId target = pickSingleTarget(entityData, *owner, instance, LifeState::Alive);
        if (target != INVALID_ENTITY_ID) {
            targets.push_back(target);
        }
        break;
    }
    case ActionLogic::AreaOfEffect:
        for (EntityId id : entityData.getEntityIds()) {
            const EntityRecord* target = entityData.getEntity(id);
            if (id == owner->id || !target->isAlive()) {
                continue;
            }
            if (!isHostile(*owner, *target) && !def.friendlyFire) {
                continue;
            }
            if (inRange(*owner, *target, def.radius)) {
                targets.push_back(id);
            }
        }
        break;
    case ActionLogic::Heal: {
        EntityId target = INVALID_ENTITY_ID;
        for (EntityId hint : instance.requestedTargets) {
            const EntityRecord* candidate = entityData.getEntity(hint);
            if (candidate && isValidSingleTarget(*owner, *candidate, def, LifeState::Alive)) {
                target = hint;
                break;
            }
        }
        if (target == INVALID_ENTITY_ID && def.friendly && owner->isAlive()) {
            target = owner->id;
        }
        if (target != INVALID_ENTITY_ID) {
            targets.push_back(target);
        }
        break;
    }
    case ActionLogic::Buff:
        targets.push_back(owner->id);
        break;
    case ActionLogic::Revive: {
        EntityId target = pickSingleTarget(entityData, *owner, instance, LifeState::Fainted);
        if (target != INVALID_ENTITY_ID) {
            targets.push_back(target);
        }
        break;
    }
    }
    return targets;
}

std::vector<EntityId> execute(EntityDataManager& entityData, HealthManager& health,
                              const ActionInstance& instance) {
    std::vector<EntityId> affected;
    if (!instance.definition) {
        return affected;
    }
    const ActionDefinition& def = *instance.definition;

    for (EntityId target : resolveTargets(entityData, instance)) {
        HealthResult result = HealthResult::Unchanged;
        switch (def.logic) {
        case ActionLogic::Melee:
        case ActionLogic::Ranged:
        case ActionLogic::AreaOfEffect:
            result = health.applyDelta(target, instance.ownerId, -def.amount);
            break;
        case ActionLogic::Heal:
            result = health.applyDelta(target, instance.ownerId, def.amount);
            break;
        case ActionLogic::Buff:
            result = HealthResult::Applied;
            break;
        case ActionLogic::Revive:
            result = health.revive(target, instance.ownerId, def.amount);
            break;
        }
        if (result == HealthResult::Applied) {
            affected.push_back(target);
        }
    }

    ACTION_DEBUG("'" + def.id + "' by " + std::to_string(instance.ownerId) + " affected " +
                 std::to_string(affected.size()) + " target(s)");
    return affected;
}

} // namespace ActionEffects
