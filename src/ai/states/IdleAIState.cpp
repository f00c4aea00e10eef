/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/states/IdleAIState.hpp"
#include "ai/AIBrain.hpp"
#include "core/Logger.hpp"
#include "managers/EntityDataManager.hpp"

void IdleAIState::update(AIContext& ctx) {
    const float range = ctx.self.detectionRange;
    const float rangeSq = range * range;

    for (EntityId id : ctx.entityData.getEntityIds()) {
        if (id == ctx.self.id || !ctx.brain.isValidTarget(ctx.entityData, id)) {
            continue;
        }
        const EntityRecord* other = ctx.entityData.getEntity(id);
        if (Vector2D::distanceSquared(ctx.self.position, other->position) <= rangeSq &&
            ctx.brain.addHated(ctx.entityData, id)) {
            AI_DEBUG("Entity " + std::to_string(ctx.self.id) + " spotted " + std::to_string(id));
        }
    }
}
