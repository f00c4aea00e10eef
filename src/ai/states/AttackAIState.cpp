/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/states/AttackAIState.hpp"
#include "ai/AIBrain.hpp"
#include "core/Logger.hpp"
#include "data/CharacterClass.hpp"
#include "data/GameDataCatalog.hpp"
#include "managers/ActionManager.hpp"
#include "managers/EntityDataManager.hpp"

namespace {

// Friendly skills (heals, buffs) land on the caster, so they always reach
bool reaches(const ActionDefinition& def, const EntityRecord& self, const EntityRecord& target) {
    if (def.friendly || def.logic == ActionLogic::Buff) {
        return true;
    }
    const float reach = def.logic == ActionLogic::AreaOfEffect ? def.radius : def.range;
    return Vector2D::distanceSquared(self.position, target.position) <= reach * reach;
}

} // namespace

bool AttackAIState::isEligible(AIContext& ctx) {
    return ctx.brain.selectTarget(ctx.entityData) != INVALID_ENTITY_ID;
}

void AttackAIState::update(AIContext& ctx) {
    const EntityId targetId = ctx.brain.selectTarget(ctx.entityData);
    if (targetId == INVALID_ENTITY_ID) {
        return;
    }
    if (ctx.actions.getQueueLength(ctx.self.id) > 0 || !ctx.characterClass) {
        return;
    }
    const EntityRecord* target = ctx.entityData.getEntity(targetId);

    m_candidates.clear();
    bool anyReady = false;
    for (const auto& skill : ctx.characterClass->skills) {
        if (ctx.actions.isOnCooldown(ctx.self.id, skill)) {
            continue;
        }
        anyReady = true;
        ActionDefinitionPtr def = ctx.actions.getCatalog().getAction(skill);
        if (def && reaches(*def, ctx.self, *target)) {
            m_candidates.push_back(skill);
        }
    }

    if (m_candidates.empty()) {
        if (anyReady) {
            Vector2D next = Vector2D::moveTowards(ctx.self.position, target->position,
                                                  ctx.self.moveSpeed * ctx.deltaTime);
            ctx.entityData.setPosition(ctx.self.id, next);
        }
        return;
    }

    std::uniform_int_distribution<size_t> pick(0, m_candidates.size() - 1);
    const std::string& skill = m_candidates[pick(ctx.rng)];
    ActionRequestResult result = ctx.actions.requestAction(ctx.self.id, skill, {targetId});
    if (result != ActionRequestResult::Started && result != ActionRequestResult::Queued) {
        AI_DEBUG("Entity " + std::to_string(ctx.self.id) + " could not use '" + skill + "': " +
                 toString(result));
    }
}
