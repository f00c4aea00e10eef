/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/AIManager.hpp"
#include "ai/states/AttackAIState.hpp"
#include "ai/states/IdleAIState.hpp"
#include "core/Logger.hpp"
#include "data/GameDataCatalog.hpp"
#include "events/EntityEvents.hpp"
#include "managers/ActionManager.hpp"
#include "managers/EntityDataManager.hpp"
#include <vector>

AIManager::AIManager(EntityDataManager& entityData, ActionManager& actions,
                     const GameDataCatalog& catalog, EventManager& eventManager, uint32_t seed)
    : m_entityData(entityData)
    , m_actions(actions)
    , m_catalog(catalog)
    , m_eventManager(eventManager)
    , m_rng(seed) {
    m_healthToken = m_eventManager.subscribe<HealthChangedEvent>([this](const HealthChangedEvent& event) {
        onHealthChanged(event.getEntityId(), event.getSourceId(), event.isDamage());
    });
    AI_INFO("AIManager initialized (seed " + std::to_string(seed) + ")");
}

AIManager::~AIManager() {
    if (!m_eventManager.removeHandler(m_healthToken)) {
        AI_WARN("Health subscription was already removed");
    }
}

std::unique_ptr<AIBrain> AIManager::createDefaultBrain(EntityId entityId) {
    auto brain = std::make_unique<AIBrain>(entityId);
    brain->addState(std::make_unique<AttackAIState>());
    brain->addState(std::make_unique<IdleAIState>());
    return brain;
}

bool AIManager::registerEntity(EntityId entityId) {
    const EntityRecord* record = m_entityData.getEntity(entityId);
    if (!record) {
        AI_ERROR("Cannot register unknown entity " + std::to_string(entityId));
        return false;
    }
    if (record->kind != EntityKind::NPC) {
        AI_WARN("Entity " + std::to_string(entityId) + " is not an NPC");
        return false;
    }
    if (hasBrain(entityId)) {
        return false;
    }
    m_brains.emplace(entityId, createDefaultBrain(entityId));
    AI_DEBUG("Registered NPC " + std::to_string(entityId) + " (" + record->classId + ")");
    return true;
}

bool AIManager::assignBrain(std::unique_ptr<AIBrain> brain) {
    if (!brain || !m_entityData.exists(brain->getEntityId())) {
        AI_ERROR("assignBrain: missing brain or unknown entity");
        return false;
    }
    EntityId id = brain->getEntityId();
    m_brains[id] = std::move(brain);
    return true;
}

bool AIManager::unregisterEntity(EntityId entityId) {
    return m_brains.erase(entityId) > 0;
}

AIBrain* AIManager::getBrain(EntityId entityId) {
    auto it = m_brains.find(entityId);
    return it != m_brains.end() ? it->second.get() : nullptr;
}

const AIBrain* AIManager::getBrain(EntityId entityId) const {
    auto it = m_brains.find(entityId);
    return it != m_brains.end() ? it->second.get() : nullptr;
}

void AIManager::resetBehaviors() {
    m_brains.clear();
}

void AIManager::update(float deltaTime) {
    if (m_globallyPaused) {
        return;
    }

    // Brains may request actions whose events re-enter this manager; iterate a snapshot
    std::vector<EntityId> ids;
    ids.reserve(m_brains.size());
    for (const auto& [id, _] : m_brains) {
        ids.push_back(id);
    }

    for (EntityId id : ids) {
        AIBrain* brain = getBrain(id);
        EntityRecord* self = m_entityData.getEntity(id);
        if (!brain || !self || !self->isAlive()) {
            continue;
        }

        brain->prune(m_entityData);

        CharacterClassPtr characterClass = m_catalog.getClass(self->classId);
        AIContext ctx(*brain, *self, m_entityData, m_actions, characterClass.get(), m_rng, deltaTime);
        brain->update(ctx);
    }
}

void AIManager::onHealthChanged(EntityId victimId, EntityId sourceId, bool isDamage) {
    if (!isDamage || sourceId == INVALID_ENTITY_ID) {
        return;
    }
    AIBrain* brain = getBrain(victimId);
    if (brain && brain->addHated(m_entityData, sourceId)) {
        AI_DEBUG("Entity " + std::to_string(victimId) + " now hates " + std::to_string(sourceId));
    }
}
