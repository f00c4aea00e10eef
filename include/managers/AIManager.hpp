/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AI_MANAGER_HPP
#define AI_MANAGER_HPP

/**
 * @file AIManager.hpp
 * @brief Drives every registered NPC through its AIBrain once per tick
 *
 * Each tick, for every living managed NPC in id order:
 * 1. invalid hated entries and targets are pruned
 * 2. the first eligible state (Attack, then Idle) runs
 *
 * Damage from a valid hostile puts the source in the victim's hated set.
 * Skill choice uses one mt19937 seeded from settings, so runs with the same
 * seed and inputs make the same choices.
 */

#include "ai/AIBrain.hpp"
#include "entities/EntityTypes.hpp"
#include "managers/EventManager.hpp"
#include <boost/container/flat_map.hpp>
#include <cstdint>
#include <memory>
#include <random>

class ActionManager;
class EntityDataManager;
class GameDataCatalog;

class AIManager {
public:
    AIManager(EntityDataManager& entityData, ActionManager& actions,
              const GameDataCatalog& catalog, EventManager& eventManager,
              uint32_t seed = 1337);
    ~AIManager();

    AIManager(const AIManager&) = delete;
    AIManager& operator=(const AIManager&) = delete;

    void update(float deltaTime);

    /**
     * @brief Gives an NPC the default brain (Attack, then Idle)
     * @return false for unknown entities, players, or already managed NPCs
     */
    bool registerEntity(EntityId entityId);

    /**
     * @brief Installs a custom brain; replaces any existing one
     * @return false if the entity is unknown
     */
    bool assignBrain(std::unique_ptr<AIBrain> brain);

    bool unregisterEntity(EntityId entityId);
    bool hasBrain(EntityId entityId) const { return m_brains.count(entityId) > 0; }

    AIBrain* getBrain(EntityId entityId);
    const AIBrain* getBrain(EntityId entityId) const;

    size_t getManagedEntityCount() const { return m_brains.size(); }

    void setGlobalPause(bool paused) { m_globallyPaused = paused; }
    bool isGloballyPaused() const { return m_globallyPaused; }

    void setSeed(uint32_t seed) { m_rng.seed(seed); }

    // Drops every brain
    void resetBehaviors();

    static std::unique_ptr<AIBrain> createDefaultBrain(EntityId entityId);

private:
    EntityDataManager& m_entityData;
    ActionManager& m_actions;
    const GameDataCatalog& m_catalog;
    EventManager& m_eventManager;

    boost::container::flat_map<EntityId, std::unique_ptr<AIBrain>> m_brains;
    std::mt19937 m_rng;
    bool m_globallyPaused{false};
    EventManager::HandlerToken m_healthToken;

    void onHealthChanged(EntityId victimId, EntityId sourceId, bool isDamage);
};

#endif // AI_MANAGER_HPP
