/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ACTION_EFFECTS_HPP
#define ACTION_EFFECTS_HPP

/**
 * @file ActionEffects.hpp
 * @brief Target resolution and effect application for every ActionLogic
 *
 * One switch on ActionLogic replaces a per-ability class hierarchy:
 * - Melee / Ranged: damage the first valid target in range (explicit hint
 *   first, else the closest)
 * - AreaOfEffect: damage every valid target within radius of the owner
 * - Heal: heal the explicit ally, else the owner
 * - Buff: no instant effect; ActionManager scales incoming damage while active
 * - Revive: revive a fainted ally in range
 *
 * Invalid targets are skipped silently.
 */

#include "entities/EntityTypes.hpp"
#include <vector>

class EntityDataManager;
class HealthManager;
struct ActionInstance;
struct EntityRecord;

namespace ActionEffects {

// Players and NPCs are hostile to each other; same-kind entities are allies
bool isHostile(const EntityRecord& a, const EntityRecord& b);

/**
 * @brief Resolves the targets the effect would hit right now
 * @note Pure query; called at start (provisional) and at execution (real)
 */
std::vector<EntityId> resolveTargets(const EntityDataManager& entityData,
                                     const ActionInstance& instance);

/**
 * @brief Applies the action's effect to freshly resolved targets
 * @return Targets actually affected
 */
std::vector<EntityId> execute(EntityDataManager& entityData, HealthManager& health,
                              const ActionInstance& instance);

} // namespace ActionEffects

#endif // ACTION_EFFECTS_HPP
