/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AI_BRAIN_HPP
#define AI_BRAIN_HPP

#include "ai/AIState.hpp"
#include "entities/EntityTypes.hpp"
#include <boost/container/flat_set.hpp>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Per-NPC decision state: hated set, current target and the
 * prioritized state list
 *
 * States are evaluated in the order they were added; the last one should
 * always be eligible so a brain always has an active state.
 */
class AIBrain {
public:
    explicit AIBrain(EntityId entityId);

    AIBrain(const AIBrain&) = delete;
    AIBrain& operator=(const AIBrain&) = delete;

    // Appends a state at the lowest priority so far
    void addState(std::unique_ptr<AIState> state);

    // Runs the first eligible state
    void update(AIContext& ctx);

    EntityId getEntityId() const { return m_entityId; }

    /**
     * @brief Shared validity predicate: exists, hostile to this brain's
     * entity, Alive and not stealthy
     */
    bool isValidTarget(const EntityDataManager& entityData, EntityId targetId) const;

    bool addHated(const EntityDataManager& entityData, EntityId targetId);
    bool isHated(EntityId targetId) const { return m_hated.count(targetId) > 0; }
    std::vector<EntityId> getHated() const { return {m_hated.begin(), m_hated.end()}; }
    void clearHated();

    // Drops invalid hated entries and an invalid current target
    void prune(const EntityDataManager& entityData);

    // True when the target is within this brain's entity detection range
    bool isInDetectionRange(const EntityDataManager& entityData, EntityId targetId) const;

    /**
     * @brief Keeps a valid target that is still within detection range, else
     * picks the closest hated entity within range (ties broken by lowest id)
     * @return Selected target or INVALID_ENTITY_ID
     */
    EntityId selectTarget(const EntityDataManager& entityData);

    EntityId getTarget() const { return m_target; }
    std::string getActiveStateName() const;

private:
    EntityId m_entityId;
    boost::container::flat_set<EntityId> m_hated;
    EntityId m_target{INVALID_ENTITY_ID};
    std::vector<std::unique_ptr<AIState>> m_states;
    AIState* mp_activeState{nullptr};
};

#endif // AI_BRAIN_HPP
