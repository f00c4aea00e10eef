/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ACTION_INSTANCE_HPP
#define ACTION_INSTANCE_HPP

#include "actions/ActionTypes.hpp"
#include "data/ActionDefinition.hpp"
#include "entities/EntityTypes.hpp"
#include "utils/Vector2D.hpp"
#include <vector>

/**
 * @brief One in-flight execution of an ActionDefinition by one entity
 *
 * Created on request, started when it reaches the front of the owner's
 * queue, destroyed when it ends or is cancelled.
 */
struct ActionInstance {
    ActionInstanceId instanceId{INVALID_ACTION_INSTANCE_ID};
    ActionDefinitionPtr definition;
    EntityId ownerId{INVALID_ENTITY_ID};

    float elapsedSeconds{0.0f};

    // Hints from the requester; re-validated at execution
    std::vector<EntityId> requestedTargets;
    // Resolved at start for presentation only
    std::vector<EntityId> provisionalTargets;

    Vector2D spawnPosition;
    Vector2D spawnDirection{1.0f, 0.0f};

    bool started{false};
    bool effectApplied{false};
    bool ended{false};

    bool isActive() const { return started && !ended; }
};

#endif // ACTION_INSTANCE_HPP
