/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ACTION_DEFINITION_HPP
#define ACTION_DEFINITION_HPP

#include "actions/ActionTypes.hpp"
#include <memory>
#include <string>

/**
 * @brief Immutable template for an ability
 *
 * Loaded once by GameDataCatalog and shared read-only between every
 * ActionInstance that uses it.
 */
struct ActionDefinition {
    std::string id;
    ActionLogic logic{ActionLogic::Melee};

    float durationSeconds{0.0f};
    float executeTimeSeconds{0.0f};  // Offset into the action at which the effect fires
    float reuseTimeSeconds{0.0f};    // Cooldown; 0 disables it

    float range{1.5f};
    int amount{0};                   // Damage, heal or revive hit points
    float radius{0.0f};              // AreaOfEffect only
    float damageMultiplier{1.0f};    // Buff only, applied to incoming damage

    bool friendly{false};            // Targets allies rather than enemies
    bool friendlyFire{false};        // AreaOfEffect also hits allies
    bool interruptible{true};

    std::string animTrigger;
};

using ActionDefinitionPtr = std::shared_ptr<const ActionDefinition>;

#endif // ACTION_DEFINITION_HPP
