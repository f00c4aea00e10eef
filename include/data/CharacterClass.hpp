/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CHARACTER_CLASS_HPP
#define CHARACTER_CLASS_HPP

#include <memory>
#include <string>
#include <vector>

struct CharacterClass {
    std::string id;
    int maxHitPoints{100};
    float moveSpeed{5.0f};
    float detectionRange{10.0f};
    bool isNpc{false};
    // Ability ids in preference order; AI picks among the off-cooldown ones
    std::vector<std::string> skills;
};

using CharacterClassPtr = std::shared_ptr<const CharacterClass>;

#endif // CHARACTER_CLASS_HPP
