/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AI_STATE_HPP
#define AI_STATE_HPP

#include <random>
#include <string>

class AIBrain;
class ActionManager;
class EntityDataManager;
struct CharacterClass;
struct EntityRecord;

/**
 * @brief Everything a state needs for one tick, resolved once by AIManager
 */
struct AIContext {
    AIBrain& brain;
    EntityRecord& self;
    EntityDataManager& entityData;
    ActionManager& actions;
    const CharacterClass* characterClass; // nullptr: no skills
    std::mt19937& rng;
    float deltaTime;

    AIContext(AIBrain& b, EntityRecord& s, EntityDataManager& e, ActionManager& a,
              const CharacterClass* c, std::mt19937& r, float dt)
        : brain(b), self(s), entityData(e), actions(a), characterClass(c), rng(r), deltaTime(dt) {}
};

class AIState {
public:
  virtual ~AIState() = default;

  // First eligible state in priority order runs this tick
  virtual bool isEligible(AIContext& ctx) = 0;
  virtual void update(AIContext& ctx) = 0;

  virtual void enter([[maybe_unused]] AIContext& ctx) {}
  virtual void exit([[maybe_unused]] AIContext& ctx) {}

  virtual std::string getName() const = 0;
};

#endif // AI_STATE_HPP
