/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ATTACK_AI_STATE_HPP
#define ATTACK_AI_STATE_HPP

#include "ai/AIState.hpp"
#include <string>
#include <vector>

/**
 * @brief Fights the brain's current target
 *
 * Eligible while a valid target exists or one can be picked from the hated
 * set. Each tick without an action in progress it picks a random
 * off-cooldown skill that reaches the target and submits it; if none
 * reaches, it steps toward the target at the class move speed.
 */
class AttackAIState : public AIState {
public:
  bool isEligible(AIContext& ctx) override;
  void update(AIContext& ctx) override;
  std::string getName() const override { return "Attack"; }

private:
  std::vector<std::string> m_candidates;
};

#endif // ATTACK_AI_STATE_HPP
