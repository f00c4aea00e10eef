/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IDLE_AI_STATE_HPP
#define IDLE_AI_STATE_HPP

#include "ai/AIState.hpp"

/**
 * @brief Fallback state: watches for hostiles inside detection range
 *
 * Always eligible. Every valid hostile within the class detection range is
 * added to the brain's hated set.
 */
class IdleAIState : public AIState {
public:
  bool isEligible([[maybe_unused]] AIContext& ctx) override { return true; }
  void update(AIContext& ctx) override;
  std::string getName() const override { return "Idle"; }
};

#endif // IDLE_AI_STATE_HPP
