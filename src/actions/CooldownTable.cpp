/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "actions/CooldownTable.hpp"
#include <algorithm>

std::optional<double> CooldownTable::getLastStart(const std::string& actionId) const {
    auto it = m_lastStart.find(actionId);
    if (it == m_lastStart.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool CooldownTable::isOnCooldown(const ActionDefinition& definition, double now) const {
    return getRemaining(definition, now) > 0.0f;
}

float CooldownTable::getRemaining(const ActionDefinition& definition, double now) const {
    if (definition.reuseTimeSeconds <= 0.0f) {
        return 0.0f;
    }
    auto lastStart = getLastStart(definition.id);
    if (!lastStart) {
        return 0.0f;
    }
    double remaining = static_cast<double>(definition.reuseTimeSeconds) - (now - *lastStart);
    return static_cast<float>(std::max(0.0, remaining));
}
