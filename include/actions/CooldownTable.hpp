/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COOLDOWN_TABLE_HPP
#define COOLDOWN_TABLE_HPP

#include "data/ActionDefinition.hpp"
#include <boost/container/flat_map.hpp>
#include <optional>
#include <string>

/**
 * @brief Per-entity record of when each action last started
 *
 * An action is cooling down while (now - lastStart) < reuseTime. A zero
 * reuse time never cools down. Only successful starts are recorded.
 */
class CooldownTable {
public:
    void recordStart(const std::string& actionId, double now) { m_lastStart[actionId] = now; }

    std::optional<double> getLastStart(const std::string& actionId) const;

    bool isOnCooldown(const ActionDefinition& definition, double now) const;
    float getRemaining(const ActionDefinition& definition, double now) const;

    size_t size() const { return m_lastStart.size(); }
    void clear() { m_lastStart.clear(); }

private:
    boost::container::flat_map<std::string, double> m_lastStart;
};

#endif // COOLDOWN_TABLE_HPP
