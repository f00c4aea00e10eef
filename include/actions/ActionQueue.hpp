/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ACTION_QUEUE_HPP
#define ACTION_QUEUE_HPP

#include "actions/ActionInstance.hpp"
#include <algorithm>
#include <deque>

/**
 * @brief Per-entity FIFO of action instances
 *
 * Only the front instance may be started, so at most one instance per
 * entity is ever active.
 */
class ActionQueue {
public:
    void push(ActionInstance instance) { m_instances.push_back(std::move(instance)); }

    bool empty() const { return m_instances.empty(); }
    size_t size() const { return m_instances.size(); }

    ActionInstance* front() { return m_instances.empty() ? nullptr : &m_instances.front(); }
    const ActionInstance* front() const { return m_instances.empty() ? nullptr : &m_instances.front(); }

    // Front instance if it has started
    const ActionInstance* active() const {
        const ActionInstance* head = front();
        return head && head->isActive() ? head : nullptr;
    }

    void popFront() {
        if (!m_instances.empty()) {
            m_instances.pop_front();
        }
    }

    bool contains(ActionInstanceId id) const {
        return std::any_of(m_instances.begin(), m_instances.end(),
                           [id](const ActionInstance& a) { return a.instanceId == id; });
    }

    // Removes a not-yet-started instance; the front is never removed here
    bool removeQueued(ActionInstanceId id) {
        auto it = std::find_if(m_instances.begin(), m_instances.end(),
                               [id](const ActionInstance& a) { return a.instanceId == id; });
        if (it == m_instances.end() || it->started) {
            return false;
        }
        m_instances.erase(it);
        return true;
    }

    // Drops everything behind the front; returns the number dropped
    size_t dropQueued() {
        if (m_instances.size() <= 1) {
            return 0;
        }
        size_t dropped = m_instances.size() - 1;
        if (!m_instances.front().started) {
            ++dropped;
            m_instances.clear();
            return dropped;
        }
        m_instances.erase(m_instances.begin() + 1, m_instances.end());
        return dropped;
    }

    void clear() { m_instances.clear(); }

private:
    std::deque<ActionInstance> m_instances;
};

#endif // ACTION_QUEUE_HPP
