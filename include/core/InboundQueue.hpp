/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef INBOUND_QUEUE_HPP
#define INBOUND_QUEUE_HPP

#include "core/Logger.hpp"
#include <exception>
#include <functional>
#include <mutex>
#include <vector>

namespace VanguardEngine {

/**
 * @brief The one cross-thread boundary into the simulation
 *
 * Transport and connection-method callbacks post closures from any thread;
 * the tick thread drains them first thing each tick. Work posted while a
 * drain is running waits for the next drain.
 */
class InboundQueue {
public:
    using Task = std::function<void()>;

    void post(Task task) {
        if (!task) {
            return;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pending.push_back(std::move(task));
    }

    /**
     * @return Number of tasks run
     */
    size_t drain() {
        std::vector<Task> local;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            local.swap(m_pending);
        }

        for (auto& task : local) {
            try {
                task();
            } catch (const std::exception& e) {
                ENGINE_ERROR("Inbound task threw: " + std::string(e.what()));
            }
        }
        return local.size();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_pending.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pending.clear();
    }

private:
    mutable std::mutex m_mutex;
    std::vector<Task> m_pending;
};

} // namespace VanguardEngine

#endif // INBOUND_QUEUE_HPP
