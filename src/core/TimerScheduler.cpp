/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/TimerScheduler.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <exception>

namespace VanguardEngine {

TimerId TimerScheduler::schedule(double delaySeconds, Callback callback) {
    if (!callback) {
        TIMER_WARN("Ignoring timer with empty callback");
        return INVALID_TIMER_ID;
    }
    TimerId id = m_nextId++;
    m_timers.push_back({id, m_clock.now() + std::max(0.0, delaySeconds), std::move(callback)});
    return id;
}

bool TimerScheduler::cancel(TimerId id) {
    auto it = std::find_if(m_timers.begin(), m_timers.end(),
                           [id](const Timer& t) { return t.id == id; });
    if (it == m_timers.end()) {
        return false;
    }
    m_timers.erase(it);
    return true;
}

size_t TimerScheduler::fireDue() {
    const double now = m_clock.now();
    // Timers scheduled by callbacks get ids >= this and wait for the next call
    const TimerId firstNewId = m_nextId;
    size_t fired = 0;

    while (true) {
        auto due = m_timers.end();
        for (auto it = m_timers.begin(); it != m_timers.end(); ++it) {
            if (it->id >= firstNewId || it->dueTime > now) {
                continue;
            }
            if (due == m_timers.end() || it->dueTime < due->dueTime ||
                (it->dueTime == due->dueTime && it->id < due->id)) {
                due = it;
            }
        }
        if (due == m_timers.end()) {
            break;
        }

        Callback callback = std::move(due->callback);
        m_timers.erase(due);
        ++fired;

        try {
            callback();
        } catch (const std::exception& e) {
            TIMER_ERROR("Timer callback threw: " + std::string(e.what()));
        }
    }
    return fired;
}

void TimerScheduler::clear() {
    m_timers.clear();
}

bool TimerScheduler::isPending(TimerId id) const {
    return std::any_of(m_timers.begin(), m_timers.end(),
                       [id](const Timer& t) { return t.id == id; });
}

} // namespace VanguardEngine
