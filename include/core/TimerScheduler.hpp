/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TIMER_SCHEDULER_HPP
#define TIMER_SCHEDULER_HPP

#include "core/SimulationClock.hpp"
#include <cstdint>
#include <functional>
#include <vector>

namespace VanguardEngine {

using TimerId = uint64_t;
constexpr TimerId INVALID_TIMER_ID = 0;

/**
 * @brief One-shot delayed callbacks on simulation time
 *
 * Timers fire from fireDue() on the tick thread, ordered by due time and
 * then by scheduling order. A callback may schedule or cancel timers; timers
 * it schedules are never fired in the same fireDue() call.
 */
class TimerScheduler {
public:
    using Callback = std::function<void()>;

    explicit TimerScheduler(const SimulationClock& clock) : m_clock(clock) {}

    TimerScheduler(const TimerScheduler&) = delete;
    TimerScheduler& operator=(const TimerScheduler&) = delete;

    /**
     * @param delaySeconds Seconds from now; negative delays are treated as 0
     * @return Id usable with cancel()
     */
    TimerId schedule(double delaySeconds, Callback callback);

    /**
     * @return true if the timer was pending and is now cancelled
     */
    bool cancel(TimerId id);

    /**
     * Run every timer whose due time is <= now
     * @return Number of callbacks run
     */
    size_t fireDue();

    void clear();

    bool isPending(TimerId id) const;
    size_t getPendingCount() const { return m_timers.size(); }

private:
    struct Timer {
        TimerId id;
        double dueTime;
        Callback callback;
    };

    const SimulationClock& m_clock;
    std::vector<Timer> m_timers;
    TimerId m_nextId{1};
};

} // namespace VanguardEngine

#endif // TIMER_SCHEDULER_HPP
