/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SIMULATION_CLOCK_HPP
#define SIMULATION_CLOCK_HPP

#include <cstdint>

namespace VanguardEngine {

/**
 * @brief Monotonic simulation time, advanced once per tick
 *
 * Cooldowns, timers and reconnection delays all read this clock instead of
 * wall time so simulations replay deterministically in tests.
 */
class SimulationClock {
public:
    double now() const { return m_seconds; }
    uint64_t getTick() const { return m_tick; }

    void advance(float deltaTime) {
        if (deltaTime > 0.0f) {
            m_seconds += static_cast<double>(deltaTime);
        }
        ++m_tick;
    }

    void reset() {
        m_seconds = 0.0;
        m_tick = 0;
    }

private:
    double m_seconds{0.0};
    uint64_t m_tick{0};
};

} // namespace VanguardEngine

#endif // SIMULATION_CLOCK_HPP
