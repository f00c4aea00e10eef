/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TIMESTEP_MANAGER_HPP
#define TIMESTEP_MANAGER_HPP

#include <chrono>
#include <cstdint>

/**
 * TimestepManager paces the authoritative simulation at a fixed tick rate.
 *
 * Wall-clock time is accumulated each frame and drained in whole ticks, so
 * the simulation always advances by the same delta regardless of how long a
 * frame took. Catch-up is capped to avoid a spiral of death after a stall.
 * Between ticks the thread sleeps with SDL_DelayPrecise.
 */
class TimestepManager {
public:
    /**
     * @param tickRate Simulation ticks per second (e.g. 30.0f)
     */
    explicit TimestepManager(float tickRate = 30.0f);

    /**
     * Call at the start of each frame to accumulate elapsed wall time
     */
    void startFrame();

    /**
     * Returns true while a whole tick is pending in the accumulator.
     * May return true several times per frame during catch-up.
     */
    bool shouldUpdate();

    /**
     * Fixed simulation delta in seconds (1 / tick rate)
     */
    float getUpdateDeltaTime() const { return m_fixedTimestep; }

    /**
     * Call at the end of each frame; sleeps until the next tick is due
     */
    void endFrame();

    float getTickRate() const { return 1.0f / m_fixedTimestep; }
    void setTickRate(float tickRate);

    // Measured ticks per second (EMA smoothed)
    float getMeasuredTickRate() const { return m_measuredTickRate; }

    uint64_t getTickCount() const { return m_tickCount; }

    // Ticks dropped because the catch-up cap was hit
    uint64_t getDroppedTickCount() const { return m_droppedTicks; }

    void reset();

private:
    float m_fixedTimestep;
    double m_accumulator{0.0};
    uint64_t m_tickCount{0};
    uint64_t m_droppedTicks{0};
    float m_measuredTickRate{0.0f};
    bool m_firstFrame{true};

    std::chrono::steady_clock::time_point m_frameStart;
    std::chrono::steady_clock::time_point m_lastFrameTime;
    std::chrono::steady_clock::time_point m_lastTickTime;

    static constexpr int MAX_CATCH_UP_TICKS = 5;
    static constexpr float TICK_RATE_SMOOTHING = 0.05f;

    void recordTick();
};

#endif // TIMESTEP_MANAGER_HPP
