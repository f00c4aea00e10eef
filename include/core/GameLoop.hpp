/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_LOOP_HPP
#define GAME_LOOP_HPP

#include "core/TimestepManager.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>

/**
 * GameLoop drives the authoritative simulation on the calling thread.
 *
 * Callback-based so the loop knows nothing about the systems it runs:
 * - the poll handler runs once per frame (transport pumping)
 * - the update handler runs once per fixed tick, possibly several times
 *   per frame during catch-up
 *
 * All game state is mutated from inside these callbacks, on one thread.
 */
class GameLoop {
public:
    using PollHandler = std::function<void()>;
    using UpdateHandler = std::function<void(float deltaTime)>;

    /**
     * @param tickRate Simulation ticks per second
     * @param maxTicks Stop after this many ticks (0 runs until stop())
     */
    explicit GameLoop(float tickRate = 30.0f, uint64_t maxTicks = 0);
    ~GameLoop() = default;

    void setPollHandler(PollHandler handler);
    void setUpdateHandler(UpdateHandler handler);

    /**
     * Run the loop. Blocks until stop() is called, maxTicks is reached or an
     * update handler throws.
     * @return true if the loop finished cleanly, false on error
     */
    bool run();

    /**
     * Request the loop to stop after the current tick. Safe from any thread.
     */
    void stop();

    bool isRunning() const;

    /**
     * Paused loops keep polling but skip simulation ticks
     */
    void setPaused(bool paused);
    bool isPaused() const;

    uint64_t getTickCount() const;
    TimestepManager& getTimestepManager();

private:
    std::unique_ptr<TimestepManager> m_timestepManager;

    PollHandler m_pollHandler;
    UpdateHandler m_updateHandler;

    std::atomic<bool> m_running{false};
    std::atomic<bool> m_paused{false};
    std::atomic<bool> m_stopRequested{false};
    uint64_t m_maxTicks;
    uint64_t m_ticksRun{0};

    bool runFrame();

    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;
};

#endif // GAME_LOOP_HPP
