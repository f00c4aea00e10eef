/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/GameLoop.hpp"
#include "core/Logger.hpp"
#include <exception>

GameLoop::GameLoop(float tickRate, uint64_t maxTicks)
    : m_timestepManager(std::make_unique<TimestepManager>(tickRate))
    , m_maxTicks(maxTicks)
{
}

void GameLoop::setPollHandler(PollHandler handler) {
    m_pollHandler = std::move(handler);
}

void GameLoop::setUpdateHandler(UpdateHandler handler) {
    m_updateHandler = std::move(handler);
}

bool GameLoop::run() {
    if (m_running.load()) {
        GAMELOOP_WARN("GameLoop already running");
        return false;
    }
    if (!m_updateHandler) {
        GAMELOOP_ERROR("GameLoop has no update handler");
        return false;
    }

    m_running.store(true, std::memory_order_relaxed);
    m_stopRequested.store(false, std::memory_order_relaxed);
    m_ticksRun = 0;
    m_timestepManager->reset();

    GAMELOOP_INFO("GameLoop started at " +
                  std::to_string(m_timestepManager->getTickRate()) + " Hz");

    try {
        while (!m_stopRequested.load(std::memory_order_relaxed)) {
            if (!runFrame()) {
                break;
            }
        }
    } catch (const std::exception& e) {
        GAMELOOP_CRITICAL("Exception in main loop: " + std::string(e.what()));
        m_running.store(false, std::memory_order_relaxed);
        return false;
    }

    GAMELOOP_INFO("GameLoop stopped after " + std::to_string(m_ticksRun) + " ticks");
    m_running.store(false, std::memory_order_relaxed);
    return true;
}

bool GameLoop::runFrame() {
    m_timestepManager->startFrame();

    if (m_pollHandler) {
        m_pollHandler();
    }

    while (m_timestepManager->shouldUpdate()) {
        if (m_paused.load(std::memory_order_relaxed)) {
            continue;
        }
        m_updateHandler(m_timestepManager->getUpdateDeltaTime());
        ++m_ticksRun;

        if (m_maxTicks > 0 && m_ticksRun >= m_maxTicks) {
            return false;
        }
        if (m_stopRequested.load(std::memory_order_relaxed)) {
            return false;
        }
    }

    m_timestepManager->endFrame();
    return true;
}

void GameLoop::stop() {
    m_stopRequested.store(true, std::memory_order_relaxed);
}

bool GameLoop::isRunning() const {
    return m_running.load(std::memory_order_relaxed);
}

void GameLoop::setPaused(bool paused) {
    m_paused.store(paused, std::memory_order_relaxed);
}

bool GameLoop::isPaused() const {
    return m_paused.load(std::memory_order_relaxed);
}

uint64_t GameLoop::getTickCount() const {
    return m_ticksRun;
}

TimestepManager& GameLoop::getTimestepManager() {
    return *m_timestepManager;
}
