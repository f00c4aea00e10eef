/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/TimestepManager.hpp"
#include "core/Logger.hpp"
#include <SDL3/SDL.h>
#include <algorithm>

TimestepManager::TimestepManager(float tickRate)
    : m_fixedTimestep(tickRate > 0.0f ? 1.0f / tickRate : 1.0f / 30.0f)
{
    auto now = std::chrono::steady_clock::now();
    m_frameStart = now;
    m_lastFrameTime = now;
    m_lastTickTime = now;
}

void TimestepManager::startFrame() {
    auto now = std::chrono::steady_clock::now();
    m_frameStart = now;

    if (m_firstFrame) {
        // First frame always runs exactly one tick
        m_firstFrame = false;
        m_lastFrameTime = now;
        m_lastTickTime = now;
        m_accumulator = m_fixedTimestep;
        return;
    }

    double deltaSeconds = std::chrono::duration<double>(now - m_lastFrameTime).count();
    m_lastFrameTime = now;
    m_accumulator += deltaSeconds;

    const double maxAccumulated = static_cast<double>(m_fixedTimestep) * MAX_CATCH_UP_TICKS;
    if (m_accumulator > maxAccumulated) {
        auto dropped = static_cast<uint64_t>((m_accumulator - maxAccumulated) / m_fixedTimestep);
        m_droppedTicks += dropped;
        m_accumulator = maxAccumulated;
        GAMELOOP_WARN("Simulation fell behind, dropped " + std::to_string(dropped) + " ticks");
    }
}

bool TimestepManager::shouldUpdate() {
    if (m_accumulator >= m_fixedTimestep) {
        m_accumulator -= m_fixedTimestep;
        recordTick();
        return true;
    }
    return false;
}

void TimestepManager::endFrame() {
    // Sleep until the accumulator will hold one full tick
    double remainingSeconds = static_cast<double>(m_fixedTimestep) - m_accumulator;
    double frameSeconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - m_frameStart).count();
    remainingSeconds -= frameSeconds;

    if (remainingSeconds > 0.0) {
        SDL_DelayPrecise(static_cast<Uint64>(remainingSeconds * 1e9));
    }
}

void TimestepManager::setTickRate(float tickRate) {
    if (tickRate > 0.0f) {
        m_fixedTimestep = 1.0f / tickRate;
    }
}

void TimestepManager::reset() {
    m_accumulator = 0.0;
    m_tickCount = 0;
    m_droppedTicks = 0;
    m_measuredTickRate = 0.0f;
    m_firstFrame = true;

    auto now = std::chrono::steady_clock::now();
    m_frameStart = now;
    m_lastFrameTime = now;
    m_lastTickTime = now;
}

void TimestepManager::recordTick() {
    ++m_tickCount;

    auto now = std::chrono::steady_clock::now();
    double sinceLast = std::chrono::duration<double>(now - m_lastTickTime).count();
    m_lastTickTime = now;
    if (sinceLast <= 0.0) {
        return;
    }

    float instant = std::clamp(static_cast<float>(1.0 / sinceLast), 0.1f, 1000.0f);
    if (m_measuredTickRate <= 0.0f) {
        m_measuredTickRate = instant;
    } else {
        m_measuredTickRate = TICK_RATE_SMOOTHING * instant +
                             (1.0f - TICK_RATE_SMOOTHING) * m_measuredTickRate;
    }
}
