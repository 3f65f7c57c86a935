/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/TimestepManager.hpp"
#include <algorithm>
#include <thread>

namespace Cosmic
{

TimestepManager::TimestepManager(float targetFPS, float fixedTimestep)
    : m_targetFPS(targetFPS > 0.0f ? targetFPS : 60.0f)
    , m_fixedTimestep(fixedTimestep > 0.0f ? fixedTimestep : 1.0f / 60.0f)
    , m_targetFrameTime(1.0f / m_targetFPS)
{
    auto currentTime = std::chrono::steady_clock::now();
    m_frameStart = currentTime;
    m_lastFrameTime = currentTime;
}

void TimestepManager::startFrame() {
    auto currentTime = std::chrono::steady_clock::now();
    m_frameStart = currentTime;

    if (m_firstFrame) {
        m_firstFrame = false;
        m_lastFrameTime = currentTime;
        return;
    }

    auto deltaTimeNs = std::chrono::duration_cast<std::chrono::nanoseconds>(currentTime - m_lastFrameTime);
    m_lastFrameTime = currentTime;

    addElapsed(static_cast<double>(deltaTimeNs.count()) / 1.0e9);
}

void TimestepManager::addElapsed(double seconds) {
    if (seconds <= 0.0) {
        return;
    }

    m_lastFrameTimeMs = static_cast<uint32_t>(seconds * 1000.0);
    updateFPS(seconds);

    // Clamp to prevent the spiral of death after a stall
    m_accumulator += std::min(seconds, MAX_FRAME_DELTA);
}

bool TimestepManager::shouldUpdate() {
    if (m_accumulator >= m_fixedTimestep) {
        m_accumulator -= m_fixedTimestep;
        return true;
    }
    return false;
}

double TimestepManager::getInterpolationAlpha() const {
    return std::clamp(m_accumulator / m_fixedTimestep, 0.0, 1.0);
}

void TimestepManager::endFrame() {
    auto targetEndTime = m_frameStart + std::chrono::nanoseconds(static_cast<int64_t>(m_targetFrameTime * 1e9));
    if (std::chrono::steady_clock::now() < targetEndTime) {
        std::this_thread::sleep_until(targetEndTime);
    }
}

void TimestepManager::setTargetFPS(float fps) {
    if (fps > 0.0f) {
        m_targetFPS = fps;
        m_targetFrameTime = 1.0f / fps;
    }
}

void TimestepManager::setFixedTimestep(float timestep) {
    if (timestep > 0.0f) {
        m_fixedTimestep = timestep;
    }
}

void TimestepManager::reset() {
    m_accumulator = 0.0;
    m_firstFrame = true;
    m_currentFPS = 0.0f;
    m_lastFrameTimeMs = 0;

    auto currentTime = std::chrono::steady_clock::now();
    m_frameStart = currentTime;
    m_lastFrameTime = currentTime;
}

void TimestepManager::updateFPS(double deltaSeconds) {
    float instantFPS = static_cast<float>(1.0 / deltaSeconds);
    instantFPS = std::clamp(instantFPS, 0.1f, 1000.0f);

    if (m_currentFPS <= 0.0f) {
        m_currentFPS = instantFPS;
    } else {
        m_currentFPS = m_smoothingAlpha * instantFPS + (1.0f - m_smoothingAlpha) * m_currentFPS;
    }
}

} // namespace Cosmic
