/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TIMESTEP_MANAGER_HPP
#define TIMESTEP_MANAGER_HPP

#include <chrono>
#include <cstdint>

namespace Cosmic
{

/**
 * TimestepManager turns variable wall-clock frames into fixed simulation steps.
 *
 * Each frame's elapsed time goes into an accumulator; shouldUpdate() returns
 * true once per whole fixed step held in it, so a slow frame runs several
 * ticks and a fast frame may run none. The simulation always sees the same
 * dt. Per-frame elapsed time is clamped so a stall cannot queue an unbounded
 * number of catch-up ticks.
 */
class TimestepManager {
public:
    /**
     * Constructor
     * @param targetFPS Target frames per second for rendering (e.g., 60.0f)
     * @param fixedTimestep Fixed timestep for updates in seconds (e.g., 1.0f/60.0f)
     */
    explicit TimestepManager(float targetFPS = 60.0f, float fixedTimestep = 1.0f/60.0f);

    /**
     * Call this at the start of each frame; measures the time since the last one
     */
    void startFrame();

    /**
     * Feed elapsed time directly, for hosts with their own clock and for tests
     * @param seconds Elapsed time, clamped to MAX_FRAME_DELTA
     */
    void addElapsed(double seconds);

    /**
     * Returns true if an update should be performed with fixed timestep.
     * May return true multiple times per frame for catch-up.
     */
    bool shouldUpdate();

    /**
     * Fixed delta time for updates, always the same value
     */
    float getUpdateDeltaTime() const { return m_fixedTimestep; }

    /**
     * Fraction of the next fixed step already accumulated, in [0, 1]
     */
    double getInterpolationAlpha() const;

    /**
     * Call this at the end of each frame. Sleeps off the rest of the target frame time.
     */
    void endFrame();

    float getCurrentFPS() const { return m_currentFPS; }
    float getTargetFPS() const { return m_targetFPS; }
    uint32_t getFrameTimeMs() const { return m_lastFrameTimeMs; }
    float getUpdateFrequencyHz() const { return 1.0f / m_fixedTimestep; }

    /**
     * Set new target FPS (ignored when not positive)
     */
    void setTargetFPS(float fps);

    /**
     * Set new fixed timestep for updates (ignored when not positive)
     */
    void setFixedTimestep(float timestep);

    /**
     * Reset timing state (useful when pausing/unpausing)
     */
    void reset();

    static constexpr double MAX_FRAME_DELTA = 0.25; // Max delta clamp per frame

private:
    void updateFPS(double deltaSeconds);

    // Timing configuration
    float m_targetFPS;                    // Target frames per second for rendering
    float m_fixedTimestep;                // Fixed timestep for updates (seconds)
    float m_targetFrameTime;              // Target frame time (1/targetFPS)

    std::chrono::steady_clock::time_point m_frameStart;
    std::chrono::steady_clock::time_point m_lastFrameTime;

    double m_accumulator{0.0};

    // Frame statistics
    uint32_t m_lastFrameTimeMs{0};
    float m_currentFPS{0.0f};             // EMA smoothed
    float m_smoothingAlpha{0.03f};

    bool m_firstFrame{true};
};

} // namespace Cosmic

#endif // TIMESTEP_MANAGER_HPP
