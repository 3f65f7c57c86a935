/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef BEHAVIOR_CONFIG_HPP
#define BEHAVIOR_CONFIG_HPP

namespace Cosmic
{

// Velocities below are in units per reference tick (1/60 s); the integrator
// scales them by dt * 60.

/**
 * Configuration for the Basic variant
 *
 * Straight descent with a slight drift toward the player's column.
 */
struct BasicBehaviorConfig
{
    float trackThreshold = 50.0f;                 // Horizontal offset (px) before drifting toward the player
    float trackSpeed = 0.5f;                      // Horizontal drift speed while tracking
};

/**
 * Configuration for the Fast variant
 *
 * Erratic strafing: a new random column is chosen at a fixed interval and
 * the enemy steers a fraction of the remaining offset every tick.
 */
struct FastBehaviorConfig
{
    float retargetInterval = 0.5f;                // Seconds between target column changes
    float steerFactor = 0.1f;                     // Fraction of x offset converted to velocity per tick
    float targetMargin = 50.0f;                   // Keep target columns this far from field edges
};

/**
 * Configuration for the Heavy variant
 */
struct HeavyBehaviorConfig
{
    float descentScale = 0.8f;                    // Fraction of base speed used for descent
    float swayAmplitude = 0.5f;                   // Peak horizontal speed during sway
    float swayStepsPerSecond = 2.0f;              // Sway gate resolution (steps of ai_timer)
    int swayCycleSteps = 4;                       // Sway is active on one step out of this many
};

/**
 * Configuration for the ZigZag variant
 */
struct ZigZagBehaviorConfig
{
    float frequency = 3.0f;                       // Radians of oscillation per second of ai_timer
    float amplitude = 2.0f;                       // Peak horizontal speed
};

/**
 * Configuration for the Boss variant
 *
 * The boss cycles through three attack patterns, each with its own movement
 * law and volley shape.
 */
struct BossBehaviorConfig
{
    // Pattern cycling
    float patternDuration = 5.0f;                 // Seconds spent in each pattern
    int patternCount = 3;                         // Sweep, orbit, pursuit

    // Pattern 0: side-to-side sweep
    float sweepFrequency = 2.0f;
    float sweepAmplitude = 3.0f;
    float sweepDescent = 0.5f;

    // Pattern 1: orbit around a fixed point above the play field
    float orbitFrequency = 2.0f;
    float orbitCenterY = 150.0f;                  // Orbit center; x is the field center
    float orbitRadius = 100.0f;
    float orbitVerticalScale = 0.5f;              // Flattens the orbit into an ellipse
    float orbitGain = 0.05f;                      // Proportional seek toward the orbit point

    // Pattern 2: pursuit
    float pursuitRange = 200.0f;                  // Pursue when farther than this
    float pursuitSpeed = 2.0f;
    float retreatGain = 0.01f;                    // Gentle pull-back when close

    // Volleys
    int spreadCount = 5;
    float spreadAngle = 0.8f;                     // Half-angle of the spread fan (radians)
    float spreadSpeedScale = 0.6f;                // Fraction of bullet speed
    int circleCount = 8;
    float circleSpeedScale = 0.5f;
    int missileCount = 2;
    float missileJitter = 20.0f;                  // Random x offset per missile (px)
    float missileDamageScale = 2.0f;
};

/**
 * Aggregate of all enemy behavior tuning plus the shared shooting gate.
 */
struct BehaviorConfig
{
    BasicBehaviorConfig basic;
    FastBehaviorConfig fast;
    HeavyBehaviorConfig heavy;
    ZigZagBehaviorConfig zigzag;
    BossBehaviorConfig boss;

    float fireRange = 400.0f;                     // Enemies only shoot when the player is this close
    float aimedShotSpeedScale = 0.8f;             // Non-boss aimed shot speed as fraction of bullet speed
};

} // namespace Cosmic

#endif // BEHAVIOR_CONFIG_HPP
