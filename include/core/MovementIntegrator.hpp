/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef MOVEMENT_INTEGRATOR_HPP
#define MOVEMENT_INTEGRATOR_HPP

/**
 * @file MovementIntegrator.hpp
 * @brief Advances positions and countdown timers by one fixed step
 *
 * Velocities are stored per reference tick, so every position update is
 * position += velocity * dt * referenceTickRate. Countdowns decrease by dt
 * and clamp at zero; ages increase by dt.
 *
 * Enemy-side entities (enemies, enemy bullets, power-ups) advance with a
 * scaled dt while TimeSlow or the player's time freeze is active. See
 * enemyTimeScale().
 */

#include "core/GameConfig.hpp"
#include "entities/EntityData.hpp"
#include <vector>

namespace Cosmic
{

class MovementIntegrator
{
public:
    explicit MovementIntegrator(const GameConfig& config) : m_config(config) {}

    /**
     * @brief Ease player velocity toward the move intent
     * @param moveVector Sanitized intent in [-1, 1] on both axes
     */
    void steerPlayer(Player& player, const Vector2D& moveVector) const;

    /**
     * @brief Move the player, clamp to the field and run its countdowns
     *
     * Decrements invulnerability, fire cooldown, special cooldown and time
     * freeze. Timed power-up durations belong to PowerUpEffectTimer.
     */
    void integratePlayer(Player& player, float dt) const;

    /**
     * @brief Advance ai_timer, boss pattern timer and fire cooldown
     * @note Runs before BehaviorEngine so behaviors see this tick's timers
     */
    void advanceEnemyTimers(std::vector<Enemy>& enemies, float dt) const;

    /**
     * @brief Move enemies and clamp them horizontally inside the field
     */
    void integrateEnemies(std::vector<Enemy>& enemies, float dt) const;

    /**
     * @brief Age and move bullets; player bullets use playerDt, enemy bullets enemyDt
     */
    void integrateBullets(std::vector<Bullet>& bullets, float playerDt, float enemyDt) const;

    void integratePowerUps(std::vector<PowerUp>& powerUps, float dt) const;

    /**
     * @brief Time scale for enemy-side entities
     * @return 0 while time freeze is active, timeSlowScale while TimeSlow is
     *         active, 1 otherwise
     */
    [[nodiscard]] float enemyTimeScale(const Player& player) const;

private:
    [[nodiscard]] float stepScale(float dt) const { return dt * m_config.referenceTickRate; }

    const GameConfig& m_config;
};

} // namespace Cosmic

#endif // MOVEMENT_INTEGRATOR_HPP
