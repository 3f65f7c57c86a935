/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef BEHAVIOR_ENGINE_HPP
#define BEHAVIOR_ENGINE_HPP

/**
 * @file BehaviorEngine.hpp
 * @brief Per-variant enemy movement and shooting
 *
 * Each enemy carries a BehaviorState variant; update() dispatches on it with
 * std::visit so every variant has exactly one update function. Behaviors
 * only write the enemy's velocity and scratch state. Shots are returned as
 * FireRequests and turned into bullets by the caller, so nothing is added
 * to the EntityStore while its enemy list is being iterated.
 */

#include "ai/BehaviorConfig.hpp"
#include "core/GameConfig.hpp"
#include "entities/EntityData.hpp"
#include <boost/container/small_vector.hpp>
#include <vector>

namespace Cosmic
{

class RandomSource;

struct FireRequest
{
    Vector2D position;
    Vector2D velocity;
    float damage{1.0f};
    BulletKind kind{BulletKind::Normal};
};

// A boss circle volley is the largest single burst
using FireRequests = boost::container::small_vector<FireRequest, 16>;

class BehaviorEngine
{
public:
    BehaviorEngine(const GameConfig& config, RandomSource& random);

    /**
     * @brief Run behavior and the shooting gate for every live enemy
     * @param playerPos Position the behaviors react to
     * @param requests Output, appended to in enemy order
     */
    void update(std::vector<Enemy>& enemies, const Vector2D& playerPos, FireRequests& requests);

    /**
     * @brief Recompute one enemy's velocity from its variant state
     */
    void updateMovement(Enemy& enemy, const Vector2D& playerPos);

    /**
     * @brief Fire if the cooldown has elapsed and the player is within range
     * @return true if the enemy fired (cooldown restarted)
     */
    bool tryFire(Enemy& enemy, const Vector2D& playerPos, FireRequests& requests);

    // Volley builders

    /**
     * @brief Fan of bullets around straight down
     *
     * Bullet i is the velocity (0, speed) rotated by
     * -spread + 2 * spread * i / (count - 1); a single bullet flies straight.
     */
    static void appendSpread(FireRequests& requests, const Vector2D& origin, int count,
                             float spread, float speed, float damage);

    /// Evenly spaced ring starting at angle 0 (pointing right)
    static void appendCircle(FireRequests& requests, const Vector2D& origin, int count,
                             float speed, float damage);

private:
    // Per-variant movement laws
    void move(Enemy& enemy, BasicState& state, const Vector2D& playerPos);
    void move(Enemy& enemy, FastState& state, const Vector2D& playerPos);
    void move(Enemy& enemy, HeavyState& state, const Vector2D& playerPos);
    void move(Enemy& enemy, ZigZagState& state, const Vector2D& playerPos);
    void move(Enemy& enemy, BossState& state, const Vector2D& playerPos);

    void fireAimed(const Enemy& enemy, const Vector2D& origin, const Vector2D& playerPos,
                   FireRequests& requests) const;
    void fireBossPattern(const Enemy& enemy, const BossState& state, const Vector2D& origin,
                         FireRequests& requests);

    const GameConfig& m_config;
    const BehaviorConfig& m_behavior;
    RandomSource& m_random;
};

} // namespace Cosmic

#endif // BEHAVIOR_ENGINE_HPP
