/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef HOMING_GUIDANCE_HPP
#define HOMING_GUIDANCE_HPP

/**
 * @file HomingGuidance.hpp
 * @brief Steering for Homing-kind bullets
 *
 * A homing bullet holds a weak lock on a target by EntityID. Each tick:
 *  - no lock: scan opposing-faction entities within homing range and lock
 *    the nearest;
 *  - lock that fails lookup: the lock is dropped and the bullet flies
 *    straight this tick, the next tick scans again;
 *  - live lock: turn toward the target by at most turnRate * dt * 60
 *    radians, keeping the current speed.
 */

#include "core/GameConfig.hpp"
#include "entities/EntityData.hpp"
#include <optional>

namespace Cosmic
{

class EntityStore;

class HomingGuidance
{
public:
    explicit HomingGuidance(const GameConfig& config) : m_config(config) {}

    /**
     * @brief Steer every live homing bullet in the store
     * @param playerDt Step for player bullets
     * @param enemyDt Time-scaled step for enemy bullets
     */
    void update(EntityStore& store, float playerDt, float enemyDt) const;

    /**
     * @brief Steer one bullet, maintaining its lock
     * @return true when the bullet was turned this tick
     */
    bool steer(Bullet& bullet, const EntityStore& store, float dt) const;

    /**
     * @brief Nearest opposing-faction entity strictly inside homing range
     * @return INVALID_ENTITY_ID when nothing is in range
     */
    [[nodiscard]] EntityID acquireTarget(const Bullet& bullet, const EntityStore& store) const;

    /// Wrap into (-pi, pi]
    [[nodiscard]] static float normalizeAngle(float angle);

    /**
     * @brief Rotate velocity toward a bearing, clamped to maxTurn radians
     * @return The signed turn actually applied
     */
    static float turnToward(Vector2D& velocity, float targetBearing, float maxTurn);

private:
    [[nodiscard]] std::optional<Vector2D> lookupTarget(const Bullet& bullet,
                                                       const EntityStore& store) const;

    const GameConfig& m_config;
};

} // namespace Cosmic

#endif // HOMING_GUIDANCE_HPP
