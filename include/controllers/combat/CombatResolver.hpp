/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBAT_RESOLVER_HPP
#define COMBAT_RESOLVER_HPP

/**
 * @file CombatResolver.hpp
 * @brief Applies the outcome of each detected collision
 *
 * CombatResolver handles:
 * - Damage to enemies and the player (health clamped at zero)
 * - Enemy destruction, score and power-up drops
 * - The player's invulnerability window after a hit
 * - Power-up collection (delegated to PowerUpEffectTimer)
 *
 * It is the only component that changes health or score. Events are
 * processed in detection order, one effect each. An event whose bullet,
 * enemy or power-up is already gone (destroyed earlier in the same batch)
 * is skipped.
 *
 * Ownership: GameSession owns the resolver; entities stay in EntityStore.
 */

#include "collisions/CollisionInfo.hpp"
#include "controllers/ControllerBase.hpp"
#include "core/GameConfig.hpp"

namespace Cosmic
{

class PowerUpEffectTimer;
class RandomSource;
struct Enemy;

class CombatResolver : public ControllerBase
{
public:
    CombatResolver(EntityStore& store, EventQueue& events, const GameConfig& config,
                   RandomSource& random, PowerUpEffectTimer& powerUps);
    ~CombatResolver() override = default;

    [[nodiscard]] std::string_view getName() const override { return "CombatResolver"; }

    /**
     * @brief Resolve a tick's collision batch in order
     * @return Number of events that had an effect
     */
    size_t resolve(const CollisionBatch& batch);

    /**
     * @brief Resolve a single collision
     * @return false when the event was skipped
     */
    bool resolve(const CollisionInfo& info);

    /**
     * @brief Damage the player unless invulnerable
     * @return true if damage was applied
     */
    bool damagePlayer(float amount);

    /**
     * @brief Roll the drop chance and spawn a weighted-random power-up
     * @return true if a power-up was spawned
     */
    bool rollPowerUpDrop(const Vector2D& position);

    /**
     * @brief Pick a power-up kind from the configured weights
     */
    [[nodiscard]] PowerUpKind pickPowerUpKind();

    [[nodiscard]] int getScore() const { return m_score; }
    void resetScore() { m_score = 0; }

private:
    bool resolveBulletHit(EntityID bulletId, EntityID enemyId);
    bool resolvePlayerHit(EntityID bulletId);
    bool resolveContact(EntityID enemyId);
    bool resolvePickup(EntityID powerUpId);

    void destroyEnemy(Enemy& enemy, int score);

    const GameConfig& m_config;
    RandomSource& m_random;
    PowerUpEffectTimer& m_powerUps;
    int m_score{0};
};

} // namespace Cosmic

#endif // COMBAT_RESOLVER_HPP
