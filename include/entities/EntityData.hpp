/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_DATA_HPP
#define ENTITY_DATA_HPP

/**
 * @file EntityData.hpp
 * @brief Plain data blocks for every simulated entity
 *
 * All instances are owned by EntityStore. Systems receive transient
 * references during a tick; anything that must outlive a tick refers to
 * another entity by EntityID.
 */

#include "collisions/AABB.hpp"
#include "entities/EntityTypes.hpp"
#include "utils/Vector2D.hpp"
#include <boost/container/flat_map.hpp>
#include <variant>

namespace Cosmic {

/**
 * @brief Data shared by every entity kind
 *
 * Velocity is expressed in units per reference tick (1/60 s).
 */
struct Body {
    EntityID id{INVALID_ENTITY_ID};
    Vector2D position{0.0f, 0.0f};
    Vector2D velocity{0.0f, 0.0f};
    Vector2D size{0.0f, 0.0f};
    Faction faction{Faction::Neutral};
    bool alive{true};

    [[nodiscard]] AABB bounds() const noexcept {
        return AABB::fromSize(position, size);
    }
};

/**
 * @brief The player ship
 */
struct Player : Body {
    float health{100.0f};
    float maxHealth{100.0f};
    float invulnerableTimer{0.0f};    // Seconds left in the invulnerability window
    float fireCooldown{0.0f};
    float specialCooldown{0.0f};
    float timeFreezeTimer{0.0f};      // Seconds left in the special time freeze
    float bulletDamage{1.0f};

    // Active timed power-ups, kind -> remaining seconds
    boost::container::flat_map<PowerUpKind, float> activePowerUps;

    [[nodiscard]] bool isInvulnerable() const noexcept { return invulnerableTimer > 0.0f; }
    [[nodiscard]] bool isTimeFrozen() const noexcept { return timeFreezeTimer > 0.0f; }
    [[nodiscard]] bool hasPowerUp(PowerUpKind kind) const {
        return activePowerUps.find(kind) != activePowerUps.end();
    }
    [[nodiscard]] float remaining(PowerUpKind kind) const {
        auto it = activePowerUps.find(kind);
        return it != activePowerUps.end() ? it->second : 0.0f;
    }
};

// Per-variant scratch state for the behavior engine
struct BasicState {};
struct FastState {
    float targetX{0.0f};              // Column the enemy is strafing toward
};
struct HeavyState {};
struct ZigZagState {};
struct BossState {
    Vector2D target{0.0f, 0.0f};      // Orbit point for pattern 1
    int pattern{0};                   // 0 sweep, 1 orbit, 2 pursuit
    float patternTimer{0.0f};
};

using BehaviorState = std::variant<BasicState, FastState, HeavyState, ZigZagState, BossState>;

/**
 * @brief Scratch state matching a variant, targets start at the spawn point
 */
BehaviorState makeBehaviorState(EnemyVariant variant, const Vector2D& spawnPosition);

struct Enemy : Body {
    EnemyVariant variant{EnemyVariant::Basic};
    float health{1.0f};
    float maxHealth{1.0f};
    float speed{2.0f};
    float aiTimer{0.0f};
    float fireCooldown{0.0f};         // Counts down; the enemy may fire at zero
    float fireRate{1.0f};             // Shots per second
    float bulletDamage{1.0f};
    int scoreValue{100};
    BehaviorState behavior{BasicState{}};

    [[nodiscard]] bool isBoss() const noexcept { return variant == EnemyVariant::Boss; }
};

struct Bullet : Body {
    float damage{1.0f};
    BulletKind kind{BulletKind::Normal};
    float age{0.0f};
    float maxLifetime{5.0f};

    // Homing only. The target is a weak id reference re-acquired on lookup failure.
    EntityID targetId{INVALID_ENTITY_ID};
    float turnRate{0.1f};
    float homingRange{200.0f};

    [[nodiscard]] bool isHoming() const noexcept { return kind == BulletKind::Homing; }
};

struct PowerUp : Body {
    PowerUpKind kind{PowerUpKind::Health};
    float age{0.0f};
};

/**
 * @brief Visual-only particle; never read by the simulation pipeline
 *
 * Unlike other bodies, particle velocity is in units per second.
 */
struct Particle {
    Vector2D position{0.0f, 0.0f};
    Vector2D velocity{0.0f, 0.0f};
    float age{0.0f};
    float lifetime{1.0f};
    float size{2.0f};
    int intensity{0};

    [[nodiscard]] bool isDead() const noexcept { return age >= lifetime; }
};

} // namespace Cosmic

#endif // ENTITY_DATA_HPP
