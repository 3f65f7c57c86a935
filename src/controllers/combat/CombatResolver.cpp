/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/combat/CombatResolver.hpp"
#include "controllers/combat/PowerUpEffectTimer.hpp"
#include "core/Logger.hpp"
#include "core/RandomSource.hpp"
#include "managers/EntityStore.hpp"
#include <algorithm>
#include <numeric>
#include <string>

namespace Cosmic
{

CombatResolver::CombatResolver(EntityStore& store, EventQueue& events, const GameConfig& config,
                               RandomSource& random, PowerUpEffectTimer& powerUps)
    : ControllerBase(store, events), m_config(config), m_random(random), m_powerUps(powerUps)
{
}

size_t CombatResolver::resolve(const CollisionBatch& batch)
{
    size_t applied = 0;
    for (const auto& info : batch) {
        if (resolve(info)) {
            ++applied;
        }
    }
    return applied;
}

bool CombatResolver::resolve(const CollisionInfo& info)
{
    switch (info.kind) {
    case CollisionKind::PlayerBulletEnemy:
        return resolveBulletHit(info.a, info.b);
    case CollisionKind::EnemyBulletPlayer:
        return resolvePlayerHit(info.a);
    case CollisionKind::PlayerEnemy:
        return resolveContact(info.b);
    case CollisionKind::PlayerPowerUp:
        return resolvePickup(info.b);
    }
    return false;
}

bool CombatResolver::resolveBulletHit(EntityID bulletId, EntityID enemyId)
{
    Bullet* bullet = getStore().findBullet(bulletId);
    Enemy* enemy = getStore().findEnemy(enemyId);
    if (!bullet || !enemy) {
        COMBAT_DEBUG("Skipping bullet hit, bullet or enemy already removed");
        return false;
    }

    const float oldHealth = enemy->health;
    enemy->health = std::max(0.0f, enemy->health - bullet->damage);
    bullet->alive = false;

    emit(ExplosionRequested{enemy->position.getX(), enemy->position.getY(),
                            m_config.particle.hitIntensity});

    COMBAT_DEBUG("Enemy " + std::to_string(enemy->id) + " hit for " +
                 std::to_string(bullet->damage) + ", HP: " + std::to_string(oldHealth) +
                 " -> " + std::to_string(enemy->health));

    if (enemy->health <= 0.0f) {
        const Vector2D position = enemy->position;
        destroyEnemy(*enemy, enemy->scoreValue);
        // May add to the power-up list; enemy and bullet pointers are not used past here
        rollPowerUpDrop(position);
    }
    return true;
}

bool CombatResolver::resolvePlayerHit(EntityID bulletId)
{
    Bullet* bullet = getStore().findBullet(bulletId);
    if (!bullet) {
        return false;
    }

    // An invulnerable player does not absorb the bullet; it keeps flying
    if (!damagePlayer(bullet->damage)) {
        return false;
    }
    bullet->alive = false;
    return true;
}

bool CombatResolver::resolveContact(EntityID enemyId)
{
    Enemy* enemy = getStore().findEnemy(enemyId);
    if (!enemy) {
        return false;
    }

    if (!damagePlayer(m_config.player.contactDamage)) {
        return false;
    }

    emit(ExplosionRequested{enemy->position.getX(), enemy->position.getY(),
                            m_config.particle.blastIntensity});
    destroyEnemy(*enemy, 0);
    return true;
}

bool CombatResolver::resolvePickup(EntityID powerUpId)
{
    PowerUp* powerUp = getStore().findPowerUp(powerUpId);
    if (!powerUp) {
        return false;
    }

    const PowerUpKind kind = powerUp->kind;
    powerUp->alive = false;

    m_powerUps.apply(kind);
    emit(PowerUpCollected{kind});
    return true;
}

bool CombatResolver::damagePlayer(float amount)
{
    Player& player = getStore().getPlayer();
    if (player.isInvulnerable()) {
        return false;
    }

    const float oldHealth = player.health;
    player.health = std::clamp(player.health - amount, 0.0f, player.maxHealth);
    player.invulnerableTimer = m_config.player.invulnerabilityTime;

    emit(PlayerDamaged{amount, player.health});
    emit(ScreenFeedback{});

    COMBAT_INFO("Player hit for " + std::to_string(amount) + ", HP: " +
                std::to_string(oldHealth) + " -> " + std::to_string(player.health));
    return true;
}

void CombatResolver::destroyEnemy(Enemy& enemy, int score)
{
    enemy.health = 0.0f;
    enemy.alive = false;
    m_score += score;

    emit(EnemyDestroyed{enemy.position.getX(), enemy.position.getY(), score, enemy.variant});

    COMBAT_INFO(std::string(toString(enemy.variant)) + " enemy " + std::to_string(enemy.id) +
                " destroyed (+" + std::to_string(score) + ")");
}

bool CombatResolver::rollPowerUpDrop(const Vector2D& position)
{
    if (m_random.uniform01() >= m_config.powerUp.dropChance) {
        return false;
    }

    const PowerUpConfig& cfg = m_config.powerUp;

    PowerUp powerUp;
    powerUp.kind = pickPowerUpKind();
    powerUp.position = position;
    powerUp.velocity = Vector2D(0.0f, cfg.descentSpeed);
    powerUp.size = cfg.size;
    getStore().addPowerUp(powerUp);

    emit(PowerUpSpawned{position.getX(), position.getY(), powerUp.kind});
    COMBAT_DEBUG("Power-up dropped: " + std::string(toString(powerUp.kind)));
    return true;
}

PowerUpKind CombatResolver::pickPowerUpKind()
{
    const auto& weights = m_config.powerUp.weights;
    const int total = std::accumulate(weights.begin(), weights.end(), 0);
    if (total <= 0) {
        COMBAT_WARN("Power-up weights sum to zero, defaulting to health");
        return PowerUpKind::Health;
    }

    int roll = m_random.uniformInt(1, total);
    for (PowerUpKind kind : ALL_POWERUP_KINDS) {
        roll -= weights[toIndex(kind)];
        if (roll <= 0) {
            return kind;
        }
    }
    return ALL_POWERUP_KINDS.back();
}

} // namespace Cosmic
