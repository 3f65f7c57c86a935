/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/MovementIntegrator.hpp"
#include "core/Logger.hpp"
#include <algorithm>

namespace Cosmic
{

namespace
{

void countDown(float& timer, float dt)
{
    if (timer > 0.0f) {
        timer = std::max(0.0f, timer - dt);
    }
}

} // namespace

void MovementIntegrator::steerPlayer(Player& player, const Vector2D& moveVector) const
{
    const PlayerConfig& cfg = m_config.player;

    float targetX = moveVector.getX() * cfg.speed;
    float targetY = moveVector.getY() * cfg.speed;
    if (targetX != 0.0f && targetY != 0.0f) {
        targetX *= cfg.diagonalScale;
        targetY *= cfg.diagonalScale;
    }

    Vector2D velocity = player.velocity;
    velocity += (Vector2D(targetX, targetY) - velocity) * cfg.acceleration;
    velocity *= cfg.friction;
    player.velocity = velocity;
}

void MovementIntegrator::integratePlayer(Player& player, float dt) const
{
    const PlayerConfig& cfg = m_config.player;

    float speedMult = 1.0f;
    if (player.hasPowerUp(PowerUpKind::RapidFire)) {
        speedMult *= cfg.rapidFireSpeedMult;
    }
    if (player.hasPowerUp(PowerUpKind::Shield)) {
        speedMult *= cfg.shieldSpeedMult;
    }

    player.position += player.velocity * (speedMult * stepScale(dt));

    const float halfW = player.size.getX() * 0.5f;
    const float halfH = player.size.getY() * 0.5f;
    player.position.setX(std::clamp(player.position.getX(), halfW, m_config.field.width - halfW));
    player.position.setY(std::clamp(player.position.getY(), halfH, m_config.field.height - halfH));

    const bool wasInvulnerable = player.isInvulnerable();
    const bool wasFrozen = player.isTimeFrozen();

    countDown(player.invulnerableTimer, dt);
    countDown(player.fireCooldown, dt);
    countDown(player.specialCooldown, dt);
    countDown(player.timeFreezeTimer, dt);

    if (wasInvulnerable && !player.isInvulnerable()) {
        GAMELOOP_DEBUG("Player invulnerability lifted");
    }
    if (wasFrozen && !player.isTimeFrozen()) {
        GAMELOOP_INFO("Time freeze ended");
    }
}

void MovementIntegrator::advanceEnemyTimers(std::vector<Enemy>& enemies, float dt) const
{
    for (auto& enemy : enemies) {
        if (!enemy.alive) {
            continue;
        }
        enemy.aiTimer += dt;
        countDown(enemy.fireCooldown, dt);
        if (auto* boss = std::get_if<BossState>(&enemy.behavior)) {
            boss->patternTimer += dt;
        }
    }
}

void MovementIntegrator::integrateEnemies(std::vector<Enemy>& enemies, float dt) const
{
    const float scale = stepScale(dt);
    const float fieldWidth = m_config.field.width;

    for (auto& enemy : enemies) {
        if (!enemy.alive) {
            continue;
        }
        enemy.position += enemy.velocity * scale;

        const float halfW = enemy.size.getX() * 0.5f;
        enemy.position.setX(std::clamp(enemy.position.getX(), halfW, fieldWidth - halfW));
    }
}

void MovementIntegrator::integrateBullets(std::vector<Bullet>& bullets, float playerDt,
                                          float enemyDt) const
{
    for (auto& bullet : bullets) {
        if (!bullet.alive) {
            continue;
        }
        const float dt = (bullet.faction == Faction::Player) ? playerDt : enemyDt;
        bullet.age += dt;
        bullet.position += bullet.velocity * stepScale(dt);
    }
}

void MovementIntegrator::integratePowerUps(std::vector<PowerUp>& powerUps, float dt) const
{
    const float scale = stepScale(dt);
    for (auto& powerUp : powerUps) {
        if (!powerUp.alive) {
            continue;
        }
        powerUp.age += dt;
        powerUp.position += powerUp.velocity * scale;
    }
}

float MovementIntegrator::enemyTimeScale(const Player& player) const
{
    if (player.isTimeFrozen()) {
        return 0.0f;
    }
    if (player.hasPowerUp(PowerUpKind::TimeSlow)) {
        return m_config.powerUp.timeSlowScale;
    }
    return 1.0f;
}

} // namespace Cosmic
