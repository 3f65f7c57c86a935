/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/BehaviorEngine.hpp"
#include "core/Logger.hpp"
#include "core/RandomSource.hpp"
#include <cmath>
#include <string>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace Cosmic
{

BehaviorEngine::BehaviorEngine(const GameConfig& config, RandomSource& random)
    : m_config(config), m_behavior(config.behavior), m_random(random)
{
}

void BehaviorEngine::update(std::vector<Enemy>& enemies, const Vector2D& playerPos,
                            FireRequests& requests)
{
    for (auto& enemy : enemies) {
        if (!enemy.alive) {
            continue;
        }
        updateMovement(enemy, playerPos);
        tryFire(enemy, playerPos, requests);
    }
}

void BehaviorEngine::updateMovement(Enemy& enemy, const Vector2D& playerPos)
{
    std::visit([this, &enemy, &playerPos](auto& state) { move(enemy, state, playerPos); },
               enemy.behavior);
}

// ---------------------------------------------------------------------------
// Movement laws
// ---------------------------------------------------------------------------

void BehaviorEngine::move(Enemy& enemy, BasicState&, const Vector2D& playerPos)
{
    const BasicBehaviorConfig& cfg = m_behavior.basic;
    const float dx = playerPos.getX() - enemy.position.getX();

    float vx = 0.0f;
    if (std::abs(dx) > cfg.trackThreshold) {
        vx = dx > 0.0f ? cfg.trackSpeed : -cfg.trackSpeed;
    }
    enemy.velocity = Vector2D(vx, enemy.speed);
}

void BehaviorEngine::move(Enemy& enemy, FastState& state, const Vector2D&)
{
    const FastBehaviorConfig& cfg = m_behavior.fast;

    if (enemy.aiTimer > cfg.retargetInterval) {
        const int lo = static_cast<int>(cfg.targetMargin);
        const int hi = static_cast<int>(m_config.field.width - cfg.targetMargin);
        state.targetX = static_cast<float>(m_random.uniformInt(lo, hi));
        enemy.aiTimer = 0.0f;
    }

    const float dx = state.targetX - enemy.position.getX();
    enemy.velocity = Vector2D(dx * cfg.steerFactor, enemy.speed);
}

void BehaviorEngine::move(Enemy& enemy, HeavyState&, const Vector2D&)
{
    const HeavyBehaviorConfig& cfg = m_behavior.heavy;

    float vx = 0.0f;
    const int step = static_cast<int>(std::floor(enemy.aiTimer * cfg.swayStepsPerSecond));
    if (cfg.swayCycleSteps > 0 && step % cfg.swayCycleSteps == 0) {
        vx = std::sin(enemy.aiTimer) * cfg.swayAmplitude;
    }
    enemy.velocity = Vector2D(vx, enemy.speed * cfg.descentScale);
}

void BehaviorEngine::move(Enemy& enemy, ZigZagState&, const Vector2D&)
{
    const ZigZagBehaviorConfig& cfg = m_behavior.zigzag;
    enemy.velocity = Vector2D(std::sin(enemy.aiTimer * cfg.frequency) * cfg.amplitude, enemy.speed);
}

void BehaviorEngine::move(Enemy& enemy, BossState& state, const Vector2D& playerPos)
{
    const BossBehaviorConfig& cfg = m_behavior.boss;

    if (state.patternTimer > cfg.patternDuration) {
        state.pattern = (state.pattern + 1) % cfg.patternCount;
        state.patternTimer = 0.0f;
        BEHAVIOR_DEBUG("Boss " + std::to_string(enemy.id) + " switched to pattern " +
                       std::to_string(state.pattern));
    }

    const float t = enemy.aiTimer;

    switch (state.pattern) {
    case 0:
        enemy.velocity = Vector2D(std::sin(t * cfg.sweepFrequency) * cfg.sweepAmplitude,
                                  cfg.sweepDescent);
        break;

    case 1: {
        const float angle = t * cfg.orbitFrequency;
        state.target = Vector2D(m_config.field.width * 0.5f + std::cos(angle) * cfg.orbitRadius,
                                cfg.orbitCenterY +
                                    std::sin(angle) * cfg.orbitRadius * cfg.orbitVerticalScale);
        enemy.velocity = (state.target - enemy.position) * cfg.orbitGain;
        break;
    }

    default: {
        const Vector2D toPlayer = playerPos - enemy.position;
        const float distance = toPlayer.length();
        if (distance > cfg.pursuitRange) {
            enemy.velocity = (toPlayer / distance) * cfg.pursuitSpeed;
        } else {
            enemy.velocity = -toPlayer * cfg.retreatGain;
        }
        break;
    }
    }
}

// ---------------------------------------------------------------------------
// Shooting
// ---------------------------------------------------------------------------

bool BehaviorEngine::tryFire(Enemy& enemy, const Vector2D& playerPos, FireRequests& requests)
{
    if (enemy.fireCooldown > 0.0f || enemy.fireRate <= 0.0f) {
        return false;
    }
    if (Vector2D::distance(enemy.position, playerPos) > m_behavior.fireRange) {
        return false;
    }

    enemy.fireCooldown = 1.0f / enemy.fireRate;

    // Shots leave from the enemy's lower edge
    const Vector2D origin(enemy.position.getX(), enemy.position.getY() + enemy.size.getY() * 0.5f);

    if (const auto* boss = std::get_if<BossState>(&enemy.behavior)) {
        fireBossPattern(enemy, *boss, origin, requests);
    } else {
        fireAimed(enemy, origin, playerPos, requests);
    }
    return true;
}

void BehaviorEngine::fireAimed(const Enemy& enemy, const Vector2D& origin,
                               const Vector2D& playerPos, FireRequests& requests) const
{
    // Aim from the enemy center, matching the range check
    const Vector2D toPlayer = playerPos - enemy.position;
    const float distance = toPlayer.length();
    if (distance <= 0.0f) {
        return;
    }

    const float speed = m_config.bullet.speed * m_behavior.aimedShotSpeedScale;
    requests.push_back(FireRequest{origin, (toPlayer / distance) * speed, enemy.bulletDamage,
                                   BulletKind::Normal});
}

void BehaviorEngine::fireBossPattern(const Enemy& enemy, const BossState& state,
                                     const Vector2D& origin, FireRequests& requests)
{
    const BossBehaviorConfig& cfg = m_behavior.boss;
    const float bulletSpeed = m_config.bullet.speed;

    switch (state.pattern) {
    case 0:
        appendSpread(requests, origin, cfg.spreadCount, cfg.spreadAngle,
                     bulletSpeed * cfg.spreadSpeedScale, enemy.bulletDamage);
        break;

    case 1:
        appendCircle(requests, origin, cfg.circleCount, bulletSpeed * cfg.circleSpeedScale,
                     enemy.bulletDamage);
        break;

    default: {
        const int jitter = static_cast<int>(cfg.missileJitter);
        for (int i = 0; i < cfg.missileCount; ++i) {
            const float offset = static_cast<float>(m_random.uniformInt(-jitter, jitter));
            requests.push_back(FireRequest{Vector2D(origin.getX() + offset, origin.getY()),
                                           Vector2D(0.0f, m_config.bullet.homingSpeed),
                                           enemy.bulletDamage * cfg.missileDamageScale,
                                           BulletKind::Homing});
        }
        break;
    }
    }
}

void BehaviorEngine::appendSpread(FireRequests& requests, const Vector2D& origin, int count,
                                  float spread, float speed, float damage)
{
    const Vector2D base(0.0f, speed);
    for (int i = 0; i < count; ++i) {
        float angle = 0.0f;
        if (count > 1) {
            angle = -spread + (2.0f * spread * static_cast<float>(i) / static_cast<float>(count - 1));
        }
        requests.push_back(FireRequest{origin, base.rotated(angle), damage, BulletKind::Normal});
    }
}

void BehaviorEngine::appendCircle(FireRequests& requests, const Vector2D& origin, int count,
                                  float speed, float damage)
{
    if (count <= 0) {
        return;
    }
    const float step = 2.0f * static_cast<float>(M_PI) / static_cast<float>(count);
    for (int i = 0; i < count; ++i) {
        requests.push_back(FireRequest{origin, Vector2D::fromAngle(step * static_cast<float>(i), speed),
                                       damage, BulletKind::Normal});
    }
}

} // namespace Cosmic
