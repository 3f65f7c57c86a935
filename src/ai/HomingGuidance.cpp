/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/HomingGuidance.hpp"
#include "core/Logger.hpp"
#include "managers/EntityStore.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace Cosmic
{

void HomingGuidance::update(EntityStore& store, float playerDt, float enemyDt) const
{
    for (auto& bullet : store.getBullets()) {
        if (!bullet.alive || !bullet.isHoming()) {
            continue;
        }
        const float dt = (bullet.faction == Faction::Player) ? playerDt : enemyDt;
        steer(bullet, store, dt);
    }
}

bool HomingGuidance::steer(Bullet& bullet, const EntityStore& store, float dt) const
{
    std::optional<Vector2D> targetPos;

    if (bullet.targetId != INVALID_ENTITY_ID) {
        targetPos = lookupTarget(bullet, store);
        if (!targetPos) {
            BEHAVIOR_DEBUG("Homing bullet " + std::to_string(bullet.id) + " lost target " +
                           std::to_string(bullet.targetId));
            bullet.targetId = INVALID_ENTITY_ID;
            return false;
        }
    } else {
        bullet.targetId = acquireTarget(bullet, store);
        if (bullet.targetId == INVALID_ENTITY_ID) {
            return false;
        }
        targetPos = lookupTarget(bullet, store);
        if (!targetPos) {
            bullet.targetId = INVALID_ENTITY_ID;
            return false;
        }
    }

    const Vector2D toTarget = *targetPos - bullet.position;
    const float maxTurn = bullet.turnRate * dt * m_config.referenceTickRate;
    turnToward(bullet.velocity, toTarget.angle(), maxTurn);
    return true;
}

EntityID HomingGuidance::acquireTarget(const Bullet& bullet, const EntityStore& store) const
{
    const float rangeSq = bullet.homingRange * bullet.homingRange;

    if (bullet.faction == Faction::Enemy) {
        const Player& player = store.getPlayer();
        if (player.alive && player.id != INVALID_ENTITY_ID &&
            Vector2D::distanceSquared(player.position, bullet.position) < rangeSq) {
            return player.id;
        }
        return INVALID_ENTITY_ID;
    }

    EntityID best = INVALID_ENTITY_ID;
    float bestDistSq = std::numeric_limits<float>::max();
    for (const auto& enemy : store.getEnemies()) {
        if (!enemy.alive) {
            continue;
        }
        const float distSq = Vector2D::distanceSquared(enemy.position, bullet.position);
        if (distSq < rangeSq && distSq < bestDistSq) {
            bestDistSq = distSq;
            best = enemy.id;
        }
    }
    return best;
}

std::optional<Vector2D> HomingGuidance::lookupTarget(const Bullet& bullet,
                                                     const EntityStore& store) const
{
    if (bullet.faction == Faction::Enemy) {
        const Player& player = store.getPlayer();
        if (player.alive && player.id == bullet.targetId) {
            return player.position;
        }
        return std::nullopt;
    }

    if (const Enemy* enemy = store.findEnemy(bullet.targetId)) {
        return enemy->position;
    }
    return std::nullopt;
}

float HomingGuidance::normalizeAngle(float angle)
{
    constexpr float pi = static_cast<float>(M_PI);
    while (angle > pi) {
        angle -= 2.0f * pi;
    }
    while (angle <= -pi) {
        angle += 2.0f * pi;
    }
    return angle;
}

float HomingGuidance::turnToward(Vector2D& velocity, float targetBearing, float maxTurn)
{
    const float speed = velocity.length();
    if (speed <= 0.0f || maxTurn <= 0.0f) {
        return 0.0f;
    }

    const float current = velocity.angle();
    const float diff = normalizeAngle(targetBearing - current);
    const float turn = std::clamp(diff, -maxTurn, maxTurn);

    velocity = Vector2D::fromAngle(current + turn, speed);
    return turn;
}

} // namespace Cosmic
