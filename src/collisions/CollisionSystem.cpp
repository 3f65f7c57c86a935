/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/CollisionSystem.hpp"
#include "core/Logger.hpp"
#include "managers/EntityStore.hpp"
#include <string>

namespace Cosmic {

std::string_view toString(CollisionKind kind)
{
    switch (kind) {
    case CollisionKind::PlayerBulletEnemy:
        return "player_bullet_enemy";
    case CollisionKind::EnemyBulletPlayer:
        return "enemy_bullet_player";
    case CollisionKind::PlayerEnemy:
        return "player_enemy";
    case CollisionKind::PlayerPowerUp:
        return "player_powerup";
    }
    return "unknown";
}

bool CollisionSystem::collides(const Body& a, const Body& b)
{
    return a.bounds().intersects(b.bounds());
}

size_t CollisionSystem::detect(const EntityStore& store, CollisionBatch& batch) const
{
    const size_t before = batch.size();
    const Player& player = store.getPlayer();
    const bool playerActive = player.alive && player.id != INVALID_ENTITY_ID;
    const auto& enemies = store.getEnemies();

    // 1. Player bullets x enemies, at most one pair per bullet
    for (const auto& bullet : store.getBullets()) {
        if (!bullet.alive || bullet.faction != Faction::Player) {
            continue;
        }
        for (const auto& enemy : enemies) {
            if (enemy.alive && collides(bullet, enemy)) {
                batch.push_back({bullet.id, enemy.id, CollisionKind::PlayerBulletEnemy});
                break;
            }
        }
    }

    if (playerActive) {
        // 2. Enemy bullets x player
        for (const auto& bullet : store.getBullets()) {
            if (bullet.alive && bullet.faction == Faction::Enemy && collides(bullet, player)) {
                batch.push_back({bullet.id, player.id, CollisionKind::EnemyBulletPlayer});
            }
        }

        // 3. Player x enemies
        for (const auto& enemy : enemies) {
            if (enemy.alive && collides(player, enemy)) {
                batch.push_back({player.id, enemy.id, CollisionKind::PlayerEnemy});
            }
        }

        // 4. Player x power-ups
        for (const auto& powerUp : store.getPowerUps()) {
            if (powerUp.alive && collides(player, powerUp)) {
                batch.push_back({player.id, powerUp.id, CollisionKind::PlayerPowerUp});
            }
        }
    }

    const size_t found = batch.size() - before;
    if (found > 0) {
        COLLISION_DEBUG("Detected " + std::to_string(found) + " collisions");
    }
    return found;
}

} // namespace Cosmic
