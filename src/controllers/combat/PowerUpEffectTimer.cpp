/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/combat/PowerUpEffectTimer.hpp"
#include "core/Logger.hpp"
#include "managers/EntityStore.hpp"
#include <algorithm>
#include <string>

namespace Cosmic
{

PowerUpEffectTimer::PowerUpEffectTimer(EntityStore& store, EventQueue& events,
                                       const GameConfig& config)
    : ControllerBase(store, events), m_config(config)
{
}

void PowerUpEffectTimer::update(float deltaTime)
{
    auto& active = getStore().getPlayer().activePowerUps;

    for (auto it = active.begin(); it != active.end();) {
        it->second -= deltaTime;
        if (it->second > 0.0f) {
            ++it;
            continue;
        }

        const PowerUpKind kind = it->first;
        it = active.erase(it);
        emit(PowerUpExpired{kind});
        POWERUP_INFO("Power-up expired: " + std::string(toString(kind)));
    }
}

void PowerUpEffectTimer::apply(PowerUpKind kind)
{
    Player& player = getStore().getPlayer();
    const PowerUpConfig& cfg = m_config.powerUp;

    switch (kind) {
    case PowerUpKind::Health: {
        const float before = player.health;
        player.health = std::min(player.maxHealth, player.health + cfg.healAmount);
        POWERUP_INFO("Health restored: " + std::to_string(before) + " -> " +
                     std::to_string(player.health));
        return;
    }

    case PowerUpKind::ScreenClear: {
        const size_t destroyed = clearScreen();
        POWERUP_INFO("Screen clear destroyed " + std::to_string(destroyed) + " enemies");
        return;
    }

    case PowerUpKind::Shield:
        player.invulnerableTimer = cfg.duration;
        break;

    case PowerUpKind::RapidFire:
    case PowerUpKind::MultiShot:
    case PowerUpKind::TimeSlow:
    case PowerUpKind::Homing:
        break;

    case PowerUpKind::COUNT:
        POWERUP_ERROR("Invalid power-up kind");
        return;
    }

    // Re-collecting resets the window to the full duration
    player.activePowerUps[kind] = cfg.duration;
    POWERUP_INFO("Power-up applied: " + std::string(toString(kind)));
}

size_t PowerUpEffectTimer::clearScreen()
{
    size_t destroyed = 0;
    for (auto& enemy : getStore().getEnemies()) {
        if (!enemy.alive) {
            continue;
        }
        enemy.health = 0.0f;
        enemy.alive = false;
        emit(ExplosionRequested{enemy.position.getX(), enemy.position.getY(),
                                m_config.particle.blastIntensity});
        emit(EnemyDestroyed{enemy.position.getX(), enemy.position.getY(), 0, enemy.variant});
        ++destroyed;
    }
    return destroyed;
}

} // namespace Cosmic
