/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/EntityTypes.hpp"

namespace Cosmic {

std::string_view toString(Faction faction)
{
    switch (faction) {
    case Faction::Player:
        return "player";
    case Faction::Enemy:
        return "enemy";
    case Faction::Neutral:
        return "neutral";
    }
    return "unknown";
}

std::string_view toString(EnemyVariant variant)
{
    switch (variant) {
    case EnemyVariant::Basic:
        return "basic";
    case EnemyVariant::Fast:
        return "fast";
    case EnemyVariant::Heavy:
        return "heavy";
    case EnemyVariant::ZigZag:
        return "zigzag";
    case EnemyVariant::Boss:
        return "boss";
    case EnemyVariant::COUNT:
        break;
    }
    return "unknown";
}

std::string_view toString(BulletKind kind)
{
    switch (kind) {
    case BulletKind::Normal:
        return "normal";
    case BulletKind::Homing:
        return "homing";
    case BulletKind::Explosive:
        return "explosive";
    }
    return "unknown";
}

std::string_view toString(PowerUpKind kind)
{
    switch (kind) {
    case PowerUpKind::Health:
        return "health";
    case PowerUpKind::Shield:
        return "shield";
    case PowerUpKind::RapidFire:
        return "rapid_fire";
    case PowerUpKind::MultiShot:
        return "multi_shot";
    case PowerUpKind::ScreenClear:
        return "screen_clear";
    case PowerUpKind::TimeSlow:
        return "time_slow";
    case PowerUpKind::Homing:
        return "homing";
    case PowerUpKind::COUNT:
        break;
    }
    return "unknown";
}

std::optional<EnemyVariant> parseEnemyVariant(std::string_view name)
{
    for (EnemyVariant variant : ALL_ENEMY_VARIANTS) {
        if (toString(variant) == name) {
            return variant;
        }
    }
    return std::nullopt;
}

std::optional<PowerUpKind> parsePowerUpKind(std::string_view name)
{
    for (PowerUpKind kind : ALL_POWERUP_KINDS) {
        if (toString(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

} // namespace Cosmic
