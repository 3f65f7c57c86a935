/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_TYPES_HPP
#define ENTITY_TYPES_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace Cosmic {

using EntityID = uint64_t;
constexpr EntityID INVALID_ENTITY_ID = 0;

/**
 * @brief Ownership tag used to select collision pairs and homing targets
 */
enum class Faction : uint8_t {
    Player = 0,
    Enemy = 1,
    Neutral = 2
};

enum class EnemyVariant : uint8_t {
    Basic = 0,
    Fast = 1,
    Heavy = 2,
    ZigZag = 3,
    Boss = 4,
    COUNT
};

enum class BulletKind : uint8_t {
    Normal = 0,
    Homing = 1,
    Explosive = 2
};

enum class PowerUpKind : uint8_t {
    Health = 0,
    Shield = 1,
    RapidFire = 2,
    MultiShot = 3,
    ScreenClear = 4,
    TimeSlow = 5,
    Homing = 6,
    COUNT
};

constexpr size_t ENEMY_VARIANT_COUNT = static_cast<size_t>(EnemyVariant::COUNT);
constexpr size_t POWERUP_KIND_COUNT = static_cast<size_t>(PowerUpKind::COUNT);

constexpr std::array<EnemyVariant, ENEMY_VARIANT_COUNT> ALL_ENEMY_VARIANTS{
    EnemyVariant::Basic, EnemyVariant::Fast, EnemyVariant::Heavy,
    EnemyVariant::ZigZag, EnemyVariant::Boss};

constexpr std::array<PowerUpKind, POWERUP_KIND_COUNT> ALL_POWERUP_KINDS{
    PowerUpKind::Health, PowerUpKind::Shield, PowerUpKind::RapidFire,
    PowerUpKind::MultiShot, PowerUpKind::ScreenClear, PowerUpKind::TimeSlow,
    PowerUpKind::Homing};

constexpr size_t toIndex(EnemyVariant variant) noexcept {
    return static_cast<size_t>(variant);
}

constexpr size_t toIndex(PowerUpKind kind) noexcept {
    return static_cast<size_t>(kind);
}

/// Timed kinds hold a flag + duration; Health and ScreenClear are instant
constexpr bool isTimedPowerUp(PowerUpKind kind) noexcept {
    return kind != PowerUpKind::Health && kind != PowerUpKind::ScreenClear;
}

// Lower-case identifiers shared by config files, replay sources and logs
std::string_view toString(Faction faction);
std::string_view toString(EnemyVariant variant);
std::string_view toString(BulletKind kind);
std::string_view toString(PowerUpKind kind);

// Boundary parsers; unknown names yield std::nullopt and are never coerced
std::optional<EnemyVariant> parseEnemyVariant(std::string_view name);
std::optional<PowerUpKind> parsePowerUpKind(std::string_view name);

} // namespace Cosmic

#endif // ENTITY_TYPES_HPP
