/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_CONFIG_HPP
#define GAME_CONFIG_HPP

/**
 * @file GameConfig.hpp
 * @brief Immutable tuning data for one simulation session
 *
 * Every table the simulation reads (enemy stats, difficulty multipliers,
 * wave weights, power-up weights, capacities) lives here. A GameConfig is
 * built once, optionally overlaid from JSON by ConfigLoader, and then passed
 * by const reference into the systems that need it.
 */

#include "ai/BehaviorConfig.hpp"
#include "entities/EntityTypes.hpp"
#include "utils/Vector2D.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace Cosmic
{

enum class Difficulty : uint8_t
{
    Cadet = 0,
    Pilot,
    Commander,
    Ace,
    Legend,
    COUNT
};

inline constexpr size_t DIFFICULTY_COUNT = static_cast<size_t>(Difficulty::COUNT);

std::string_view toString(Difficulty difficulty);
std::optional<Difficulty> parseDifficulty(std::string_view name);

struct FieldConfig
{
    float width = 1200.0f;
    float height = 800.0f;
    float pruneMargin = 50.0f;                    // Entities further outside than this are removed
};

struct PlayerConfig
{
    float speed = 5.0f;
    float maxHealth = 100.0f;
    float fireRate = 10.0f;                       // Shots per second
    Vector2D size{40.0f, 40.0f};
    float invulnerabilityTime = 2.0f;             // Seconds after taking a hit
    float spawnBottomOffset = 100.0f;             // Spawns centered, this far above the bottom edge

    // Movement smoothing
    float acceleration = 0.5f;                    // Fraction of (target - velocity) applied per tick
    float friction = 0.8f;
    float diagonalScale = 0.707f;
    float rapidFireSpeedMult = 1.2f;
    float shieldSpeedMult = 0.8f;

    // Shooting
    float muzzleOffset = 20.0f;                   // Bullets spawn this far above the player center
    float multiShotAngle = 0.3f;                  // Radians between multi-shot barrels
    float multiShotSpread = 20.0f;                // x offset / vx per unit sin(angle)
    float rapidFireMult = 2.0f;

    // Special ability
    float specialCooldown = 15.0f;
    float timeFreezeDuration = 3.0f;

    float contactDamage = 10.0f;                  // Body collision with an enemy
};

struct BulletConfig
{
    float speed = 8.0f;
    Vector2D size{4.0f, 10.0f};
    float damage = 1.0f;
    float maxLifetime = 5.0f;
    size_t maxPerFaction = 100;                   // Oldest bullet of the faction is evicted beyond this

    // Homing
    float homingSpeed = 6.0f;
    float homingTurnRate = 0.1f;                  // Radians per reference tick
    float homingRange = 200.0f;
};

struct EnemyStats
{
    float speed;
    float health;
    int score;
    Vector2D size;
    float fireRate;                               // Shots per second
    float bulletDamage = 1.0f;
};

struct DifficultyProfile
{
    float enemySpeedMult;
    float enemyHealthMult;
    float playerDamageMult;
    float scoreMult;
    float playerHealthMult = 1.0f;
};

/**
 * Enemy weights used for every wave number up to and including maxWave.
 * Weights are indexed by EnemyVariant; Boss is never drawn from a table.
 */
struct WaveTable
{
    int maxWave;
    std::array<int, ENEMY_VARIANT_COUNT> weights;
};

struct WaveConfig
{
    int baseEnemies = 5;
    int enemiesPerWave = 2;                       // Added for each wave after the first
    int bossInterval = 5;
    float spawnDelay = 1.0f;                      // Seconds between spawns, same on every difficulty
    float spawnMarginX = 50.0f;
    float spawnMinY = -100.0f;
    float spawnMaxY = -50.0f;
    float bossSpawnY = -50.0f;

    //                     basic fast heavy zigzag boss
    std::vector<WaveTable> tables{
        {2,  {100, 0,  0,  0,  0}},
        {5,  {70,  30, 0,  0,  0}},
        {10, {50,  30, 20, 0,  0}},
        {20, {40,  30, 20, 10, 0}},
    };
};

/**
 * A level is a run of waves; clearing the last one completes the level.
 * Level n holds baseWaves + (n - 1) * wavesPerLevel waves.
 */
struct LevelConfig
{
    int startLevel = 1;
    int maxLevel = 20;
    int baseWaves = 10;
    int wavesPerLevel = 2;                        // Added for each level after the first
};

struct PowerUpConfig
{
    float dropChance = 0.15f;
    float duration = 10.0f;                       // Timed effects
    float descentSpeed = 2.0f;
    float maxAge = 15.0f;
    Vector2D size{24.0f, 24.0f};
    float healAmount = 25.0f;
    float timeSlowScale = 0.5f;                   // Enemy-side time scale while TimeSlow is active

    //                                        health shield rapid multi clear slow homing
    std::array<int, POWERUP_KIND_COUNT> weights{25,    20,    20,   15,   10,   7,   3};
};

struct ParticleConfig
{
    size_t maxParticles = 500;
    int hitIntensity = 10;                        // Enemy destroyed by a bullet
    int blastIntensity = 15;                      // Contact kills and screen clear
    float minSpeed = 50.0f;                       // Units per second
    float maxSpeed = 200.0f;
    float positionJitter = 5.0f;
    float minSize = 2.0f;
    float maxSize = 6.0f;
    float minLifetime = 0.5f;
    float maxLifetime = 1.5f;
};

struct GameConfig
{
    FieldConfig field;
    PlayerConfig player;
    BulletConfig bullet;
    BehaviorConfig behavior;
    WaveConfig wave;
    LevelConfig level;
    PowerUpConfig powerUp;
    ParticleConfig particle;

    std::array<EnemyStats, ENEMY_VARIANT_COUNT> enemies{{
        // speed health score  size            fire rate
        {2.0f, 1.0f,  100,  {30.0f, 30.0f}, 1.0f},    // Basic
        {4.0f, 1.0f,  150,  {25.0f, 25.0f}, 1.5f},    // Fast
        {1.0f, 5.0f,  300,  {45.0f, 45.0f}, 0.5f},    // Heavy
        {3.0f, 2.0f,  200,  {35.0f, 35.0f}, 0.8f},    // ZigZag
        {1.5f, 50.0f, 1000, {80.0f, 80.0f}, 3.0f},    // Boss
    }};

    std::array<DifficultyProfile, DIFFICULTY_COUNT> difficulties{{
        // speed health damage score player hp
        {0.7f,  0.8f, 1.5f, 1.0f, 1.2f},              // Cadet
        {0.85f, 0.9f, 1.2f, 1.2f, 1.2f},              // Pilot
        {1.0f,  1.0f, 1.0f, 1.5f, 1.0f},              // Commander
        {1.2f,  1.3f, 0.8f, 2.0f, 1.0f},              // Ace
        {1.5f,  1.5f, 0.6f, 3.0f, 1.0f},              // Legend
    }};

    Difficulty difficulty = Difficulty::Commander;

    float referenceTickRate = 60.0f;              // Velocities are expressed per 1/60 s

    [[nodiscard]] const DifficultyProfile& activeDifficulty() const
    {
        return difficulties[static_cast<size_t>(difficulty)];
    }

    [[nodiscard]] const EnemyStats& enemyStats(EnemyVariant variant) const
    {
        return enemies[toIndex(variant)];
    }

    [[nodiscard]] int wavesForLevel(int levelNumber) const
    {
        return level.baseWaves + (std::max(levelNumber, 1) - 1) * level.wavesPerLevel;
    }

    // Player max health after the difficulty bonus
    [[nodiscard]] float playerMaxHealth() const
    {
        return player.maxHealth * activeDifficulty().playerHealthMult;
    }
};

} // namespace Cosmic

#endif // GAME_CONFIG_HPP
