/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/WaveSpawner.hpp"
#include "core/Logger.hpp"
#include "core/RandomSource.hpp"
#include "managers/EntityStore.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>

namespace Cosmic
{

namespace
{

// Multipliers such as 1.3f are not exact in binary; keep 50 * 1.3 at 65
constexpr float FLOOR_EPSILON = 1e-4f;

float scaledFloor(float base, float mult)
{
    return std::floor(base * mult + FLOOR_EPSILON);
}

} // namespace

std::string_view toString(SpawnerState state)
{
    return state == SpawnerState::Spawning ? "Spawning" : "Idle";
}

WaveSpawner::WaveSpawner(EntityStore& store, const GameConfig& config, RandomSource& random)
    : m_store(store), m_config(config), m_random(random)
{
}

bool WaveSpawner::isBossWave(int wave) const
{
    const int interval = m_config.wave.bossInterval;
    return wave >= 1 && interval > 0 && wave % interval == 0;
}

int WaveSpawner::enemiesForWave(int wave) const
{
    if (wave < 1) {
        return 0;
    }
    if (isBossWave(wave)) {
        return 1;
    }
    return std::max(0, m_config.wave.baseEnemies + (wave - 1) * m_config.wave.enemiesPerWave);
}

float WaveSpawner::getSpawnDelay() const
{
    return m_config.wave.spawnDelay;
}

int WaveSpawner::startWave(int wave)
{
    m_wave = wave;
    m_remaining = enemiesForWave(wave);
    m_spawnTimer = 0.0f;

    if (m_remaining <= 0) {
        m_remaining = 0;
        m_state = SpawnerState::Idle;
        SPAWN_WARN("Wave " + std::to_string(wave) + " schedules no enemies, staying idle");
        return 0;
    }

    const auto& tables = m_config.wave.tables;
    if (!isBossWave(wave) && !tables.empty() && wave > tables.back().maxWave) {
        SPAWN_WARN("No wave table for wave " + std::to_string(wave) + ", using the table for wave " +
                   std::to_string(tables.back().maxWave));
    }

    m_state = SpawnerState::Spawning;
    SPAWN_INFO("Starting wave " + std::to_string(wave) + " with " + std::to_string(m_remaining) +
               (isBossWave(wave) ? " enemy (boss wave)" : " enemies"));
    return m_remaining;
}

int WaveSpawner::update(float deltaTime)
{
    if (m_state != SpawnerState::Spawning) {
        return 0;
    }

    m_spawnTimer += deltaTime;
    if (m_spawnTimer < getSpawnDelay()) {
        return 0;
    }

    spawnOne();
    m_spawnTimer = 0.0f;
    --m_remaining;

    if (m_remaining <= 0) {
        m_remaining = 0;
        m_state = SpawnerState::Idle;
        SPAWN_DEBUG("Wave " + std::to_string(m_wave) + " fully spawned");
    }
    return 1;
}

void WaveSpawner::reset()
{
    m_state = SpawnerState::Idle;
    m_wave = 0;
    m_remaining = 0;
    m_spawnTimer = 0.0f;
}

void WaveSpawner::spawnOne()
{
    const WaveConfig& cfg = m_config.wave;

    if (isBossWave(m_wave)) {
        const Vector2D position(m_config.field.width * 0.5f, cfg.bossSpawnY);
        m_store.addEnemy(createEnemy(EnemyVariant::Boss, position));
        SPAWN_INFO("Boss spawned for wave " + std::to_string(m_wave));
        return;
    }

    const EnemyVariant variant = pickVariant(m_wave);
    const int margin = static_cast<int>(cfg.spawnMarginX);
    const float x = static_cast<float>(
        m_random.uniformInt(margin, static_cast<int>(m_config.field.width) - margin));
    const float y = static_cast<float>(
        m_random.uniformInt(static_cast<int>(cfg.spawnMinY), static_cast<int>(cfg.spawnMaxY)));

    m_store.addEnemy(createEnemy(variant, Vector2D(x, y)));
    SPAWN_DEBUG("Spawned " + std::string(toString(variant)) + " at (" + std::to_string(x) + ", " +
                std::to_string(y) + ")");
}

const WaveTable* WaveSpawner::tableForWave(int wave) const
{
    const auto& tables = m_config.wave.tables;
    if (tables.empty()) {
        return nullptr;
    }

    for (const auto& table : tables) {
        if (wave <= table.maxWave) {
            return &table;
        }
    }

    return &tables.back();
}

EnemyVariant WaveSpawner::pickVariant(int wave)
{
    const WaveTable* table = tableForWave(wave);
    if (!table) {
        SPAWN_ERROR("No wave tables configured, spawning basic enemy");
        return EnemyVariant::Basic;
    }

    const int total = std::accumulate(table->weights.begin(), table->weights.end(), 0);
    if (total <= 0) {
        SPAWN_ERROR("Wave table for wave " + std::to_string(table->maxWave) +
                    " has no weight, spawning basic enemy");
        return EnemyVariant::Basic;
    }

    int roll = m_random.uniformInt(1, total);
    for (EnemyVariant variant : ALL_ENEMY_VARIANTS) {
        roll -= table->weights[toIndex(variant)];
        if (roll <= 0) {
            return variant;
        }
    }
    return EnemyVariant::Basic;
}

Enemy WaveSpawner::createEnemy(EnemyVariant variant, const Vector2D& position) const
{
    const EnemyStats& stats = m_config.enemyStats(variant);
    const DifficultyProfile& difficulty = m_config.activeDifficulty();

    Enemy enemy;
    enemy.variant = variant;
    enemy.position = position;
    enemy.size = stats.size;
    enemy.faction = Faction::Enemy;
    enemy.speed = stats.speed * difficulty.enemySpeedMult;
    enemy.maxHealth = std::max(1.0f, scaledFloor(stats.health, difficulty.enemyHealthMult));
    enemy.health = enemy.maxHealth;
    enemy.scoreValue = static_cast<int>(scaledFloor(static_cast<float>(stats.score), difficulty.scoreMult));
    enemy.fireRate = stats.fireRate;
    enemy.bulletDamage = stats.bulletDamage;
    enemy.velocity = Vector2D(0.0f, enemy.speed);
    enemy.behavior = makeBehaviorState(variant, position);
    return enemy;
}

} // namespace Cosmic
