/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WAVE_SPAWNER_HPP
#define WAVE_SPAWNER_HPP

/**
 * @file WaveSpawner.hpp
 * @brief Idle -> Spawning -> Idle scheduler for enemy waves
 *
 * startWave(n) schedules base + (n - 1) * perWave enemies, or a single Boss
 * when n is a multiple of the boss interval. While Spawning, one enemy is
 * added to the EntityStore every spawn delay until the count reaches zero.
 *
 * Regular waves draw the variant from the first WaveTable whose maxWave
 * covers the wave number; waves past the last table reuse it, with one
 * warning logged when such a wave starts. Spawned stats are the base table scaled by the active
 * difficulty.
 */

#include "core/GameConfig.hpp"
#include "entities/EntityData.hpp"
#include <cstdint>
#include <string_view>

namespace Cosmic
{

class EntityStore;
class RandomSource;

enum class SpawnerState : uint8_t
{
    Idle,
    Spawning
};

std::string_view toString(SpawnerState state);

class WaveSpawner
{
public:
    WaveSpawner(EntityStore& store, const GameConfig& config, RandomSource& random);

    /**
     * @brief Schedule a wave
     * @param wave Wave number, 1-based; values below 1 schedule nothing
     * @return Number of enemies scheduled; 0 leaves the spawner Idle
     */
    int startWave(int wave);

    /**
     * @brief Advance the spawn timer and spawn when it elapses
     * @return Number of enemies spawned this call (0 or 1)
     */
    int update(float deltaTime);

    /**
     * @brief Stop spawning and forget the current wave
     */
    void reset();

    /**
     * @brief Build an enemy of a variant with difficulty-scaled stats
     */
    [[nodiscard]] Enemy createEnemy(EnemyVariant variant, const Vector2D& position) const;

    /**
     * @brief Weighted variant pick for a regular wave
     */
    [[nodiscard]] EnemyVariant pickVariant(int wave);

    /**
     * @brief Table used for a wave, falling back to the last one
     * @return nullptr only when no tables are configured
     */
    [[nodiscard]] const WaveTable* tableForWave(int wave) const;

    [[nodiscard]] int enemiesForWave(int wave) const;
    [[nodiscard]] bool isBossWave(int wave) const;

    [[nodiscard]] SpawnerState getState() const { return m_state; }
    [[nodiscard]] bool isSpawning() const { return m_state == SpawnerState::Spawning; }
    [[nodiscard]] int getRemaining() const { return m_remaining; }
    [[nodiscard]] int getCurrentWave() const { return m_wave; }
    [[nodiscard]] float getSpawnDelay() const;

private:
    void spawnOne();

    EntityStore& m_store;
    const GameConfig& m_config;
    RandomSource& m_random;

    SpawnerState m_state{SpawnerState::Idle};
    int m_wave{0};
    int m_remaining{0};
    float m_spawnTimer{0.0f};
};

} // namespace Cosmic

#endif // WAVE_SPAWNER_HPP
