/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_SESSION_HPP
#define GAME_SESSION_HPP

/**
 * @file GameSession.hpp
 * @brief Fixed-step orchestrator for one play session
 *
 * GameSession owns one of every simulation component, the entity store,
 * the output event queue and the single RandomSource. tick() runs the whole
 * pipeline for one step:
 *
 *   input -> player actions -> enemy behavior -> movement -> homing
 *         -> collision detection -> combat resolution -> pruning
 *         -> wave spawning -> power-up timers -> particles
 *
 * Clearing the last wave of the current level emits LevelCompleted and
 * pauses the session until startNextLevel(); waves do not advance past the
 * level's wave count.
 *
 * Identical config, seed, input script and dt stream produce identical
 * event streams.
 *
 * Not thread-safe. The host calls tick() and drainEvents() from one thread.
 */

#include "ai/BehaviorEngine.hpp"
#include "ai/HomingGuidance.hpp"
#include "collisions/CollisionSystem.hpp"
#include "controllers/combat/CombatResolver.hpp"
#include "controllers/combat/PowerUpEffectTimer.hpp"
#include "core/GameConfig.hpp"
#include "core/InputIntent.hpp"
#include "core/MovementIntegrator.hpp"
#include "core/RandomSource.hpp"
#include "events/SimEvent.hpp"
#include "managers/EntityStore.hpp"
#include "managers/ParticleManager.hpp"
#include "managers/WaveSpawner.hpp"
#include <cstdint>
#include <string_view>

namespace Cosmic
{

class GameSession
{
public:
    explicit GameSession(const GameConfig& config = GameConfig{},
                         uint32_t seed = SeededRandom::DEFAULT_SEED);

    // Components hold references into the session
    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    /**
     * @brief Advance the simulation by one fixed step
     * @param input Player intent; sanitised before use
     * @param deltaTime Step in seconds, must be finite and positive
     * @return false when the tick was skipped (game over, level complete or invalid step)
     */
    bool tick(const InputIntent& input, float deltaTime);

    /**
     * @brief Hand over every event queued since the last drain
     */
    [[nodiscard]] EventQueue drainEvents();

    /**
     * @brief Restart the current level at wave 1 with a fresh player and the original seed
     * @note Call between ticks only
     */
    void reset();

    /**
     * @brief Leave a completed level and start the next one from wave 1
     *
     * Score, player and entities start fresh, as after reset(). The level
     * number stops increasing at LevelConfig::maxLevel.
     *
     * @return false if the current level is not complete
     */
    bool startNextLevel();

    /**
     * @brief Place a power-up from an external source (replay, debug console)
     * @param kind Lower-case power-up name, e.g. "rapid_fire"
     * @return false for unknown kinds; the store is left untouched
     */
    bool injectPowerUp(std::string_view kind, float x, float y);

    [[nodiscard]] const EntityStore& getStore() const { return m_store; }
    [[nodiscard]] EntityStore& getStore() { return m_store; }
    [[nodiscard]] const ParticleManager& getParticles() const { return m_particles; }
    [[nodiscard]] const GameConfig& getConfig() const { return m_config; }
    [[nodiscard]] const EventQueue& getPendingEvents() const { return m_events; }

    [[nodiscard]] int getScore() const { return m_combat.getScore(); }
    [[nodiscard]] int getWave() const { return m_wave; }
    [[nodiscard]] int getLevel() const { return m_level; }
    [[nodiscard]] bool isLevelComplete() const { return m_levelComplete; }
    [[nodiscard]] bool isGameOver() const { return m_gameOver; }
    [[nodiscard]] uint64_t getTickCount() const { return m_tickCount; }

    /**
     * @brief Non-finite components become 0, then both axes clamp to [-1, 1]
     */
    [[nodiscard]] static Vector2D sanitizeMoveVector(const Vector2D& moveVector);

private:
    void spawnPlayer();
    void handleSpecial(bool pressed);
    void handleFire(bool held);
    void spawnEnemyBullets(const FireRequests& requests);
    void checkWaveCompletion();
    void startWave(int wave);
    void forwardExplosions(size_t firstEvent);
    void completeLevel();
    void triggerGameOver();

    [[nodiscard]] Bullet makeBullet(Faction faction, const Vector2D& position,
                                    const Vector2D& velocity, float damage,
                                    BulletKind kind) const;

    // Declaration order is construction order; components bind to the members above them
    const GameConfig m_config;
    const uint32_t m_seed;
    SeededRandom m_random;
    EntityStore m_store;
    EventQueue m_events;

    MovementIntegrator m_movement;
    BehaviorEngine m_behavior;
    HomingGuidance m_homing;
    CollisionSystem m_collisions;
    PowerUpEffectTimer m_powerUpTimer;
    CombatResolver m_combat;
    WaveSpawner m_spawner;
    ParticleManager m_particles;

    FireRequests m_fireRequests;
    CollisionBatch m_collisionBatch;

    int m_level{1};
    int m_wave{0};
    bool m_levelComplete{false};
    bool m_gameOver{false};
    uint64_t m_tickCount{0};
};

} // namespace Cosmic

#endif // GAME_SESSION_HPP
