/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_STORE_HPP
#define ENTITY_STORE_HPP

/**
 * @file EntityStore.hpp
 * @brief Owner of every live entity in a session
 *
 * EntityStore is a pure data holder: the player, enemies, bullets and
 * power-ups of the running session live here in insertion order. Systems
 * hold references only for the duration of one pass and look entities up
 * by EntityID otherwise.
 *
 * Removal is two-phase. Systems clear Body::alive; removeDead() and
 * prune() erase in a single pass afterwards, so nothing is erased while a
 * system iterates a collection.
 *
 * Bullets are capped per faction. Adding beyond the cap evicts the oldest
 * bullet of the same faction (FIFO backpressure).
 */

#include "core/GameConfig.hpp"
#include "entities/EntityData.hpp"
#include <cstddef>
#include <vector>

namespace Cosmic {

struct PruneResult {
    size_t bullets{0};
    size_t enemies{0};
    size_t powerUps{0};

    [[nodiscard]] size_t total() const noexcept { return bullets + enemies + powerUps; }
};

class EntityStore {
public:
    explicit EntityStore(size_t maxBulletsPerFaction = 100);

    // --- Player ---

    /**
     * @brief Replace the player, assigning a fresh id
     * @return Reference to the stored player
     */
    Player& spawnPlayer(Player player);
    [[nodiscard]] Player& getPlayer() { return m_player; }
    [[nodiscard]] const Player& getPlayer() const { return m_player; }

    // --- Insertion (ids are assigned here, any id on the argument is ignored) ---

    EntityID addEnemy(Enemy enemy);
    EntityID addBullet(Bullet bullet);
    EntityID addPowerUp(PowerUp powerUp);

    // --- Lookup (nullptr when absent or no longer alive) ---

    [[nodiscard]] Enemy* findEnemy(EntityID id);
    [[nodiscard]] const Enemy* findEnemy(EntityID id) const;
    [[nodiscard]] Bullet* findBullet(EntityID id);
    [[nodiscard]] PowerUp* findPowerUp(EntityID id);

    // --- Collections ---

    [[nodiscard]] std::vector<Enemy>& getEnemies() { return m_enemies; }
    [[nodiscard]] const std::vector<Enemy>& getEnemies() const { return m_enemies; }
    [[nodiscard]] std::vector<Bullet>& getBullets() { return m_bullets; }
    [[nodiscard]] const std::vector<Bullet>& getBullets() const { return m_bullets; }
    [[nodiscard]] std::vector<PowerUp>& getPowerUps() { return m_powerUps; }
    [[nodiscard]] const std::vector<PowerUp>& getPowerUps() const { return m_powerUps; }

    [[nodiscard]] size_t countBullets(Faction faction) const;
    [[nodiscard]] size_t countLiveEnemies() const;
    [[nodiscard]] size_t getMaxBulletsPerFaction() const { return m_maxBulletsPerFaction; }
    [[nodiscard]] size_t getEvictedBulletCount() const { return m_evictedBullets; }

    // --- Removal ---

    /**
     * @brief Erase every entity whose alive flag was cleared
     * @return Number of entities erased
     */
    size_t removeDead();

    /**
     * @brief Remove expired and out-of-field entities
     *
     * Bullets: age past max lifetime, or more than the margin outside the
     * field on any side. Enemies: more than the margin below the field or
     * beyond either side (they enter from above). Power-ups: more than the
     * margin below the field or older than maxPowerUpAge. Dead entities are
     * erased as well.
     */
    PruneResult prune(const FieldConfig& field, float maxPowerUpAge);

    /**
     * @brief Drop all collections and restart id numbering
     */
    void clear();

private:
    EntityID nextId() { return m_nextId++; }
    void evictOldestBullet(Faction faction);

    Player m_player;
    std::vector<Enemy> m_enemies;
    std::vector<Bullet> m_bullets;
    std::vector<PowerUp> m_powerUps;

    size_t m_maxBulletsPerFaction;
    size_t m_evictedBullets{0};
    EntityID m_nextId{1};
};

} // namespace Cosmic

#endif // ENTITY_STORE_HPP
