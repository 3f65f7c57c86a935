/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/EntityStore.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <string>

namespace Cosmic {

namespace {

// Works for const and mutable collections alike
template <typename Container>
auto findAlive(Container& items, EntityID id) -> decltype(&items.front())
{
    if (id == INVALID_ENTITY_ID) {
        return nullptr;
    }
    auto it = std::find_if(items.begin(), items.end(),
                           [id](const auto& item) { return item.id == id; });
    return (it != items.end() && it->alive) ? &*it : nullptr;
}

bool outsideField(const Vector2D& pos, const FieldConfig& field)
{
    return pos.getX() < -field.pruneMargin ||
           pos.getX() > field.width + field.pruneMargin ||
           pos.getY() < -field.pruneMargin ||
           pos.getY() > field.height + field.pruneMargin;
}

} // namespace

EntityStore::EntityStore(size_t maxBulletsPerFaction)
    : m_maxBulletsPerFaction(maxBulletsPerFaction)
{
}

Player& EntityStore::spawnPlayer(Player player)
{
    m_player = std::move(player);
    m_player.id = nextId();
    m_player.faction = Faction::Player;
    m_player.alive = true;
    return m_player;
}

EntityID EntityStore::addEnemy(Enemy enemy)
{
    enemy.id = nextId();
    enemy.faction = Faction::Enemy;
    enemy.alive = true;
    m_enemies.push_back(std::move(enemy));
    return m_enemies.back().id;
}

EntityID EntityStore::addBullet(Bullet bullet)
{
    if (m_maxBulletsPerFaction == 0) {
        ENTITY_WARN("Bullet capacity is zero, bullet dropped");
        return INVALID_ENTITY_ID;
    }

    while (countBullets(bullet.faction) >= m_maxBulletsPerFaction) {
        evictOldestBullet(bullet.faction);
    }

    bullet.id = nextId();
    bullet.alive = true;
    m_bullets.push_back(bullet);
    return bullet.id;
}

EntityID EntityStore::addPowerUp(PowerUp powerUp)
{
    powerUp.id = nextId();
    powerUp.faction = Faction::Neutral;
    powerUp.alive = true;
    m_powerUps.push_back(powerUp);
    return powerUp.id;
}

Enemy* EntityStore::findEnemy(EntityID id)
{
    return findAlive(m_enemies, id);
}

const Enemy* EntityStore::findEnemy(EntityID id) const
{
    return findAlive(m_enemies, id);
}

Bullet* EntityStore::findBullet(EntityID id)
{
    return findAlive(m_bullets, id);
}

PowerUp* EntityStore::findPowerUp(EntityID id)
{
    return findAlive(m_powerUps, id);
}

size_t EntityStore::countBullets(Faction faction) const
{
    return static_cast<size_t>(std::count_if(
        m_bullets.begin(), m_bullets.end(),
        [faction](const Bullet& b) { return b.alive && b.faction == faction; }));
}

size_t EntityStore::countLiveEnemies() const
{
    return static_cast<size_t>(std::count_if(
        m_enemies.begin(), m_enemies.end(),
        [](const Enemy& e) { return e.alive; }));
}

void EntityStore::evictOldestBullet(Faction faction)
{
    // Insertion order is preserved, so the first live match is the oldest
    auto it = std::find_if(m_bullets.begin(), m_bullets.end(), [faction](const Bullet& b) {
        return b.alive && b.faction == faction;
    });
    if (it == m_bullets.end()) {
        return;
    }
    ENTITY_DEBUG("Bullet capacity reached for faction " + std::string(toString(faction)) +
                 ", evicting bullet " + std::to_string(it->id));
    m_bullets.erase(it);
    ++m_evictedBullets;
}

size_t EntityStore::removeDead()
{
    auto isDead = [](const auto& body) { return !body.alive; };
    size_t removed = 0;
    removed += std::erase_if(m_enemies, isDead);
    removed += std::erase_if(m_bullets, isDead);
    removed += std::erase_if(m_powerUps, isDead);
    return removed;
}

PruneResult EntityStore::prune(const FieldConfig& field, float maxPowerUpAge)
{
    PruneResult result;

    result.bullets = std::erase_if(m_bullets, [&field](const Bullet& b) {
        return !b.alive || b.age > b.maxLifetime || outsideField(b.position, field);
    });

    result.enemies = std::erase_if(m_enemies, [&field](const Enemy& e) {
        const float x = e.position.getX();
        return !e.alive ||
               e.position.getY() > field.height + field.pruneMargin ||
               x < -field.pruneMargin ||
               x > field.width + field.pruneMargin;
    });

    result.powerUps = std::erase_if(m_powerUps, [&field, maxPowerUpAge](const PowerUp& p) {
        return !p.alive ||
               p.position.getY() > field.height + field.pruneMargin ||
               p.age > maxPowerUpAge;
    });

    if (result.total() > 0) {
        ENTITY_DEBUG("Pruned " + std::to_string(result.bullets) + " bullets, " +
                     std::to_string(result.enemies) + " enemies, " +
                     std::to_string(result.powerUps) + " power-ups");
    }
    return result;
}

void EntityStore::clear()
{
    m_player = Player{};
    m_enemies.clear();
    m_bullets.clear();
    m_powerUps.clear();
    m_evictedBullets = 0;
    m_nextId = 1;
    ENTITY_INFO("Entity store cleared");
}

} // namespace Cosmic
