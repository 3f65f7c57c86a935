/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/GameSession.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <string>
#include <utility>

namespace Cosmic
{

namespace
{

float sanitizeAxis(float value)
{
    if (!std::isfinite(value)) {
        return 0.0f;
    }
    return std::clamp(value, -1.0f, 1.0f);
}

} // namespace

GameSession::GameSession(const GameConfig& config, uint32_t seed)
    : m_config(config)
    , m_seed(seed)
    , m_random(seed)
    , m_store(config.bullet.maxPerFaction)
    , m_movement(m_config)
    , m_behavior(m_config, m_random)
    , m_homing(m_config)
    , m_powerUpTimer(m_store, m_events, m_config)
    , m_combat(m_store, m_events, m_config, m_random, m_powerUpTimer)
    , m_spawner(m_store, m_config, m_random)
    , m_particles(m_config.particle, m_random)
    , m_level(std::clamp(m_config.level.startLevel, 1, std::max(m_config.level.maxLevel, 1)))
{
    SESSION_INFO("Creating session, difficulty " + std::string(toString(m_config.difficulty)) +
                 ", level " + std::to_string(m_level) + ", seed " + std::to_string(seed));
    reset();
}

Vector2D GameSession::sanitizeMoveVector(const Vector2D& moveVector)
{
    return Vector2D(sanitizeAxis(moveVector.getX()), sanitizeAxis(moveVector.getY()));
}

bool GameSession::tick(const InputIntent& input, float deltaTime)
{
    if (m_gameOver || m_levelComplete) {
        return false;
    }
    if (!std::isfinite(deltaTime) || deltaTime <= 0.0f) {
        SESSION_WARN("Ignoring tick with invalid step " + std::to_string(deltaTime));
        return false;
    }

    ++m_tickCount;
    const size_t firstEvent = m_events.size();

    const Vector2D moveVector = sanitizeMoveVector(input.moveVector);
    if (!std::isfinite(input.moveVector.getX()) || !std::isfinite(input.moveVector.getY())) {
        SESSION_WARN("Non-finite move vector replaced with zero on tick " +
                     std::to_string(m_tickCount));
    }

    Player& player = m_store.getPlayer();

    // 1. Player actions: steering, special ability, movement and countdowns, firing
    m_movement.steerPlayer(player, moveVector);
    handleSpecial(input.specialPressed);
    m_movement.integratePlayer(player, deltaTime);
    handleFire(input.fireHeld);

    // 2. Enemy behavior on the enemy-side clock (slowed or frozen by power-ups)
    const float enemyDt = deltaTime * m_movement.enemyTimeScale(player);
    m_movement.advanceEnemyTimers(m_store.getEnemies(), enemyDt);
    if (enemyDt > 0.0f) {
        m_fireRequests.clear();
        m_behavior.update(m_store.getEnemies(), player.position, m_fireRequests);
        spawnEnemyBullets(m_fireRequests);
    }

    // 3. Movement and homing
    m_movement.integrateEnemies(m_store.getEnemies(), enemyDt);
    m_homing.update(m_store, deltaTime, enemyDt);
    m_movement.integrateBullets(m_store.getBullets(), deltaTime, enemyDt);
    m_movement.integratePowerUps(m_store.getPowerUps(), enemyDt);

    // 4. Collisions, detected in full before any effect is applied
    m_collisionBatch.clear();
    m_collisions.detect(m_store, m_collisionBatch);
    m_combat.resolve(m_collisionBatch);

    // 5. Removal of destroyed, expired and off-field entities
    m_store.prune(m_config.field, m_config.powerUp.maxAge);

    if (player.health <= 0.0f) {
        triggerGameOver();
    } else {
        // 6. Waves and timed power-ups
        m_spawner.update(enemyDt);
        checkWaveCompletion();
        if (!m_levelComplete) {
            m_powerUpTimer.update(deltaTime);
        }
    }

    // 7. Visual effects for everything that exploded this tick
    forwardExplosions(firstEvent);
    m_particles.update(deltaTime);
    return true;
}

EventQueue GameSession::drainEvents()
{
    EventQueue drained;
    drained.swap(m_events);
    return drained;
}

void GameSession::reset()
{
    m_store.clear();
    m_events.clear();
    m_particles.clean();
    m_combat.resetScore();
    m_spawner.reset();
    m_random.reseed(m_seed);

    m_wave = 0;
    m_levelComplete = false;
    m_gameOver = false;
    m_tickCount = 0;

    spawnPlayer();
    startWave(1);
    SESSION_INFO("Session reset, level " + std::to_string(m_level));
}

bool GameSession::startNextLevel()
{
    if (!m_levelComplete) {
        SESSION_WARN("Level " + std::to_string(m_level) + " is not complete yet");
        return false;
    }

    if (m_level < m_config.level.maxLevel) {
        ++m_level;
    }
    reset();
    return true;
}

bool GameSession::injectPowerUp(std::string_view kind, float x, float y)
{
    const auto parsed = parsePowerUpKind(kind);
    if (!parsed) {
        SESSION_WARN("Rejected unknown power-up kind '" + std::string(kind) + "'");
        return false;
    }
    if (!std::isfinite(x) || !std::isfinite(y)) {
        SESSION_WARN("Rejected power-up '" + std::string(kind) + "' at a non-finite position");
        return false;
    }

    PowerUp powerUp;
    powerUp.kind = *parsed;
    powerUp.position = Vector2D(x, y);
    powerUp.velocity = Vector2D(0.0f, m_config.powerUp.descentSpeed);
    powerUp.size = m_config.powerUp.size;
    m_store.addPowerUp(powerUp);

    m_events.push_back(PowerUpSpawned{x, y, *parsed});
    SESSION_DEBUG("Injected power-up " + std::string(toString(*parsed)));
    return true;
}

void GameSession::spawnPlayer()
{
    const PlayerConfig& cfg = m_config.player;

    Player player;
    player.position = Vector2D(m_config.field.width * 0.5f,
                               m_config.field.height - cfg.spawnBottomOffset);
    player.size = cfg.size;
    player.faction = Faction::Player;
    player.maxHealth = m_config.playerMaxHealth();
    player.health = player.maxHealth;
    player.bulletDamage = m_config.bullet.damage * m_config.activeDifficulty().playerDamageMult;
    m_store.spawnPlayer(std::move(player));
}

void GameSession::handleSpecial(bool pressed)
{
    Player& player = m_store.getPlayer();
    if (!pressed || player.specialCooldown > 0.0f) {
        return;
    }

    player.timeFreezeTimer = m_config.player.timeFreezeDuration;
    player.specialCooldown = m_config.player.specialCooldown;
    m_events.push_back(SpecialActivated{});
    SESSION_INFO("Time freeze activated");
}

void GameSession::handleFire(bool held)
{
    Player& player = m_store.getPlayer();
    if (!held || player.fireCooldown > 0.0f) {
        return;
    }

    const PlayerConfig& cfg = m_config.player;
    const bool homing = player.hasPowerUp(PowerUpKind::Homing);
    const BulletKind kind = homing ? BulletKind::Homing : BulletKind::Normal;
    const float speed = homing ? m_config.bullet.homingSpeed : m_config.bullet.speed;
    const float muzzleY = player.position.getY() - cfg.muzzleOffset;

    int fired = 0;
    if (player.hasPowerUp(PowerUpKind::MultiShot)) {
        const std::array<float, 3> angles{-cfg.multiShotAngle, 0.0f, cfg.multiShotAngle};
        for (float angle : angles) {
            const float offset = std::sin(angle) * cfg.multiShotSpread;
            m_store.addBullet(makeBullet(Faction::Player,
                                         Vector2D(player.position.getX() + offset, muzzleY),
                                         Vector2D(offset, -speed), player.bulletDamage, kind));
            ++fired;
        }
    } else {
        m_store.addBullet(makeBullet(Faction::Player, Vector2D(player.position.getX(), muzzleY),
                                     Vector2D(0.0f, -speed), player.bulletDamage, kind));
        fired = 1;
    }

    float fireRate = cfg.fireRate;
    if (player.hasPowerUp(PowerUpKind::RapidFire)) {
        fireRate *= cfg.rapidFireMult;
    }
    player.fireCooldown = fireRate > 0.0f ? 1.0f / fireRate : 0.0f;

    m_events.push_back(ShotFired{fired});
}

void GameSession::spawnEnemyBullets(const FireRequests& requests)
{
    for (const auto& request : requests) {
        m_store.addBullet(makeBullet(Faction::Enemy, request.position, request.velocity,
                                     request.damage, request.kind));
    }
}

Bullet GameSession::makeBullet(Faction faction, const Vector2D& position,
                               const Vector2D& velocity, float damage, BulletKind kind) const
{
    const BulletConfig& cfg = m_config.bullet;

    Bullet bullet;
    bullet.faction = faction;
    bullet.position = position;
    bullet.velocity = velocity;
    bullet.size = cfg.size;
    bullet.damage = damage;
    bullet.kind = kind;
    bullet.maxLifetime = cfg.maxLifetime;
    bullet.turnRate = cfg.homingTurnRate;
    bullet.homingRange = cfg.homingRange;
    return bullet;
}

void GameSession::checkWaveCompletion()
{
    if (m_wave < 1 || m_spawner.isSpawning() || m_store.countLiveEnemies() > 0) {
        return;
    }

    m_events.push_back(WaveCompleted{m_wave});
    SESSION_INFO("Wave " + std::to_string(m_wave) + " completed, score " +
                 std::to_string(m_combat.getScore()));

    if (m_wave >= m_config.wavesForLevel(m_level)) {
        completeLevel();
        return;
    }
    startWave(m_wave + 1);
}

void GameSession::startWave(int wave)
{
    m_wave = wave;
    m_spawner.startWave(wave);
    if (m_spawner.isBossWave(wave)) {
        m_events.push_back(BossWaveStarted{wave});
    }
}

void GameSession::forwardExplosions(size_t firstEvent)
{
    for (size_t i = firstEvent; i < m_events.size(); ++i) {
        if (const auto* explosion = std::get_if<ExplosionRequested>(&m_events[i])) {
            m_particles.createExplosion(explosion->x, explosion->y, explosion->intensity);
        }
    }
}

void GameSession::completeLevel()
{
    m_levelComplete = true;
    m_events.push_back(LevelCompleted{m_level, m_combat.getScore()});
    SESSION_INFO("Level " + std::to_string(m_level) + " completed after wave " +
                 std::to_string(m_wave) + " with score " + std::to_string(m_combat.getScore()));
}

void GameSession::triggerGameOver()
{
    Player& player = m_store.getPlayer();
    player.health = 0.0f;
    player.alive = false;
    m_gameOver = true;

    m_events.push_back(GameOver{m_combat.getScore(), m_wave});
    SESSION_INFO("Game over at wave " + std::to_string(m_wave) + " with score " +
                 std::to_string(m_combat.getScore()));
}

} // namespace Cosmic
