/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE MovementIntegratorTests
#include <boost/test/unit_test.hpp>

#include "core/GameConfig.hpp"
#include "core/MovementIntegrator.hpp"
#include <vector>

using namespace Cosmic;

namespace {

constexpr float TICK = 1.0f / 60.0f;

Player makePlayer(float x, float y) {
    Player player;
    player.position = Vector2D(x, y);
    player.size = Vector2D(40.0f, 40.0f);
    return player;
}

} // namespace

struct IntegratorFixture {
    GameConfig config;
    MovementIntegrator integrator{config};
};

BOOST_AUTO_TEST_SUITE(PlayerSteeringTests)

BOOST_FIXTURE_TEST_CASE(TestSteeringEasesTowardIntent, IntegratorFixture) {
    Player player = makePlayer(600.0f, 400.0f);
    integrator.steerPlayer(player, Vector2D(1.0f, 0.0f));

    // (0 + (5 - 0) * 0.5) * 0.8
    BOOST_CHECK_CLOSE(player.velocity.getX(), 2.0f, 0.001f);
    BOOST_CHECK_EQUAL(player.velocity.getY(), 0.0f);
}

BOOST_FIXTURE_TEST_CASE(TestDiagonalIntentIsScaled, IntegratorFixture) {
    Player player = makePlayer(600.0f, 400.0f);
    integrator.steerPlayer(player, Vector2D(1.0f, -1.0f));

    const float expected = 5.0f * 0.707f * 0.5f * 0.8f;
    BOOST_CHECK_CLOSE(player.velocity.getX(), expected, 0.01f);
    BOOST_CHECK_CLOSE(player.velocity.getY(), -expected, 0.01f);
}

BOOST_FIXTURE_TEST_CASE(TestReleasedInputDecays, IntegratorFixture) {
    Player player = makePlayer(600.0f, 400.0f);
    player.velocity = Vector2D(2.0f, 0.0f);
    integrator.steerPlayer(player, Vector2D(0.0f, 0.0f));

    BOOST_CHECK_CLOSE(player.velocity.getX(), 0.8f, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(PlayerIntegrationTests)

BOOST_FIXTURE_TEST_CASE(TestVelocityIsPerReferenceTick, IntegratorFixture) {
    Player player = makePlayer(600.0f, 400.0f);
    player.velocity = Vector2D(2.0f, -3.0f);

    integrator.integratePlayer(player, TICK);
    BOOST_CHECK_CLOSE(player.position.getX(), 602.0f, 0.001f);
    BOOST_CHECK_CLOSE(player.position.getY(), 397.0f, 0.001f);

    // Half a reference tick covers half the distance
    integrator.integratePlayer(player, TICK * 0.5f);
    BOOST_CHECK_CLOSE(player.position.getX(), 603.0f, 0.001f);
}

BOOST_FIXTURE_TEST_CASE(TestPowerUpsChangeMoveSpeed, IntegratorFixture) {
    Player rapid = makePlayer(600.0f, 400.0f);
    rapid.velocity = Vector2D(2.0f, 0.0f);
    rapid.activePowerUps[PowerUpKind::RapidFire] = 5.0f;
    integrator.integratePlayer(rapid, TICK);
    BOOST_CHECK_CLOSE(rapid.position.getX(), 602.4f, 0.001f);

    Player both = makePlayer(600.0f, 400.0f);
    both.velocity = Vector2D(2.0f, 0.0f);
    both.activePowerUps[PowerUpKind::RapidFire] = 5.0f;
    both.activePowerUps[PowerUpKind::Shield] = 5.0f;
    integrator.integratePlayer(both, TICK);
    BOOST_CHECK_CLOSE(both.position.getX(), 601.92f, 0.001f);
}

BOOST_FIXTURE_TEST_CASE(TestPlayerStaysInsideField, IntegratorFixture) {
    Player player = makePlayer(10.0f, 790.0f);
    player.velocity = Vector2D(-5.0f, 5.0f);
    integrator.integratePlayer(player, TICK);

    BOOST_CHECK_CLOSE(player.position.getX(), 20.0f, 0.001f);
    BOOST_CHECK_CLOSE(player.position.getY(), 780.0f, 0.001f);

    player.position = Vector2D(1195.0f, 5.0f);
    player.velocity = Vector2D(5.0f, -5.0f);
    integrator.integratePlayer(player, TICK);
    BOOST_CHECK_CLOSE(player.position.getX(), 1180.0f, 0.001f);
    BOOST_CHECK_CLOSE(player.position.getY(), 20.0f, 0.001f);
}

BOOST_FIXTURE_TEST_CASE(TestCountdownsClampAtZero, IntegratorFixture) {
    Player player = makePlayer(600.0f, 400.0f);
    player.invulnerableTimer = 0.01f;
    player.fireCooldown = 0.5f;
    player.specialCooldown = 0.005f;
    player.timeFreezeTimer = 3.0f;

    integrator.integratePlayer(player, 0.1f);

    BOOST_CHECK_EQUAL(player.invulnerableTimer, 0.0f);
    BOOST_CHECK_CLOSE(player.fireCooldown, 0.4f, 0.001f);
    BOOST_CHECK_EQUAL(player.specialCooldown, 0.0f);
    BOOST_CHECK_CLOSE(player.timeFreezeTimer, 2.9f, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(EnemySideTests)

BOOST_FIXTURE_TEST_CASE(TestEnemyTimersAdvance, IntegratorFixture) {
    std::vector<Enemy> enemies(3);
    enemies[0].fireCooldown = 0.5f;
    enemies[1].variant = EnemyVariant::Boss;
    enemies[1].behavior = BossState{};
    enemies[2].alive = false;

    integrator.advanceEnemyTimers(enemies, 0.1f);

    BOOST_CHECK_CLOSE(enemies[0].aiTimer, 0.1f, 0.001f);
    BOOST_CHECK_CLOSE(enemies[0].fireCooldown, 0.4f, 0.001f);
    BOOST_CHECK_CLOSE(std::get<BossState>(enemies[1].behavior).patternTimer, 0.1f, 0.001f);
    BOOST_CHECK_EQUAL(enemies[2].aiTimer, 0.0f);
}

BOOST_FIXTURE_TEST_CASE(TestEnemiesClampHorizontallyOnly, IntegratorFixture) {
    std::vector<Enemy> enemies(1);
    enemies[0].position = Vector2D(10.0f, -80.0f);
    enemies[0].size = Vector2D(30.0f, 30.0f);
    enemies[0].velocity = Vector2D(-4.0f, 2.0f);

    integrator.integrateEnemies(enemies, TICK);

    BOOST_CHECK_CLOSE(enemies[0].position.getX(), 15.0f, 0.001f);
    BOOST_CHECK_CLOSE(enemies[0].position.getY(), -78.0f, 0.001f);
}

BOOST_FIXTURE_TEST_CASE(TestBulletsUseFactionStep, IntegratorFixture) {
    std::vector<Bullet> bullets(2);
    bullets[0].faction = Faction::Player;
    bullets[0].position = Vector2D(100.0f, 500.0f);
    bullets[0].velocity = Vector2D(0.0f, -8.0f);
    bullets[1].faction = Faction::Enemy;
    bullets[1].position = Vector2D(100.0f, 100.0f);
    bullets[1].velocity = Vector2D(0.0f, 6.4f);

    integrator.integrateBullets(bullets, TICK, 0.0f);

    BOOST_CHECK_CLOSE(bullets[0].position.getY(), 492.0f, 0.001f);
    BOOST_CHECK_CLOSE(bullets[0].age, TICK, 0.001f);
    BOOST_CHECK_CLOSE(bullets[1].position.getY(), 100.0f, 0.001f);
    BOOST_CHECK_EQUAL(bullets[1].age, 0.0f);
}

BOOST_FIXTURE_TEST_CASE(TestPowerUpsDescendAndAge, IntegratorFixture) {
    std::vector<PowerUp> powerUps(1);
    powerUps[0].position = Vector2D(100.0f, 100.0f);
    powerUps[0].velocity = Vector2D(0.0f, 2.0f);

    integrator.integratePowerUps(powerUps, TICK * 0.5f);

    BOOST_CHECK_CLOSE(powerUps[0].position.getY(), 101.0f, 0.001f);
    BOOST_CHECK_CLOSE(powerUps[0].age, TICK * 0.5f, 0.001f);
}

BOOST_FIXTURE_TEST_CASE(TestEnemyTimeScale, IntegratorFixture) {
    Player player = makePlayer(600.0f, 400.0f);
    BOOST_CHECK_EQUAL(integrator.enemyTimeScale(player), 1.0f);

    player.activePowerUps[PowerUpKind::TimeSlow] = 5.0f;
    BOOST_CHECK_CLOSE(integrator.enemyTimeScale(player), 0.5f, 0.001f);

    // Freeze wins over slow
    player.timeFreezeTimer = 1.0f;
    BOOST_CHECK_EQUAL(integrator.enemyTimeScale(player), 0.0f);
}

BOOST_AUTO_TEST_SUITE_END()
