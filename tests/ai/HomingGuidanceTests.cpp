/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE HomingGuidanceTests
#include <boost/test/unit_test.hpp>

#include "ai/HomingGuidance.hpp"
#include "core/GameConfig.hpp"
#include "managers/EntityStore.hpp"
#include <cmath>

using namespace Cosmic;

namespace {

constexpr float PI = 3.14159265358979323846f;
constexpr float TICK = 1.0f / 60.0f;

} // namespace

struct HomingFixture {
    GameConfig config;
    EntityStore store;
    HomingGuidance guidance{config};

    HomingFixture() {
        Player player;
        player.position = Vector2D(600.0f, 700.0f);
        player.size = Vector2D(40.0f, 40.0f);
        store.spawnPlayer(player);
    }

    EntityID addEnemy(float x, float y) {
        Enemy enemy;
        enemy.position = Vector2D(x, y);
        enemy.size = Vector2D(30.0f, 30.0f);
        return store.addEnemy(enemy);
    }

    Bullet makeMissile(Faction faction, float x, float y, const Vector2D& velocity) const {
        Bullet bullet;
        bullet.faction = faction;
        bullet.kind = BulletKind::Homing;
        bullet.position = Vector2D(x, y);
        bullet.velocity = velocity;
        bullet.turnRate = config.bullet.homingTurnRate;
        bullet.homingRange = config.bullet.homingRange;
        return bullet;
    }
};

BOOST_AUTO_TEST_SUITE(AngleMathTests)

BOOST_AUTO_TEST_CASE(TestNormalizeAngleWrapsIntoHalfOpenRange) {
    BOOST_CHECK_CLOSE(HomingGuidance::normalizeAngle(1.5f * PI), -0.5f * PI, 0.01f);
    BOOST_CHECK_CLOSE(HomingGuidance::normalizeAngle(-PI), PI, 0.01f);
    BOOST_CHECK_CLOSE(HomingGuidance::normalizeAngle(PI), PI, 0.01f);
    BOOST_CHECK_SMALL(HomingGuidance::normalizeAngle(0.0f), 0.0001f);
}

BOOST_AUTO_TEST_CASE(TestTurnIsClampedAndSpeedKept) {
    Vector2D velocity(0.0f, -6.0f);   // straight up
    const float turn = HomingGuidance::turnToward(velocity, 0.0f, 0.1f);

    BOOST_CHECK_CLOSE(turn, 0.1f, 0.01f);
    BOOST_CHECK_CLOSE(velocity.angle(), -0.5f * PI + 0.1f, 0.01f);
    BOOST_CHECK_CLOSE(velocity.length(), 6.0f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestSmallCorrectionIsAppliedExactly) {
    Vector2D velocity(6.0f, 0.0f);
    const float turn = HomingGuidance::turnToward(velocity, -0.05f, 0.1f);

    BOOST_CHECK_CLOSE(turn, -0.05f, 0.01f);
    BOOST_CHECK_CLOSE(velocity.angle(), -0.05f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestTurnTakesTheShortWayAround) {
    // Heading just above -pi, target just below pi: the short turn is negative
    Vector2D velocity = Vector2D::fromAngle(-PI + 0.05f, 6.0f);
    const float turn = HomingGuidance::turnToward(velocity, PI - 0.05f, 1.0f);
    BOOST_CHECK_CLOSE(turn, -0.1f, 0.5f);
}

BOOST_AUTO_TEST_CASE(TestStationaryBulletIsNotTurned) {
    Vector2D velocity(0.0f, 0.0f);
    BOOST_CHECK_EQUAL(HomingGuidance::turnToward(velocity, 1.0f, 0.1f), 0.0f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(TargetingTests)

BOOST_FIXTURE_TEST_CASE(TestPlayerMissileLocksNearestEnemyInRange, HomingFixture) {
    addEnemy(150.0f, 100.0f);                       // 50 away
    EntityID nearest = addEnemy(120.0f, 100.0f);    // 20 away
    addEnemy(400.0f, 100.0f);                       // out of range

    const Bullet missile = makeMissile(Faction::Player, 100.0f, 100.0f, Vector2D(0.0f, -6.0f));
    BOOST_CHECK_EQUAL(guidance.acquireTarget(missile, store), nearest);
}

BOOST_FIXTURE_TEST_CASE(TestNothingInRangeLeavesNoLock, HomingFixture) {
    addEnemy(400.0f, 100.0f);
    const Bullet missile = makeMissile(Faction::Player, 100.0f, 100.0f, Vector2D(0.0f, -6.0f));
    BOOST_CHECK_EQUAL(guidance.acquireTarget(missile, store), INVALID_ENTITY_ID);
}

BOOST_FIXTURE_TEST_CASE(TestEnemyMissileLocksPlayer, HomingFixture) {
    const Bullet close = makeMissile(Faction::Enemy, 600.0f, 550.0f, Vector2D(0.0f, 6.0f));
    const Bullet far = makeMissile(Faction::Enemy, 600.0f, 300.0f, Vector2D(0.0f, 6.0f));

    BOOST_CHECK_EQUAL(guidance.acquireTarget(close, store), store.getPlayer().id);
    BOOST_CHECK_EQUAL(guidance.acquireTarget(far, store), INVALID_ENTITY_ID);
}

BOOST_FIXTURE_TEST_CASE(TestSteerTurnsTowardLockedTarget, HomingFixture) {
    EntityID target = addEnemy(200.0f, 100.0f);
    Bullet missile = makeMissile(Faction::Player, 100.0f, 100.0f, Vector2D(0.0f, -6.0f));

    BOOST_CHECK(guidance.steer(missile, store, TICK));
    BOOST_CHECK_EQUAL(missile.targetId, target);
    // One tick of turning at 0.1 rad per reference tick
    BOOST_CHECK_CLOSE(missile.velocity.angle(), -0.5f * PI + 0.1f, 0.01f);
    BOOST_CHECK_CLOSE(missile.velocity.length(), 6.0f, 0.01f);
}

BOOST_FIXTURE_TEST_CASE(TestLostTargetDropsLockAndFliesStraight, HomingFixture) {
    EntityID target = addEnemy(200.0f, 100.0f);
    Bullet missile = makeMissile(Faction::Player, 100.0f, 100.0f, Vector2D(0.0f, -6.0f));
    missile.targetId = target;
    store.findEnemy(target)->alive = false;

    BOOST_CHECK(!guidance.steer(missile, store, TICK));
    BOOST_CHECK_EQUAL(missile.targetId, INVALID_ENTITY_ID);
    BOOST_CHECK_SMALL(missile.velocity.getX(), 0.0001f);
    BOOST_CHECK_CLOSE(missile.velocity.getY(), -6.0f, 0.001f);
}

BOOST_FIXTURE_TEST_CASE(TestUpdateUsesFactionTimeStep, HomingFixture) {
    addEnemy(700.0f, 100.0f);
    store.addBullet(makeMissile(Faction::Player, 600.0f, 100.0f, Vector2D(0.0f, -6.0f)));
    store.addBullet(makeMissile(Faction::Enemy, 600.0f, 600.0f, Vector2D(-6.0f, 0.0f)));

    Bullet normal;
    normal.faction = Faction::Player;
    normal.position = Vector2D(690.0f, 100.0f);
    normal.velocity = Vector2D(0.0f, -8.0f);
    store.addBullet(normal);

    // Frozen enemy time: enemy missiles do not turn
    guidance.update(store, TICK, 0.0f);

    const auto& bullets = store.getBullets();
    BOOST_REQUIRE_EQUAL(bullets.size(), 3u);
    BOOST_CHECK_GT(bullets[0].velocity.getX(), 0.0f);
    BOOST_CHECK_CLOSE(bullets[1].velocity.getX(), -6.0f, 0.001f);
    BOOST_CHECK_SMALL(bullets[1].velocity.getY(), 0.0001f);
    BOOST_CHECK_EQUAL(bullets[2].velocity.getX(), 0.0f);
    BOOST_CHECK_EQUAL(bullets[2].targetId, INVALID_ENTITY_ID);
}

BOOST_AUTO_TEST_SUITE_END()
