/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE CollisionSystemTests
#include <boost/test/unit_test.hpp>

#include "collisions/AABB.hpp"
#include "collisions/CollisionSystem.hpp"
#include "managers/EntityStore.hpp"
#include "utils/Vector2D.hpp"

using namespace Cosmic;

BOOST_AUTO_TEST_SUITE(AABBTests)

BOOST_AUTO_TEST_CASE(TestAABBBasicProperties)
{
    AABB aabb(10.0f, 20.0f, 5.0f, 7.5f);

    BOOST_CHECK_CLOSE(aabb.left(), 5.0f, 0.01f);
    BOOST_CHECK_CLOSE(aabb.right(), 15.0f, 0.01f);
    BOOST_CHECK_CLOSE(aabb.top(), 12.5f, 0.01f);
    BOOST_CHECK_CLOSE(aabb.bottom(), 27.5f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestAABBFromSize)
{
    AABB aabb = AABB::fromSize(Vector2D(100.0f, 50.0f), Vector2D(40.0f, 20.0f));

    BOOST_CHECK_CLOSE(aabb.left(), 80.0f, 0.01f);
    BOOST_CHECK_CLOSE(aabb.right(), 120.0f, 0.01f);
    BOOST_CHECK_CLOSE(aabb.top(), 40.0f, 0.01f);
    BOOST_CHECK_CLOSE(aabb.bottom(), 60.0f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestAABBIntersection)
{
    AABB aabb1(10.0f, 10.0f, 5.0f, 5.0f);  // center at (10,10), size 10x10
    AABB aabb2(15.0f, 10.0f, 3.0f, 3.0f);  // center at (15,10), size 6x6
    AABB aabb3(20.0f, 10.0f, 2.0f, 2.0f);  // center at (20,10), size 4x4

    BOOST_CHECK(aabb1.intersects(aabb2));  // Should overlap
    BOOST_CHECK(aabb2.intersects(aabb1));  // Symmetry
    BOOST_CHECK(!aabb1.intersects(aabb3)); // Should not overlap
    BOOST_CHECK(!aabb3.intersects(aabb1)); // Symmetry
}

BOOST_AUTO_TEST_CASE(TestTouchingEdgesDoNotIntersect)
{
    AABB left(0.0f, 0.0f, 5.0f, 5.0f);
    AABB right(10.0f, 0.0f, 5.0f, 5.0f);   // shares the x = 5 edge

    BOOST_CHECK(!left.intersects(right));
    BOOST_CHECK(!right.intersects(left));
}

BOOST_AUTO_TEST_CASE(TestAABBContainsPoint)
{
    AABB aabb(10.0f, 10.0f, 5.0f, 5.0f);

    BOOST_CHECK(aabb.contains(Vector2D(10.0f, 10.0f)));  // Center
    BOOST_CHECK(aabb.contains(Vector2D(5.0f, 5.0f)));    // Corner
    BOOST_CHECK(!aabb.contains(Vector2D(20.0f, 20.0f))); // Outside
}

BOOST_AUTO_TEST_SUITE_END()

namespace {

struct CollisionFixture {
    EntityStore store;
    CollisionSystem collisions;
    CollisionBatch batch;

    CollisionFixture() {
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

    EntityID addBullet(Faction faction, float x, float y) {
        Bullet bullet;
        bullet.faction = faction;
        bullet.position = Vector2D(x, y);
        bullet.size = Vector2D(4.0f, 10.0f);
        return store.addBullet(bullet);
    }

    EntityID addPowerUp(float x, float y) {
        PowerUp powerUp;
        powerUp.position = Vector2D(x, y);
        powerUp.size = Vector2D(24.0f, 24.0f);
        return store.addPowerUp(powerUp);
    }
};

} // namespace

BOOST_AUTO_TEST_SUITE(CollisionDetectionTests)

BOOST_FIXTURE_TEST_CASE(TestNoOverlapNoEvents, CollisionFixture)
{
    addEnemy(100.0f, 100.0f);
    addBullet(Faction::Player, 400.0f, 400.0f);
    addPowerUp(900.0f, 100.0f);

    BOOST_CHECK_EQUAL(collisions.detect(store, batch), 0u);
    BOOST_CHECK(batch.empty());
}

BOOST_FIXTURE_TEST_CASE(TestPlayerBulletHitsFirstEnemyOnly, CollisionFixture)
{
    EntityID first = addEnemy(300.0f, 300.0f);
    addEnemy(305.0f, 300.0f);   // overlaps the same bullet
    EntityID bullet = addBullet(Faction::Player, 302.0f, 300.0f);

    BOOST_CHECK_EQUAL(collisions.detect(store, batch), 1u);
    BOOST_REQUIRE_EQUAL(batch.size(), 1u);
    BOOST_CHECK(batch[0].kind == CollisionKind::PlayerBulletEnemy);
    BOOST_CHECK_EQUAL(batch[0].a, bullet);
    BOOST_CHECK_EQUAL(batch[0].b, first);
}

BOOST_FIXTURE_TEST_CASE(TestEnemyBulletsIgnoreEnemies, CollisionFixture)
{
    addEnemy(300.0f, 300.0f);
    addBullet(Faction::Enemy, 300.0f, 300.0f);

    BOOST_CHECK_EQUAL(collisions.detect(store, batch), 0u);
}

BOOST_FIXTURE_TEST_CASE(TestEventsComeOutInGroupOrder, CollisionFixture)
{
    // Everything overlaps the player; the player bullet also overlaps the enemy
    EntityID powerUp = addPowerUp(600.0f, 700.0f);
    EntityID enemy = addEnemy(600.0f, 690.0f);
    EntityID enemyBullet = addBullet(Faction::Enemy, 610.0f, 700.0f);
    EntityID playerBullet = addBullet(Faction::Player, 600.0f, 685.0f);

    BOOST_CHECK_EQUAL(collisions.detect(store, batch), 4u);
    BOOST_REQUIRE_EQUAL(batch.size(), 4u);

    BOOST_CHECK(batch[0].kind == CollisionKind::PlayerBulletEnemy);
    BOOST_CHECK_EQUAL(batch[0].a, playerBullet);
    BOOST_CHECK(batch[1].kind == CollisionKind::EnemyBulletPlayer);
    BOOST_CHECK_EQUAL(batch[1].a, enemyBullet);
    BOOST_CHECK(batch[2].kind == CollisionKind::PlayerEnemy);
    BOOST_CHECK_EQUAL(batch[2].b, enemy);
    BOOST_CHECK(batch[3].kind == CollisionKind::PlayerPowerUp);
    BOOST_CHECK_EQUAL(batch[3].b, powerUp);
}

BOOST_FIXTURE_TEST_CASE(TestDeadPlayerCollidesWithNothing, CollisionFixture)
{
    addEnemy(600.0f, 700.0f);
    addPowerUp(600.0f, 700.0f);
    store.getPlayer().alive = false;

    BOOST_CHECK_EQUAL(collisions.detect(store, batch), 0u);
}

BOOST_FIXTURE_TEST_CASE(TestDeadEntitiesAreSkipped, CollisionFixture)
{
    EntityID enemy = addEnemy(300.0f, 300.0f);
    addBullet(Faction::Player, 300.0f, 300.0f);
    store.findEnemy(enemy)->alive = false;

    BOOST_CHECK_EQUAL(collisions.detect(store, batch), 0u);
}

BOOST_FIXTURE_TEST_CASE(TestDetectionDoesNotMutate, CollisionFixture)
{
    EntityID enemy = addEnemy(600.0f, 700.0f);
    const float healthBefore = store.getPlayer().health;

    collisions.detect(store, batch);
    collisions.detect(store, batch);

    BOOST_CHECK_EQUAL(batch.size(), 2u);   // same pair reported by each pass
    BOOST_CHECK(store.findEnemy(enemy) != nullptr);
    BOOST_CHECK_EQUAL(store.getPlayer().health, healthBefore);
}

BOOST_AUTO_TEST_SUITE_END()
