/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE EntityStoreTests
#include <boost/test/unit_test.hpp>

#include "core/GameConfig.hpp"
#include "managers/EntityStore.hpp"

using namespace Cosmic;

namespace {

Bullet makeBullet(Faction faction, float x = 100.0f, float y = 100.0f) {
    Bullet bullet;
    bullet.faction = faction;
    bullet.position = Vector2D(x, y);
    bullet.size = Vector2D(4.0f, 10.0f);
    return bullet;
}

Enemy makeEnemy(float x, float y) {
    Enemy enemy;
    enemy.position = Vector2D(x, y);
    enemy.size = Vector2D(30.0f, 30.0f);
    return enemy;
}

PowerUp makePowerUp(float x, float y) {
    PowerUp powerUp;
    powerUp.position = Vector2D(x, y);
    powerUp.size = Vector2D(24.0f, 24.0f);
    return powerUp;
}

} // namespace

BOOST_AUTO_TEST_SUITE(EntityStoreInsertionTests)

BOOST_AUTO_TEST_CASE(TestIdsAreUniqueAndNonZero) {
    EntityStore store;
    Player& player = store.spawnPlayer(Player{});
    EntityID enemyId = store.addEnemy(makeEnemy(100.0f, 100.0f));
    EntityID bulletId = store.addBullet(makeBullet(Faction::Player));
    EntityID powerUpId = store.addPowerUp(makePowerUp(50.0f, 50.0f));

    BOOST_CHECK_NE(player.id, INVALID_ENTITY_ID);
    BOOST_CHECK_NE(enemyId, INVALID_ENTITY_ID);
    BOOST_CHECK_NE(enemyId, player.id);
    BOOST_CHECK_NE(bulletId, enemyId);
    BOOST_CHECK_NE(powerUpId, bulletId);
}

BOOST_AUTO_TEST_CASE(TestInsertionStampsFaction) {
    EntityStore store;
    Enemy enemy = makeEnemy(10.0f, 10.0f);
    enemy.faction = Faction::Player;
    EntityID id = store.addEnemy(enemy);

    const Enemy* stored = store.findEnemy(id);
    BOOST_REQUIRE(stored != nullptr);
    BOOST_CHECK(stored->faction == Faction::Enemy);
    BOOST_CHECK(store.getPlayer().faction == Faction::Neutral);
    BOOST_CHECK(store.spawnPlayer(Player{}).faction == Faction::Player);
}

BOOST_AUTO_TEST_CASE(TestFindSkipsDeadEntities) {
    EntityStore store;
    EntityID id = store.addEnemy(makeEnemy(100.0f, 100.0f));
    BOOST_REQUIRE(store.findEnemy(id) != nullptr);

    store.findEnemy(id)->alive = false;
    BOOST_CHECK(store.findEnemy(id) == nullptr);
    BOOST_CHECK(store.findEnemy(INVALID_ENTITY_ID) == nullptr);
    BOOST_CHECK(store.findBullet(9999) == nullptr);
    BOOST_CHECK_EQUAL(store.countLiveEnemies(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(BulletCapacityTests)

BOOST_AUTO_TEST_CASE(TestOldestBulletIsEvictedAtCapacity) {
    EntityStore store(3);
    EntityID first = store.addBullet(makeBullet(Faction::Player));
    EntityID second = store.addBullet(makeBullet(Faction::Player));
    EntityID third = store.addBullet(makeBullet(Faction::Player));
    EntityID fourth = store.addBullet(makeBullet(Faction::Player));

    BOOST_CHECK_EQUAL(store.countBullets(Faction::Player), 3u);
    BOOST_CHECK(store.findBullet(first) == nullptr);
    BOOST_CHECK(store.findBullet(second) != nullptr);
    BOOST_CHECK(store.findBullet(third) != nullptr);
    BOOST_CHECK(store.findBullet(fourth) != nullptr);
    BOOST_CHECK_EQUAL(store.getEvictedBulletCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestCapacityIsPerFaction) {
    EntityStore store(2);
    EntityID enemyShot = store.addBullet(makeBullet(Faction::Enemy));
    store.addBullet(makeBullet(Faction::Player));
    store.addBullet(makeBullet(Faction::Player));
    store.addBullet(makeBullet(Faction::Player));

    BOOST_CHECK_EQUAL(store.countBullets(Faction::Player), 2u);
    BOOST_CHECK_EQUAL(store.countBullets(Faction::Enemy), 1u);
    BOOST_CHECK(store.findBullet(enemyShot) != nullptr);
}

BOOST_AUTO_TEST_CASE(TestZeroCapacityRejectsBullets) {
    EntityStore store(0);
    BOOST_CHECK_EQUAL(store.addBullet(makeBullet(Faction::Player)), INVALID_ENTITY_ID);
    BOOST_CHECK(store.getBullets().empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(RemovalTests)

BOOST_AUTO_TEST_CASE(TestRemoveDeadErasesFlaggedEntities) {
    EntityStore store;
    EntityID keep = store.addEnemy(makeEnemy(100.0f, 100.0f));
    EntityID drop = store.addEnemy(makeEnemy(200.0f, 100.0f));
    store.findEnemy(drop)->alive = false;

    BOOST_CHECK_EQUAL(store.removeDead(), 1u);
    BOOST_CHECK_EQUAL(store.getEnemies().size(), 1u);
    BOOST_CHECK_EQUAL(store.getEnemies().front().id, keep);
}

BOOST_AUTO_TEST_CASE(TestPruneRemovesOutOfMarginEntities) {
    FieldConfig field;  // 1200 x 800, margin 50
    EntityStore store;

    // Bullets: inside, above the top margin, beyond the right margin, expired
    EntityID inside = store.addBullet(makeBullet(Faction::Player, 600.0f, 400.0f));
    store.addBullet(makeBullet(Faction::Player, 600.0f, -51.0f));
    store.addBullet(makeBullet(Faction::Enemy, 1251.0f, 400.0f));
    Bullet old = makeBullet(Faction::Enemy, 600.0f, 400.0f);
    old.age = 5.1f;
    store.addBullet(old);

    // Enemies above the field are still entering and must survive
    EntityID entering = store.addEnemy(makeEnemy(600.0f, -100.0f));
    store.addEnemy(makeEnemy(600.0f, 851.0f));
    store.addEnemy(makeEnemy(-51.0f, 400.0f));

    // Power-ups: one fallen off, one too old, one fine
    EntityID fresh = store.addPowerUp(makePowerUp(600.0f, 849.0f));
    store.addPowerUp(makePowerUp(600.0f, 851.0f));
    PowerUp stale = makePowerUp(600.0f, 400.0f);
    stale.age = 15.5f;
    store.addPowerUp(stale);

    PruneResult result = store.prune(field, 15.0f);

    BOOST_CHECK_EQUAL(result.bullets, 3u);
    BOOST_CHECK_EQUAL(result.enemies, 2u);
    BOOST_CHECK_EQUAL(result.powerUps, 2u);
    BOOST_CHECK_EQUAL(result.total(), 7u);

    BOOST_CHECK(store.findBullet(inside) != nullptr);
    BOOST_CHECK(store.findEnemy(entering) != nullptr);
    BOOST_CHECK(store.findPowerUp(fresh) != nullptr);
}

BOOST_AUTO_TEST_CASE(TestPruneKeepsEntitiesExactlyOnTheMargin) {
    FieldConfig field;
    EntityStore store;
    store.addBullet(makeBullet(Faction::Player, -50.0f, -50.0f));
    store.addEnemy(makeEnemy(1250.0f, 850.0f));

    PruneResult result = store.prune(field, 15.0f);
    BOOST_CHECK_EQUAL(result.total(), 0u);
}

BOOST_AUTO_TEST_CASE(TestClearRestartsIds) {
    EntityStore store;
    store.addEnemy(makeEnemy(0.0f, 0.0f));
    store.addEnemy(makeEnemy(0.0f, 0.0f));
    store.clear();

    BOOST_CHECK(store.getEnemies().empty());
    BOOST_CHECK_EQUAL(store.addEnemy(makeEnemy(0.0f, 0.0f)), 1u);
}

BOOST_AUTO_TEST_SUITE_END()
