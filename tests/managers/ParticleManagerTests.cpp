/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ParticleManagerTests
#include <boost/test/unit_test.hpp>

#include "core/GameConfig.hpp"
#include "core/RandomSource.hpp"
#include "managers/ParticleManager.hpp"
#include "mocks/ScriptedRandom.hpp"
#include <cmath>

using namespace Cosmic;

struct ParticleFixture {
    ParticleConfig config;
    SeededRandom random{1234u};
    ParticleManager particles{config, random};
};

BOOST_AUTO_TEST_SUITE(ParticleCreationTests)

BOOST_FIXTURE_TEST_CASE(TestExplosionSpawnsIntensityParticles, ParticleFixture) {
    BOOST_CHECK_EQUAL(particles.createExplosion(100.0f, 200.0f, 10), 10u);
    BOOST_CHECK_EQUAL(particles.getActiveParticleCount(), 10u);
    BOOST_CHECK_EQUAL(particles.getPerformanceStats().totalCreated, 10u);
}

BOOST_FIXTURE_TEST_CASE(TestNonPositiveIntensityIsIgnored, ParticleFixture) {
    BOOST_CHECK_EQUAL(particles.createExplosion(0.0f, 0.0f, 0), 0u);
    BOOST_CHECK_EQUAL(particles.createExplosion(0.0f, 0.0f, -3), 0u);
    BOOST_CHECK_EQUAL(particles.getActiveParticleCount(), 0u);
}

BOOST_FIXTURE_TEST_CASE(TestParticlesStayWithinConfiguredRanges, ParticleFixture) {
    particles.createExplosion(300.0f, 400.0f, 50);

    for (const auto& particle : particles.getParticles()) {
        BOOST_CHECK_LE(std::abs(particle.position.getX() - 300.0f), config.positionJitter + 0.001f);
        BOOST_CHECK_LE(std::abs(particle.position.getY() - 400.0f), config.positionJitter + 0.001f);

        const float speed = particle.velocity.length();
        BOOST_CHECK_GE(speed, config.minSpeed - 0.01f);
        BOOST_CHECK_LE(speed, config.maxSpeed + 0.01f);

        BOOST_CHECK_GE(particle.size, config.minSize);
        BOOST_CHECK_LE(particle.size, config.maxSize);
        BOOST_CHECK_GE(particle.lifetime, config.minLifetime);
        BOOST_CHECK_LE(particle.lifetime, config.maxLifetime);
        BOOST_CHECK_EQUAL(particle.intensity, 50);
    }
}

BOOST_AUTO_TEST_CASE(TestScriptedValuesShapeTheParticle) {
    ParticleConfig config;
    ScriptedRandom random;
    random.pushFloat(0.0f);      // angle: pointing right
    random.pushFloat(100.0f);    // speed
    random.pushFloat(2.0f);      // x jitter
    random.pushFloat(-3.0f);     // y jitter
    random.pushFloat(4.0f);      // size
    random.pushFloat(1.0f);      // lifetime
    ParticleManager particles(config, random);

    particles.createExplosion(50.0f, 60.0f, 1);
    BOOST_REQUIRE_EQUAL(particles.getActiveParticleCount(), 1u);

    const Particle& particle = particles.getParticles().front();
    BOOST_CHECK_CLOSE(particle.velocity.getX(), 100.0f, 0.001f);
    BOOST_CHECK_SMALL(particle.velocity.getY(), 0.001f);
    BOOST_CHECK_CLOSE(particle.position.getX(), 52.0f, 0.001f);
    BOOST_CHECK_CLOSE(particle.position.getY(), 57.0f, 0.001f);
    BOOST_CHECK_CLOSE(particle.size, 4.0f, 0.001f);
    BOOST_CHECK_CLOSE(particle.lifetime, 1.0f, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ParticleLifecycleTests)

BOOST_AUTO_TEST_CASE(TestCapacityEvictsOldestFirst) {
    ParticleConfig config;
    config.maxParticles = 20;
    SeededRandom random(7u);
    ParticleManager particles(config, random);

    particles.createExplosion(0.0f, 0.0f, 15);
    particles.createExplosion(500.0f, 500.0f, 15);

    BOOST_CHECK_EQUAL(particles.getActiveParticleCount(), 20u);
    BOOST_CHECK_EQUAL(particles.getPerformanceStats().totalEvicted, 10u);

    // The first five survivors come from the first explosion, the newest fifteen from the second
    size_t fromSecond = 0;
    for (const auto& particle : particles.getParticles()) {
        if (particle.position.getX() > 250.0f) {
            ++fromSecond;
        }
    }
    BOOST_CHECK_EQUAL(fromSecond, 15u);
}

BOOST_FIXTURE_TEST_CASE(TestUpdateMovesInUnitsPerSecond, ParticleFixture) {
    particles.createExplosion(100.0f, 100.0f, 1);
    const Particle before = particles.getParticles().front();

    particles.update(0.1f);
    BOOST_REQUIRE_EQUAL(particles.getActiveParticleCount(), 1u);
    const Particle& after = particles.getParticles().front();

    BOOST_CHECK_CLOSE(after.position.getX(), before.position.getX() + before.velocity.getX() * 0.1f, 0.01f);
    BOOST_CHECK_CLOSE(after.position.getY(), before.position.getY() + before.velocity.getY() * 0.1f, 0.01f);
    BOOST_CHECK_CLOSE(after.age, 0.1f, 0.001f);
}

BOOST_FIXTURE_TEST_CASE(TestDeadParticlesAreRemoved, ParticleFixture) {
    particles.createExplosion(100.0f, 100.0f, 25);
    particles.update(config.maxLifetime + 0.01f);

    BOOST_CHECK_EQUAL(particles.getActiveParticleCount(), 0u);
    BOOST_CHECK_EQUAL(particles.getPerformanceStats().totalExpired, 25u);
}

BOOST_FIXTURE_TEST_CASE(TestCleanResetsEverything, ParticleFixture) {
    particles.createExplosion(100.0f, 100.0f, 5);
    particles.clean();

    BOOST_CHECK_EQUAL(particles.getActiveParticleCount(), 0u);
    BOOST_CHECK_EQUAL(particles.getPerformanceStats().totalCreated, 0u);
}

BOOST_AUTO_TEST_SUITE_END()
