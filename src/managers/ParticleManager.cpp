/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/ParticleManager.hpp"
#include "core/Logger.hpp"
#include "core/RandomSource.hpp"
#include <algorithm>
#include <cmath>
#include <string>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace Cosmic {

ParticleManager::ParticleManager(const ParticleConfig &config,
                                 RandomSource &random)
    : m_config(config), m_random(random) {}

size_t ParticleManager::createExplosion(float x, float y, int intensity) {
  if (intensity <= 0 || m_config.maxParticles == 0) {
    return 0;
  }

  const float jitter = m_config.positionJitter;
  for (int i = 0; i < intensity; ++i) {
    const float angle =
        m_random.uniformFloat(0.0f, 2.0f * static_cast<float>(M_PI));
    const float speed =
        m_random.uniformFloat(m_config.minSpeed, m_config.maxSpeed);

    const float offsetX = m_random.uniformFloat(-jitter, jitter);
    const float offsetY = m_random.uniformFloat(-jitter, jitter);

    Particle particle;
    particle.position = Vector2D(x + offsetX, y + offsetY);
    particle.velocity = Vector2D::fromAngle(angle, speed);
    particle.size = m_random.uniformFloat(m_config.minSize, m_config.maxSize);
    particle.lifetime =
        m_random.uniformFloat(m_config.minLifetime, m_config.maxLifetime);
    particle.intensity = intensity;
    addParticle(particle);
  }

  PARTICLE_DEBUG("Explosion at (" + std::to_string(x) + ", " +
                 std::to_string(y) + ") with " + std::to_string(intensity) +
                 " particles, active: " +
                 std::to_string(m_particles.size()));
  return static_cast<size_t>(intensity);
}

void ParticleManager::addParticle(const Particle &particle) {
  while (m_particles.size() >= m_config.maxParticles) {
    m_particles.pop_front();
    ++m_stats.totalEvicted;
  }
  m_particles.push_back(particle);
  ++m_stats.totalCreated;
}

void ParticleManager::update(float deltaTime) {
  for (auto &particle : m_particles) {
    particle.age += deltaTime;
    particle.position += particle.velocity * deltaTime;
  }

  const size_t expired = std::erase_if(
      m_particles, [](const Particle &p) { return p.isDead(); });
  m_stats.totalExpired += expired;
}

void ParticleManager::clean() {
  m_particles.clear();
  m_stats.reset();
  PARTICLE_INFO("ParticleManager cleaned");
}

} // namespace Cosmic
