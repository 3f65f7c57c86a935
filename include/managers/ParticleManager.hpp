/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PARTICLE_MANAGER_HPP
#define PARTICLE_MANAGER_HPP

/**
 * @file ParticleManager.hpp
 * @brief Visual-only explosion particles
 *
 * Explosion requests from the simulation become short-lived particles
 * with randomized direction, speed, size and lifetime. Particles are
 * never read back by gameplay; a renderer walks getParticles().
 *
 * The pool is bounded: creating a particle at capacity evicts the oldest
 * one first (FIFO).
 */

#include "core/GameConfig.hpp"
#include "entities/EntityData.hpp"
#include <cstddef>
#include <deque>

namespace Cosmic {

class RandomSource;

/**
 * @brief Counters for the debug overlay and tests
 */
struct ParticlePerformanceStats {
  size_t totalCreated{0};
  size_t totalEvicted{0};
  size_t totalExpired{0};

  void reset() {
    totalCreated = 0;
    totalEvicted = 0;
    totalExpired = 0;
  }
};

class ParticleManager {
public:
  ParticleManager(const ParticleConfig &config, RandomSource &random);

  /**
   * @brief Spawn one particle per unit of intensity around (x, y)
   * @return Number of particles created
   */
  size_t createExplosion(float x, float y, int intensity);

  /**
   * @brief Age and move all particles, removing dead ones
   * @param deltaTime Time elapsed in seconds
   */
  void update(float deltaTime);

  /**
   * @brief Remove every particle and reset counters
   */
  void clean();

  const std::deque<Particle> &getParticles() const { return m_particles; }
  size_t getActiveParticleCount() const { return m_particles.size(); }
  size_t getMaxParticles() const { return m_config.maxParticles; }
  const ParticlePerformanceStats &getPerformanceStats() const { return m_stats; }

private:
  void addParticle(const Particle &particle);

  const ParticleConfig &m_config;
  RandomSource &m_random;
  std::deque<Particle> m_particles;
  ParticlePerformanceStats m_stats;
};

} // namespace Cosmic

#endif // PARTICLE_MANAGER_HPP
