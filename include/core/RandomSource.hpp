/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef RANDOM_SOURCE_HPP
#define RANDOM_SOURCE_HPP

#include <cstdint>
#include <random>

namespace Cosmic
{

/**
 * @brief The single source of randomness for a simulation session
 *
 * Spawn choice, spawn positions, drop chance, drop kind, Fast-enemy
 * retargeting, boss missile jitter and particle jitter all draw from the
 * one RandomSource owned by the session. Tests substitute a scripted
 * implementation to force specific outcomes.
 */
class RandomSource
{
public:
    virtual ~RandomSource() = default;

    /// Uniform float in [0, 1)
    virtual float uniform01() = 0;

    /// Uniform integer in [lo, hi], both inclusive
    virtual int uniformInt(int lo, int hi) = 0;

    /// Uniform float in [lo, hi)
    virtual float uniformFloat(float lo, float hi) = 0;

    virtual void reseed(uint32_t seed) = 0;
};

/**
 * @brief Mersenne Twister backed source; identical seeds give identical streams
 */
class SeededRandom : public RandomSource
{
public:
    explicit SeededRandom(uint32_t seed = DEFAULT_SEED) : m_engine(seed) {}

    float uniform01() override;
    int uniformInt(int lo, int hi) override;
    float uniformFloat(float lo, float hi) override;
    void reseed(uint32_t seed) override { m_engine.seed(seed); }

    static constexpr uint32_t DEFAULT_SEED{5489u};

private:
    std::mt19937 m_engine;
};

} // namespace Cosmic

#endif // RANDOM_SOURCE_HPP
