/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/RandomSource.hpp"
#include <utility>

namespace Cosmic
{

float SeededRandom::uniform01()
{
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);
    return dist(m_engine);
}

int SeededRandom::uniformInt(int lo, int hi)
{
    if (hi < lo) {
        std::swap(lo, hi);
    }
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(m_engine);
}

float SeededRandom::uniformFloat(float lo, float hi)
{
    if (hi <= lo) {
        return lo;
    }
    std::uniform_real_distribution<float> dist(lo, hi);
    return dist(m_engine);
}

} // namespace Cosmic
