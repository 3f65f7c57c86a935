/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/AABB.hpp"
#include <cmath>

namespace Cosmic {

bool AABB::intersects(const AABB& other) const {
    // |x1 - x2| < (w1 + w2) / 2 on both axes. Written on center distance so
    // the predicate is symmetric bit-for-bit regardless of argument order.
    const float dx = std::fabs(center.getX() - other.center.getX());
    const float dy = std::fabs(center.getY() - other.center.getY());
    return dx < (halfSize.getX() + other.halfSize.getX()) &&
           dy < (halfSize.getY() + other.halfSize.getY());
}

bool AABB::contains(const Vector2D& p) const {
    return p.getX() >= left() && p.getX() <= right() &&
           p.getY() >= top()  && p.getY() <= bottom();
}

} // namespace Cosmic
