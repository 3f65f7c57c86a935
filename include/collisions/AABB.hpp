/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AABB_HPP
#define AABB_HPP

#include "utils/Vector2D.hpp"

namespace Cosmic {

/**
 * Axis-aligned box stored as center + half extents. Entities keep their
 * full width/height, fromSize() converts.
 */
struct AABB {
    Vector2D center;   // world center
    Vector2D halfSize; // half extents (w/2, h/2)

    AABB() = default;
    AABB(float cx, float cy, float hw, float hh) : center(cx, cy), halfSize(hw, hh) {}

    static AABB fromSize(const Vector2D& center, const Vector2D& size) {
        return AABB(center.getX(), center.getY(), size.getX() * 0.5f, size.getY() * 0.5f);
    }

    float left() const { return center.getX() - halfSize.getX(); }
    float right() const { return center.getX() + halfSize.getX(); }
    float top() const { return center.getY() - halfSize.getY(); }
    float bottom() const { return center.getY() + halfSize.getY(); }

    // Strict overlap on both axes; edge-touching boxes do not intersect
    bool intersects(const AABB& other) const;
    bool contains(const Vector2D& p) const;
};

} // namespace Cosmic

#endif // AABB_HPP
