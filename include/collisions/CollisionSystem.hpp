/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_SYSTEM_HPP
#define COLLISION_SYSTEM_HPP

/**
 * @file CollisionSystem.hpp
 * @brief Stateless AABB overlap detection between entity groups
 *
 * detect() reads the EntityStore and appends one CollisionInfo per
 * overlapping pair. It never mutates entities; CombatResolver consumes
 * the batch in the order produced:
 *   1. player bullets x enemies (first enemy in store order only)
 *   2. enemy bullets x player
 *   3. player x enemies
 *   4. player x power-ups
 */

#include "collisions/CollisionInfo.hpp"
#include "entities/EntityData.hpp"

namespace Cosmic {

class EntityStore;

class CollisionSystem {
public:
    CollisionSystem() = default;

    /**
     * @brief Symmetric overlap test: |dx| < (w1+w2)/2 and |dy| < (h1+h2)/2
     */
    [[nodiscard]] static bool collides(const Body& a, const Body& b);

    /**
     * @brief Append every overlapping pair for this tick to @p batch
     * @return Number of pairs appended
     */
    size_t detect(const EntityStore& store, CollisionBatch& batch) const;
};

} // namespace Cosmic

#endif // COLLISION_SYSTEM_HPP
