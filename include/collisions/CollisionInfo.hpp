/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_INFO_HPP
#define COLLISION_INFO_HPP

#include "entities/EntityTypes.hpp"
#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <string_view>

namespace Cosmic {

// Detection groups, listed in resolution order
enum class CollisionKind : uint8_t {
    PlayerBulletEnemy = 0,   // a = bullet, b = enemy
    EnemyBulletPlayer = 1,   // a = bullet, b = player
    PlayerEnemy = 2,         // a = player, b = enemy
    PlayerPowerUp = 3        // a = player, b = power-up
};

std::string_view toString(CollisionKind kind);

struct CollisionInfo {
    EntityID a{INVALID_ENTITY_ID};
    EntityID b{INVALID_ENTITY_ID};
    CollisionKind kind{CollisionKind::PlayerBulletEnemy};
};

using CollisionBatch = boost::container::small_vector<CollisionInfo, 64>;

} // namespace Cosmic

#endif // COLLISION_INFO_HPP
