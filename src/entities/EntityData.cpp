/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/EntityData.hpp"

namespace Cosmic {

BehaviorState makeBehaviorState(EnemyVariant variant, const Vector2D& spawnPosition)
{
    switch (variant) {
    case EnemyVariant::Fast:
        return FastState{spawnPosition.getX()};
    case EnemyVariant::Heavy:
        return HeavyState{};
    case EnemyVariant::ZigZag:
        return ZigZagState{};
    case EnemyVariant::Boss:
        return BossState{spawnPosition, 0, 0.0f};
    case EnemyVariant::Basic:
    case EnemyVariant::COUNT:
        break;
    }
    return BasicState{};
}

} // namespace Cosmic
