/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "events/SimEvent.hpp"
#include <type_traits>

namespace Cosmic {

std::string_view getEventName(const SimEvent& event)
{
    return std::visit([](const auto& e) -> std::string_view {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, EnemyDestroyed>) return "EnemyDestroyed";
        else if constexpr (std::is_same_v<T, PlayerDamaged>) return "PlayerDamaged";
        else if constexpr (std::is_same_v<T, PowerUpCollected>) return "PowerUpCollected";
        else if constexpr (std::is_same_v<T, PowerUpSpawned>) return "PowerUpSpawned";
        else if constexpr (std::is_same_v<T, PowerUpExpired>) return "PowerUpExpired";
        else if constexpr (std::is_same_v<T, ExplosionRequested>) return "ExplosionRequested";
        else if constexpr (std::is_same_v<T, WaveCompleted>) return "WaveCompleted";
        else if constexpr (std::is_same_v<T, BossWaveStarted>) return "BossWaveStarted";
        else if constexpr (std::is_same_v<T, LevelCompleted>) return "LevelCompleted";
        else if constexpr (std::is_same_v<T, GameOver>) return "GameOver";
        else if constexpr (std::is_same_v<T, ScreenFeedback>) return "ScreenFeedback";
        else if constexpr (std::is_same_v<T, ShotFired>) return "ShotFired";
        else return "SpecialActivated";
    }, event);
}

} // namespace Cosmic
