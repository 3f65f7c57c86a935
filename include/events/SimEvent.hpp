/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIM_EVENT_HPP
#define SIM_EVENT_HPP

/**
 * @file SimEvent.hpp
 * @brief Output events produced by the simulation each tick
 *
 * Events are queued in the order they happen and handed to collaborators
 * (renderer, audio, leaderboard) once per tick through
 * GameSession::drainEvents(). They carry values, never entity references.
 */

#include "entities/EntityTypes.hpp"
#include <string_view>
#include <variant>
#include <vector>

namespace Cosmic {

struct EnemyDestroyed {
    float x{0.0f};
    float y{0.0f};
    int score{0};                 // 0 for kills that award nothing (contact, screen clear)
    EnemyVariant variant{EnemyVariant::Basic};
};

struct PlayerDamaged {
    float amount{0.0f};
    float remainingHealth{0.0f};
};

struct PowerUpCollected {
    PowerUpKind kind{PowerUpKind::Health};
};

struct PowerUpSpawned {
    float x{0.0f};
    float y{0.0f};
    PowerUpKind kind{PowerUpKind::Health};
};

struct PowerUpExpired {
    PowerUpKind kind{PowerUpKind::Health};
};

struct ExplosionRequested {
    float x{0.0f};
    float y{0.0f};
    int intensity{0};
};

struct WaveCompleted {
    int wave{0};
};

struct BossWaveStarted {
    int wave{0};
};

struct LevelCompleted {
    int level{0};
    int score{0};
};

struct GameOver {
    int finalScore{0};
    int wave{0};
};

// Screen shake / flash cue when the player is hit
struct ScreenFeedback {};

struct ShotFired {
    int count{0};
};

struct SpecialActivated {};

using SimEvent = std::variant<EnemyDestroyed, PlayerDamaged, PowerUpCollected,
                              PowerUpSpawned, PowerUpExpired, ExplosionRequested,
                              WaveCompleted, BossWaveStarted, LevelCompleted, GameOver,
                              ScreenFeedback, ShotFired, SpecialActivated>;

using EventQueue = std::vector<SimEvent>;

[[nodiscard]] std::string_view getEventName(const SimEvent& event);

/**
 * @brief Count queued events of one type, used by hosts and tests
 */
template <typename T>
[[nodiscard]] size_t countEvents(const EventQueue& events) {
    size_t count = 0;
    for (const auto& event : events) {
        if (std::holds_alternative<T>(event)) {
            ++count;
        }
    }
    return count;
}

} // namespace Cosmic

#endif // SIM_EVENT_HPP
