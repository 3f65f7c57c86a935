/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef POWERUP_EFFECT_TIMER_HPP
#define POWERUP_EFFECT_TIMER_HPP

/**
 * @file PowerUpEffectTimer.hpp
 * @brief Applies collected power-ups and expires timed buffs on the player
 *
 * Timed kinds (Shield, RapidFire, MultiShot, TimeSlow, Homing) are stored
 * in Player::activePowerUps as kind -> remaining seconds. Collecting a kind
 * that is already active resets its timer to the full duration; timers
 * never stack. A timer reaching zero removes the entry and emits exactly
 * one PowerUpExpired.
 *
 * Instant kinds: Health heals up to max health; ScreenClear destroys every
 * live enemy without awarding score.
 */

#include "controllers/ControllerBase.hpp"
#include "controllers/IUpdatable.hpp"
#include "core/GameConfig.hpp"

namespace Cosmic
{

class PowerUpEffectTimer : public ControllerBase, public IUpdatable
{
public:
    PowerUpEffectTimer(EntityStore& store, EventQueue& events, const GameConfig& config);
    ~PowerUpEffectTimer() override = default;

    [[nodiscard]] std::string_view getName() const override { return "PowerUpEffectTimer"; }

    /**
     * @brief Count down every active timed effect
     * @param deltaTime Unscaled step; player buffs ignore TimeSlow and freeze
     */
    void update(float deltaTime) override;

    /**
     * @brief Apply one collected power-up to the player
     */
    void apply(PowerUpKind kind);

    /**
     * @brief Destroy all live enemies, one explosion and one zero-score kill each
     * @return Number of enemies destroyed
     */
    size_t clearScreen();

private:
    const GameConfig& m_config;
};

} // namespace Cosmic

#endif // POWERUP_EFFECT_TIMER_HPP
