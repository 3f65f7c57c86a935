/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IUPDATABLE_HPP
#define IUPDATABLE_HPP

/**
 * @file IUpdatable.hpp
 * @brief Interface for controllers that run every simulation tick
 *
 * Controllers implement this interface when they own countdowns that must
 * advance each tick (PowerUpEffectTimer). Controllers that only react to
 * a tick's collision batch (CombatResolver) do NOT implement it.
 *
 * Usage:
 * - Tick-updatable: class MyController : public ControllerBase, public IUpdatable
 * - Reactive:       class MyController : public ControllerBase
 */

namespace Cosmic
{

class IUpdatable
{
public:
    virtual ~IUpdatable() = default;

    /**
     * @brief Per-tick update for the controller
     * @param deltaTime Fixed step in seconds
     *
     * Called by GameSession once per tick. Not called after game over.
     */
    virtual void update(float deltaTime) = 0;
};

} // namespace Cosmic

#endif // IUPDATABLE_HPP
