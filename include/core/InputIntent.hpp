/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef INPUT_INTENT_HPP
#define INPUT_INTENT_HPP

#include "utils/Vector2D.hpp"

namespace Cosmic
{

/**
 * @brief Player intent for one tick, produced by the host from device input
 *
 * The session sanitises the move vector before use: non-finite components
 * become 0 and both axes are clamped to [-1, 1].
 */
struct InputIntent
{
    Vector2D moveVector{0.0f, 0.0f};
    bool fireHeld{false};
    bool specialPressed{false};
};

} // namespace Cosmic

#endif // INPUT_INTENT_HPP
