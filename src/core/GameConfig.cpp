/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/GameConfig.hpp"

namespace Cosmic
{

std::string_view toString(Difficulty difficulty)
{
    switch (difficulty) {
    case Difficulty::Cadet:
        return "cadet";
    case Difficulty::Pilot:
        return "pilot";
    case Difficulty::Commander:
        return "commander";
    case Difficulty::Ace:
        return "ace";
    case Difficulty::Legend:
        return "legend";
    case Difficulty::COUNT:
        break;
    }
    return "unknown";
}

std::optional<Difficulty> parseDifficulty(std::string_view name)
{
    for (size_t i = 0; i < DIFFICULTY_COUNT; ++i) {
        const auto difficulty = static_cast<Difficulty>(i);
        if (toString(difficulty) == name) {
            return difficulty;
        }
    }
    return std::nullopt;
}

} // namespace Cosmic
