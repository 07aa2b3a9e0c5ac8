/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LEVEL_EVENTS_HPP
#define LEVEL_EVENTS_HPP

#include "utils/Point.hpp"
#include <cstddef>
#include <functional>
#include <string>

namespace SneakEngine {

/**
 * @brief Raised when the player activates a level goal.
 *
 * `won` mirrors the goal's winLevel property; a goal can just as well end the
 * level in failure.
 */
struct LevelCompleteEvent {
    std::string goalId;
    bool won{true};
    Point position;
    size_t turn{0};
};

using LevelCompleteHandler = std::function<void(const LevelCompleteEvent&)>;
using CompletionHandlerId = size_t;

} // namespace SneakEngine

#endif // LEVEL_EVENTS_HPP
