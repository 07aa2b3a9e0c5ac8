/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FACING_HPP
#define FACING_HPP

#include "utils/Point.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

namespace SneakEngine {

// Which way an entity turns when it has to about-face
enum class Handedness : uint8_t { Right, Left };

inline std::ostream& operator<<(std::ostream& os, Handedness h) {
    return os << (h == Handedness::Right ? "right" : "left");
}

/**
 * Facing angles are whole degrees measured clockwise from +X with Y pointing
 * down the screen: right = 0, down = 90, left = 180, up = 270.
 */
namespace Facing {

constexpr int RIGHT = 0;
constexpr int DOWN = 90;
constexpr int LEFT = 180;
constexpr int UP = 270;

// Wraps any angle into [0, 360)
constexpr int normalizeAngle(int degrees) noexcept {
    int wrapped = degrees % 360;
    return wrapped < 0 ? wrapped + 360 : wrapped;
}

// Snaps to the nearest cardinal facing, then wraps
int normalizeFacingAngle(int degrees) noexcept;

std::optional<int> fromString(std::string_view name) noexcept;
const char* toString(int facing) noexcept;

std::optional<Handedness> handednessFromString(std::string_view name) noexcept;

// Smallest rotation between two facings, in [0, 180]
int angleBetween(int from, int to) noexcept;

/**
 * @brief One turn step from `current` toward `desired`.
 *
 * A quarter turn or less lands directly on `desired`. An about-face turns a
 * quarter toward the handedness side (right = +90, left = -90), so reversing
 * always takes two steps.
 */
int turnToward(int current, int desired, Handedness handedness) noexcept;

// Unit map-space step for a cardinal facing
Point delta(int facing) noexcept;

// Cardinal facing for a unit step; nullopt for zero or diagonal steps
std::optional<int> fromDelta(int dx, int dy) noexcept;

} // namespace Facing

} // namespace SneakEngine

#endif // FACING_HPP
