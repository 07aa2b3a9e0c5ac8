/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Facing.hpp"
#include <cmath>
#include <cstdlib>

namespace SneakEngine::Facing {

int normalizeFacingAngle(int degrees) noexcept {
    int snapped = static_cast<int>(std::lround(static_cast<double>(degrees) / 90.0)) * 90;
    return normalizeAngle(snapped);
}

std::optional<int> fromString(std::string_view name) noexcept {
    if (name == "right") return RIGHT;
    if (name == "down") return DOWN;
    if (name == "left") return LEFT;
    if (name == "up") return UP;
    return std::nullopt;
}

const char* toString(int facing) noexcept {
    switch (normalizeFacingAngle(facing)) {
        case RIGHT: return "right";
        case DOWN:  return "down";
        case LEFT:  return "left";
        case UP:    return "up";
        default:    return "right";
    }
}

std::optional<Handedness> handednessFromString(std::string_view name) noexcept {
    if (name == "right") return Handedness::Right;
    if (name == "left") return Handedness::Left;
    return std::nullopt;
}

int angleBetween(int from, int to) noexcept {
    int diff = std::abs(normalizeAngle(from) - normalizeAngle(to));
    return 180 - std::abs(diff - 180);
}

int turnToward(int current, int desired, Handedness handedness) noexcept {
    if (angleBetween(current, desired) <= 90) {
        return normalizeFacingAngle(desired);
    }
    int quarter = handedness == Handedness::Right ? 90 : -90;
    return normalizeFacingAngle(current + quarter);
}

Point delta(int facing) noexcept {
    switch (normalizeFacingAngle(facing)) {
        case RIGHT: return Point(1, 0);
        case DOWN:  return Point(0, 1);
        case LEFT:  return Point(-1, 0);
        default:    return Point(0, -1);
    }
}

std::optional<int> fromDelta(int dx, int dy) noexcept {
    if (dx != 0 && dy != 0) {
        return std::nullopt;
    }
    if (dx > 0) return RIGHT;
    if (dx < 0) return LEFT;
    if (dy > 0) return DOWN;
    if (dy < 0) return UP;
    return std::nullopt;
}

} // namespace SneakEngine::Facing
