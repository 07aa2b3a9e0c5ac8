/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_KIND_HPP
#define ENTITY_KIND_HPP

#include <cstdint>
#include <ostream>

namespace SneakEngine {

/**
 * @brief Kind tag carried by every entity in a level.
 *
 * Behaviour is selected from this tag and the per-kind state the entity
 * owns; capability questions go through EntityTraits rather than type tests.
 */
enum class EntityKind : uint8_t {
    // Actors (move on their own or under player control)
    Player = 0,
    Guard = 1,

    // Devices (react to triggers)
    Door = 2,
    Button = 3,
    LevelGoal = 4,

    // Markers (non-blocking references)
    PlayerStart = 5,
    Waypoint = 6,

    COUNT = 7
};

namespace EntityTraits {

/// Returns true if this kind moves during play
constexpr bool isActor(EntityKind kind) noexcept {
    return kind == EntityKind::Player || kind == EntityKind::Guard;
}

/// Returns true if this kind only marks a location for other entities
constexpr bool isMarker(EntityKind kind) noexcept {
    return kind == EntityKind::PlayerStart || kind == EntityKind::Waypoint;
}

/// Returns true if triggering this kind changes its state
constexpr bool isTriggerable(EntityKind kind) noexcept {
    return kind == EntityKind::Door || kind == EntityKind::Button ||
           kind == EntityKind::LevelGoal;
}

/// Patrolling guards give these one trigger to clear their path
constexpr bool opensWhenTriggered(EntityKind kind) noexcept {
    return kind == EntityKind::Door;
}

/// Returns true if the player walking onto this kind activates it
constexpr bool reactsToTouch(EntityKind kind) noexcept {
    return kind == EntityKind::LevelGoal;
}

/// Returns true if this kind owns a vision cone
constexpr bool hasVision(EntityKind kind) noexcept {
    return kind == EntityKind::Guard;
}

constexpr int defaultZOrder(EntityKind kind) noexcept {
    switch (kind) {
        case EntityKind::Player:      return 10;
        case EntityKind::Guard:       return 10;
        case EntityKind::Button:      return 100;
        case EntityKind::PlayerStart: return -10;
        default:                      return 0;
    }
}

constexpr const char* kindToString(EntityKind kind) noexcept {
    switch (kind) {
        case EntityKind::Player:      return "Player";
        case EntityKind::Guard:       return "Guard";
        case EntityKind::Door:        return "Door";
        case EntityKind::Button:      return "Button";
        case EntityKind::LevelGoal:   return "LevelGoal";
        case EntityKind::PlayerStart: return "PlayerStart";
        case EntityKind::Waypoint:    return "Waypoint";
        default:                      return "Unknown";
    }
}

} // namespace EntityTraits

inline std::ostream& operator<<(std::ostream& os, EntityKind kind) {
    return os << EntityTraits::kindToString(kind);
}

} // namespace SneakEngine

#endif // ENTITY_KIND_HPP
