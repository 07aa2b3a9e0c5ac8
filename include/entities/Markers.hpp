/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MARKERS_HPP
#define MARKERS_HPP

#include "entities/EntityProperties.hpp"

namespace SneakEngine {

class Entity;
class Level;

/**
 * @brief State for PlayerStart and Waypoint entities.
 *
 * Markers never block, never step and ignore triggers; they exist only so
 * other entities can find a location by ID.
 */
class MarkerState {
public:
    MarkerState() = default;

    static PropertyDefaults defaultProperties() { return {}; }
    static PropertyRules propertyRules() { return {}; }

    bool blocksMovement() const noexcept { return false; }
    void step(Entity&, Level&) {}
    void trigger(Entity&, Level&, Entity*) {}
    void touch(Entity&, Level&, Entity&) {}
};

/**
 * @brief State for the player entity.
 *
 * Player movement is driven from outside by the TurnController, so the
 * player itself has nothing to do during a step.
 */
class PlayerState {
public:
    PlayerState() = default;

    static PropertyDefaults defaultProperties();
    static PropertyRules propertyRules() { return {}; }

    bool blocksMovement() const noexcept { return true; }
    void step(Entity&, Level&) {}
    void trigger(Entity&, Level&, Entity*) {}
    void touch(Entity&, Level&, Entity&) {}
};

} // namespace SneakEngine

#endif // MARKERS_HPP
